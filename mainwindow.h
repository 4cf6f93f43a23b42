#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <vector>
#include "ExampleData.h"
#include "keysense/midi/ExportProfile.h"
#include "keysense/theory/ProgressionAnalyzer.h"

// Forward declare Qt classes
QT_BEGIN_NAMESPACE
class QVBoxLayout;
class QHBoxLayout;
class QPushButton;
class QLineEdit;
class QLabel;
class QTableWidget;
class QGroupBox;
class QSettings;
QT_END_NAMESPACE

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(const ExampleLibrary& examples, QWidget *parent = nullptr);
    ~MainWindow();

private slots:
    void onAnalyzeClicked();
    void onExampleClicked(int exampleIndex);
    void onExportMidiClicked();

private:
    void createWidgets(const ExampleLibrary& examples);
    void createLayout();
    void createConnections();
    void displayResult(const keysense::theory::AnalysisResult& result);

    QSettings* m_settings;
    keysense::midi::ExportProfile m_exportProfile;
    keysense::theory::AnalysisResult m_currentAnalysis;
    bool m_hasAnalysis;
    ExampleLibrary m_examples;

    // UI Widgets
    QWidget* centralWidget;
    QVBoxLayout* mainLayout;
    QLineEdit* chordInput;
    QPushButton* analyzeButton;
    QGroupBox* exampleBox;
    std::vector<QPushButton*> exampleButtons;
    QLabel* detectedKeyLabel;
    QTableWidget* analysisTable;
    QPushButton* exportMidiButton;
};

#endif // MAINWINDOW_H
