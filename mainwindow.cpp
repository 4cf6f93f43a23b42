#include "mainwindow.h"
#include <QtWidgets>
#include "keysense/midi/MidiExporter.h"

namespace {

// Row tint for chords outside the detected key.
const QColor kNonDiatonicRow(255, 228, 196);

const char* kSettingsExportPrefix = "midiExport";
const char* kSettingsLastDir = "ui/lastExportDir";

} // namespace

MainWindow::MainWindow(const ExampleLibrary& examples, QWidget *parent)
    : QMainWindow(parent),
      m_settings(new QSettings("Keysense", "Keysense", this)),
      m_hasAnalysis(false),
      m_examples(examples) {
    m_exportProfile = keysense::midi::loadExportProfile(*m_settings, kSettingsExportPrefix);

    centralWidget = new QWidget(this);
    setCentralWidget(centralWidget);

    createWidgets(examples);
    createLayout();
    createConnections();

    setWindowTitle("Keysense - Chord Progression Analyzer");
    resize(720, 560);
}

MainWindow::~MainWindow() {
    keysense::midi::saveExportProfile(*m_settings, kSettingsExportPrefix, m_exportProfile);
}

void MainWindow::createWidgets(const ExampleLibrary& examples) {
    chordInput = new QLineEdit;
    chordInput->setPlaceholderText("e.g. C, G, Am, F");
    chordInput->setClearButtonEnabled(true);

    analyzeButton = new QPushButton("Analyze");
    analyzeButton->setDefault(true);

    exampleBox = new QGroupBox(examples.name.isEmpty() ? QString("Examples") : examples.name);
    for (const auto& e : examples.examples) {
        QPushButton* button = new QPushButton(e.name);
        button->setToolTip(e.chords);
        exampleButtons.push_back(button);
    }

    detectedKeyLabel = new QLabel("Detected key: -");
    QFont keyFont = detectedKeyLabel->font();
    keyFont.setPointSize(keyFont.pointSize() + 4);
    keyFont.setBold(true);
    detectedKeyLabel->setFont(keyFont);

    analysisTable = new QTableWidget(0, 3);
    analysisTable->setHorizontalHeaderLabels({"Chord", "Numeral", "Function"});
    analysisTable->horizontalHeader()->setSectionResizeMode(QHeaderView::Stretch);
    analysisTable->verticalHeader()->setVisible(false);
    analysisTable->setEditTriggers(QAbstractItemView::NoEditTriggers);
    analysisTable->setSelectionMode(QAbstractItemView::NoSelection);

    exportMidiButton = new QPushButton("Export MIDI...");
    exportMidiButton->setEnabled(false);
}

void MainWindow::createLayout() {
    mainLayout = new QVBoxLayout(centralWidget);

    QHBoxLayout* inputLayout = new QHBoxLayout;
    inputLayout->addWidget(new QLabel("Chords:"));
    inputLayout->addWidget(chordInput, 1);
    inputLayout->addWidget(analyzeButton);
    mainLayout->addLayout(inputLayout);

    // Example buttons, two per row
    QGridLayout* exampleLayout = new QGridLayout(exampleBox);
    for (size_t i = 0; i < exampleButtons.size(); ++i) {
        exampleLayout->addWidget(exampleButtons[i], int(i / 2), int(i % 2));
    }
    exampleBox->setVisible(!exampleButtons.empty());
    mainLayout->addWidget(exampleBox);

    mainLayout->addWidget(detectedKeyLabel);
    mainLayout->addWidget(analysisTable, 1);

    QHBoxLayout* exportLayout = new QHBoxLayout;
    exportLayout->addStretch(1);
    exportLayout->addWidget(exportMidiButton);
    mainLayout->addLayout(exportLayout);
}

void MainWindow::createConnections() {
    connect(analyzeButton, &QPushButton::clicked, this, &MainWindow::onAnalyzeClicked);
    connect(chordInput, &QLineEdit::returnPressed, this, &MainWindow::onAnalyzeClicked);

    for (size_t i = 0; i < exampleButtons.size(); ++i) {
        connect(exampleButtons[i], &QPushButton::clicked, this, [this, i]() {
            onExampleClicked(int(i));
        });
    }

    connect(exportMidiButton, &QPushButton::clicked, this, &MainWindow::onExportMidiClicked);
}

void MainWindow::onAnalyzeClicked() {
    const QString text = chordInput->text().trimmed();
    if (text.isEmpty()) return;

    m_currentAnalysis = keysense::theory::analyzeProgression(text);
    m_hasAnalysis = true;
    displayResult(m_currentAnalysis);
}

void MainWindow::onExampleClicked(int exampleIndex) {
    if (exampleIndex < 0 || exampleIndex >= m_examples.examples.size()) return;
    chordInput->setText(m_examples.examples[exampleIndex].chords);
    onAnalyzeClicked();
}

void MainWindow::displayResult(const keysense::theory::AnalysisResult& result) {
    detectedKeyLabel->setText("Detected key: " + (result.hasKey() ? result.key : QString("Unknown")));

    analysisTable->setRowCount(0);
    for (const auto& entry : result.analysis) {
        const int row = analysisTable->rowCount();
        analysisTable->insertRow(row);
        const QStringList cells = {entry.chord, entry.numeral, entry.function};
        for (int col = 0; col < cells.size(); ++col) {
            QTableWidgetItem* item = new QTableWidgetItem(cells[col]);
            if (!entry.diatonic) item->setBackground(kNonDiatonicRow);
            analysisTable->setItem(row, col, item);
        }
    }

    exportMidiButton->setEnabled(!result.analysis.isEmpty());
}

void MainWindow::onExportMidiClicked() {
    if (!m_hasAnalysis) {
        QMessageBox::information(this, "Export MIDI", "Please analyze chords first before exporting MIDI.");
        return;
    }

    const QString lastDir = m_settings->value(kSettingsLastDir, QDir::homePath()).toString();
    const QString suggested = QDir(lastDir).filePath(keysense::midi::suggestedFileName(m_currentAnalysis.key));
    const QString path = QFileDialog::getSaveFileName(this, "Export MIDI", suggested, "MIDI files (*.mid *.midi)");
    if (path.isEmpty()) return;

    const auto chords = keysense::midi::chordsForExport(m_currentAnalysis);
    if (!keysense::midi::writeProgressionMidi(path, chords, m_exportProfile)) {
        QMessageBox::critical(this, "Export MIDI", "MIDI export failed. Could not write:\n" + path);
        return;
    }
    m_settings->setValue(kSettingsLastDir, QFileInfo(path).absolutePath());
}
