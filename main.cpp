#include "mainwindow.h"
#include <QApplication>
#include <QDebug>
#include "ExampleLoader.h"

int main(int argc, char *argv[]) {
    QApplication a(argc, argv);
    QApplication::setOrganizationName("Keysense");
    QApplication::setApplicationName("Keysense");

    // Example progressions are embedded via resources.qrc.
    ExampleLoader loader;
    ExampleLibrary examples = loader.loadExamples(":/examples.xml");

    // Examples only feed the quick-select buttons; the analyzer works without them.
    if (!examples.isValid) {
        qWarning() << "Embedded examples.xml could not be parsed; starting without examples.";
        examples.examples.clear();
    }

    MainWindow w(examples);
    w.show();

    return a.exec();
}
