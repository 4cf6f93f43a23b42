#include "ExampleLoader.h"
#include <QFile>
#include <QDebug>

ExampleLoader::ExampleLoader() {}

ExampleLibrary ExampleLoader::loadExamples(const QString& filePath) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "Could not open example file:" << filePath;
        return ExampleLibrary{};
    }

    QXmlStreamReader xml(&file);
    return parse(xml);
}

ExampleLibrary ExampleLoader::parseExamples(const QByteArray& xmlData) {
    QXmlStreamReader xml(xmlData);
    return parse(xml);
}

ExampleLibrary ExampleLoader::parse(QXmlStreamReader& xml) {
    ExampleLibrary library;

    if (xml.readNextStartElement()) {
        if (xml.name().toString() == "KeysenseExamples") {
            library.name = xml.attributes().value("name").toString();
            while (xml.readNextStartElement()) {
                if (xml.name().toString() == "Example") {
                    parseExample(xml, library);
                } else {
                    xml.skipCurrentElement();
                }
            }
        } else {
            xml.raiseError("Expected <KeysenseExamples> root element");
        }
    }

    if (xml.hasError()) {
        qWarning() << "XML parsing error:" << xml.errorString();
        library.isValid = false;
        return library;
    }

    library.isValid = true;
    return library;
}

void ExampleLoader::parseExample(QXmlStreamReader& xml, ExampleLibrary& library) {
    ExampleProgression e;
    e.name = xml.attributes().value("name").toString();
    e.expectedKey = xml.attributes().value("expectedKey").toString();
    // Chord text is the element body: <Example name="..." expectedKey="C">Am, C, F</Example>
    e.chords = xml.readElementText().trimmed();
    if (e.chords.isEmpty()) return;
    library.examples.append(e);
}
