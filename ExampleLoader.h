#ifndef EXAMPLELOADER_H
#define EXAMPLELOADER_H

#include <QByteArray>
#include <QString>
#include <QXmlStreamReader>
#include "ExampleData.h"

class ExampleLoader {
public:
    ExampleLoader();
    ExampleLibrary loadExamples(const QString& filePath);
    ExampleLibrary parseExamples(const QByteArray& xmlData);

private:
    ExampleLibrary parse(QXmlStreamReader& xml);
    void parseExample(QXmlStreamReader& xml, ExampleLibrary& library);
};

#endif // EXAMPLELOADER_H
