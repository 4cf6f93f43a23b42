#ifndef EXAMPLEDATA_H
#define EXAMPLEDATA_H

#include <QString>
#include <QList>

// A named reference progression shown as a quick-select button.
struct ExampleProgression {
    QString name;        // e.g. "Avicii - Levels (C)"
    QString chords;      // comma-separated, e.g. "Am, C, F"
    QString expectedKey; // key the song is written in
};

struct ExampleLibrary {
    QString name;
    QList<ExampleProgression> examples;
    bool isValid = false;
};

#endif // EXAMPLEDATA_H
