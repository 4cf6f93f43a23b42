#pragma once

#include <QString>
#include <QStringList>
#include <QVector>

namespace music {

// Expected triad quality on each of the seven major-scale positions.
enum class DegreeQuality {
    Major,      // I, IV, V
    Minor,      // ii, iii, vi
    Diminished, // vii
};

struct MajorScale {
    int tonicPc = -1;
    QString name;      // preferred key spelling ("Eb", not "D#")
    QStringList notes; // 7 spellings, flats for the flat keys
    QVector<int> pcs;  // 7 pitch classes, same order as notes

    bool isValid() const { return tonicPc >= 0; }
};

// The twelve major scales, built once on first use and immutable afterwards.
class ScaleLibrary {
public:
    static const QVector<int>& majorIntervals(); // {0,2,4,5,7,9,11}

    static const MajorScale& major(int tonicPc);

    // Resolves primary or alias spelling ("C#" and "Db" give the same scale).
    // Returns nullptr for spellings outside the note table.
    static const MajorScale* major(const QString& keySpelling);

    // root transposed by semitones (negative allowed). When target is given and the
    // literal result has an enharmonic twin in it, the twin is returned instead.
    // Empty if root is unknown.
    static QString scaleDegree(const QString& root, int semitones, const MajorScale* target = nullptr);

    // Index 0..6 of note in scale, trying the enharmonic twin if the spelling is absent; -1 otherwise.
    static int positionInScale(const QString& note, const MajorScale& scale);
    static int positionInScale(int pc, const MajorScale& scale);

    static DegreeQuality diatonicQuality(int position);
};

} // namespace music
