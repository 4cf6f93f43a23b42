#pragma once

#include <QString>
#include <QVector>

namespace music {

enum class ChordQuality {
    Major = 0,
    Minor,
    Diminished,
    Augmented,
};

struct ChordSymbol {
    QString originalText; // trimmed token as typed, e.g. "Bbmaj7/D"

    QString root;  // root spelling as typed ("Bb")
    QString bass;  // optional slash-bass spelling, empty when absent
    int rootPc = -1; // 0..11, -1 if the spelling is outside the note table
    int bassPc = -1;

    // At most one of these is set; none means major.
    bool isMinor = false;
    bool isDiminished = false;
    bool isAugmented = false;

    bool isSeventh = false;
    bool isMajorSeventh = false; // maj7 / M7; other sevenths are not distinguished

    ChordQuality quality = ChordQuality::Major;

    bool isMajor() const { return quality == ChordQuality::Major; }
};

// Parses one chord token of the form ROOT QUALITY? (/BASS)? where ROOT is A-G with
// an optional '#' or 'b'. The quality tail is scanned for substrings:
//   dim, °        -> diminished
//   aug, +        -> augmented
//   m (not maj)   -> minor
//   7             -> seventh; maj7 / M7 -> major seventh
// Returns false if the token does not match the grammar. Nothing is logged.
bool parseChordSymbol(const QString& chordText, ChordSymbol& out);

// Splits a comma-separated progression and keeps the tokens that parse, in order.
QVector<ChordSymbol> parseProgression(const QString& progression);

} // namespace music
