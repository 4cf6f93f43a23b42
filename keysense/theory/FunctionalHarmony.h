#pragma once

#include <QString>

#include "music/ChordSymbol.h"

namespace keysense::theory {

struct HarmonyLabel {
    QString roman;      // e.g. "V7", "ii", "VI*", "bVII*"
    QString function;   // "Tonic", "Dominant", "Tierce de Picardie", "Borrowed Chord", ...
    bool diatonic = false;
};

// True if the chord's quality is the one a major key expects on this scale position
// (I, IV, V major; ii, iii, vi minor; vii diminished). Augmented chords never are.
bool isDiatonicQuality(const music::ChordSymbol& chord, int position);

// Tonic, Supertonic, Mediant, Subdominant, Dominant, Submediant, Leading Tone.
QString functionNameForPosition(int position);

// Numeral for a chord whose root is not in the scale: built from the semitone
// distance to the tonic (I, bII, II, bIII, ...), always ending in '*'.
QString chromaticNumeral(int tonicPc, const music::ChordSymbol& chord);

// Roman numeral, diatonic flag and function label of a chord in a major key.
HarmonyLabel analyzeChordInMajorKey(int tonicPc, const music::ChordSymbol& chord);

} // namespace keysense::theory
