#pragma once

#include <QString>

namespace music {

// Normalized pitch class: 0=C, 1=C#/Db, ... 11=B.
inline int normalizePc(int pc) {
    pc %= 12;
    if (pc < 0) pc += 12;
    return pc;
}

// Resolves a note spelling to its pitch class by scanning the canonical (sharp)
// and alias (flat) spellings of the note table. Only the 17 table spellings are
// recognized; "Cb", "E#" and friends return -1.
int noteIndex(const QString& spelling);

// noteIndex() on the trimmed token, in bool/out-param form. pcOut is untouched on failure.
bool parsePitchClass(const QString& token, int& pcOut);

// (index(b) - index(a) + 12) % 12, or -1 if either spelling is unknown.
int semitoneDistance(const QString& from, const QString& to);

// Canonical spelling of a pitch class ("C#", never "Db").
QString canonicalSpelling(int pc);

// Flat alias of a black-key pitch class ("Db"); empty for the white keys.
QString aliasSpelling(int pc);

// "C#" <-> "Db" etc. Empty if the spelling has no twin in the note table.
QString enharmonicTwin(const QString& spelling);

// Key names are shown with flats for the black keys: G#->Ab, D#->Eb, A#->Bb, C#->Db, F#->Gb.
QString preferredKeySpelling(int pc);
QString preferredKeySpelling(const QString& spelling);

// True for the major keys written with flats (F, Bb, Eb, Ab, Db, Gb).
bool isFlatKey(int tonicPc);

// Spells a pitch class using either flats or sharps.
// Returns a short name like "Eb" or "D#".
QString spellPitchClass(int pc, bool preferFlats);

} // namespace music
