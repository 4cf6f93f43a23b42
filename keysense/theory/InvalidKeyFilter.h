#pragma once

#include <QString>

#include "keysense/theory/ChordInventory.h"

namespace keysense::theory {

// Degrees one semitone below a major scale's ii, iii, v, vi and vii.
struct BorrowedDegrees {
    int flatSecond = 0;
    int flatThird = 0;
    int flatFifth = 0;
    int flatSixth = 0;
    int flatSeventh = 0;
};

BorrowedDegrees borrowedDegreesFor(int keyPc);

// A key is invalid for a progression when choosing it would force one of these labels:
//  - a minor chord on the flat second
//  - a minor chord on the flat fifth
//  - a major VI together with a major bVI or bVII
//  - a major bVII together with a minor v
// Invalid keys stay in the running with a large penalty (see KeyAnalyzer).
// outReason, when given, receives a short description of the first rule that fired.
bool isInvalidKey(int keyPc, const ChordInventory& chords, QString* outReason = nullptr);

} // namespace keysense::theory
