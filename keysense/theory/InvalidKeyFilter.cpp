#include "keysense/theory/InvalidKeyFilter.h"

#include "music/Pitch.h"
#include "music/ScaleLibrary.h"

namespace keysense::theory {

BorrowedDegrees borrowedDegreesFor(int keyPc) {
    const auto& pcs = music::ScaleLibrary::major(keyPc).pcs;
    BorrowedDegrees d;
    d.flatSecond = music::normalizePc(pcs[1] - 1);
    d.flatThird = music::normalizePc(pcs[2] - 1);
    d.flatFifth = music::normalizePc(pcs[4] - 1);
    d.flatSixth = music::normalizePc(pcs[5] - 1);
    d.flatSeventh = music::normalizePc(pcs[6] - 1);
    return d;
}

bool isInvalidKey(int keyPc, const ChordInventory& chords, QString* outReason) {
    const auto& scale = music::ScaleLibrary::major(keyPc);
    const BorrowedDegrees d = borrowedDegreesFor(keyPc);

    auto reject = [&](const char* why) {
        if (outReason) *outReason = QString::fromLatin1(why);
        return true;
    };

    if (chords.hasMinor(d.flatSecond)) return reject("minor bii");
    if (chords.hasMinor(d.flatFifth)) return reject("minor bv");

    const bool majorSubmediant = chords.hasMajor(scale.pcs[5]);
    const bool majorFlatSix = chords.hasMajor(d.flatSixth);
    const bool majorFlatSeven = chords.hasMajor(d.flatSeventh);
    if (majorSubmediant && (majorFlatSix || majorFlatSeven)) return reject("VI with bVI/bVII");

    if (majorFlatSeven && chords.hasMinor(scale.pcs[4])) return reject("bVII with minor v");

    if (outReason) outReason->clear();
    return false;
}

} // namespace keysense::theory
