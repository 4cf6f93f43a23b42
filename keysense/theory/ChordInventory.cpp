#include "keysense/theory/ChordInventory.h"

#include "music/Pitch.h"

namespace keysense::theory {

ChordInventory::ChordInventory(const QVector<music::ChordSymbol>& chords)
    : m_chords(chords) {
    for (const auto& c : m_chords) {
        if (c.rootPc < 0) continue;
        m_present[size_t(c.rootPc)][size_t(c.quality)] = true;
    }
}

bool ChordInventory::has(int pc, music::ChordQuality quality) const {
    if (pc < 0) return false;
    return m_present[size_t(music::normalizePc(pc))][size_t(quality)];
}

bool ChordInventory::hasNonMinor(int pc) const {
    return has(pc, music::ChordQuality::Major)
        || has(pc, music::ChordQuality::Diminished)
        || has(pc, music::ChordQuality::Augmented);
}

} // namespace keysense::theory
