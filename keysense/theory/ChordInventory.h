#pragma once

#include <QVector>

#include <array>

#include "music/ChordSymbol.h"

namespace keysense::theory {

// Set view of a progression: which (root pitch class, quality) pairs occur.
// Chords whose root is outside the note table are kept in chords() but never
// show up in the set queries.
class ChordInventory {
public:
    ChordInventory() = default;
    explicit ChordInventory(const QVector<music::ChordSymbol>& chords);

    bool has(int pc, music::ChordQuality quality) const;
    bool hasMajor(int pc) const { return has(pc, music::ChordQuality::Major); }
    bool hasMinor(int pc) const { return has(pc, music::ChordQuality::Minor); }
    bool hasNonMinor(int pc) const;

    const QVector<music::ChordSymbol>& chords() const { return m_chords; }
    bool isEmpty() const { return m_chords.isEmpty(); }

private:
    QVector<music::ChordSymbol> m_chords;
    std::array<std::array<bool, 4>, 12> m_present{};
};

} // namespace keysense::theory
