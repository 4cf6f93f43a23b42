#pragma once

#include <QString>
#include <QStringList>
#include <QVector>

#include <array>

#include "keysense/theory/ChordInventory.h"

namespace keysense::theory {

/**
 * Pattern detectors: heuristics that propose a likely major key from chord-pair
 * relationships. Each returns a tonic pitch class, or -1 when nothing matches.
 * Their proposals are turned into score bonuses by KeyAnalyzer; none of them
 * decides the key on its own.
 */

struct RotationProposal {
    int keyPc = -1;          // most frequent proposal (first seen wins ties)
    int count = 0;           // its tally
    std::array<int, 12> tally{}; // proposals per tonic pitch class
};

/**
 * Rotation: a major chord A and a minor chord B a major third above it (IV -> vi,
 * or I -> iii) imply the key a perfect fifth above A. Every ordered (A, B) pair is
 * counted.
 */
RotationProposal detectRotation(const ChordInventory& chords);

/**
 * Fourth pair: two plain major chords a whole step apart read as IV and V, so the
 * key is a perfect fourth below the lower one. Pairs are scanned in progression
 * order and the first proposal that survives the invalid-key filter is returned.
 */
int detectFourthPair(const ChordInventory& chords);

// Literal chord sets that always map to one key. All roots must appear as major chords.
struct SubmediantShortcut {
    QStringList majorRoots;
    QString key;
};

const QVector<SubmediantShortcut>& submediantShortcuts();

/**
 * Borrowed submediant (VI*): a major chord on a key's normally-minor vi, backed by a
 * major IV plus a major I or V from the same key. The shortcut table is consulted
 * first, then the twelve keys are scanned in pitch-class order. Invalid keys are
 * never proposed.
 */
int detectBorrowedSubmediant(const ChordInventory& chords);

} // namespace keysense::theory
