#pragma once

#include <QJsonObject>
#include <QString>
#include <QVector>

#include <functional>

#include "keysense/theory/ChordInventory.h"
#include "keysense/theory/PatternDetectors.h"
#include "music/ChordSymbol.h"

namespace keysense::theory {

struct RuleHit {
    QString rule;
    int bonus = 0;
};

struct KeyScore {
    int keyPc = 0;
    QString key;          // preferred spelling
    bool valid = true;
    QString invalidReason;
    int base = 0;         // before pattern bonuses (the penalty for invalid keys)
    int total = 0;
    QVector<RuleHit> hits; // every rule that contributed, in evaluation order
};

struct KeyDecision {
    int keyPc = -1;       // -1 when the progression had no usable chords
    QString key;          // preferred spelling, empty when keyPc == -1
    QVector<KeyScore> scores; // one per tonic pitch class, C first

    int submediantKey = -1;
    int fourthPairKey = -1;
    RotationProposal rotation;

    bool hasKey() const { return keyPc >= 0; }

    // Human-readable score table (one line per key).
    QString toText() const;
    QJsonObject toJsonObject() const;
};

// Everything a scoring rule may look at besides the candidate key.
struct ScoringContext {
    const ChordInventory& chords;
    int submediantKey = -1;
    int fourthPairKey = -1;
    RotationProposal rotation;
};

// A named bonus. The function returns the points a key earns (0 if it does not apply).
struct ScoringRule {
    QString name;
    std::function<int(int keyPc, const ScoringContext& ctx)> bonus;
};

/**
 * KeyAnalyzer: chooses the most plausible major key for a chord progression.
 *
 * Every one of the 12 major keys is scored:
 *  1. Invalid keys (see isInvalidKey) get kInvalidKeyPenalty as their base score.
 *     Valid keys run the base rules: diatonic membership and a few bonuses for
 *     strong degrees and borrowed chords.
 *  2. Pattern rules then add the detector bonuses (VI*, fourth pair, rotation)
 *     and two progression-shape bonuses to every key.
 *
 * Rules are evaluated in list order and their weights are fixed; changing either
 * changes which key wins on ambiguous input. The highest total wins, the first key
 * in pitch-class order wins ties. An invalid winner falls back to the best valid key.
 */
class KeyAnalyzer {
public:
    static constexpr int kInvalidKeyPenalty = -1000;

    KeyAnalyzer();

    KeyDecision analyze(const QVector<music::ChordSymbol>& chords) const;

    const QVector<ScoringRule>& baseRules() const { return m_baseRules; }
    const QVector<ScoringRule>& patternRules() const { return m_patternRules; }

private:
    QVector<ScoringRule> m_baseRules;
    QVector<ScoringRule> m_patternRules;

    KeyScore scoreKey(int keyPc, const ScoringContext& ctx) const;
    static int chooseKey(const QVector<KeyScore>& scores);
};

} // namespace keysense::theory
