#pragma once

#include <QJsonObject>
#include <QString>
#include <QVector>

#include "keysense/theory/KeyAnalyzer.h"
#include "music/ChordSymbol.h"

namespace keysense::theory {

struct AnalysisEntry {
    QString chord;    // original symbol
    QString numeral;
    QString function;
    bool diatonic = false;

    QJsonObject toJsonObject() const;
};

struct AnalysisResult {
    QString key;                      // preferred spelling, empty when unknown
    QVector<AnalysisEntry> analysis;  // one per parsed chord, input order

    QVector<music::ChordSymbol> chords; // the parsed chords behind analysis
    KeyDecision decision;               // per-key scores, for explanations

    bool hasKey() const { return !key.isEmpty(); }

    // {"key": "C" | null, "analysis": [{"chord", "numeral", "function", "diatonic"}, ...]}
    QJsonObject toJsonObject() const;
    QString toJsonString(bool compact = true) const;
};

// Parses a comma-separated progression ("C, G, Am, F"), picks its key and labels
// every chord. Unparseable tokens are skipped; with no chords left the key is
// empty and analysis is empty. Pure: no state survives between calls.
AnalysisResult analyzeProgression(const QString& progression);

// Same, for chords that were already parsed.
AnalysisResult analyzeChords(const QVector<music::ChordSymbol>& chords);

} // namespace keysense::theory
