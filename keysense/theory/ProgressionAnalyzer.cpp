#include "keysense/theory/ProgressionAnalyzer.h"

#include "keysense/theory/FunctionalHarmony.h"

#include <QJsonArray>
#include <QJsonDocument>

namespace keysense::theory {

QJsonObject AnalysisEntry::toJsonObject() const {
    QJsonObject o;
    o.insert("chord", chord);
    o.insert("numeral", numeral);
    o.insert("function", function);
    o.insert("diatonic", diatonic);
    return o;
}

QJsonObject AnalysisResult::toJsonObject() const {
    QJsonObject o;
    o.insert("key", hasKey() ? QJsonValue(key) : QJsonValue(QJsonValue::Null));
    QJsonArray arr;
    for (const auto& e : analysis) arr.push_back(e.toJsonObject());
    o.insert("analysis", arr);
    return o;
}

QString AnalysisResult::toJsonString(bool compact) const {
    const QJsonDocument doc(toJsonObject());
    return QString::fromUtf8(doc.toJson(compact ? QJsonDocument::Compact : QJsonDocument::Indented));
}

AnalysisResult analyzeChords(const QVector<music::ChordSymbol>& chords) {
    AnalysisResult out;
    out.chords = chords;
    if (chords.isEmpty()) return out;

    const KeyAnalyzer analyzer;
    out.decision = analyzer.analyze(chords);
    if (!out.decision.hasKey()) return out;
    out.key = out.decision.key;

    for (const auto& c : chords) {
        const HarmonyLabel label = analyzeChordInMajorKey(out.decision.keyPc, c);
        AnalysisEntry e;
        e.chord = c.originalText;
        e.numeral = label.roman;
        e.function = label.function;
        e.diatonic = label.diatonic;
        out.analysis.push_back(e);
    }
    return out;
}

AnalysisResult analyzeProgression(const QString& progression) {
    return analyzeChords(music::parseProgression(progression));
}

} // namespace keysense::theory
