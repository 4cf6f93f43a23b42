#include "keysense/theory/KeyAnalyzer.h"

#include "keysense/theory/FunctionalHarmony.h"
#include "keysense/theory/InvalidKeyFilter.h"
#include "music/Pitch.h"
#include "music/ScaleLibrary.h"

#include <QDebug>
#include <QJsonArray>
#include <QStringList>

namespace keysense::theory {
namespace {

static const QVector<int>& pcsOf(int keyPc) {
    return music::ScaleLibrary::major(keyPc).pcs;
}

static QString keyLabel(int pc) {
    return (pc < 0) ? QString("-") : music::preferredKeySpelling(pc);
}

static QVector<ScoringRule> makeBaseRules() {
    QVector<ScoringRule> rules;

    // +2 per chord sitting on a scale position with the expected quality.
    rules.push_back({"diatonic chords", [](int key, const ScoringContext& ctx) {
        const auto& scale = music::ScaleLibrary::major(key);
        int points = 0;
        for (const auto& c : ctx.chords.chords()) {
            const int pos = music::ScaleLibrary::positionInScale(c.rootPc, scale);
            if (pos >= 0 && isDiatonicQuality(c, pos)) points += 2;
        }
        return points;
    }});
    rules.push_back({"major tonic", [](int key, const ScoringContext& ctx) {
        return ctx.chords.hasMajor(pcsOf(key)[0]) ? 1 : 0;
    }});
    rules.push_back({"major subdominant", [](int key, const ScoringContext& ctx) {
        return ctx.chords.hasMajor(pcsOf(key)[3]) ? 1 : 0;
    }});
    rules.push_back({"major dominant", [](int key, const ScoringContext& ctx) {
        return ctx.chords.hasMajor(pcsOf(key)[4]) ? 1 : 0;
    }});
    rules.push_back({"borrowed mediant", [](int key, const ScoringContext& ctx) {
        return ctx.chords.hasMajor(pcsOf(key)[2]) ? 3 : 0;
    }});
    rules.push_back({"major submediant", [](int key, const ScoringContext& ctx) {
        return ctx.chords.hasMajor(pcsOf(key)[5]) ? 2 : 0;
    }});
    rules.push_back({"I + vi + bVI/bVII", [](int key, const ScoringContext& ctx) {
        const auto& pcs = pcsOf(key);
        const BorrowedDegrees d = borrowedDegreesFor(key);
        const bool borrowed = ctx.chords.hasNonMinor(d.flatSixth) || ctx.chords.hasNonMinor(d.flatSeventh);
        return (ctx.chords.hasMajor(pcs[0]) && ctx.chords.hasMinor(pcs[5]) && borrowed) ? 4 : 0;
    }});
    return rules;
}

static QVector<ScoringRule> makePatternRules() {
    QVector<ScoringRule> rules;

    rules.push_back({"VI* pattern", [](int key, const ScoringContext& ctx) {
        return (key == ctx.submediantKey) ? 10 : 0;
    }});
    rules.push_back({"fourth pair", [](int key, const ScoringContext& ctx) {
        if (key != ctx.fourthPairKey) return 0;
        return ctx.chords.hasMajor(key) ? 8 : 4;
    }});
    rules.push_back({"rotation tally", [](int key, const ScoringContext& ctx) {
        return ctx.rotation.tally[size_t(key)] * 2;
    }});
    rules.push_back({"rotation best", [](int key, const ScoringContext& ctx) {
        return (key == ctx.rotation.keyPc && ctx.rotation.count >= 2) ? 2 : 0;
    }});
    rules.push_back({"I + IV + vi", [](int key, const ScoringContext& ctx) {
        const auto& pcs = pcsOf(key);
        const bool all = ctx.chords.hasMinor(pcs[5]) && ctx.chords.hasMajor(pcs[0]) && ctx.chords.hasMajor(pcs[3]);
        return all ? 12 : 0;
    }});
    rules.push_back({"tonicless II + IV + VI", [](int key, const ScoringContext& ctx) {
        const auto& pcs = pcsOf(key);
        if (ctx.chords.hasMajor(pcs[0])) return 0;
        const bool all = ctx.chords.hasMajor(pcs[5]) && ctx.chords.hasMajor(pcs[3]) && ctx.chords.hasMajor(pcs[1]);
        return all ? 10 : 0;
    }});
    return rules;
}

} // namespace

KeyAnalyzer::KeyAnalyzer()
    : m_baseRules(makeBaseRules())
    , m_patternRules(makePatternRules()) {
}

KeyScore KeyAnalyzer::scoreKey(int keyPc, const ScoringContext& ctx) const {
    KeyScore s;
    s.keyPc = keyPc;
    s.key = music::preferredKeySpelling(keyPc);
    s.valid = !isInvalidKey(keyPc, ctx.chords, &s.invalidReason);

    if (!s.valid) {
        s.base = kInvalidKeyPenalty;
        s.hits.push_back({"invalid key (" + s.invalidReason + ")", kInvalidKeyPenalty});
    } else {
        for (const auto& rule : m_baseRules) {
            const int b = rule.bonus(keyPc, ctx);
            if (b == 0) continue;
            s.base += b;
            s.hits.push_back({rule.name, b});
        }
    }

    s.total = s.base;
    for (const auto& rule : m_patternRules) {
        const int b = rule.bonus(keyPc, ctx);
        if (b == 0) continue;
        s.total += b;
        s.hits.push_back({rule.name, b});
    }
    return s;
}

int KeyAnalyzer::chooseKey(const QVector<KeyScore>& scores) {
    int best = -1;
    for (int i = 0; i < scores.size(); ++i) {
        if (best < 0 || scores[i].total > scores[best].total) best = i;
    }
    if (best < 0 || scores[best].valid) return best;

    int bestValid = -1;
    for (int i = 0; i < scores.size(); ++i) {
        if (!scores[i].valid) continue;
        if (bestValid < 0 || scores[i].total > scores[bestValid].total) bestValid = i;
    }
    return (bestValid >= 0) ? bestValid : best;
}

KeyDecision KeyAnalyzer::analyze(const QVector<music::ChordSymbol>& chords) const {
    KeyDecision out;
    if (chords.isEmpty()) return out;

    const ChordInventory inventory(chords);
    out.submediantKey = detectBorrowedSubmediant(inventory);
    out.fourthPairKey = detectFourthPair(inventory);
    out.rotation = detectRotation(inventory);

    const ScoringContext ctx{inventory, out.submediantKey, out.fourthPairKey, out.rotation};
    for (int key = 0; key < 12; ++key) out.scores.push_back(scoreKey(key, ctx));

    const int chosen = chooseKey(out.scores);
    out.keyPc = out.scores[chosen].keyPc;
    out.key = out.scores[chosen].key;

    qDebug().noquote() << "KeyAnalyzer: VI*=" << keyLabel(out.submediantKey)
                       << "fourthPair=" << keyLabel(out.fourthPairKey)
                       << "rotation=" << keyLabel(out.rotation.keyPc) << "x" << out.rotation.count
                       << "-> key" << out.key;
    qDebug().noquote() << out.toText();
    return out;
}

QString KeyDecision::toText() const {
    QStringList lines;
    lines << QString("VI* pattern: %1, fourth pair: %2, rotation: %3 (x%4)")
                 .arg(keyLabel(submediantKey), keyLabel(fourthPairKey), keyLabel(rotation.keyPc))
                 .arg(rotation.count);
    for (const auto& s : scores) {
        QStringList parts;
        for (const auto& h : s.hits) parts << QString("%1 %2%3").arg(h.rule, QString(h.bonus >= 0 ? "+" : "")).arg(h.bonus);
        lines << QString("%1 %2 %3  %4")
                     .arg(QString(s.keyPc == keyPc ? ">" : " "))
                     .arg(s.key, -3)
                     .arg(s.total, 6)
                     .arg(parts.join(", "));
    }
    return lines.join('\n');
}

QJsonObject KeyDecision::toJsonObject() const {
    QJsonObject o;
    o.insert("key", hasKey() ? QJsonValue(key) : QJsonValue(QJsonValue::Null));
    if (submediantKey >= 0) o.insert("submediant_key", keyLabel(submediantKey));
    if (fourthPairKey >= 0) o.insert("fourth_pair_key", keyLabel(fourthPairKey));
    if (rotation.keyPc >= 0) {
        o.insert("rotation_key", keyLabel(rotation.keyPc));
        o.insert("rotation_count", rotation.count);
    }

    QJsonArray arr;
    for (const auto& s : scores) {
        QJsonObject so;
        so.insert("key", s.key);
        so.insert("valid", s.valid);
        if (!s.valid) so.insert("invalid_reason", s.invalidReason);
        so.insert("base", s.base);
        so.insert("total", s.total);
        QJsonArray hits;
        for (const auto& h : s.hits) {
            QJsonObject ho;
            ho.insert("rule", h.rule);
            ho.insert("bonus", h.bonus);
            hits.push_back(ho);
        }
        so.insert("rules", hits);
        arr.push_back(so);
    }
    o.insert("scores", arr);
    return o;
}

} // namespace keysense::theory
