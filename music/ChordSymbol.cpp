#include "music/ChordSymbol.h"

#include "music/Pitch.h"

#include <QRegularExpression>
#include <QStringList>

namespace music {
namespace {

static const QChar kDegreeSign(0x00B0); // °

static void decideQuality(const QString& tail, ChordSymbol& out) {
    // "dim" contains an 'm', so diminished has to win over minor.
    if (tail.contains("dim") || tail.contains(kDegreeSign)) {
        out.isDiminished = true;
        out.quality = ChordQuality::Diminished;
    } else if (tail.contains("aug") || tail.contains('+')) {
        out.isAugmented = true;
        out.quality = ChordQuality::Augmented;
    } else if (tail.contains('m') && !tail.contains("maj")) {
        out.isMinor = true;
        out.quality = ChordQuality::Minor;
    } else {
        out.quality = ChordQuality::Major;
    }
}

} // namespace

bool parseChordSymbol(const QString& chordText, ChordSymbol& out) {
    out = ChordSymbol{};

    const QString s = chordText.trimmed();
    if (s.isEmpty()) return false;

    static const QRegularExpression re(R"(^([A-G][b#]?)([^/]*)(?:/([A-G][b#]?))?$)");
    const auto m = re.match(s);
    if (!m.hasMatch()) return false;

    out.originalText = s;
    out.root = m.captured(1);
    out.bass = m.captured(3);
    if (!parsePitchClass(out.root, out.rootPc)) out.rootPc = -1;
    if (!out.bass.isEmpty() && !parsePitchClass(out.bass, out.bassPc)) out.bassPc = -1;

    const QString tail = m.captured(2);
    decideQuality(tail, out);
    out.isSeventh = tail.contains('7');
    out.isMajorSeventh = tail.contains("maj7") || tail.contains("M7");
    return true;
}

QVector<ChordSymbol> parseProgression(const QString& progression) {
    QVector<ChordSymbol> out;
    const QStringList tokens = progression.split(',');
    for (const QString& token : tokens) {
        ChordSymbol c;
        if (parseChordSymbol(token, c)) out.push_back(c);
    }
    return out;
}

} // namespace music
