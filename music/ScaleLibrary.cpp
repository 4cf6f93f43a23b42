#include "music/ScaleLibrary.h"

#include "music/Pitch.h"

#include <QHash>

namespace music {
namespace {

struct ScaleTable {
    QVector<MajorScale> byTonic;
    QHash<QString, int> tonicBySpelling;
};

static MajorScale make(int tonicPc) {
    MajorScale s;
    s.tonicPc = tonicPc;
    s.name = preferredKeySpelling(tonicPc);
    const bool flats = isFlatKey(tonicPc);
    for (int iv : ScaleLibrary::majorIntervals()) {
        const int pc = normalizePc(tonicPc + iv);
        s.pcs.push_back(pc);
        s.notes << spellPitchClass(pc, flats);
    }
    return s;
}

static const ScaleTable& table() {
    static const ScaleTable k = [] {
        ScaleTable t;
        for (int pc = 0; pc < 12; ++pc) {
            t.byTonic.push_back(make(pc));
            t.tonicBySpelling.insert(canonicalSpelling(pc), pc);
            const QString alias = aliasSpelling(pc);
            if (!alias.isEmpty()) t.tonicBySpelling.insert(alias, pc);
        }
        return t;
    }();
    return k;
}

} // namespace

const QVector<int>& ScaleLibrary::majorIntervals() {
    static const QVector<int> k = {0, 2, 4, 5, 7, 9, 11};
    return k;
}

const MajorScale& ScaleLibrary::major(int tonicPc) {
    return table().byTonic[normalizePc(tonicPc)];
}

const MajorScale* ScaleLibrary::major(const QString& keySpelling) {
    const auto& t = table();
    const auto it = t.tonicBySpelling.constFind(keySpelling);
    if (it == t.tonicBySpelling.constEnd()) return nullptr;
    return &t.byTonic[it.value()];
}

QString ScaleLibrary::scaleDegree(const QString& root, int semitones, const MajorScale* target) {
    const int rootPc = noteIndex(root);
    if (rootPc < 0) return {};
    const QString literal = canonicalSpelling(rootPc + normalizePc(semitones));
    if (target) {
        const QString twin = enharmonicTwin(literal);
        if (!twin.isEmpty() && target->notes.contains(twin)) return twin;
    }
    return literal;
}

int ScaleLibrary::positionInScale(const QString& note, const MajorScale& scale) {
    const int direct = scale.notes.indexOf(note);
    if (direct >= 0) return direct;
    const QString twin = enharmonicTwin(note);
    if (!twin.isEmpty()) return scale.notes.indexOf(twin);
    return -1;
}

int ScaleLibrary::positionInScale(int pc, const MajorScale& scale) {
    if (pc < 0) return -1;
    return scale.pcs.indexOf(normalizePc(pc));
}

DegreeQuality ScaleLibrary::diatonicQuality(int position) {
    switch (position) {
    case 0: case 3: case 4: return DegreeQuality::Major;
    case 6: return DegreeQuality::Diminished;
    default: return DegreeQuality::Minor;
    }
}

} // namespace music
