#include "music/Pitch.h"

namespace music {
namespace {

struct NoteEntry {
    const char* canonical;
    const char* alias; // nullptr for white keys
};

static const NoteEntry kNotes[12] = {
    {"C", nullptr}, {"C#", "Db"}, {"D", nullptr}, {"D#", "Eb"},
    {"E", nullptr}, {"F", nullptr}, {"F#", "Gb"}, {"G", nullptr},
    {"G#", "Ab"},   {"A", nullptr}, {"A#", "Bb"}, {"B", nullptr},
};

} // namespace

int noteIndex(const QString& spelling) {
    if (spelling.isEmpty()) return -1;
    for (int pc = 0; pc < 12; ++pc) {
        if (spelling == QLatin1String(kNotes[pc].canonical)) return pc;
        if (kNotes[pc].alias && spelling == QLatin1String(kNotes[pc].alias)) return pc;
    }
    return -1;
}

bool parsePitchClass(const QString& token, int& pcOut) {
    const int pc = noteIndex(token.trimmed());
    if (pc < 0) return false;
    pcOut = pc;
    return true;
}

int semitoneDistance(const QString& from, const QString& to) {
    const int a = noteIndex(from);
    const int b = noteIndex(to);
    if (a < 0 || b < 0) return -1;
    return (b - a + 12) % 12;
}

QString canonicalSpelling(int pc) {
    return QString::fromLatin1(kNotes[normalizePc(pc)].canonical);
}

QString aliasSpelling(int pc) {
    const char* a = kNotes[normalizePc(pc)].alias;
    return a ? QString::fromLatin1(a) : QString();
}

QString enharmonicTwin(const QString& spelling) {
    const int pc = noteIndex(spelling);
    if (pc < 0 || !kNotes[pc].alias) return {};
    return (spelling == QLatin1String(kNotes[pc].canonical)) ? aliasSpelling(pc) : canonicalSpelling(pc);
}

QString preferredKeySpelling(int pc) {
    pc = normalizePc(pc);
    return kNotes[pc].alias ? aliasSpelling(pc) : canonicalSpelling(pc);
}

QString preferredKeySpelling(const QString& spelling) {
    const int pc = noteIndex(spelling);
    if (pc < 0) return spelling;
    return preferredKeySpelling(pc);
}

bool isFlatKey(int tonicPc) {
    tonicPc = normalizePc(tonicPc);
    return tonicPc == 5 || kNotes[tonicPc].alias != nullptr;
}

QString spellPitchClass(int pc, bool preferFlats) {
    pc = normalizePc(pc);
    static const char* kSharps[12] = {"C","C#","D","D#","E","F","F#","G","G#","A","A#","B"};
    static const char* kFlats[12]  = {"C","Db","D","Eb","E","F","Gb","G","Ab","A","Bb","B"};
    return preferFlats ? QString::fromLatin1(kFlats[pc]) : QString::fromLatin1(kSharps[pc]);
}

} // namespace music
