#include "keysense/theory/PatternDetectors.h"

#include "keysense/theory/InvalidKeyFilter.h"
#include "music/Pitch.h"
#include "music/ScaleLibrary.h"

namespace keysense::theory {
namespace {

static QVector<int> plainMajorRoots(const ChordInventory& chords) {
    QVector<int> out;
    for (const auto& c : chords.chords()) {
        if (c.rootPc >= 0 && c.isMajor()) out.push_back(c.rootPc);
    }
    return out;
}

} // namespace

RotationProposal detectRotation(const ChordInventory& chords) {
    RotationProposal out;
    QVector<int> firstSeen;

    const auto& list = chords.chords();
    for (int i = 0; i < list.size(); ++i) {
        const auto& a = list[i];
        if (a.rootPc < 0 || !a.isMajor()) continue;
        for (int j = 0; j < list.size(); ++j) {
            if (i == j) continue;
            const auto& b = list[j];
            if (b.rootPc < 0 || !b.isMinor) continue;
            if (music::normalizePc(b.rootPc - a.rootPc) != 4) continue;

            const int key = music::normalizePc(a.rootPc + 7);
            if (out.tally[size_t(key)]++ == 0) firstSeen.push_back(key);
        }
    }

    for (int key : firstSeen) {
        if (out.tally[size_t(key)] > out.count) {
            out.count = out.tally[size_t(key)];
            out.keyPc = key;
        }
    }
    return out;
}

int detectFourthPair(const ChordInventory& chords) {
    const QVector<int> majors = plainMajorRoots(chords);
    for (int i = 0; i < majors.size(); ++i) {
        for (int j = i + 1; j < majors.size(); ++j) {
            const int diff = music::normalizePc(majors[j] - majors[i]);
            int lower = -1;
            if (diff == 2) lower = majors[i];
            else if (diff == 10) lower = majors[j];
            else continue;

            const int key = music::normalizePc(lower - 5);
            if (isInvalidKey(key, chords)) continue;
            return key;
        }
    }
    return -1;
}

const QVector<SubmediantShortcut>& submediantShortcuts() {
    static const QVector<SubmediantShortcut> k = {
        {{"A", "C", "F"}, "C"},    // VI*, I, IV
        {{"F", "Ab", "Db"}, "Ab"}, // VI*, I, IV
    };
    return k;
}

int detectBorrowedSubmediant(const ChordInventory& chords) {
    for (const auto& shortcut : submediantShortcuts()) {
        bool all = true;
        for (const QString& root : shortcut.majorRoots) {
            if (!chords.hasMajor(music::noteIndex(root))) { all = false; break; }
        }
        if (!all) continue;
        const int key = music::noteIndex(shortcut.key);
        if (!isInvalidKey(key, chords)) return key;
    }

    for (int key = 0; key < 12; ++key) {
        if (isInvalidKey(key, chords)) continue;
        const auto& pcs = music::ScaleLibrary::major(key).pcs;
        // Accepted: VI + IV + I, or VI + IV + V. VI + I alone is not enough.
        if (!chords.hasMajor(pcs[5])) continue;
        if (!chords.hasMajor(pcs[3])) continue;
        if (chords.hasMajor(pcs[0]) || chords.hasMajor(pcs[4])) return key;
    }
    return -1;
}

} // namespace keysense::theory
