#include "keysense/theory/ChordInventory.h"
#include "keysense/theory/FunctionalHarmony.h"
#include "keysense/theory/InvalidKeyFilter.h"
#include "keysense/theory/KeyAnalyzer.h"
#include "keysense/theory/PatternDetectors.h"
#include "keysense/theory/ProgressionAnalyzer.h"
#include "music/ChordSymbol.h"
#include "music/Pitch.h"
#include "music/ScaleLibrary.h"

#include <QCoreApplication>
#include <QJsonArray>
#include <QtGlobal>

using keysense::theory::AnalysisResult;
using keysense::theory::ChordInventory;
using keysense::theory::KeyAnalyzer;
using music::ChordQuality;
using music::ChordSymbol;
using music::ScaleLibrary;

namespace {

static int g_failures = 0;

static void expect(bool cond, const QString& msg) {
    if (!cond) {
        ++g_failures;
        qWarning().noquote() << "FAIL:" << msg;
    }
}

static void expectEq(int a, int b, const QString& msg) {
    expect(a == b, msg + QString(" (got %1 expected %2)").arg(a).arg(b));
}

static void expectStrEq(const QString& a, const QString& b, const QString& msg) {
    expect(a == b, msg + QString(" (got '%1' expected '%2')").arg(a, b));
}

static ChordSymbol chord(const QString& text) {
    ChordSymbol c;
    const bool ok = music::parseChordSymbol(text, c);
    expect(ok, "parse " + text);
    return c;
}

static ChordInventory inventory(const QString& progression) {
    return ChordInventory(music::parseProgression(progression));
}

// Bonus a rule contributed to a key score, 0 if it did not fire.
static int ruleBonus(const keysense::theory::KeyScore& score, const QString& rule) {
    for (const auto& h : score.hits) {
        if (h.rule == rule) return h.bonus;
    }
    return 0;
}

// Checks key and the (numeral, function) of every entry.
static void expectAnalysis(const QString& progression, const QString& key,
                           const QStringList& numerals, const QStringList& functions) {
    const AnalysisResult r = keysense::theory::analyzeProgression(progression);
    expectStrEq(r.key, key, progression + ": key");
    expectEq(int(r.analysis.size()), int(numerals.size()), progression + ": entry count");
    if (r.analysis.size() != numerals.size()) return;
    for (int i = 0; i < numerals.size(); ++i) {
        expectStrEq(r.analysis[i].numeral, numerals[i], progression + QString(": numeral %1").arg(i));
        if (i < functions.size()) {
            expectStrEq(r.analysis[i].function, functions[i], progression + QString(": function %1").arg(i));
        }
    }
}

} // namespace

static void testPitch() {
    expectEq(music::noteIndex("C"), 0, "noteIndex C");
    expectEq(music::noteIndex("Db"), 1, "noteIndex Db");
    expectEq(music::noteIndex("C#"), 1, "noteIndex C#");
    expectEq(music::noteIndex("Bb"), 10, "noteIndex Bb");
    expectEq(music::noteIndex("B"), 11, "noteIndex B");
    expectEq(music::noteIndex("Cb"), -1, "Cb is not in the note table");
    expectEq(music::noteIndex("E#"), -1, "E# is not in the note table");
    expectEq(music::noteIndex(""), -1, "empty spelling");

    int pc = -1;
    expect(music::parsePitchClass(" Eb ", pc), "parsePitchClass trims");
    expectEq(pc, 3, "parsePitchClass Eb");
    expect(!music::parsePitchClass("H", pc), "parsePitchClass rejects H");

    expectEq(music::semitoneDistance("C", "G"), 7, "C -> G");
    expectEq(music::semitoneDistance("G", "C"), 5, "G -> C wraps");
    expectEq(music::semitoneDistance("C#", "Db"), 0, "enharmonic distance");
    expectEq(music::semitoneDistance("X", "C"), -1, "unknown spelling");

    expectStrEq(music::enharmonicTwin("C#"), "Db", "twin of C#");
    expectStrEq(music::enharmonicTwin("Bb"), "A#", "twin of Bb");
    expect(music::enharmonicTwin("C").isEmpty(), "white keys have no twin");

    expectStrEq(music::preferredKeySpelling(8), "Ab", "key 8 is Ab");
    expectStrEq(music::preferredKeySpelling(6), "Gb", "key 6 is Gb");
    expectStrEq(music::preferredKeySpelling(0), "C", "key 0 is C");
    expectStrEq(music::preferredKeySpelling("A#"), "Bb", "A# key shown as Bb");
    expectStrEq(music::preferredKeySpelling("D"), "D", "D key stays D");

    expect(music::isFlatKey(5), "F is a flat key");
    expect(music::isFlatKey(3), "Eb is a flat key");
    expect(!music::isFlatKey(7), "G is a sharp key");
}

static void testScales() {
    expectEq(int(ScaleLibrary::majorIntervals().size()), 7, "seven intervals");

    const auto& c = ScaleLibrary::major(0);
    expectStrEq(c.notes.join(" "), "C D E F G A B", "C major notes");

    const auto& g = ScaleLibrary::major(7);
    expectStrEq(g.notes.join(" "), "G A B C D E F#", "G major spelled with sharps");

    const auto* f = ScaleLibrary::major("F");
    expect(f != nullptr, "F major exists");
    if (f) expectStrEq(f->notes.join(" "), "F G A Bb C D E", "F major spelled with flats");

    const auto* bb = ScaleLibrary::major("Bb");
    const auto* as = ScaleLibrary::major("A#");
    expect(bb != nullptr && bb == as, "A# and Bb resolve to the same scale");
    if (bb) expectStrEq(bb->name, "Bb", "scale name uses the preferred spelling");

    expect(ScaleLibrary::major("Cb") == nullptr, "Cb has no scale");

    expectStrEq(ScaleLibrary::scaleDegree("F", 5), "A#", "F + 5 literal");
    expectStrEq(ScaleLibrary::scaleDegree("F", 5, f), "Bb", "F + 5 in F major uses the scale's spelling");
    expectStrEq(ScaleLibrary::scaleDegree("C", -1), "B", "negative transposition");
    expect(ScaleLibrary::scaleDegree("H", 2).isEmpty(), "unknown root");

    if (f) {
        expectEq(ScaleLibrary::positionInScale("Bb", *f), 3, "Bb is 4th of F");
        expectEq(ScaleLibrary::positionInScale("A#", *f), 3, "A# found through its twin");
    }
    expectEq(ScaleLibrary::positionInScale("Gb", c), -1, "Gb not in C");
    expectEq(ScaleLibrary::positionInScale(9, c), 5, "A is 6th of C");
    expectEq(ScaleLibrary::positionInScale(-1, c), -1, "unknown pitch class");

    expect(ScaleLibrary::diatonicQuality(0) == music::DegreeQuality::Major, "I is major");
    expect(ScaleLibrary::diatonicQuality(5) == music::DegreeQuality::Minor, "vi is minor");
    expect(ScaleLibrary::diatonicQuality(6) == music::DegreeQuality::Diminished, "vii is diminished");
}

static void testChordParsing() {
    {
        const ChordSymbol c = chord("Cmaj7");
        expect(c.quality == ChordQuality::Major, "Cmaj7 is major");
        expect(c.isSeventh && c.isMajorSeventh, "Cmaj7 is a major seventh");
    }
    {
        const ChordSymbol c = chord("CM7");
        expect(c.quality == ChordQuality::Major, "CM7 is major");
        expect(c.isMajorSeventh, "CM7 is a major seventh");
    }
    {
        const ChordSymbol c = chord("Dm7");
        expect(c.quality == ChordQuality::Minor && c.isMinor, "Dm7 is minor");
        expect(c.isSeventh && !c.isMajorSeventh, "Dm7 is a plain seventh");
        expectEq(c.rootPc, 2, "Dm7 root");
    }
    {
        const ChordSymbol c = chord("Bdim");
        expect(c.quality == ChordQuality::Diminished, "Bdim is diminished, not minor");
        expect(!c.isMinor, "Bdim minor flag unset");
    }
    {
        const ChordSymbol c = chord(QString("B") + QChar(0x00B0));
        expect(c.quality == ChordQuality::Diminished, "degree sign means diminished");
    }
    {
        const ChordSymbol c = chord("Caug");
        expect(c.quality == ChordQuality::Augmented, "Caug is augmented");
        expect(chord("C+").isAugmented, "C+ is augmented");
    }
    {
        const ChordSymbol c = chord("C#m");
        expectStrEq(c.root, "C#", "C#m root spelling");
        expectEq(c.rootPc, 1, "C#m root pc");
        expect(c.isMinor, "C#m is minor");
    }
    {
        const ChordSymbol c = chord(" C/E ");
        expectStrEq(c.originalText, "C/E", "token is trimmed");
        expectStrEq(c.bass, "E", "slash bass");
        expectEq(c.bassPc, 4, "slash bass pc");
        expect(c.isMajor(), "C/E is major");
    }
    {
        const ChordSymbol c = chord("Cb");
        expectEq(c.rootPc, -1, "Cb parses with an unknown root");
        expectEq(c.bassPc, -1, "no slash bass");
        const ChordSymbol slash = chord("Am/Fb");
        expectEq(slash.rootPc, 9, "Am/Fb root");
        expectEq(slash.bassPc, -1, "Fb bass is outside the note table");
    }

    ChordSymbol bad;
    expect(!music::parseChordSymbol("H", bad), "H is rejected");
    expect(!music::parseChordSymbol("C6/9", bad), "C6/9 is rejected");
    expect(!music::parseChordSymbol("", bad), "empty token is rejected");
    expect(!music::parseChordSymbol("am", bad), "lowercase root is rejected");

    const auto list = music::parseProgression("C, H, Am,, G7");
    expectEq(int(list.size()), 3, "bad tokens are dropped");
    if (list.size() == 3) {
        expectStrEq(list[0].originalText, "C", "progression order 0");
        expectStrEq(list[1].originalText, "Am", "progression order 1");
        expectStrEq(list[2].originalText, "G7", "progression order 2");
    }
}

static void testInventory() {
    const ChordInventory inv = inventory("C, Am, Bdim, Cb");
    expectEq(int(inv.chords().size()), 4, "inventory keeps every chord");
    expect(inv.hasMajor(0), "C major present");
    expect(inv.hasMinor(9), "A minor present");
    expect(!inv.hasMajor(9), "A major absent");
    expect(inv.hasNonMinor(11), "B diminished counts as non-minor");
    expect(!inv.hasMinor(-1) && !inv.hasNonMinor(-1), "unknown roots never match");
    expect(inv.hasMajor(12), "pitch classes are normalized");
    expect(ChordInventory().isEmpty(), "default inventory is empty");
}

static void testInvalidKeyFilter() {
    const auto d = keysense::theory::borrowedDegreesFor(0);
    expectEq(d.flatSecond, 1, "C bII");
    expectEq(d.flatThird, 3, "C bIII");
    expectEq(d.flatFifth, 6, "C bV");
    expectEq(d.flatSixth, 8, "C bVI");
    expectEq(d.flatSeventh, 10, "C bVII");

    QString reason;
    expect(!keysense::theory::isInvalidKey(0, inventory("C, F, G"), &reason), "C valid for C, F, G");
    expect(reason.isEmpty(), "no reason for a valid key");

    expect(keysense::theory::isInvalidKey(0, inventory("C, Dbm"), &reason), "minor bii invalidates C");
    expectStrEq(reason, "minor bii", "minor bii reason");

    expect(keysense::theory::isInvalidKey(0, inventory("C, F#m"), &reason), "minor bv invalidates C");
    expectStrEq(reason, "minor bv", "minor bv reason");

    expect(keysense::theory::isInvalidKey(0, inventory("A, Bb"), &reason), "VI with bVII invalidates C");
    expect(keysense::theory::isInvalidKey(0, inventory("A, Ab"), &reason), "VI with bVI invalidates C");
    expectStrEq(reason, "VI with bVI/bVII", "VI reason");

    expect(keysense::theory::isInvalidKey(0, inventory("Bb, Gm"), &reason), "bVII with minor v invalidates C");
    expectStrEq(reason, "bVII with minor v", "bVII reason");

    expect(!keysense::theory::isInvalidKey(0, inventory("C, Bb, G"), &reason), "bVII with major V is fine");
}

static void testPatternDetectors() {
    using namespace keysense::theory;

    {
        const auto r = detectRotation(inventory("F, Am"));
        expectEq(r.keyPc, 0, "F -> Am proposes C");
        expectEq(r.count, 1, "one rotation pair");
        expectEq(r.tally[0], 1, "tally for C");
    }
    {
        const auto r = detectRotation(inventory("F, Am, C, Em"));
        expectEq(r.keyPc, 0, "first proposal wins ties");
        expectEq(r.tally[7], 1, "C -> Em proposes G");
    }
    {
        const auto r = detectRotation(inventory("C, Em, Em"));
        expectEq(r.keyPc, 7, "repeated pairs are counted");
        expectEq(r.count, 2, "two rotation pairs");
    }
    expectEq(detectRotation(inventory("C, Dm")).keyPc, -1, "no rotation");

    expectEq(detectFourthPair(inventory("F, G")), 0, "F G -> C");
    expectEq(detectFourthPair(inventory("G, F")), 0, "G F -> C");
    expectEq(detectFourthPair(inventory("D, C")), 7, "D C -> G");
    expectEq(detectFourthPair(inventory("F, Gm")), -1, "minor chords do not pair");
    expectEq(detectFourthPair(inventory("F, G, Dbm")), -1, "invalid proposal skipped");

    expectEq(int(submediantShortcuts().size()), 2, "two VI* shortcuts");
    expectEq(detectBorrowedSubmediant(inventory("A, C, F")), 0, "A C F -> C");
    expectEq(detectBorrowedSubmediant(inventory("F, Ab, Db")), 8, "F Ab Db -> Ab");
    expectEq(detectBorrowedSubmediant(inventory("E, C, G")), 7, "E C G -> G by scan");
    expectEq(detectBorrowedSubmediant(inventory("F, G, D")), -1, "VI* needs the IV");
    expectEq(detectBorrowedSubmediant(inventory("A, C")), -1, "VI* with only the tonic is not enough");
    expectEq(detectBorrowedSubmediant(inventory("A, F, G")), 0, "VI* with IV and V");
    expectEq(detectBorrowedSubmediant(inventory("Am, C, F")), -1, "minor vi is not VI*");
}

static void testFunctionalHarmony() {
    using keysense::theory::analyzeChordInMajorKey;

    {
        const auto r = analyzeChordInMajorKey(0, chord("G7"));
        expectStrEq(r.roman, "V7", "G7 in C");
        expectStrEq(r.function, "Dominant", "V is Dominant");
        expect(r.diatonic, "G7 diatonic");
    }
    {
        const auto r = analyzeChordInMajorKey(0, chord(QString("Bdim")));
        expectStrEq(r.roman, QString("vii") + QChar(0x00B0), "Bdim in C");
        expectStrEq(r.function, "Leading Tone", "vii function");
        expect(r.diatonic, "Bdim diatonic");
    }
    {
        const auto r = analyzeChordInMajorKey(0, chord("Fm"));
        expectStrEq(r.roman, "iv*", "Fm in C");
        expectStrEq(r.function, "Minor Four", "minor iv function");
        expect(!r.diatonic, "Fm not diatonic");
    }
    {
        const auto r = analyzeChordInMajorKey(0, chord("E"));
        expectStrEq(r.roman, "III*", "E in C");
        expectStrEq(r.function, "Phrygian Dominant", "major III function");
    }
    {
        const auto r = analyzeChordInMajorKey(0, chord("D7"));
        expectStrEq(r.roman, "II7*", "D7 in C");
        expectStrEq(r.function, "V of V", "major II function");
    }
    {
        const auto r = analyzeChordInMajorKey(0, chord("Ab"));
        expectStrEq(r.roman, "bVI*", "Ab in C");
        expectStrEq(r.function, "Borrowed Chord", "bVI function");
        expect(!r.diatonic, "bVI not diatonic");
    }
    expectStrEq(analyzeChordInMajorKey(0, chord("Bb7")).roman, "bVII*", "borrowed label ignores the seventh");
    {
        const auto r = analyzeChordInMajorKey(0, chord("Eb"));
        expectStrEq(r.roman, "bIII*", "Eb in C");
        expectStrEq(r.function, "Borrowed Chord", "chromatic function");
    }
    expectStrEq(analyzeChordInMajorKey(0, chord("Bbm")).roman, "bvii*", "minor on bVII is chromatic");
    expectStrEq(analyzeChordInMajorKey(0, chord("Caug")).roman, "I+*", "augmented tonic");
    {
        const auto r = analyzeChordInMajorKey(0, chord("Cb"));
        expectStrEq(r.roman, "?", "unknown root numeral");
        expectStrEq(r.function, "Unknown", "unknown root function");
    }
    expectStrEq(analyzeChordInMajorKey(3, chord("Cm")).roman, "vi", "Cm in Eb");
    expectStrEq(keysense::theory::functionNameForPosition(5), "Submediant", "position 5 name");
}

static void testKeyAnalyzer() {
    const KeyAnalyzer analyzer;
    expectEq(int(analyzer.baseRules().size()), 7, "base rule count");
    expectEq(int(analyzer.patternRules().size()), 6, "pattern rule count");

    {
        const auto d = analyzer.analyze(music::parseProgression("Am, F, G"));
        expectEq(int(d.scores.size()), 12, "twelve key scores");
        expectEq(d.keyPc, 0, "Am F G -> C");
        expectEq(d.scores[0].total, 14, "C total");
        expectEq(d.scores[0].base, 8, "C base");
        expectEq(d.scores[5].total, 5, "F total");
        expectEq(d.scores[7].total, 5, "G total");
        expectEq(d.fourthPairKey, 0, "fourth pair proposal");
        expectEq(d.rotation.keyPc, 0, "rotation proposal");
        expectEq(d.submediantKey, -1, "no VI* proposal");
        expect(d.toText().contains("fourth pair +4"), "explain text lists rule hits");
        expect(d.toJsonObject().value("scores").toArray().size() == 12, "explain JSON has every key");
    }
    {
        const auto d = analyzer.analyze(music::parseProgression("C, Dbm"));
        expect(!d.scores[0].valid, "C invalid for C, Dbm");
        expectEq(d.scores[0].base, KeyAnalyzer::kInvalidKeyPenalty, "invalid base score");
        expect(d.key != "C", "invalid key is never chosen");
    }

    // One progression per weight, each checked on the C score.
    {
        const auto d = analyzer.analyze(music::parseProgression("C, E"));
        expectEq(ruleBonus(d.scores[0], "borrowed mediant"), 3, "C E: borrowed mediant");
        expectEq(ruleBonus(d.scores[0], "diatonic chords"), 2, "C E: only C is diatonic");
        expectEq(ruleBonus(d.scores[0], "major tonic"), 1, "C E: major tonic");
        expectEq(d.scores[0].total, 6, "C E: C total");
    }
    {
        const auto d = analyzer.analyze(music::parseProgression("C, Am, Ab"));
        expect(d.scores[0].valid, "C Am Ab: C valid");
        expectEq(ruleBonus(d.scores[0], "I + vi + bVI/bVII"), 4, "C Am Ab: borrowed flat six bonus");
        expectEq(ruleBonus(d.scores[0], "major submediant"), 0, "C Am Ab: vi is minor");
    }
    {
        const auto d = analyzer.analyze(music::parseProgression("F, Am, Am"));
        expectEq(d.rotation.keyPc, 0, "F Am Am: rotation proposes C");
        expectEq(d.rotation.count, 2, "F Am Am: both pairs counted");
        expectEq(ruleBonus(d.scores[0], "rotation tally"), 4, "F Am Am: tally x2");
        expectEq(ruleBonus(d.scores[0], "rotation best"), 2, "F Am Am: best with tally 2");
        expectEq(ruleBonus(d.scores[5], "rotation best"), 0, "F Am Am: best only for C");
    }
    {
        const auto d = analyzer.analyze(music::parseProgression("F, Am"));
        expectEq(ruleBonus(d.scores[0], "rotation best"), 0, "F Am: tally 1 gets no best bonus");
    }
    {
        const auto d = analyzer.analyze(music::parseProgression("C, G, Am, F"));
        expectEq(ruleBonus(d.scores[0], "I + IV + vi"), 12, "C G Am F: I IV vi");
        expectEq(ruleBonus(d.scores[0], "fourth pair"), 8, "C G Am F: fourth pair with tonic");
        expectEq(d.scores[0].total, 33, "C G Am F: C total");
    }
    {
        const auto d = analyzer.analyze(music::parseProgression("D, F, A"));
        expectEq(ruleBonus(d.scores[0], "tonicless II + IV + VI"), 10, "D F A: tonicless II IV VI");
        expectEq(ruleBonus(d.scores[0], "major submediant"), 2, "D F A: major submediant");
        expectEq(d.scores[0].total, 15, "D F A: C total");
        expectEq(ruleBonus(d.scores[5], "tonicless II + IV + VI"), 0, "D F A: not for F");
    }
    {
        const auto d = analyzer.analyze(music::parseProgression("A, C, F"));
        expectEq(ruleBonus(d.scores[0], "VI* pattern"), 10, "A C F: VI* bonus");
    }

    // Every key invalid: a minor chord on every root is a minor bii for every key.
    {
        const auto chords = music::parseProgression("Cm, C#m, Dm, D#m, Em, Fm, F#m, Gm, G#m, Am, A#m, Bm");
        const auto d = analyzer.analyze(chords);
        bool anyValid = false;
        for (const auto& s : d.scores) anyValid = anyValid || s.valid;
        expect(!anyValid, "all minors: every key invalid");
        expect(d.hasKey(), "all minors: still picks a key");
        expectEq(d.keyPc, 0, "all minors: first key in order");
        expectEq(d.scores[0].total, KeyAnalyzer::kInvalidKeyPenalty, "all minors: no pattern bonus");

        const AnalysisResult r = keysense::theory::analyzeChords(chords);
        expectStrEq(r.key, "C", "all minors: result key");
        expectEq(int(r.analysis.size()), 12, "all minors: every chord labelled");
    }
    {
        const auto d = analyzer.analyze({});
        expect(!d.hasKey(), "no chords, no key");
        expect(d.scores.isEmpty(), "no chords, no scores");
    }
}

static void testProgressions() {
    expectAnalysis("C, G, Am, F", "C",
                   {"I", "V", "vi", "IV"},
                   {"Tonic", "Dominant", "Submediant", "Subdominant"});

    expectAnalysis("Dm7, G7, Cmaj7", "C",
                   {"ii7", "V7", "Imaj7"},
                   {"Supertonic", "Dominant", "Tonic"});

    expectAnalysis("Am, F, G", "C",
                   {"vi", "IV", "V"}, {});

    expectAnalysis("Am, C, F", "C",
                   {"vi", "I", "IV"}, {});

    expectAnalysis("A, C, F", "C",
                   {"VI*", "I", "IV"},
                   {"Tierce de Picardie", "Tonic", "Subdominant"});

    expectAnalysis("F, G, D", "C",
                   {"IV", "V", "II*"},
                   {"Subdominant", "Dominant", "V of V"});

    expectAnalysis("D, F, A", "C",
                   {"II*", "IV", "VI*"},
                   {"V of V", "Subdominant", "Tierce de Picardie"});

    for (const auto& e : keysense::theory::analyzeProgression("C, G, Am, F").analysis) {
        expect(e.diatonic, "C G Am F: " + e.chord + " is diatonic");
    }
    {
        const AnalysisResult r = keysense::theory::analyzeProgression("A, C, F");
        expect(!r.analysis[0].diatonic, "VI* is not diatonic");
        expect(r.analysis[1].diatonic, "I is diatonic");
        expectEq(r.decision.scores[0].total, 18, "A C F: C total");
    }

    // Empty and unusable input
    {
        const AnalysisResult r = keysense::theory::analyzeProgression("");
        expect(!r.hasKey(), "empty input has no key");
        expect(r.analysis.isEmpty(), "empty input has no entries");
        expect(keysense::theory::analyzeProgression(" , H, X7").analysis.isEmpty(), "nothing parses");
    }
    {
        const AnalysisResult r = keysense::theory::analyzeProgression("Cb");
        expectStrEq(r.key, "C", "only unknown roots fall back to C");
        expectEq(int(r.analysis.size()), 1, "unknown root still gets an entry");
        if (!r.analysis.isEmpty()) expectStrEq(r.analysis[0].numeral, "?", "unknown root numeral");
    }

    // Spelling does not change the result
    {
        const AnalysisResult flats = keysense::theory::analyzeProgression("C, Db, Eb");
        const AnalysisResult sharps = keysense::theory::analyzeProgression("C, C#, D#");
        expectStrEq(flats.key, sharps.key, "enharmonic spellings pick the same key");
        expectEq(int(flats.analysis.size()), int(sharps.analysis.size()), "enharmonic entry count");
        for (int i = 0; i < flats.analysis.size() && i < sharps.analysis.size(); ++i) {
            expectStrEq(flats.analysis[i].numeral, sharps.analysis[i].numeral,
                        QString("enharmonic numeral %1").arg(i));
        }
        expectStrEq(sharps.analysis.value(1).chord, "C#", "original chord text kept");
    }

    // Same input, same output; order and length preserved
    {
        const QString p = "G, Em, C, D, Bm7, Am";
        const AnalysisResult a = keysense::theory::analyzeProgression(p);
        const AnalysisResult b = keysense::theory::analyzeProgression(p);
        expectStrEq(a.toJsonString(), b.toJsonString(), "analysis is deterministic");
        expectEq(int(a.analysis.size()), 6, "one entry per chord");
        const QStringList expectedOrder = {"G", "Em", "C", "D", "Bm7", "Am"};
        for (int i = 0; i < a.analysis.size() && i < expectedOrder.size(); ++i) {
            expectStrEq(a.analysis[i].chord, expectedOrder[i], QString("entry order %1").arg(i));
        }
    }
}

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);

    testPitch();
    testScales();
    testChordParsing();
    testInventory();
    testInvalidKeyFilter();
    testPatternDetectors();
    testFunctionalHarmony();
    testKeyAnalyzer();
    testProgressions();

    if (g_failures == 0) {
        qInfo("KeysenseCoreTests: PASS");
        return 0;
    }

    qWarning("KeysenseCoreTests: FAIL (%d failures)", g_failures);
    return 1;
}
