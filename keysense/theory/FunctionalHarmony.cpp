#include "keysense/theory/FunctionalHarmony.h"

#include "keysense/theory/InvalidKeyFilter.h"
#include "music/Pitch.h"
#include "music/ScaleLibrary.h"

#include <QtGlobal>

namespace keysense::theory {
namespace {

static const QChar kDegreeSign(0x00B0); // °

static QString romanDegree(int position, bool uppercase) {
    static const char* romans[] = {"I","II","III","IV","V","VI","VII"};
    const QString r = QString::fromLatin1(romans[qBound(0, position, 6)]);
    return uppercase ? r : r.toLower();
}

// Applies the chord's quality to an uppercase numeral: lowercase for minor and
// diminished, ° for diminished, + for augmented, then the seventh suffix.
static QString decorate(const QString& upperNumeral, const music::ChordSymbol& chord) {
    QString out;
    switch (chord.quality) {
    case music::ChordQuality::Minor:
        out = upperNumeral.toLower();
        break;
    case music::ChordQuality::Diminished:
        out = upperNumeral.toLower() + kDegreeSign;
        break;
    case music::ChordQuality::Augmented:
        out = upperNumeral + '+';
        break;
    case music::ChordQuality::Major:
        out = upperNumeral;
        break;
    }
    if (chord.isSeventh) out += chord.isMajorSeventh ? "maj7" : "7";
    return out;
}

static QString functionForPosition(int position, const music::ChordSymbol& chord) {
    using music::ChordQuality;
    if (position == 1 && chord.quality == ChordQuality::Major) return "V of V";
    if (position == 2 && chord.quality == ChordQuality::Major) return "Phrygian Dominant";
    if (position == 3 && chord.quality == ChordQuality::Minor) return "Minor Four";
    if (position == 5 && chord.quality == ChordQuality::Major) return "Tierce de Picardie";
    return functionNameForPosition(position);
}

} // namespace

bool isDiatonicQuality(const music::ChordSymbol& chord, int position) {
    if (position < 0 || position > 6) return false;
    const auto expected = music::ScaleLibrary::diatonicQuality(position);
    switch (chord.quality) {
    case music::ChordQuality::Diminished: return expected == music::DegreeQuality::Diminished;
    case music::ChordQuality::Minor:      return expected == music::DegreeQuality::Minor;
    case music::ChordQuality::Major:      return expected == music::DegreeQuality::Major;
    case music::ChordQuality::Augmented:  return false;
    }
    return false;
}

QString functionNameForPosition(int position) {
    switch (position) {
    case 0: return "Tonic";
    case 1: return "Supertonic";
    case 2: return "Mediant";
    case 3: return "Subdominant";
    case 4: return "Dominant";
    case 5: return "Submediant";
    case 6: return "Leading Tone";
    default: return "Unknown";
    }
}

QString chromaticNumeral(int tonicPc, const music::ChordSymbol& chord) {
    if (chord.rootPc < 0) return "?";
    static const char* kIntervals[12] = {"I","bII","II","bIII","III","IV","bV","V","bVI","VI","bVII","VII"};
    const int semitones = music::normalizePc(chord.rootPc - tonicPc);
    return decorate(QString::fromLatin1(kIntervals[semitones]), chord) + '*';
}

HarmonyLabel analyzeChordInMajorKey(int tonicPc, const music::ChordSymbol& chord) {
    HarmonyLabel out;
    tonicPc = music::normalizePc(tonicPc);

    if (chord.rootPc < 0) {
        out.roman = "?";
        out.function = "Unknown";
        return out;
    }

    // Borrowed bVI / bVII from the parallel minor bypass the scale lookup.
    const BorrowedDegrees borrowed = borrowedDegreesFor(tonicPc);
    if (!chord.isMinor && (chord.rootPc == borrowed.flatSixth || chord.rootPc == borrowed.flatSeventh)) {
        out.roman = (chord.rootPc == borrowed.flatSixth) ? "bVI*" : "bVII*";
        out.function = "Borrowed Chord";
        return out;
    }

    const auto& scale = music::ScaleLibrary::major(tonicPc);
    const int pos = music::ScaleLibrary::positionInScale(chord.rootPc, scale);
    if (pos < 0) {
        out.roman = chromaticNumeral(tonicPc, chord);
        out.function = "Borrowed Chord";
        return out;
    }

    out.diatonic = isDiatonicQuality(chord, pos);
    out.roman = decorate(romanDegree(pos, true), chord);
    if (!out.diatonic) out.roman += '*';
    out.function = functionForPosition(pos, chord);
    return out;
}

} // namespace keysense::theory
