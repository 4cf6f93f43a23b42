#pragma once

#include <QByteArray>
#include <QString>
#include <QVector>

#include "keysense/midi/ExportProfile.h"
#include "music/ChordSymbol.h"

namespace keysense::theory {
struct AnalysisResult;
}

namespace keysense::midi {

/**
 * Block-chord voicing used by the export: root in rootOctave, the fifth above it,
 * and the third an octave higher (a tenth above the root). Fifth and third move
 * up an octave when their pitch class is not above the root's. Minor and
 * diminished chords get a minor third. Empty if the root spelling is unknown.
 */
QVector<int> voiceChord(const music::ChordSymbol& chord, int rootOctave);

// Re-parses the original symbols of an analysis (the export does not use numerals).
QVector<music::ChordSymbol> chordsForExport(const theory::AnalysisResult& result);

// "progression-in-Bflat.mid"; an empty key exports as C.
QString suggestedFileName(const QString& key);

// Largest tick a delta time can encode (four variable-length bytes).
static constexpr quint32 kMaxTrackTicks = 0x0FFFFFFF;

// True if every voiced chord ends at or before kMaxTrackTicks.
bool fitsMidiTimeline(const QVector<music::ChordSymbol>& chords, const ExportProfile& profile);

// Standard MIDI File, format 0: tempo, track name and program change at tick 0,
// then one block chord of ticksPerChord per voiced chord. Chords that would end
// past kMaxTrackTicks are left out.
QByteArray buildProgressionMidi(const QVector<music::ChordSymbol>& chords, const ExportProfile& profile);

// Writes buildProgressionMidi() to path. Returns false (and logs) on I/O failure
// or when the progression does not fit the MIDI timeline.
bool writeProgressionMidi(const QString& path,
                          const QVector<music::ChordSymbol>& chords,
                          const ExportProfile& profile);

} // namespace keysense::midi
