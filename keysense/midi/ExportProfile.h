#pragma once

#include <QString>

class QSettings;

namespace keysense::midi {

// MIDI export configuration. Versioned and persisted via QSettings.
struct ExportProfile {
    int version = 1;

    int tempoBpm = 120;
    int ticksPerBeat = 128;   // division written to the file header
    int ticksPerChord = 512;  // one 4/4 bar at the default division

    int velocity = 90;
    int midiChannel = 1;      // 1..16
    int program = 1;          // General MIDI program 1..128 (1 = Acoustic Grand)

    int rootOctave = 2;       // octave of the chord root; C2 = MIDI 36
};

ExportProfile defaultExportProfile();

// Reads <prefix>/... keys, falling back to defaults and clamping to valid MIDI ranges.
ExportProfile loadExportProfile(QSettings& settings, const QString& prefix);
void saveExportProfile(QSettings& settings, const QString& prefix, const ExportProfile& p);

} // namespace keysense::midi
