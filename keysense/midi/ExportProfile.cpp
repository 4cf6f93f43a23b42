#include "keysense/midi/ExportProfile.h"

#include <QSettings>
#include <algorithm>

namespace keysense::midi {
namespace {

static int clampInt(int v, int lo, int hi) { return std::max(lo, std::min(hi, v)); }
static int readInt(QSettings& s, const QString& k, int def) { return s.value(k, def).toInt(); }

} // namespace

ExportProfile defaultExportProfile() {
    return ExportProfile{};
}

ExportProfile loadExportProfile(QSettings& settings, const QString& prefix) {
    ExportProfile p = defaultExportProfile();
    const QString base = prefix;

    p.version = readInt(settings, base + "/version", p.version);

    p.tempoBpm = clampInt(readInt(settings, base + "/tempoBpm", p.tempoBpm), 20, 300);
    p.ticksPerBeat = clampInt(readInt(settings, base + "/ticksPerBeat", p.ticksPerBeat), 24, 960);
    p.ticksPerChord = clampInt(readInt(settings, base + "/ticksPerChord", p.ticksPerChord), 1, 0x0FFFFFFF);

    p.velocity = clampInt(readInt(settings, base + "/velocity", p.velocity), 1, 127);
    p.midiChannel = clampInt(readInt(settings, base + "/midiChannel", p.midiChannel), 1, 16);
    p.program = clampInt(readInt(settings, base + "/program", p.program), 1, 128);

    // Keep root + tenth (+28 semitones at most) inside the MIDI range.
    p.rootOctave = clampInt(readInt(settings, base + "/rootOctave", p.rootOctave), -1, 6);

    return p;
}

void saveExportProfile(QSettings& settings, const QString& prefix, const ExportProfile& p) {
    const QString base = prefix;

    settings.setValue(base + "/version", p.version);

    settings.setValue(base + "/tempoBpm", p.tempoBpm);
    settings.setValue(base + "/ticksPerBeat", p.ticksPerBeat);
    settings.setValue(base + "/ticksPerChord", p.ticksPerChord);

    settings.setValue(base + "/velocity", p.velocity);
    settings.setValue(base + "/midiChannel", p.midiChannel);
    settings.setValue(base + "/program", p.program);

    settings.setValue(base + "/rootOctave", p.rootOctave);
}

} // namespace keysense::midi
