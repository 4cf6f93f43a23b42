#include "keysense/midi/MidiExporter.h"

#include "keysense/theory/ProgressionAnalyzer.h"
#include "music/Pitch.h"

#include <QDebug>
#include <QFile>

#include <algorithm>

namespace keysense::midi {
namespace {

static constexpr quint32 kMicrosecondsPerMinute = 60000000;

// Pending channel event, sorted by tick before delta times are written.
struct WriteEvent {
    quint32 tick = 0;
    quint8 status = 0;
    quint8 data1 = 0;
    quint8 data2 = 0;
    int priority = 0; // note-off (0) before note-on (1) at the same tick
};

static void writeVariableLength(QByteArray& buf, quint32 value) {
    quint8 bytes[4];
    int n = 0;
    bytes[n++] = quint8(value & 0x7F);
    while ((value >>= 7) != 0 && n < 4) {
        bytes[n++] = quint8((value & 0x7F) | 0x80);
    }
    while (n > 0) buf.append(char(bytes[--n]));
}

static void writeBE16(QByteArray& buf, quint16 value) {
    buf.append(char((value >> 8) & 0xFF));
    buf.append(char(value & 0xFF));
}

static void writeBE32(QByteArray& buf, quint32 value) {
    buf.append(char((value >> 24) & 0xFF));
    buf.append(char((value >> 16) & 0xFF));
    buf.append(char((value >> 8) & 0xFF));
    buf.append(char(value & 0xFF));
}

static void writeMetaText(QByteArray& buf, quint8 type, const QByteArray& text) {
    writeVariableLength(buf, 0);
    buf.append(char(0xFF));
    buf.append(char(type));
    writeVariableLength(buf, quint32(text.size()));
    buf.append(text);
}

} // namespace

QVector<int> voiceChord(const music::ChordSymbol& chord, int rootOctave) {
    if (chord.rootPc < 0) return {};
    const int r = chord.rootPc;
    const bool minorThird = chord.isMinor || chord.isDiminished;

    const int fifthPc = music::normalizePc(r + 7);
    const int thirdPc = music::normalizePc(r + (minorThird ? 3 : 4));

    const int root = 12 * (rootOctave + 1) + r;
    const int fifth = 12 * (rootOctave + 1 + (fifthPc <= r ? 1 : 0)) + fifthPc;
    const int third = 12 * (rootOctave + 2 + (thirdPc <= r ? 1 : 0)) + thirdPc;

    QVector<int> out = {root, fifth, third};
    for (int& n : out) n = std::max(0, std::min(127, n));
    return out;
}

QVector<music::ChordSymbol> chordsForExport(const theory::AnalysisResult& result) {
    QVector<music::ChordSymbol> out;
    for (const auto& entry : result.analysis) {
        music::ChordSymbol c;
        if (music::parseChordSymbol(entry.chord, c)) out.push_back(c);
    }
    return out;
}

QString suggestedFileName(const QString& key) {
    QString k = key.isEmpty() ? QString("C") : key;
    const int sharp = k.indexOf('#');
    if (sharp >= 0) k.replace(sharp, 1, "sharp");
    const int flat = k.indexOf('b');
    if (flat >= 0) k.replace(flat, 1, "flat");
    return "progression-in-" + k + ".mid";
}

bool fitsMidiTimeline(const QVector<music::ChordSymbol>& chords, const ExportProfile& profile) {
    quint64 voiced = 0;
    for (const auto& chord : chords) {
        if (chord.rootPc >= 0) ++voiced;
    }
    const quint64 duration = quint64(std::max(1, profile.ticksPerChord));
    return voiced * duration <= kMaxTrackTicks;
}

QByteArray buildProgressionMidi(const QVector<music::ChordSymbol>& chords, const ExportProfile& profile) {
    const quint8 channel = quint8((profile.midiChannel - 1) & 0x0F);

    QByteArray track;

    // Tempo
    const quint32 usPerBeat = kMicrosecondsPerMinute / quint32(std::max(1, profile.tempoBpm));
    writeVariableLength(track, 0);
    track.append(char(0xFF));
    track.append(char(0x51));
    track.append(char(0x03));
    track.append(char((usPerBeat >> 16) & 0xFF));
    track.append(char((usPerBeat >> 8) & 0xFF));
    track.append(char(usPerBeat & 0xFF));

    writeMetaText(track, 0x03, QByteArray("Keysense"));

    writeVariableLength(track, 0);
    track.append(char(0xC0 | channel));
    track.append(char((profile.program - 1) & 0x7F));

    QVector<WriteEvent> events;
    quint32 tick = 0;
    const quint32 duration = quint32(std::max(1, profile.ticksPerChord));
    for (const auto& chord : chords) {
        const QVector<int> notes = voiceChord(chord, profile.rootOctave);
        if (notes.isEmpty()) continue;
        if (quint64(tick) + duration > kMaxTrackTicks) break;
        for (int n : notes) {
            events.push_back({tick, quint8(0x90 | channel), quint8(n), quint8(profile.velocity & 0x7F), 1});
            events.push_back({tick + duration, quint8(0x80 | channel), quint8(n), 0, 0});
        }
        tick += duration;
    }

    std::stable_sort(events.begin(), events.end(), [](const WriteEvent& a, const WriteEvent& b) {
        if (a.tick != b.tick) return a.tick < b.tick;
        return a.priority < b.priority;
    });

    quint32 prevTick = 0;
    for (const auto& e : events) {
        writeVariableLength(track, e.tick - prevTick);
        track.append(char(e.status));
        track.append(char(e.data1 & 0x7F));
        track.append(char(e.data2 & 0x7F));
        prevTick = e.tick;
    }

    // End of track
    writeVariableLength(track, 0);
    track.append(char(0xFF));
    track.append(char(0x2F));
    track.append(char(0x00));

    QByteArray out;
    out.append("MThd", 4);
    writeBE32(out, 6);
    writeBE16(out, 0); // format 0
    writeBE16(out, 1); // one track
    writeBE16(out, quint16(profile.ticksPerBeat));
    out.append("MTrk", 4);
    writeBE32(out, quint32(track.size()));
    out.append(track);
    return out;
}

bool writeProgressionMidi(const QString& path,
                          const QVector<music::ChordSymbol>& chords,
                          const ExportProfile& profile) {
    if (!fitsMidiTimeline(chords, profile)) {
        qWarning() << "Progression too long for a MIDI track:" << chords.size() << "chords of"
                   << profile.ticksPerChord << "ticks";
        return false;
    }
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qWarning() << "Could not open MIDI file for writing:" << path << file.errorString();
        return false;
    }
    const QByteArray bytes = buildProgressionMidi(chords, profile);
    if (file.write(bytes) != bytes.size()) {
        qWarning() << "Short write to MIDI file:" << path << file.errorString();
        return false;
    }
    return true;
}

} // namespace keysense::midi
