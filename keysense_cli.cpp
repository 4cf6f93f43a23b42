#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QSettings>
#include <QTextStream>

#include "ExampleLoader.h"
#include "keysense/midi/ExportProfile.h"
#include "keysense/midi/MidiExporter.h"
#include "keysense/theory/ProgressionAnalyzer.h"

using keysense::theory::AnalysisResult;

namespace {

static void printResult(QTextStream& out, const AnalysisResult& r, bool json, bool explain) {
    if (json) {
        out << r.toJsonString(/*compact=*/false);
    } else {
        out << "Key: " << (r.hasKey() ? r.key : QString("Unknown")) << "\n";
        for (const auto& e : r.analysis) {
            const QString line = QString("%1 %2 %3 %4")
                                     .arg(e.chord, -8)
                                     .arg(e.numeral, -8)
                                     .arg(e.function, -22)
                                     .arg(e.diatonic ? QString() : QString("*"));
            out << "  " << line.trimmed() << "\n";
        }
    }
    if (explain) {
        const QString table = r.decision.toText();
        out << table;
        if (!table.endsWith('\n')) out << "\n";
    }
}

static bool parseIntOption(const QCommandLineParser& parser, const QString& name, int& out) {
    if (!parser.isSet(name)) return true;
    bool ok = false;
    const int v = parser.value(name).toInt(&ok);
    if (!ok) return false;
    out = v;
    return true;
}

static int runExamples(QTextStream& out) {
    ExampleLoader loader;
    const ExampleLibrary lib = loader.loadExamples(":/examples.xml");
    if (!lib.isValid) {
        qWarning() << "Embedded examples could not be loaded.";
        return 1;
    }
    int matched = 0;
    for (const auto& ex : lib.examples) {
        const AnalysisResult r = keysense::theory::analyzeProgression(ex.chords);
        const QString detected = r.hasKey() ? r.key : QString("Unknown");
        const bool ok = (detected == ex.expectedKey);
        if (ok) ++matched;
        out << QString("%1 %2 detected %3, expected %4")
                   .arg(QString(ok ? "ok  " : "diff"))
                   .arg(ex.name, -36)
                   .arg(detected, -3)
                   .arg(ex.expectedKey)
            << "\n";
    }
    out << QString("%1/%2 examples match their expected key").arg(matched).arg(lib.examples.size()) << "\n";
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("Keysense");
    QCoreApplication::setApplicationName("keysense-cli");

    QCommandLineParser parser;
    parser.setApplicationDescription("Detects the major key of a chord progression and labels each chord.");
    parser.addHelpOption();
    parser.addPositionalArgument("progression", "Comma-separated chords, e.g. \"C, G, Am, F\". Read from stdin when omitted.",
                                 "[progression...]");
    parser.addOption({"json", "Print the analysis as JSON."});
    parser.addOption({"explain", "Print the per-key score table."});
    parser.addOption({"midi", "Write the last progression to a MIDI file.", "file"});
    parser.addOption({"tempo", "MIDI export tempo in BPM.", "bpm"});
    parser.addOption({"ticks-per-chord", "MIDI export length of each chord in ticks.", "ticks"});
    parser.addOption({"velocity", "MIDI export note velocity.", "1-127"});
    parser.addOption({"examples", "Analyze the built-in examples and compare with their expected keys."});
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    if (parser.isSet("examples")) {
        const int rc = runExamples(out);
        out.flush();
        return rc;
    }

    QStringList progressions = parser.positionalArguments();
    if (progressions.isEmpty()) {
        QTextStream in(stdin);
        QString line;
        while (in.readLineInto(&line)) {
            if (!line.trimmed().isEmpty()) progressions.push_back(line);
        }
    }

    const bool json = parser.isSet("json");
    const bool explain = parser.isSet("explain");

    AnalysisResult last;
    for (const QString& p : progressions) {
        last = keysense::theory::analyzeProgression(p);
        printResult(out, last, json, explain);
    }
    out.flush();

    if (parser.isSet("midi")) {
        QSettings settings("Keysense", "Keysense");
        keysense::midi::ExportProfile profile = keysense::midi::loadExportProfile(settings, "midiExport");
        if (!parseIntOption(parser, "tempo", profile.tempoBpm)
            || !parseIntOption(parser, "ticks-per-chord", profile.ticksPerChord)
            || !parseIntOption(parser, "velocity", profile.velocity)) {
            err << "Invalid numeric value for a MIDI export option.\n";
            return 1;
        }
        profile.tempoBpm = qBound(20, profile.tempoBpm, 300);
        profile.ticksPerChord = qBound(1, profile.ticksPerChord, 0x0FFFFFFF);
        profile.velocity = qBound(1, profile.velocity, 127);

        const QString path = parser.value("midi");
        if (!keysense::midi::writeProgressionMidi(path, keysense::midi::chordsForExport(last), profile)) {
            err << "MIDI export failed: " << path << "\n";
            return 1;
        }
        err << "Wrote " << path << "\n";
    }

    return 0;
}
