#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QString>

#include <csignal>
#include <vector>

#include "audio/AudioOutput.h"
#include "audio/StdoutSink.h"
#include "blip/core.h"
#include "blip/scheduler.h"
#include "log/Logging.h"
#include "models/ProgramDocument.h"
#include "settings/AppSettings.h"

namespace {
constexpr int kExitOk = 0;
constexpr int kExitLoadFailed = 1;
constexpr int kExitIoFailed = 2;

void report_load_errors(const std::vector<blip::LoadError>& errors) {
    for (const blip::LoadError& e : errors) {
        qCCritical(lcLoad).noquote() << ProgramDocument::format_error(e);
    }
    qCCritical(lcLoad).noquote()
        << QString("aborting due to %1 previous error%2")
               .arg(errors.size())
               .arg(errors.size() == 1 ? QString() : QStringLiteral("s"));
}

void report_stats(const blip::RunStats& stats, int sample_rate) {
    qCDebug(lcApp).noquote()
        << QString("%1 samples (%2 s), stopped: %3, peak threads %4, spawned %5, clipped %6, peak %7")
               .arg(stats.samples)
               .arg(static_cast<double>(stats.samples) / sample_rate, 0, 'f', 3)
               .arg(QString::fromLatin1(blip::StopReasonName(stats.reason)))
               .arg(static_cast<qulonglong>(stats.peak_threads))
               .arg(stats.threads_spawned)
               .arg(stats.clipped_samples)
               .arg(stats.peak_level, 0, 'f', 3);
    if (stats.clipped_samples > 0) {
        qCInfo(lcApp) << stats.clipped_samples << "samples clipped";
    }
}
} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("BlipMachine");
    QCoreApplication::setApplicationName("blip-machine");
    QCoreApplication::setApplicationVersion(QString("%1.%2.%3")
                                                .arg(blip::Version::kMajor)
                                                .arg(blip::Version::kMinor)
                                                .arg(blip::Version::kPatch));
    install_log_format();

    QCommandLineParser parser;
    parser.setApplicationDescription("Compiles a tone program into a raw PCM stream.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("program", "Program file; omit or use '-' for stdin.", "[program]");

    const QCommandLineOption rate_opt({"r", "rate"}, "Sample rate in Hz.", "hz");
    const QCommandLineOption seed_opt({"s", "seed"}, "Decision seed.", "n");
    const QCommandLineOption format_opt({"f", "format"}, "Sample format: u8 or s16le.", "fmt");
    const QCommandLineOption duration_opt({"d", "duration"}, "Stop after this many seconds.", "secs");
    const QCommandLineOption play_opt({"p", "play"}, "Play on the default audio device instead of stdout.");
    const QCommandLineOption verbose_opt({"v", "verbose"}, "Debug logging on stderr.");
    const QCommandLineOption save_opt("save-defaults", "Store rate, seed and format as defaults.");
    const QCommandLineOption check_opt("check", "Validate the program and exit.");
    parser.addOptions({rate_opt, seed_opt, format_opt, duration_opt, play_opt, verbose_opt, save_opt, check_opt});
    parser.process(app);

    set_verbose_logging(parser.isSet(verbose_opt));

    AppSettings settings = load_app_settings();
    if (parser.isSet(rate_opt) && !parse_sample_rate(parser.value(rate_opt), &settings.sample_rate)) {
        qCCritical(lcApp).noquote() << "invalid sample rate:" << parser.value(rate_opt);
        return kExitLoadFailed;
    }
    if (parser.isSet(seed_opt) && !parse_seed(parser.value(seed_opt), &settings.seed)) {
        qCCritical(lcApp).noquote() << "invalid seed:" << parser.value(seed_opt);
        return kExitLoadFailed;
    }
    if (parser.isSet(format_opt) && !parse_sample_format(parser.value(format_opt), &settings.format)) {
        qCCritical(lcApp).noquote() << "invalid sample format:" << parser.value(format_opt);
        return kExitLoadFailed;
    }
    quint64 max_samples = 0;
    if (parser.isSet(duration_opt)
        && !parse_duration(parser.value(duration_opt), settings.sample_rate, &max_samples)) {
        qCCritical(lcApp).noquote() << "invalid duration:" << parser.value(duration_opt);
        return kExitLoadFailed;
    }
    if (parser.isSet(save_opt)) {
        save_app_settings(settings);
        qCInfo(lcApp) << "defaults saved";
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.size() > 1) {
        qCCritical(lcApp) << "expected at most one program file";
        return kExitLoadFailed;
    }

    ProgramDocument doc;
    QString error;
    if (!doc.load_from_file(positional.isEmpty() ? QString() : positional.first(), &error)) {
        qCCritical(lcApp).noquote() << error;
        return kExitIoFailed;
    }

    std::vector<blip::LoadError> load_errors;
    if (!doc.compile(&load_errors)) {
        report_load_errors(load_errors);
        return kExitLoadFailed;
    }
    if (parser.isSet(check_opt)) {
        qCInfo(lcLoad).noquote() << QString("%1: ok, %2 instructions")
                                        .arg(doc.source_name())
                                        .arg(static_cast<qulonglong>(doc.program().size()));
        return kExitOk;
    }

    blip::SchedulerConfig config;
    config.sample_rate = settings.sample_rate;
    config.seed = settings.seed;
    config.format = settings.format;
    config.max_samples = max_samples;
    qCDebug(lcApp).noquote() << QString("rate %1 Hz, seed %2, format %3")
                                    .arg(config.sample_rate)
                                    .arg(config.seed)
                                    .arg(sample_format_to_code(config.format));

    blip::Scheduler scheduler(doc.program(), config);

    if (parser.isSet(play_opt)) {
        AudioOutput output;
        QObject::connect(&output, &AudioOutput::finished, &app, &QCoreApplication::quit);
        if (!output.start(&scheduler, config.sample_rate)) {
            qCCritical(lcAudio).noquote() << output.last_error();
            return kExitIoFailed;
        }
        const int rc = app.exec();
        qCDebug(lcAudio) << "played" << output.frames_rendered() << "frames, peak"
                         << output.peak_percent() << "%";
        return rc;
    }

#ifdef SIGPIPE
    // A vanished reader must surface as a failed write, not kill the process.
    std::signal(SIGPIPE, SIG_IGN);
#endif
    StdoutSink sink;
    if (!sink.open(&error)) {
        qCCritical(lcApp).noquote() << error;
        return kExitIoFailed;
    }
    const blip::RunStats stats = scheduler.run(sink);
    report_stats(stats, config.sample_rate);
    return kExitOk;
}
