#include "settings/AppSettings.h"

#include <QSettings>

#include <cstdint>

#include "blip/scheduler.h"

namespace {
constexpr const char* kOrg = "BlipMachine";
constexpr const char* kApp = "blip-machine";
constexpr const char* kRateKey = "output/sample_rate";
constexpr const char* kFormatKey = "output/format";
constexpr const char* kSeedKey = "run/seed";

constexpr int kMinSampleRate = 1000;
constexpr int kMaxSampleRate = 384000;
} // namespace

bool parse_sample_rate(const QString& text, int* out) {
    bool ok = false;
    const int rate = text.trimmed().toInt(&ok);
    if (!ok || rate < kMinSampleRate || rate > kMaxSampleRate) {
        return false;
    }
    if (out) *out = rate;
    return true;
}

bool parse_seed(const QString& text, quint64* out) {
    bool ok = false;
    const quint64 seed = text.trimmed().toULongLong(&ok, 10);
    if (!ok) {
        return false;
    }
    if (out) *out = seed;
    return true;
}

bool parse_duration(const QString& text, int sample_rate, quint64* out) {
    bool ok = false;
    const double secs = text.trimmed().toDouble(&ok);
    uint64_t samples = 0;
    if (!ok || !blip::SamplesForDuration(secs, sample_rate, &samples)) {
        return false;
    }
    if (out) *out = samples;
    return true;
}

bool parse_sample_format(const QString& text, blip::SampleFormat* out) {
    return blip::ParseSampleFormat(text.trimmed().toStdString(), out);
}

QString sample_format_to_code(blip::SampleFormat format) {
    return QString::fromLatin1(blip::SampleFormatName(format));
}

AppSettings load_app_settings() {
    QSettings settings(kOrg, kApp);
    AppSettings s;
    // Stored values that no longer parse fall back to the defaults.
    parse_sample_rate(settings.value(kRateKey, s.sample_rate).toString(), &s.sample_rate);
    parse_seed(settings.value(kSeedKey, QString::number(s.seed)).toString(), &s.seed);
    parse_sample_format(settings.value(kFormatKey, sample_format_to_code(s.format)).toString(), &s.format);
    return s;
}

void save_app_settings(const AppSettings& s) {
    QSettings settings(kOrg, kApp);
    settings.setValue(kRateKey, s.sample_rate);
    settings.setValue(kSeedKey, QString::number(s.seed));
    settings.setValue(kFormatKey, sample_format_to_code(s.format));
}
