#pragma once

#include <QString>
#include <QtGlobal>

#include "blip/core.h"
#include "blip/mixer.h"

struct AppSettings {
    int sample_rate = blip::kDefaultSampleRate;
    quint64 seed = 0;
    blip::SampleFormat format = blip::SampleFormat::kU8;
};

AppSettings load_app_settings();
void save_app_settings(const AppSettings& settings);

bool parse_sample_rate(const QString& text, int* out);
// Decimal only; a leading zero is not an octal prefix.
bool parse_seed(const QString& text, quint64* out);
// Seconds to a sample limit at |sample_rate|; never zero, which would mean unbounded.
bool parse_duration(const QString& text, int sample_rate, quint64* out);
bool parse_sample_format(const QString& text, blip::SampleFormat* out);
QString sample_format_to_code(blip::SampleFormat format);
