#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcApp)
Q_DECLARE_LOGGING_CATEGORY(lcLoad)
Q_DECLARE_LOGGING_CATEGORY(lcAudio)

// stderr only; stdout carries the sample stream.
void install_log_format();
void set_verbose_logging(bool verbose);
