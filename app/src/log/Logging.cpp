#include "log/Logging.h"

#include <QtGlobal>

Q_LOGGING_CATEGORY(lcApp, "blip.app", QtInfoMsg)
Q_LOGGING_CATEGORY(lcLoad, "blip.load", QtInfoMsg)
Q_LOGGING_CATEGORY(lcAudio, "blip.audio", QtInfoMsg)

void install_log_format() {
    qSetMessagePattern(
        "%{appname}: "
        "%{if-debug}[%{category}] %{endif}"
        "%{if-warning}warning: %{endif}"
        "%{if-critical}error: %{endif}"
        "%{if-fatal}fatal: %{endif}"
        "%{message}");
}

void set_verbose_logging(bool verbose) {
    QLoggingCategory::setFilterRules(verbose ? QStringLiteral("blip.*.debug=true")
                                             : QStringLiteral("blip.*.debug=false"));
}
