#include "audio/StdoutSink.h"

#include <cstdio>

#include "log/Logging.h"

bool StdoutSink::open(QString* error) {
    // Unbuffered fd write so a closed pipe shows up on the write that hits it.
    if (!file_.open(fileno(stdout), QIODevice::WriteOnly | QIODevice::Unbuffered,
                    QFileDevice::DontCloseHandle)) {
        if (error) *error = QString("Cannot open stdout: %1").arg(file_.errorString());
        return false;
    }
    closed_ = false;
    return true;
}

bool StdoutSink::write(const uint8_t* data, size_t size) {
    if (closed_ || !file_.isOpen()) {
        return false;
    }
    const char* p = reinterpret_cast<const char*>(data);
    qint64 left = static_cast<qint64>(size);
    while (left > 0) {
        const qint64 n = file_.write(p, left);
        if (n <= 0) {
            qCDebug(lcAudio) << "stdout closed:" << file_.errorString();
            closed_ = true;
            return false;
        }
        p += n;
        left -= n;
    }
    return true;
}
