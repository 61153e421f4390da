#pragma once

#include <QFile>

#include "blip/sample_sink.h"

// Raw PCM to stdout. A failed write (reader gone, EPIPE) closes the sink.
class StdoutSink : public blip::SampleSink
{
public:
    bool open(QString* error = nullptr);
    bool write(const uint8_t* data, size_t size) override;

private:
    QFile file_;
    bool closed_ = false;
};
