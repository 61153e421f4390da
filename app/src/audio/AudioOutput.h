#pragma once

#include <QObject>
#include <QString>
#include <vector>

class QAudioSink;
class QIODevice;
class QTimer;

namespace blip {
class Scheduler;
}

// Plays a Scheduler through the default audio device. A timer tops up the
// device buffer with freshly rendered frames; once the program halts and the
// device has drained, finished() is emitted.
class AudioOutput : public QObject
{
    Q_OBJECT

public:
    explicit AudioOutput(QObject* parent = nullptr);
    ~AudioOutput();

    bool start(blip::Scheduler* scheduler, int sample_rate);
    void stop();
    QString last_error() const;
    QString debug_info() const;
    int peak_percent() const;
    quint64 frames_rendered() const;

signals:
    void finished();

private:
    void on_audio_tick();
    void write_frames(int frames);
    void finish();

    QAudioSink* sink_ = nullptr;
    QIODevice* device_ = nullptr;
    QTimer* timer_ = nullptr;
    blip::Scheduler* scheduler_ = nullptr;
    QString last_error_;
    QString device_desc_;
    int sample_rate_ = 0;
    bool float_samples_ = false;
    std::vector<double> mono_;
    quint64 frames_rendered_ = 0;
    bool draining_ = false;
    double peak_ = 0.0;
};
