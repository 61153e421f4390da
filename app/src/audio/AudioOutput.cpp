#include "audio/AudioOutput.h"

#include <QAudioDevice>
#include <QAudioFormat>
#include <QAudioSink>
#include <QIODevice>
#include <QMediaDevices>
#include <QTimer>
#include <algorithm>
#include <cmath>
#include <cstdint>

#include "blip/mixer.h"
#include "blip/scheduler.h"
#include "log/Logging.h"

namespace {
constexpr int kTickMs = 10;
constexpr int kBufferBytes = 8192;
constexpr int kMinFramesPerWrite = 128;
constexpr double kPeakDecay = 0.92;

const char* state_name(QAudio::State state) {
    switch (state) {
    case QAudio::ActiveState:
        return "active";
    case QAudio::SuspendedState:
        return "suspended";
    case QAudio::StoppedState:
        return "stopped";
    case QAudio::IdleState:
        return "idle";
    }
    return "?";
}
} // namespace

AudioOutput::AudioOutput(QObject* parent)
    : QObject(parent) {}

AudioOutput::~AudioOutput() {
    stop();
}

bool AudioOutput::start(blip::Scheduler* scheduler, int sample_rate) {
    stop();
    last_error_.clear();
    if (!scheduler) {
        last_error_ = "Nothing to play";
        return false;
    }

    const QAudioDevice device = QMediaDevices::defaultAudioOutput();
    if (device.isNull()) {
        last_error_ = "No default audio output device";
        return false;
    }

    QAudioFormat format;
    format.setSampleRate(sample_rate);
    format.setChannelCount(1);
    format.setSampleFormat(QAudioFormat::Int16);
    if (!device.isFormatSupported(format)) {
        format.setSampleFormat(QAudioFormat::Float);
    }
    if (!device.isFormatSupported(format)) {
        // Resampling would change pitch and tempo; the program runs at its own clock.
        last_error_ = QString("Audio device does not support %1 Hz mono").arg(sample_rate);
        return false;
    }

    sink_ = new QAudioSink(device, format, this);
    sink_->setBufferSize(kBufferBytes);
    device_ = sink_->start();
    if (!device_ || !device_->isOpen()) {
        last_error_ = QString("Cannot open audio device %1").arg(device.description());
        stop();
        return false;
    }

    scheduler_ = scheduler;
    device_desc_ = device.description();
    sample_rate_ = sample_rate;
    float_samples_ = (format.sampleFormat() == QAudioFormat::Float);
    frames_rendered_ = 0;
    draining_ = false;
    peak_ = 0.0;

    timer_ = new QTimer(this);
    connect(timer_, &QTimer::timeout, this, &AudioOutput::on_audio_tick);
    timer_->start(kTickMs);
    qCDebug(lcAudio).noquote() << "playing on" << debug_info();
    return true;
}

void AudioOutput::stop() {
    if (timer_) {
        timer_->stop();
        timer_->deleteLater();
        timer_ = nullptr;
    }
    if (sink_) {
        sink_->stop();
        sink_->deleteLater();
        sink_ = nullptr;
    }
    // Owned by the sink.
    device_ = nullptr;
    scheduler_ = nullptr;
    draining_ = false;
}

QString AudioOutput::last_error() const {
    return last_error_;
}

QString AudioOutput::debug_info() const {
    if (!sink_) {
        return QString();
    }
    return QString("%1 (%2 Hz mono %3, %4)")
        .arg(device_desc_)
        .arg(sample_rate_)
        .arg(float_samples_ ? QStringLiteral("float") : QStringLiteral("int16"))
        .arg(QString::fromLatin1(state_name(sink_->state())));
}

int AudioOutput::peak_percent() const {
    return std::clamp(static_cast<int>(std::lround(peak_ * 100.0)), 0, 100);
}

quint64 AudioOutput::frames_rendered() const {
    return frames_rendered_;
}

void AudioOutput::on_audio_tick() {
    if (!scheduler_ || !sink_ || !device_) {
        return;
    }
    if (sink_->state() == QAudio::StoppedState && sink_->error() != QAudio::NoError) {
        last_error_ = QString("Audio device stopped: %1").arg(debug_info());
        qCWarning(lcAudio).noquote() << last_error_;
        finish();
        return;
    }

    const int bytes_free = sink_->bytesFree();
    if (draining_) {
        if (bytes_free >= sink_->bufferSize() || sink_->state() == QAudio::IdleState) {
            qCDebug(lcAudio) << "drained after" << frames_rendered_ << "frames";
            finish();
        }
        return;
    }

    const int bytes_per_frame = float_samples_ ? int(sizeof(float)) : int(sizeof(int16_t));
    const int frames = bytes_free / bytes_per_frame;
    if (frames >= kMinFramesPerWrite) {
        write_frames(frames);
    }
}

void AudioOutput::write_frames(int frames) {
    mono_.resize(static_cast<size_t>(frames));
    const size_t produced = scheduler_->render(mono_.data(), mono_.size());
    frames_rendered_ += produced;
    if (produced < mono_.size()) {
        draining_ = true;
    }
    if (produced == 0) {
        return;
    }

    double block_peak = 0.0;
    for (size_t i = 0; i < produced; ++i) {
        block_peak = std::max(block_peak, std::fabs(mono_[i]));
    }
    peak_ = std::max(block_peak, peak_ * kPeakDecay);

    if (float_samples_) {
        std::vector<float> out(produced);
        std::transform(mono_.begin(), mono_.begin() + produced, out.begin(),
                       [](double s) { return static_cast<float>(s); });
        device_->write(reinterpret_cast<const char*>(out.data()),
                       static_cast<qint64>(out.size() * sizeof(float)));
    } else {
        std::vector<int16_t> out(produced);
        std::transform(mono_.begin(), mono_.begin() + produced, out.begin(), &blip::Mixer::ToS16);
        device_->write(reinterpret_cast<const char*>(out.data()),
                       static_cast<qint64>(out.size() * sizeof(int16_t)));
    }
}

void AudioOutput::finish() {
    stop();
    emit finished();
}
