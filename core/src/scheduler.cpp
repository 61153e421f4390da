#include "blip/scheduler.h"

#include <algorithm>
#include <cmath>
#include <vector>

namespace blip {

namespace {
constexpr double kTwoPi = 6.283185307179586476925286766559;
// Largest sample count representable without overflowing llround().
constexpr double kMaxSamples = 9.0e18;
}  // namespace

const char* StopReasonName(StopReason reason) {
    switch (reason) {
    case StopReason::kHalted:
        return "halted";
    case StopReason::kSinkClosed:
        return "sink closed";
    case StopReason::kLimitReached:
        return "limit reached";
    }
    return "?";
}

bool SamplesForDuration(double seconds, int sample_rate, uint64_t* out) {
    if (!std::isfinite(seconds) || seconds <= 0.0 || sample_rate <= 0) {
        return false;
    }
    const double exact = std::min(seconds * static_cast<double>(sample_rate), kMaxSamples);
    const uint64_t samples = static_cast<uint64_t>(std::llround(exact));
    if (out) *out = std::max<uint64_t>(samples, 1);
    return true;
}

Scheduler::Scheduler(const Program& program, const SchedulerConfig& config)
    : program_(&program), config_(config), mixer_(config.format) {
    if (config_.sample_rate <= 0) {
        config_.sample_rate = kDefaultSampleRate;
    }
    if (config_.block_frames == 0) {
        config_.block_frames = 1;
    }
    reset();
}

void Scheduler::reset() {
    threads_.clear();
    mixer_.reset();
    tick_ = 0;
    threads_spawned_ = 0;
    peak_threads_ = 0;
    halted_ = false;
    threads_.spawn(0, DecisionSource(config_.seed));
}

uint64_t Scheduler::tone_samples(double duration) const {
    const double exact = duration * static_cast<double>(config_.sample_rate);
    if (!(exact > 0.0)) {
        return 0;
    }
    return static_cast<uint64_t>(std::llround(std::min(exact, kMaxSamples)));
}

void Scheduler::resolve_thread(ThreadId id) {
    const size_t count = program_->size();
    for (;;) {
        // Re-fetched each step: spawning may grow the arena.
        VirtualThread& t = threads_.get(id);
        if (t.pc >= count) {
            threads_.halt(id);
            return;
        }

        const Instruction& ins = program_->at(t.pc);
        switch (ins.op) {
        case Opcode::kLabel:
            ++t.pc;
            break;

        case Opcode::kTone: {
            ++t.pc;
            const uint64_t samples = tone_samples(ins.duration);
            if (samples == 0) {
                break;
            }
            t.status = ThreadStatus::kPlaying;
            t.phase = 0.0;
            t.phase_step = kTwoPi * ins.frequency / static_cast<double>(config_.sample_rate);
            t.samples_remaining = samples;
            return;
        }

        case Opcode::kJump:
            t.pc = (t.decisions.next() < ins.probability) ? ins.target : t.pc + 1;
            break;

        case Opcode::kFork: {
            ++t.pc;
            if (t.decisions.next() < ins.probability) {
                const DecisionSource child = t.decisions.split();
                threads_.spawn(ins.target, child);
                ++threads_spawned_;
            }
            break;
        }
        }
    }
}

bool Scheduler::resolve() {
    // order() grows while we walk it: forked threads join this same pass.
    for (size_t i = 0; i < threads_.order().size(); ++i) {
        const ThreadId id = threads_.order()[i];
        if (threads_.get(id).status == ThreadStatus::kReady) {
            resolve_thread(id);
        }
    }
    threads_.compact();
    peak_threads_ = std::max(peak_threads_, threads_.live_count());
    if (threads_.empty()) {
        halted_ = true;
    }
    return !halted_;
}

void Scheduler::advance() {
    for (const ThreadId id : threads_.order()) {
        VirtualThread& t = threads_.get(id);
        if (t.status != ThreadStatus::kPlaying) {
            continue;
        }
        t.phase = std::fmod(t.phase + t.phase_step, kTwoPi);
        if (--t.samples_remaining == 0) {
            t.status = ThreadStatus::kReady;
        }
    }
    ++tick_;
}

bool Scheduler::next_sample(double* out) {
    if (limit_reached() || !resolve()) {
        return false;
    }
    const double sample = mixer_.mix(threads_);
    advance();
    if (out) {
        *out = sample;
    }
    return true;
}

size_t Scheduler::render(double* out, size_t frames) {
    size_t produced = 0;
    while (produced < frames && next_sample(out + produced)) {
        ++produced;
    }
    return produced;
}

RunStats Scheduler::run(SampleSink& sink) {
    RunStats stats;
    const size_t bps = mixer_.bytes_per_sample();
    const size_t block_bytes = config_.block_frames * bps;

    std::vector<uint8_t> block;
    block.reserve(block_bytes);

    bool closed = false;
    double sample = 0.0;
    while (next_sample(&sample)) {
        mixer_.encode(sample, &block);
        if (block.size() < block_bytes) {
            continue;
        }
        if (!sink.write(block.data(), block.size())) {
            closed = true;
            break;
        }
        stats.samples += block.size() / bps;
        block.clear();
    }

    if (!closed && !block.empty()) {
        if (sink.write(block.data(), block.size())) {
            stats.samples += block.size() / bps;
        } else {
            closed = true;
        }
    }

    if (closed) {
        stats.reason = StopReason::kSinkClosed;
    } else if (halted_) {
        stats.reason = StopReason::kHalted;
    } else {
        stats.reason = StopReason::kLimitReached;
    }
    stats.peak_threads = peak_threads_;
    stats.threads_spawned = threads_spawned_;
    stats.clipped_samples = mixer_.clipped_samples();
    stats.peak_level = mixer_.peak();
    return stats;
}

bool Scheduler::finished() const {
    return halted_;
}

bool Scheduler::limit_reached() const {
    return config_.max_samples > 0 && tick_ >= config_.max_samples;
}

}  // namespace blip
