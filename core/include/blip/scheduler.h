#pragma once

#include <cstddef>
#include <cstdint>

#include "blip/core.h"
#include "blip/mixer.h"
#include "blip/program.h"
#include "blip/sample_sink.h"
#include "blip/thread_set.h"

namespace blip {

struct SchedulerConfig {
    int sample_rate = kDefaultSampleRate;
    uint64_t seed = 0;
    SampleFormat format = SampleFormat::kU8;
    size_t block_frames = 512;  // samples per sink write
    uint64_t max_samples = 0;   // 0 = until halted or the sink closes
};

enum class StopReason {
    kHalted,        // every thread ran off the end of the program
    kSinkClosed,    // the consumer went away
    kLimitReached,  // max_samples emitted
};

const char* StopReasonName(StopReason reason);

// Sample count for a time limit of |seconds| at |sample_rate|: rounded to the
// nearest sample, at least one, saturating for very long limits. Returns false
// for a non-finite or non-positive duration or rate.
bool SamplesForDuration(double seconds, int sample_rate, uint64_t* out);

struct RunStats {
    uint64_t samples = 0;  // samples accepted by the sink
    StopReason reason = StopReason::kHalted;
    size_t peak_threads = 0;
    uint64_t threads_spawned = 0;
    uint64_t clipped_samples = 0;
    double peak_level = 0.0;  // largest pre-clip magnitude
};

// Sample-clocked interpreter for a loaded Program.
//
// Each tick runs a resolve phase (every ready thread executes zero-duration
// instructions until it starts a tone or halts; forked threads are appended
// and resolved in the same pass), mixes all playing threads into one sample,
// then advances every playing thread by one sample.
class Scheduler {
public:
    explicit Scheduler(const Program& program, const SchedulerConfig& config = SchedulerConfig());

    // Back to tick 0 with a single root thread at instruction 0.
    void reset();

    // Resolve every ready thread. Returns false when no thread is left.
    bool resolve();

    // Advance every playing thread by one sample.
    void advance();

    // resolve() + mix + advance(). Returns false once the program has halted
    // or the sample limit is reached; |out| is untouched in that case.
    bool next_sample(double* out);

    // Fill up to |frames| mixed samples. Returns the number produced, which is
    // short only when the program halts or the sample limit is reached.
    size_t render(double* out, size_t frames);

    // Stream encoded samples into |sink| until halted, closed or limited.
    RunStats run(SampleSink& sink);

    bool finished() const;
    bool limit_reached() const;
    uint64_t tick() const { return tick_; }
    size_t live_threads() const { return threads_.live_count(); }
    uint64_t threads_spawned() const { return threads_spawned_; }
    size_t peak_threads() const { return peak_threads_; }

    const Program& program() const { return *program_; }
    const SchedulerConfig& config() const { return config_; }
    const ThreadSet& threads() const { return threads_; }
    const Mixer& mixer() const { return mixer_; }

private:
    void resolve_thread(ThreadId id);
    uint64_t tone_samples(double duration) const;

    const Program* program_ = nullptr;
    SchedulerConfig config_;
    ThreadSet threads_;
    Mixer mixer_;
    uint64_t tick_ = 0;
    uint64_t threads_spawned_ = 0;
    size_t peak_threads_ = 0;
    bool halted_ = false;
};

}  // namespace blip
