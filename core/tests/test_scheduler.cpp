#include <catch2/catch.hpp>

#include <cmath>
#include <string>
#include <vector>

#include "blip/scheduler.h"

using blip::MemorySink;
using blip::Program;
using blip::RunStats;
using blip::SampleFormat;
using blip::Scheduler;
using blip::SchedulerConfig;
using blip::StopReason;

namespace {
constexpr double kTwoPi = 6.283185307179586476925286766559;

Program Compile(const std::string& text) {
    Program program;
    std::vector<blip::LoadError> errors;
    const bool ok = blip::CompileProgram(text, &program, &errors);
    REQUIRE(ok);
    return program;
}

std::vector<double> RenderAll(const Program& program, SchedulerConfig config = SchedulerConfig()) {
    Scheduler scheduler(program, config);
    std::vector<double> out;
    double s = 0.0;
    while (scheduler.next_sample(&s)) {
        out.push_back(s);
    }
    return out;
}

double Sine(double freq, size_t i) {
    return std::sin(kTwoPi * freq * static_cast<double>(i) / 8000.0);
}

double Clip(double v) {
    return v > 1.0 ? 1.0 : (v < -1.0 ? -1.0 : v);
}
}  // namespace

TEST_CASE("Tone-only programs emit the sum of rounded tone lengths", "[scheduler]") {
    const Program program = Compile("sin 440 0.5\nsin 220 0.25\nsin 880 0.001\n");
    Scheduler scheduler(program);
    MemorySink sink;
    const RunStats stats = scheduler.run(sink);

    CHECK(stats.reason == StopReason::kHalted);
    CHECK(stats.samples == 4000 + 2000 + 8);
    CHECK(sink.bytes().size() == 6008);
    CHECK(scheduler.tick() == 6008);
    CHECK(scheduler.finished());
    CHECK(stats.peak_threads == 1);
    CHECK(stats.threads_spawned == 0);
}

TEST_CASE("Tone length follows the sample rate", "[scheduler]") {
    const Program program = Compile("sin 440 0.5\n");
    SchedulerConfig config;
    config.sample_rate = 44100;
    CHECK(RenderAll(program, config).size() == 22050);
}

TEST_CASE("Zero-length tones are skipped without emitting", "[scheduler]") {
    const Program program = Compile("sin 440 0\nsin 440 0.001\nsin 100 0.00001\n");
    CHECK(RenderAll(program).size() == 8);
}

TEST_CASE("Single tone starts at phase zero", "[scheduler]") {
    const Program program = Compile("sin 440 0.01\n");
    const auto samples = RenderAll(program);
    REQUIRE(samples.size() == 80);
    CHECK(samples[0] == 0.0);
    for (size_t i = 0; i < samples.size(); ++i) {
        CHECK(samples[i] == Approx(Sine(440.0, i)).margin(1e-9));
    }
}

TEST_CASE("Empty and label-only programs halt without output", "[scheduler]") {
    for (const char* text : {"", "lbl a\n", "lbl a\nlbl b\nlbl c\n"}) {
        const Program program = Compile(text);
        Scheduler scheduler(program);
        MemorySink sink;
        const RunStats stats = scheduler.run(sink);
        CHECK(stats.samples == 0);
        CHECK(stats.reason == StopReason::kHalted);
        CHECK(sink.bytes().empty());
        CHECK(sink.write_calls() == 0);
    }
}

TEST_CASE("Jump with probability 1 is always taken, 0 never", "[scheduler]") {
    const Program always = Compile("pjump end 1\nsin 440 0.02\nlbl end\nsin 220 0.01\n");
    const Program never = Compile("pjump end 0\nsin 440 0.02\nlbl end\nsin 220 0.01\n");

    for (uint64_t seed = 0; seed < 32; ++seed) {
        SchedulerConfig config;
        config.seed = seed;
        // Taken: skips the 0.02 s tone.
        CHECK(RenderAll(always, config).size() == 80);
        // Not taken: falls through both tones.
        CHECK(RenderAll(never, config).size() == 240);
    }
}

TEST_CASE("Forked thread starts on the spawning tick", "[scheduler][fork]") {
    const Program program = Compile("pfork X 1\nsin 200 0.01\nlbl X\nsin 300 0.01\n");
    Scheduler scheduler(program);

    std::vector<double> samples;
    double s = 0.0;
    while (scheduler.next_sample(&s)) {
        samples.push_back(s);
        if (samples.size() == 1) {
            CHECK(scheduler.live_threads() == 2);
        }
    }

    // Both voices together for 80 samples, then the spawner falls through
    // label X into the 300 Hz tone on its own.
    REQUIRE(samples.size() == 160);
    for (size_t i = 0; i < 80; ++i) {
        CHECK(samples[i] == Approx(Clip(Sine(200.0, i) + Sine(300.0, i))).margin(1e-9));
    }
    for (size_t i = 80; i < 160; ++i) {
        CHECK(samples[i] == Approx(Sine(300.0, i - 80)).margin(1e-9));
    }

    CHECK(scheduler.threads_spawned() == 1);
    CHECK(scheduler.peak_threads() == 2);
    CHECK(scheduler.mixer().clipped_samples() > 0);
}

TEST_CASE("Fork with probability 0 never spawns", "[scheduler][fork]") {
    const Program program = Compile("pfork X 0\nsin 200 0.01\nlbl X\nsin 300 0.01\n");
    Scheduler scheduler(program);
    std::vector<double> samples(200);
    const size_t n = scheduler.render(samples.data(), samples.size());

    REQUIRE(n == 160);
    CHECK(scheduler.threads_spawned() == 0);
    CHECK(scheduler.peak_threads() == 1);
    CHECK(samples[1] == Approx(Sine(200.0, 1)).margin(1e-9));
    CHECK(samples[81] == Approx(Sine(300.0, 1)).margin(1e-9));
}

TEST_CASE("Fork never redirects the spawning thread", "[scheduler][fork]") {
    // Spawner continues to the 0.02 s tone; the child plays 0.01 s at X.
    const Program program = Compile("pfork X 1\nsin 440 0.02\npjump end 1\nlbl X\nsin 220 0.01\nlbl end\n");
    const auto samples = RenderAll(program);
    REQUIRE(samples.size() == 160);
    for (size_t i = 80; i < 160; ++i) {
        CHECK(samples[i] == Approx(Sine(440.0, i)).margin(1e-9));
    }
}

TEST_CASE("Spawn chains keep the stream gapless", "[scheduler][fork]") {
    // Each thread plays 8 samples, forks a successor and halts.
    const Program program = Compile("lbl a\nsin 1000 0.001\npfork a 1\n");
    SchedulerConfig config;
    config.max_samples = 80;
    Scheduler scheduler(program, config);
    MemorySink sink;
    const RunStats stats = scheduler.run(sink);

    CHECK(stats.reason == StopReason::kLimitReached);
    CHECK(stats.samples == 80);
    CHECK(stats.threads_spawned == 9);
    CHECK(stats.peak_threads == 1);
    CHECK(scheduler.live_threads() == 1);

    for (size_t i = 8; i < 80; ++i) {
        CHECK(sink.bytes()[i] == sink.bytes()[i % 8]);
    }
}

TEST_CASE("Probability-1 loop repeats an identical segment", "[scheduler]") {
    const Program program = Compile("lbl A\nsin 100 0.01\npjump A 1\n");
    SchedulerConfig config;
    config.max_samples = 800;
    const auto samples = RenderAll(program, config);

    REQUIRE(samples.size() == 800);
    for (size_t i = 80; i < samples.size(); ++i) {
        REQUIRE(samples[i] == samples[i % 80]);
    }
}

TEST_CASE("Same seed and program give byte-identical output", "[scheduler]") {
    const Program program = Compile(
        "lbl a\n"
        "sin 100 0.004\n"
        "pjump b 0.5\n"
        "sin 200 0.004\n"
        "pfork c 0.3\n"
        "lbl b\n"
        "pjump a 1\n"
        "lbl c\n"
        "sin 300 0.002\n");

    SchedulerConfig config;
    config.seed = 42;
    config.max_samples = 4000;
    config.format = SampleFormat::kS16LE;

    Scheduler first(program, config);
    Scheduler second(program, config);
    MemorySink a;
    MemorySink b;
    const RunStats sa = first.run(a);
    const RunStats sb = second.run(b);
    CHECK(a.bytes() == b.bytes());
    CHECK(sa.samples == sb.samples);
    CHECK(sa.threads_spawned == sb.threads_spawned);

    SchedulerConfig other = config;
    other.seed = 43;
    Scheduler third(program, other);
    MemorySink c;
    third.run(c);
    CHECK(a.bytes() != c.bytes());
}

TEST_CASE("Reset replays the run from tick zero", "[scheduler]") {
    const Program program = Compile("lbl a\nsin 100 0.001\npjump a 0.5\npfork a 0.5\nsin 50 0.002\n");
    SchedulerConfig config;
    config.seed = 5;
    config.max_samples = 1000;
    Scheduler scheduler(program, config);

    std::vector<double> first(1000);
    std::vector<double> second(1000);
    const size_t n1 = scheduler.render(first.data(), first.size());
    scheduler.reset();
    CHECK(scheduler.tick() == 0);
    const size_t n2 = scheduler.render(second.data(), second.size());

    CHECK(n1 == n2);
    CHECK(first == second);
}

TEST_CASE("Closed sink stops an endless program gracefully", "[scheduler][sink]") {
    const Program program = Compile("lbl A\nsin 100 0.01\npjump A 1\n");
    SchedulerConfig config;
    config.block_frames = 10;
    Scheduler scheduler(program, config);
    MemorySink sink(100);

    const RunStats stats = scheduler.run(sink);
    CHECK(stats.reason == StopReason::kSinkClosed);
    CHECK(stats.samples == 100);
    CHECK(sink.bytes().size() == 100);
    CHECK(sink.write_calls() == 11);
    CHECK_FALSE(scheduler.finished());
}

TEST_CASE("Closed sink on the final partial block", "[scheduler][sink]") {
    const Program program = Compile("sin 440 0.01\n");
    SchedulerConfig config;
    config.block_frames = 64;
    Scheduler scheduler(program, config);
    MemorySink sink(64);

    const RunStats stats = scheduler.run(sink);
    CHECK(stats.reason == StopReason::kSinkClosed);
    CHECK(stats.samples == 64);
}

TEST_CASE("Sample limit bounds endless programs", "[scheduler]") {
    const Program program = Compile("lbl A\nsin 100 0.01\npjump A 1\n");
    SchedulerConfig config;
    config.max_samples = 1000;
    Scheduler scheduler(program, config);
    MemorySink sink;

    const RunStats stats = scheduler.run(sink);
    CHECK(stats.reason == StopReason::kLimitReached);
    CHECK(stats.samples == 1000);
    CHECK(sink.bytes().size() == 1000);
    CHECK(sink.write_calls() == 2);
    CHECK(scheduler.limit_reached());
}

TEST_CASE("Time limits convert to a nonzero sample count", "[scheduler][limit]") {
    uint64_t samples = 0;

    SECTION("rounded to the nearest sample") {
        REQUIRE(blip::SamplesForDuration(0.5, 8000, &samples));
        CHECK(samples == 4000);
        REQUIRE(blip::SamplesForDuration(0.00019, 8000, &samples));
        CHECK(samples == 2);
    }

    SECTION("short limits still bound the run") {
        REQUIRE(blip::SamplesForDuration(0.00001, 8000, &samples));
        CHECK(samples == 1);

        const Program program = Compile("lbl A\nsin 100 0.01\npjump A 1\n");
        SchedulerConfig config;
        config.max_samples = samples;
        Scheduler scheduler(program, config);
        std::vector<double> buf(100000);
        CHECK(scheduler.render(buf.data(), buf.size()) == 1);
        CHECK(scheduler.limit_reached());
    }

    SECTION("huge limits saturate") {
        REQUIRE(blip::SamplesForDuration(1e300, 8000, &samples));
        CHECK(samples == 9000000000000000000ULL);
    }

    SECTION("non-positive and non-finite limits are rejected") {
        CHECK_FALSE(blip::SamplesForDuration(0.0, 8000, &samples));
        CHECK_FALSE(blip::SamplesForDuration(-1.0, 8000, &samples));
        CHECK_FALSE(blip::SamplesForDuration(std::nan(""), 8000, &samples));
        CHECK_FALSE(blip::SamplesForDuration(HUGE_VAL, 8000, &samples));
        CHECK_FALSE(blip::SamplesForDuration(1.0, 0, &samples));
    }
}

TEST_CASE("Forked threads branch on their own decision stream", "[scheduler][fork]") {
    // Parent picks 100/200 Hz, child picks 300/400 Hz, both on tick zero.
    const Program program = Compile(
        "pfork C 1\n"
        "pjump PA 0.5\n"
        "sin 100 0.01\n"
        "pjump END 1\n"
        "lbl PA\n"
        "sin 200 0.01\n"
        "pjump END 1\n"
        "lbl C\n"
        "pjump CA 0.5\n"
        "sin 300 0.01\n"
        "pjump END 1\n"
        "lbl CA\n"
        "sin 400 0.01\n"
        "lbl END\n");

    int child_taken = 0;
    int differs_from_parent_stream = 0;
    for (uint64_t seed = 0; seed < 64; ++seed) {
        blip::DecisionSource parent(seed);
        parent.next();  // fork draw
        blip::DecisionSource child = parent.split();
        const bool expect_parent = parent.next() < 0.5;
        const bool expect_child = child.next() < 0.5;
        const bool parent_stream_next = parent.next() < 0.5;

        SchedulerConfig config;
        config.seed = seed;
        Scheduler scheduler(program, config);
        REQUIRE(scheduler.resolve());
        const std::vector<blip::ThreadId>& order = scheduler.threads().order();
        REQUIRE(order.size() == 2);

        const double parent_step = scheduler.threads().get(order[0]).phase_step;
        const double child_step = scheduler.threads().get(order[1]).phase_step;
        CHECK(parent_step == Approx(kTwoPi * (expect_parent ? 200.0 : 100.0) / 8000.0));
        CHECK(child_step == Approx(kTwoPi * (expect_child ? 400.0 : 300.0) / 8000.0));

        if (expect_child) ++child_taken;
        if (expect_child != parent_stream_next) ++differs_from_parent_stream;
    }
    CHECK(child_taken > 0);
    CHECK(child_taken < 64);
    CHECK(differs_from_parent_stream > 0);
}

TEST_CASE("Render returns short when the program halts", "[scheduler]") {
    const Program program = Compile("sin 440 0.01\n");
    Scheduler scheduler(program);
    std::vector<double> buf(100);

    CHECK(scheduler.render(buf.data(), 50) == 50);
    CHECK(scheduler.render(buf.data(), 50) == 30);
    CHECK(scheduler.finished());
    CHECK(scheduler.render(buf.data(), 50) == 0);
}

TEST_CASE("Encoded output matches the sample format", "[scheduler][format]") {
    const Program program = Compile("sin 440 0.01\n");

    SchedulerConfig u8;
    Scheduler a(program, u8);
    MemorySink sa;
    a.run(sa);
    REQUIRE(sa.bytes().size() == 80);
    CHECK(sa.bytes()[0] == 128);

    SchedulerConfig s16;
    s16.format = SampleFormat::kS16LE;
    Scheduler b(program, s16);
    MemorySink sb;
    const RunStats stats = b.run(sb);
    CHECK(stats.samples == 80);
    REQUIRE(sb.bytes().size() == 160);
    CHECK(sb.bytes()[0] == 0);
    CHECK(sb.bytes()[1] == 0);
}

TEST_CASE("Frequencies above the sample rate keep the phase wrapped", "[scheduler]") {
    const Program program = Compile("sin 20000 0.01\n");
    Scheduler scheduler(program);
    double s = 0.0;
    while (scheduler.next_sample(&s)) {
        CHECK(s >= -1.0);
        CHECK(s <= 1.0);
        for (const blip::ThreadId id : scheduler.threads().order()) {
            const auto& t = scheduler.threads().get(id);
            if (t.status == blip::ThreadStatus::kPlaying) {
                CHECK(t.phase >= 0.0);
                CHECK(t.phase < kTwoPi);
            }
        }
    }
    CHECK(scheduler.tick() == 80);
}
