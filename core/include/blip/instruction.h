#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace blip {

enum class Opcode {
    kLabel,
    kTone,
    kJump,
    kFork,
};

// One resolved program step. Only the fields of the active opcode are meaningful:
//   kLabel: label
//   kTone:  frequency (Hz), duration (seconds)
//   kJump/kFork: label (target name), target (index), probability
struct Instruction {
    Opcode op = Opcode::kLabel;
    std::string label;
    double frequency = 0.0;
    double duration = 0.0;
    double probability = 0.0;
    size_t target = 0;
    int line = 0;  // 1-based source line

    static Instruction Label(const std::string& name, int line = 0);
    static Instruction Tone(double frequency, double duration, int line = 0);
    static Instruction Jump(const std::string& name, double probability, int line = 0);
    static Instruction Fork(const std::string& name, double probability, int line = 0);
};

const char* OpcodeMnemonic(Opcode op);

// A tokenized, non-blank source line.
struct SourceLine {
    int line = 0;
    std::vector<std::string> tokens;
};

// Split program text into lines of whitespace-separated tokens.
// Blank lines are dropped; line numbers are 1-based and refer to the input text.
std::vector<SourceLine> TokenizeProgram(const std::string& text);

}  // namespace blip
