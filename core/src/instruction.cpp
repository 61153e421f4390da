#include "blip/instruction.h"

namespace blip {

namespace {
bool IsBlank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\v' || c == '\f';
}
}  // namespace

Instruction Instruction::Label(const std::string& name, int line) {
    Instruction ins;
    ins.op = Opcode::kLabel;
    ins.label = name;
    ins.line = line;
    return ins;
}

Instruction Instruction::Tone(double frequency, double duration, int line) {
    Instruction ins;
    ins.op = Opcode::kTone;
    ins.frequency = frequency;
    ins.duration = duration;
    ins.line = line;
    return ins;
}

Instruction Instruction::Jump(const std::string& name, double probability, int line) {
    Instruction ins;
    ins.op = Opcode::kJump;
    ins.label = name;
    ins.probability = probability;
    ins.line = line;
    return ins;
}

Instruction Instruction::Fork(const std::string& name, double probability, int line) {
    Instruction ins = Jump(name, probability, line);
    ins.op = Opcode::kFork;
    return ins;
}

const char* OpcodeMnemonic(Opcode op) {
    switch (op) {
    case Opcode::kLabel:
        return "lbl";
    case Opcode::kTone:
        return "sin";
    case Opcode::kJump:
        return "pjump";
    case Opcode::kFork:
        return "pfork";
    }
    return "?";
}

std::vector<SourceLine> TokenizeProgram(const std::string& text) {
    std::vector<SourceLine> lines;
    SourceLine current;
    current.line = 1;
    std::string token;

    auto flush_token = [&]() {
        if (!token.empty()) {
            current.tokens.push_back(token);
            token.clear();
        }
    };
    auto flush_line = [&]() {
        flush_token();
        if (!current.tokens.empty()) {
            lines.push_back(current);
        }
        current.tokens.clear();
        ++current.line;
    };

    for (const char c : text) {
        if (c == '\n') {
            flush_line();
        } else if (IsBlank(c)) {
            flush_token();
        } else {
            token.push_back(c);
        }
    }
    flush_token();
    if (!current.tokens.empty()) {
        lines.push_back(current);
    }
    return lines;
}

}  // namespace blip
