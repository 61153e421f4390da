#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "blip/instruction.h"

namespace blip {

enum class LoadErrorKind {
    kDuplicateLabel,
    kUnresolvedLabel,
    kMalformedInstruction,
};

struct LoadError {
    LoadErrorKind kind = LoadErrorKind::kMalformedInstruction;
    int line = 0;
    std::string token;    // offending label name or operand, may be empty
    std::string message;
};

// Immutable, validated instruction table. Jump and fork targets are already
// resolved to instruction indices, so execution never looks up names.
class Program {
public:
    Program() = default;

    size_t size() const { return instructions_.size(); }
    bool empty() const { return instructions_.empty(); }
    const Instruction& at(size_t pc) const { return instructions_[pc]; }
    const std::vector<Instruction>& instructions() const { return instructions_; }

    // Index of the label instruction, or -1 when the name is unknown.
    long label_index(const std::string& name) const;
    const std::unordered_map<std::string, size_t>& labels() const { return labels_; }

    size_t tone_count() const;
    bool has_probabilistic_branches() const;

private:
    friend bool BuildProgram(const std::vector<Instruction>&, Program*, std::vector<LoadError>*);

    std::vector<Instruction> instructions_;
    std::unordered_map<std::string, size_t> labels_;
};

// Parse and validate tokenized lines. On any error nothing is written to
// |out| and every problem found is appended to |errors| in source order.
bool LoadProgram(const std::vector<SourceLine>& lines, Program* out, std::vector<LoadError>* errors);

// Validate an already-parsed instruction list (labels, targets, operand ranges).
bool BuildProgram(const std::vector<Instruction>& instructions, Program* out,
                  std::vector<LoadError>* errors);

// TokenizeProgram + LoadProgram.
bool CompileProgram(const std::string& text, Program* out, std::vector<LoadError>* errors);

}  // namespace blip
