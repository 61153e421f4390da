#include "blip/program.h"

#include <algorithm>
#include <cmath>
#include <locale>
#include <sstream>
#include <utility>

namespace blip {

namespace {
// Operands are always written with '.' decimals, whatever the process locale.
bool ParseNumber(const std::string& token, double* out) {
    std::istringstream in(token);
    in.imbue(std::locale::classic());
    double value = 0.0;
    if (!(in >> value)) {
        return false;
    }
    char extra = 0;
    if (in >> extra) {
        return false;
    }
    if (!std::isfinite(value)) {
        return false;
    }
    *out = value;
    return true;
}

LoadError MakeError(LoadErrorKind kind, int line, const std::string& token, const std::string& message) {
    LoadError e;
    e.kind = kind;
    e.line = line;
    e.token = token;
    e.message = message;
    return e;
}

LoadError Malformed(int line, const std::string& token, const std::string& message) {
    return MakeError(LoadErrorKind::kMalformedInstruction, line, token, message);
}

bool ExpectTokenCount(const SourceLine& src, size_t count, const char* usage,
                      std::vector<LoadError>* errors) {
    if (src.tokens.size() == count) {
        return true;
    }
    errors->push_back(Malformed(src.line, src.tokens.front(),
                                std::string("bad syntax, expected '") + usage + "'"));
    return false;
}

bool ParseProbability(const SourceLine& src, const std::string& token, double* out,
                      std::vector<LoadError>* errors) {
    double p = 0.0;
    if (!ParseNumber(token, &p)) {
        errors->push_back(Malformed(src.line, token, "expected a number"));
        return false;
    }
    if (p < 0.0 || p > 1.0) {
        errors->push_back(Malformed(src.line, token, "probabilities must be between 0 and 1"));
        return false;
    }
    *out = p;
    return true;
}

bool ParseLine(const SourceLine& src, Instruction* out, std::vector<LoadError>* errors) {
    const std::string& opcode = src.tokens.front();

    if (opcode == OpcodeMnemonic(Opcode::kLabel)) {
        if (!ExpectTokenCount(src, 2, "lbl <name>", errors)) {
            return false;
        }
        *out = Instruction::Label(src.tokens[1], src.line);
        return true;
    }

    if (opcode == OpcodeMnemonic(Opcode::kTone)) {
        if (!ExpectTokenCount(src, 3, "sin <frequency> <duration>", errors)) {
            return false;
        }
        double freq = 0.0;
        double dur = 0.0;
        bool ok = true;
        if (!ParseNumber(src.tokens[1], &freq)) {
            errors->push_back(Malformed(src.line, src.tokens[1], "expected a number"));
            ok = false;
        } else if (freq <= 0.0) {
            errors->push_back(Malformed(src.line, src.tokens[1], "frequency must be positive"));
            ok = false;
        }
        if (!ParseNumber(src.tokens[2], &dur)) {
            errors->push_back(Malformed(src.line, src.tokens[2], "expected a number"));
            ok = false;
        } else if (dur < 0.0) {
            errors->push_back(Malformed(src.line, src.tokens[2], "duration must not be negative"));
            ok = false;
        }
        if (!ok) {
            return false;
        }
        *out = Instruction::Tone(freq, dur, src.line);
        return true;
    }

    if (opcode == OpcodeMnemonic(Opcode::kJump) || opcode == OpcodeMnemonic(Opcode::kFork)) {
        const bool fork = (opcode == OpcodeMnemonic(Opcode::kFork));
        if (!ExpectTokenCount(src, 3, fork ? "pfork <label> <probability>" : "pjump <label> <probability>",
                              errors)) {
            return false;
        }
        double p = 0.0;
        if (!ParseProbability(src, src.tokens[2], &p, errors)) {
            return false;
        }
        *out = fork ? Instruction::Fork(src.tokens[1], p, src.line)
                    : Instruction::Jump(src.tokens[1], p, src.line);
        return true;
    }

    errors->push_back(Malformed(src.line, opcode, "unknown instruction '" + opcode + "'"));
    return false;
}
}  // namespace

long Program::label_index(const std::string& name) const {
    const auto it = labels_.find(name);
    if (it == labels_.end()) {
        return -1;
    }
    return static_cast<long>(it->second);
}

size_t Program::tone_count() const {
    return static_cast<size_t>(std::count_if(instructions_.begin(), instructions_.end(),
                                             [](const Instruction& ins) { return ins.op == Opcode::kTone; }));
}

bool Program::has_probabilistic_branches() const {
    return std::any_of(instructions_.begin(), instructions_.end(), [](const Instruction& ins) {
        return (ins.op == Opcode::kJump || ins.op == Opcode::kFork) && ins.probability > 0.0 &&
               ins.probability < 1.0;
    });
}

bool BuildProgram(const std::vector<Instruction>& instructions, Program* out,
                  std::vector<LoadError>* errors) {
    std::vector<LoadError> local;
    std::unordered_map<std::string, size_t> labels;
    std::vector<Instruction> resolved = instructions;

    for (size_t i = 0; i < resolved.size(); ++i) {
        const Instruction& ins = resolved[i];
        switch (ins.op) {
        case Opcode::kLabel:
            if (ins.label.empty()) {
                local.push_back(Malformed(ins.line, "", "label name is empty"));
            } else if (!labels.emplace(ins.label, i).second) {
                local.push_back(MakeError(LoadErrorKind::kDuplicateLabel, ins.line, ins.label,
                                          "label '" + ins.label + "' is already defined"));
            }
            break;
        case Opcode::kTone:
            if (!std::isfinite(ins.frequency) || ins.frequency <= 0.0) {
                local.push_back(Malformed(ins.line, "", "frequency must be positive"));
            }
            if (!std::isfinite(ins.duration) || ins.duration < 0.0) {
                local.push_back(Malformed(ins.line, "", "duration must not be negative"));
            }
            break;
        case Opcode::kJump:
        case Opcode::kFork:
            if (!(ins.probability >= 0.0 && ins.probability <= 1.0)) {
                local.push_back(Malformed(ins.line, "", "probabilities must be between 0 and 1"));
            }
            break;
        }
    }

    for (Instruction& ins : resolved) {
        if (ins.op != Opcode::kJump && ins.op != Opcode::kFork) {
            continue;
        }
        const auto it = labels.find(ins.label);
        if (it == labels.end()) {
            local.push_back(MakeError(LoadErrorKind::kUnresolvedLabel, ins.line, ins.label,
                                      "unknown label '" + ins.label + "'"));
            continue;
        }
        ins.target = it->second;
    }

    if (!local.empty()) {
        std::stable_sort(local.begin(), local.end(),
                         [](const LoadError& a, const LoadError& b) { return a.line < b.line; });
        if (errors) {
            errors->insert(errors->end(), local.begin(), local.end());
        }
        return false;
    }

    if (out) {
        out->instructions_ = std::move(resolved);
        out->labels_ = std::move(labels);
    }
    return true;
}

bool LoadProgram(const std::vector<SourceLine>& lines, Program* out, std::vector<LoadError>* errors) {
    std::vector<LoadError> local;
    std::vector<Instruction> parsed;
    parsed.reserve(lines.size());

    for (const SourceLine& src : lines) {
        if (src.tokens.empty()) {
            continue;
        }
        Instruction ins;
        if (ParseLine(src, &ins, &local)) {
            parsed.push_back(ins);
        }
    }

    // Run label checks even after syntax errors so one pass reports everything.
    Program built;
    const bool structure_ok = BuildProgram(parsed, &built, &local);

    if (!local.empty() || !structure_ok) {
        std::stable_sort(local.begin(), local.end(),
                         [](const LoadError& a, const LoadError& b) { return a.line < b.line; });
        if (errors) {
            errors->insert(errors->end(), local.begin(), local.end());
        }
        return false;
    }

    if (out) {
        *out = std::move(built);
    }
    return true;
}

bool CompileProgram(const std::string& text, Program* out, std::vector<LoadError>* errors) {
    return LoadProgram(TokenizeProgram(text), out, errors);
}

}  // namespace blip
