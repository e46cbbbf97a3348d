// Instruction validator: token line -> typed instruction or syntax_error
#pragma once
#include "ipparse/diagnostics.hpp"
#include "ipparse/lexer.hpp"
#include "ipparse/opcodes.hpp"
#include "ipparse/program.hpp"

namespace ipparse {

struct validator_options {
    bool suggest = true; // attach "did you mean" notes to unknown opcodes
};

struct validate_result {
    bool success = false;
    instruction instr;
    diagnostic diag; // meaningful only when !success
};

class validator {
public:
    explicit validator(validator_options opts = {}) : opts_(opts) {}

    // Throws syntax_error on unknown opcodes, arity mismatches and operands
    // that no grammar permitted at their position accepts.
    instruction validate(const token_line& line, int order) const;
    validate_result try_validate(const token_line& line, int order) const;

    // Classify one operand token for a given position.
    operand classify(const token& tok, slot s, int line) const;

private:
    validator_options opts_;
    constant literal(const token& tok, std::string_view prefix, std::string_view body, int line) const;
};

} // namespace ipparse
