// Program assembler: header check + ordered accumulation of validated instructions
#pragma once
#include "ipparse/diagnostics.hpp"
#include "ipparse/lexer.hpp"
#include "ipparse/line_source.hpp"
#include "ipparse/program.hpp"
#include "ipparse/validator.hpp"

namespace ipparse {

bool is_header_line(const token_line& line);

class assembler {
public:
    explicit assembler(validator_options opts = {}) : validator_(opts) {}

    // Feed logical lines in input order. The first must be the header.
    void accept(const token_line& line);
    // Returns the completed program; throws header_error if no header was seen.
    program finish();

    int next_order() const { return next_order_; }
    bool header_seen() const { return header_seen_; }

private:
    validator validator_;
    program prog_;
    bool header_seen_ = false;
    int next_order_ = 1;
};

// Runs the whole front end over one source. Throws the classified error.
program assemble(line_source& src, validator_options opts = {});

struct parse_result {
    bool success = false;
    program prog;
    diagnostic diag; // meaningful only when !success
};

// Non-throwing wrapper around assemble().
parse_result parse_program(line_source& src, validator_options opts = {});

} // namespace ipparse
