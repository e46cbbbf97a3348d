#pragma once
#include "ipparse/line_source.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace ipparse {

struct token {
    std::string text;
    int col = 1; // 1-based column of the first character
};

// One logical line: comment stripped, split on whitespace, never empty.
struct token_line {
    int line = 0;
    std::vector<token> tokens;
};

// Everything from the first '#' on is dropped.
std::string_view strip_comment(std::string_view line);
std::vector<token> tokenize_line(std::string_view line);

class lexer {
public:
    explicit lexer(line_source& src) : src_(src) {}
    // Next non-blank logical line; false at end of input.
    bool next(token_line& out);
    int physical_line() const { return line_no_; }
private:
    line_source& src_;
    std::string buf_;
    int line_no_ = 0;
};

} // namespace ipparse
