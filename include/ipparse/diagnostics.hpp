// diagnostics.hpp - classified failures raised by the IPPcode24 pipeline
#pragma once
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ipparse {

// Ordered by precedence: a header problem outranks anything found in the body.
enum class error_kind { header_error, syntax_error, internal_error };

struct diag_note { std::string message; int line=-1; int col=-1; };

struct diagnostic {
    error_kind kind = error_kind::internal_error;
    std::string code;
    std::string message;
    std::string hint;
    int line=-1;
    int col=-1;
    std::vector<diag_note> notes;
};

// Process exit status for each failure class (0 is reserved for success).
int exit_code(error_kind k);
const char* kind_name(error_kind k);

struct error : std::runtime_error {
    explicit error(diagnostic d) : std::runtime_error(d.message), diag_(std::move(d)) {}
    const diagnostic& diag() const noexcept { return diag_; }
    error_kind kind() const noexcept { return diag_.kind; }
private:
    diagnostic diag_;
};

struct header_error : error {
    header_error(std::string code, std::string message, std::string hint, int line, int col=1)
        : error(diagnostic{error_kind::header_error, std::move(code), std::move(message), std::move(hint), line, col, {}}) {}
};

struct syntax_error : error {
    syntax_error(std::string code, std::string message, std::string hint, int line, int col=1)
        : error(diagnostic{error_kind::syntax_error, std::move(code), std::move(message), std::move(hint), line, col, {}}) {}
    explicit syntax_error(diagnostic d) : error(std::move(d)) {}
};

struct internal_error : error {
    internal_error(std::string code, std::string message, int line=-1)
        : error(diagnostic{error_kind::internal_error, std::move(code), std::move(message), "", line, -1, {}}) {}
};

// One human readable line (plus hint and notes) for stderr.
std::string format_diagnostic(const diagnostic& d, const std::string& source_name);

// Levenshtein distance, used to rank "did you mean" candidates.
int edit_distance(std::string_view a, std::string_view b);
// Appends "did you mean A, B or C?" at the diagnostic's position; no-op for an empty list.
void add_suggestion_note(diagnostic& d, const std::vector<std::string>& names);

} // namespace ipparse
