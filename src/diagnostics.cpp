#include "ipparse/diagnostics.hpp"
#include <algorithm>
#include <sstream>
#include <utility>

namespace ipparse {

int exit_code(error_kind k){
    switch(k){
        case error_kind::header_error: return 21;
        case error_kind::syntax_error: return 23;
        case error_kind::internal_error: return 99;
    }
    return 99;
}

const char* kind_name(error_kind k){
    switch(k){
        case error_kind::header_error: return "header error";
        case error_kind::syntax_error: return "syntax error";
        case error_kind::internal_error: return "internal error";
    }
    return "internal error";
}

std::string format_diagnostic(const diagnostic& d, const std::string& source_name){
    std::ostringstream os;
    os << source_name;
    if(d.line>0){ os << ":" << d.line; if(d.col>0) os << ":" << d.col; }
    os << ": " << kind_name(d.kind) << ": " << d.message;
    if(!d.code.empty()) os << " [" << d.code << "]";
    os << "\n";
    if(!d.hint.empty()) os << "  hint: " << d.hint << "\n";
    for(auto &n: d.notes) os << "  note: " << n.message << "\n";
    return os.str();
}

int edit_distance(std::string_view a, std::string_view b){
    // Two rolling rows of the Levenshtein table.
    std::vector<int> prev(b.size()+1), cur(b.size()+1);
    for(size_t j=0;j<=b.size();++j) prev[j] = static_cast<int>(j);
    for(size_t i=1;i<=a.size();++i){
        cur[0] = static_cast<int>(i);
        for(size_t j=1;j<=b.size();++j){
            const int subst = prev[j-1] + (a[i-1]==b[j-1] ? 0 : 1);
            cur[j] = std::min({prev[j] + 1, cur[j-1] + 1, subst});
        }
        std::swap(prev, cur);
    }
    return prev[b.size()];
}

void add_suggestion_note(diagnostic& d, const std::vector<std::string>& names){
    if(names.empty()) return;
    std::string msg = "did you mean " + names.front();
    for(size_t i=1;i<names.size();++i) msg += (i+1==names.size() ? " or " : ", ") + names[i];
    d.notes.push_back(diag_note{msg + "?", d.line, d.col});
}

} // namespace ipparse
