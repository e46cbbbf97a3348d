#include "ipparse/diagnostics_json.hpp"
#include "ipparse/config.hpp"
#include "ipparse/text.hpp"
#include <iostream>

namespace ipparse {

std::string json_escape(const std::string& s){
    return "\"" + escape_text(s, text_dialect::json) + "\"";
}

namespace {

// Comma-separated members of one JSON object, in insertion order.
class json_object {
public:
    json_object& str(const char* key, const std::string& v){ return raw(key, json_escape(v)); }
    json_object& num(const char* key, int v){ return raw(key, std::to_string(v)); }
    json_object& raw(const char* key, const std::string& v){
        body_ += body_.empty() ? "" : ",";
        body_ += "\"" + std::string(key) + "\":" + v;
        return *this;
    }
    std::string close() const { return "{" + body_ + "}"; }
private:
    std::string body_;
};

std::string position_json(const std::string& message, int line, int col){
    return json_object().str("message", message).num("line", line).num("col", col).close();
}

} // namespace

std::string diagnostic_to_json(const diagnostic& d){
    std::string notes = "[";
    for(size_t i=0;i<d.notes.size();++i){
        if(i) notes += ",";
        notes += position_json(d.notes[i].message, d.notes[i].line, d.notes[i].col);
    }
    notes += "]";
    return json_object()
        .str("kind", kind_name(d.kind))
        .num("exit", exit_code(d.kind))
        .str("code", d.code)
        .str("message", d.message)
        .str("hint", d.hint)
        .num("line", d.line)
        .num("col", d.col)
        .raw("notes", notes)
        .close();
}

void maybe_print_json(const diagnostic& d){
    if(env_flag("IPPARSE_DIAG_JSON", false))
        std::cerr << diagnostic_to_json(d) << "\n";
}

} // namespace ipparse
