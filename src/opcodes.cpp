#include "ipparse/opcodes.hpp"
#include "ipparse/diagnostics.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <utility>

namespace ipparse {

namespace {

using S = slot;

const std::vector<opcode_signature>& signature_list(){
    static const std::vector<opcode_signature> sigs = {
        // frames, calls
        {"MOVE", {S::var, S::symb}},
        {"CREATEFRAME", {}},
        {"PUSHFRAME", {}},
        {"POPFRAME", {}},
        {"DEFVAR", {S::var}},
        {"CALL", {S::label}},
        {"RETURN", {}},
        // data stack
        {"PUSHS", {S::symb}},
        {"POPS", {S::var}},
        // arithmetic, relational, boolean, conversions
        {"ADD", {S::var, S::symb, S::symb}},
        {"SUB", {S::var, S::symb, S::symb}},
        {"MUL", {S::var, S::symb, S::symb}},
        {"IDIV", {S::var, S::symb, S::symb}},
        {"DIV", {S::var, S::symb, S::symb}},
        {"LT", {S::var, S::symb, S::symb}},
        {"GT", {S::var, S::symb, S::symb}},
        {"EQ", {S::var, S::symb, S::symb}},
        {"AND", {S::var, S::symb, S::symb}},
        {"OR", {S::var, S::symb, S::symb}},
        {"NOT", {S::var, S::symb}},
        {"INT2CHAR", {S::var, S::symb}},
        {"STRI2INT", {S::var, S::symb, S::symb}},
        {"INT2FLOAT", {S::var, S::symb}},
        {"FLOAT2INT", {S::var, S::symb}},
        // I/O
        {"READ", {S::var, S::type}},
        {"WRITE", {S::symb}},
        // strings
        {"CONCAT", {S::var, S::symb, S::symb}},
        {"STRLEN", {S::var, S::symb}},
        {"GETCHAR", {S::var, S::symb, S::symb}},
        {"SETCHAR", {S::var, S::symb, S::symb}},
        // types
        {"TYPE", {S::var, S::symb}},
        // control flow
        {"LABEL", {S::label}},
        {"JUMP", {S::label}},
        {"JUMPIFEQ", {S::label, S::symb, S::symb}},
        {"JUMPIFNEQ", {S::label, S::symb, S::symb}},
        {"EXIT", {S::symb}},
        // debugging
        {"DPRINT", {S::symb}},
        {"BREAK", {}},
        // stack variants operate on the data stack only
        {"CLEARS", {}},
        {"ADDS", {}},
        {"SUBS", {}},
        {"MULS", {}},
        {"IDIVS", {}},
        {"DIVS", {}},
        {"LTS", {}},
        {"GTS", {}},
        {"EQS", {}},
        {"ANDS", {}},
        {"ORS", {}},
        {"NOTS", {}},
        {"INT2CHARS", {}},
        {"STRI2INTS", {}},
        {"INT2FLOATS", {}},
        {"FLOAT2INTS", {}},
        {"JUMPIFEQS", {S::label}},
        {"JUMPIFNEQS", {S::label}},
    };
    return sigs;
}

const std::unordered_map<std::string, const opcode_signature*>& signature_index(){
    static const std::unordered_map<std::string, const opcode_signature*> index = []{
        std::unordered_map<std::string, const opcode_signature*> m;
        for(auto &s: signature_list()) m.emplace(s.name, &s);
        return m;
    }();
    return index;
}

} // namespace

std::string to_upper(std::string_view s){
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
    return out;
}

const char* slot_name(slot s){
    switch(s){
        case slot::var: return "variable";
        case slot::symb: return "symbol (variable or constant)";
        case slot::label: return "label";
        case slot::type: return "type name";
    }
    return "?";
}

bool slot_accepts(slot s, const operand& op){
    switch(s){
        case slot::var: return is_variable(op);
        case slot::symb: return is_variable(op) || is_constant(op);
        case slot::label: return is_label(op);
        case slot::type: return is_type_name(op);
    }
    return false;
}

const opcode_signature* find_opcode(std::string_view name){
    auto &idx = signature_index();
    auto it = idx.find(to_upper(name));
    return it == idx.end() ? nullptr : it->second;
}

const std::vector<std::string>& opcode_names(){
    static const std::vector<std::string> names = []{
        std::vector<std::string> v;
        for(auto &s: signature_list()) v.push_back(s.name);
        return v;
    }();
    return names;
}

std::vector<std::string> similar_opcodes(std::string_view name, std::size_t limit){
    const std::string key = to_upper(name);
    std::vector<std::pair<int, const std::string*>> ranked;
    for(auto &sig: signature_list()){
        const int d = edit_distance(key, sig.name);
        if(d <= 2) ranked.emplace_back(d, &sig.name);
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& l, const auto& r){ return l.first < r.first; });
    std::vector<std::string> out;
    for(size_t i=0;i<ranked.size() && i<limit;++i) out.push_back(*ranked[i].second);
    return out;
}

} // namespace ipparse
