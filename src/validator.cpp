#include "ipparse/validator.hpp"
#include "ipparse/grammar.hpp"
#include "ipparse/text.hpp"

namespace ipparse {

namespace {

frame_kind frame_of(std::string_view text){
    if(text.compare(0, 2, "LF")==0) return frame_kind::local;
    if(text.compare(0, 2, "TF")==0) return frame_kind::temporary;
    return frame_kind::global;
}

bool looks_like_variable(std::string_view text){
    return text.size()>=3 && text[2]=='@' && (text.compare(0,2,"GF")==0 || text.compare(0,2,"LF")==0 || text.compare(0,2,"TF")==0);
}

bool literal_prefix(std::string_view prefix, literal_kind& out){
    if(prefix=="int"){ out=literal_kind::int_lit; return true; }
    if(prefix=="bool"){ out=literal_kind::bool_lit; return true; }
    if(prefix=="string"){ out=literal_kind::string_lit; return true; }
    if(prefix=="nil"){ out=literal_kind::nil_lit; return true; }
    if(prefix=="float"){ out=literal_kind::float_lit; return true; }
    return false;
}

} // namespace

constant validator::literal(const token& tok, std::string_view prefix, std::string_view body, int line) const {
    literal_kind k{};
    if(!literal_prefix(prefix, k))
        throw syntax_error("E2303", "unknown literal type '" + std::string(prefix) + "' in '" + tok.text + "'",
                           "constants are written int@, bool@, string@, nil@ or float@", line, tok.col);
    bool ok=false;
    std::string value;
    switch(k){
        case literal_kind::int_lit: ok = grammar::full_match<grammar::int_literal>(body); value = std::string(body); break;
        case literal_kind::bool_lit: ok = grammar::full_match<grammar::bool_literal>(body); value = std::string(body); break;
        case literal_kind::nil_lit: ok = grammar::full_match<grammar::nil_literal>(body); value = std::string(body); break;
        case literal_kind::float_lit: ok = grammar::full_match<grammar::float_literal>(body); value = std::string(body); break;
        case literal_kind::string_lit:
            ok = grammar::decode_string(body, value);
            if(!ok && body.find('\\')!=std::string_view::npos)
                throw syntax_error("E2305", "invalid escape sequence in '" + tok.text + "'",
                                   "a backslash must be followed by exactly three decimal digits", line, tok.col);
            if(ok && find_non_xml_char(body)!=std::string_view::npos)
                throw syntax_error("E2304", "string literal '" + tok.text + "' is not valid UTF-8 text", "", line, tok.col);
            if(ok && find_non_xml_char(value)!=std::string::npos)
                throw syntax_error("E2305", "escape sequence in '" + tok.text + "' denotes a character XML cannot carry",
                                   "below \\032 only \\009, \\010 and \\013 are representable", line, tok.col);
            break;
    }
    if(!ok)
        throw syntax_error("E2304", "malformed " + std::string(prefix) + " literal '" + tok.text + "'", "", line, tok.col);
    return constant{k, std::move(value)};
}

operand validator::classify(const token& tok, slot s, int line) const {
    const std::string& text = tok.text;
    const bool want_var = s==slot::var || s==slot::symb;
    const bool want_const = s==slot::symb;
    if(want_var){
        if(grammar::full_match<grammar::variable>(text))
            return variable{frame_of(text), text.substr(3)};
        if(looks_like_variable(text))
            throw syntax_error("E2306", "invalid variable name '" + text + "'",
                               "names start with a letter or one of _-$&%*!? and continue with letters, digits or those symbols", line, tok.col);
    }
    if(want_const){
        auto at = text.find('@');
        if(at!=std::string::npos)
            return literal(tok, std::string_view(text).substr(0, at), std::string_view(text).substr(at+1), line);
    }
    if(s==slot::type && grammar::full_match<grammar::type_keyword>(text))
        return type_name{text};
    if(s==slot::label && grammar::full_match<grammar::identifier>(text))
        return label_ref{text};
    throw syntax_error("E2303", "expected " + std::string(slot_name(s)) + ", got '" + text + "'", "", line, tok.col);
}

instruction validator::validate(const token_line& line, int order) const {
    if(line.tokens.empty()) throw internal_error("E9902", "empty token line reached the validator", line.line);
    const token& op = line.tokens.front();
    const opcode_signature* sig = find_opcode(op.text);
    if(!sig){
        diagnostic d{error_kind::syntax_error, "E2301", "unknown instruction '" + op.text + "'", "", line.line, op.col, {}};
        if(opts_.suggest) add_suggestion_note(d, similar_opcodes(op.text));
        throw syntax_error(std::move(d));
    }
    const size_t argc = line.tokens.size() - 1;
    if(argc != sig->arity()){
        throw syntax_error("E2302", sig->name + " expects " + std::to_string(sig->arity()) + " operand(s), got " + std::to_string(argc), "", line.line,
                           argc > sig->arity() ? line.tokens[sig->arity()+1].col : op.col);
    }
    instruction instr;
    instr.opcode = sig->name;
    instr.order = order;
    instr.source_line = line.line;
    for(size_t i=0;i<argc;++i){
        try {
            instr.operands.push_back(classify(line.tokens[i+1], sig->operands[i], line.line));
        } catch(const syntax_error& e){
            std::string where = "operand " + std::to_string(i+1) + " of " + sig->name;
            diagnostic d = e.diag();
            d.message = where + ": " + d.message;
            throw syntax_error(std::move(d));
        }
    }
    return instr;
}

validate_result validator::try_validate(const token_line& line, int order) const {
    validate_result r;
    try {
        r.instr = validate(line, order);
        r.success = true;
    } catch(const error& e){
        r.diag = e.diag();
    }
    return r;
}

} // namespace ipparse
