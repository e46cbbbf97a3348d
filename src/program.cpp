#include "ipparse/program.hpp"

namespace ipparse {

const char* frame_prefix(frame_kind f){
    switch(f){
        case frame_kind::global: return "GF";
        case frame_kind::local: return "LF";
        case frame_kind::temporary: return "TF";
    }
    return "GF";
}

const char* literal_tag(literal_kind k){
    switch(k){
        case literal_kind::int_lit: return "int";
        case literal_kind::bool_lit: return "bool";
        case literal_kind::string_lit: return "string";
        case literal_kind::nil_lit: return "nil";
        case literal_kind::float_lit: return "float";
    }
    return "nil";
}

std::string kind_tag(const operand& op){
    struct V {
        std::string operator()(const variable&) const { return "var"; }
        std::string operator()(const constant& c) const { return literal_tag(c.kind); }
        std::string operator()(const label_ref&) const { return "label"; }
        std::string operator()(const type_name&) const { return "type"; }
    };
    return std::visit(V{}, op);
}

std::string operand_text(const operand& op){
    struct V {
        std::string operator()(const variable& v) const { return std::string(frame_prefix(v.frame)) + '@' + v.name; }
        std::string operator()(const constant& c) const { return c.value; }
        std::string operator()(const label_ref& l) const { return l.name; }
        std::string operator()(const type_name& t) const { return t.name; }
    };
    return std::visit(V{}, op);
}

} // namespace ipparse
