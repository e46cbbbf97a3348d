#include "ipparse/xml_writer.hpp"
#include "ipparse/diagnostics.hpp"
#include "ipparse/opcodes.hpp"
#include "ipparse/text.hpp"
#include <sstream>

namespace ipparse {

std::string xml_escape(std::string_view s){
    return escape_text(s, text_dialect::xml);
}

// Signature drift here means the validator let something through.
static void check_instruction(const instruction& in){
    const opcode_signature* sig = find_opcode(in.opcode);
    if(!sig) throw internal_error("E9901", "cannot serialize unknown opcode '" + in.opcode + "'", in.source_line);
    if(sig->arity() != in.operands.size())
        throw internal_error("E9901", "instruction " + std::to_string(in.order) + " (" + in.opcode + ") carries " +
                             std::to_string(in.operands.size()) + " operand(s), signature has " + std::to_string(sig->arity()), in.source_line);
    for(size_t i=0;i<in.operands.size();++i){
        if(!slot_accepts(sig->operands[i], in.operands[i]))
            throw internal_error("E9901", "operand " + std::to_string(i+1) + " of instruction " + std::to_string(in.order) +
                                 " is not a " + slot_name(sig->operands[i]), in.source_line);
        const std::string text = operand_text(in.operands[i]);
        const std::size_t bad = find_non_xml_char(text);
        if(bad != std::string::npos)
            throw internal_error("E9901", "operand " + std::to_string(i+1) + " of instruction " + std::to_string(in.order) +
                                 " holds a character XML cannot carry at offset " + std::to_string(bad), in.source_line);
    }
}

void write_xml(const program& p, std::ostream& os, const xml_options& opts){
    auto indentStr = [&](int depth) -> std::string {
        int spaces = depth * opts.indent_width;
        if (spaces < 0) spaces = 0;
        return std::string(static_cast<size_t>(spaces), ' ');
    };

    for(auto &in: p.instructions) check_instruction(in);

    std::string out;
    if(opts.declaration) out += "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    out += "<program language=\"" + xml_escape(p.language) + "\"";
    if(p.instructions.empty()){
        out += "/>\n";
    } else {
        out += ">\n";
        for(auto &in: p.instructions){
            out += indentStr(1) + "<instruction order=\"" + std::to_string(in.order) + "\" opcode=\"" + xml_escape(in.opcode) + "\"";
            if(in.operands.empty()){ out += "/>\n"; continue; }
            out += ">\n";
            for(size_t i=0;i<in.operands.size();++i){
                const std::string tag = "arg" + std::to_string(i+1);
                const std::string text = operand_text(in.operands[i]);
                out += indentStr(2) + "<" + tag + " type=\"" + kind_tag(in.operands[i]) + "\"";
                if(text.empty()) out += "/>\n";
                else out += ">" + xml_escape(text) + "</" + tag + ">\n";
            }
            out += indentStr(1) + "</instruction>\n";
        }
        out += "</program>\n";
    }
    os << out;
    os.flush();
    if(!os) throw internal_error("E9903", "failed to write XML output");
}

std::string to_xml(const program& p, const xml_options& opts){
    std::ostringstream oss;
    write_xml(p, oss, opts);
    return oss.str();
}

} // namespace ipparse
