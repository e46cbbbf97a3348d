// Opcode signature table for IPPcode24 (base language + FLOAT and STACK extensions)
#pragma once
#include "ipparse/program.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace ipparse {

// What one operand position accepts.
enum class slot {
    var,    // variable only
    symb,   // variable or any constant
    label,  // label only
    type    // type name only
};

const char* slot_name(slot s);
bool slot_accepts(slot s, const operand& op);

struct opcode_signature {
    std::string name;            // canonical upper case
    std::vector<slot> operands;
    size_t arity() const { return operands.size(); }
};

// Case-insensitive lookup; nullptr for unknown opcodes.
const opcode_signature* find_opcode(std::string_view name);

// All canonical opcode names in table order.
const std::vector<std::string>& opcode_names();

// Opcodes within edit distance 2 of name (case-folded), closest first, at most limit.
std::vector<std::string> similar_opcodes(std::string_view name, std::size_t limit = 3);

std::string to_upper(std::string_view s);

} // namespace ipparse
