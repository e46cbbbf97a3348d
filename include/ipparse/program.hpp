// Validated IPPcode24 program: instructions with strongly typed operands
#pragma once
#include <string>
#include <variant>
#include <vector>

namespace ipparse {

inline constexpr const char* language_id = "IPPcode24";

enum class frame_kind { global, local, temporary };   // GF, LF, TF
enum class literal_kind { int_lit, bool_lit, string_lit, nil_lit, float_lit };

struct variable {
    frame_kind frame;
    std::string name;
};
struct constant {
    literal_kind kind;
    std::string value; // decoded text (\ddd escapes already resolved for strings)
};
struct label_ref {
    std::string name;
};
struct type_name {
    std::string name;
};

using operand = std::variant<variable, constant, label_ref, type_name>;

struct instruction {
    std::string opcode;            // canonical upper case
    std::vector<operand> operands;
    int order = 0;                 // 1-based, assigned by the assembler
    int source_line = -1;
};

struct program {
    std::string language = language_id;
    std::vector<instruction> instructions;
};

const char* frame_prefix(frame_kind f);       // "GF" / "LF" / "TF"
const char* literal_tag(literal_kind k);      // "int", "bool", ...

// Value of the type="..." attribute: var, int, bool, string, nil, float, label, type.
std::string kind_tag(const operand& op);
// Text content of an argument element (unescaped).
std::string operand_text(const operand& op);

inline bool is_variable(const operand& op) { return std::holds_alternative<variable>(op); }
inline bool is_constant(const operand& op) { return std::holds_alternative<constant>(op); }
inline bool is_label(const operand& op) { return std::holds_alternative<label_ref>(op); }
inline bool is_type_name(const operand& op) { return std::holds_alternative<type_name>(op); }

} // namespace ipparse
