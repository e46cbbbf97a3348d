#include <gtest/gtest.h>
#include "ipparse/validator.hpp"
#include "test_support.hpp"

using namespace ipparse;
using ipparse_test::make_line;

namespace {

diagnostic expect_syntax_error(const std::string& text, validator_options opts = {}){
    validator v(opts);
    auto r = v.try_validate(make_line(text, 7), 1);
    EXPECT_FALSE(r.success) << text;
    EXPECT_EQ(r.diag.kind, error_kind::syntax_error) << text;
    EXPECT_EQ(r.diag.line, 7) << text;
    return r.diag;
}

} // namespace

TEST(Validator, MoveWithVariableAndInt){
    validator v;
    auto in = v.validate(make_line("MOVE GF@x int@42"), 1);
    EXPECT_EQ(in.opcode, "MOVE");
    EXPECT_EQ(in.order, 1);
    ASSERT_EQ(in.operands.size(), 2u);
    ASSERT_TRUE(is_variable(in.operands[0]));
    EXPECT_EQ(std::get<variable>(in.operands[0]).frame, frame_kind::global);
    EXPECT_EQ(std::get<variable>(in.operands[0]).name, "x");
    ASSERT_TRUE(is_constant(in.operands[1]));
    EXPECT_EQ(std::get<constant>(in.operands[1]).kind, literal_kind::int_lit);
    EXPECT_EQ(std::get<constant>(in.operands[1]).value, "42");
}

TEST(Validator, OpcodeCaseIsFolded){
    validator v;
    for(const char* spelling : {"MOVE", "move", "MoVe"}){
        auto in = v.validate(make_line(std::string(spelling) + " LF@a bool@true"), 3);
        EXPECT_EQ(in.opcode, "MOVE");
        EXPECT_EQ(kind_tag(in.operands[1]), "bool");
    }
}

TEST(Validator, VariableNamesKeepTheirCase){
    validator v;
    auto a = v.validate(make_line("DEFVAR GF@x"), 1);
    auto b = v.validate(make_line("DEFVAR GF@X"), 2);
    EXPECT_EQ(operand_text(a.operands[0]), "GF@x");
    EXPECT_EQ(operand_text(b.operands[0]), "GF@X");
    EXPECT_NE(operand_text(a.operands[0]), operand_text(b.operands[0]));
}

TEST(Validator, AllConstantKinds){
    validator v;
    auto check = [&](const std::string& tok, literal_kind k, const std::string& value){
        auto in = v.validate(make_line("WRITE " + tok), 1);
        ASSERT_TRUE(is_constant(in.operands[0])) << tok;
        EXPECT_EQ(std::get<constant>(in.operands[0]).kind, k) << tok;
        EXPECT_EQ(std::get<constant>(in.operands[0]).value, value) << tok;
    };
    check("int@-0x1A", literal_kind::int_lit, "-0x1A");
    check("bool@false", literal_kind::bool_lit, "false");
    check("nil@nil", literal_kind::nil_lit, "nil");
    check("float@0x1.8p+1", literal_kind::float_lit, "0x1.8p+1");
    check("string@", literal_kind::string_lit, "");
    check("string@a@b", literal_kind::string_lit, "a@b");
    check("string@tab\\009end", literal_kind::string_lit, "tab\tend");
}

TEST(Validator, LabelsAndTypes){
    validator v;
    auto j = v.validate(make_line("JUMPIFEQ end GF@a nil@nil"), 1);
    ASSERT_TRUE(is_label(j.operands[0]));
    EXPECT_EQ(std::get<label_ref>(j.operands[0]).name, "end");
    // a label slot takes identifiers that look like type keywords
    auto l = v.validate(make_line("LABEL int"), 2);
    EXPECT_TRUE(is_label(l.operands[0]));
    auto r = v.validate(make_line("READ TF@in string"), 3);
    ASSERT_TRUE(is_type_name(r.operands[1]));
    EXPECT_EQ(std::get<type_name>(r.operands[1]).name, "string");
    EXPECT_EQ(std::get<variable>(r.operands[0]).frame, frame_kind::temporary);
}

TEST(Validator, UnknownOpcode){
    auto d = expect_syntax_error("FOO GF@x");
    EXPECT_EQ(d.code, "E2301");
}

TEST(Validator, UnknownOpcodeSuggestions){
    auto d = expect_syntax_error("MOVEE GF@x int@1");
    ASSERT_FALSE(d.notes.empty());
    EXPECT_NE(d.notes[0].message.find("MOVE"), std::string::npos);

    validator_options quiet; quiet.suggest = false;
    auto q = expect_syntax_error("MOVEE GF@x int@1", quiet);
    EXPECT_TRUE(q.notes.empty());
}

TEST(Validator, ArityMismatch){
    EXPECT_EQ(expect_syntax_error("MOVE GF@x").code, "E2302");
    EXPECT_EQ(expect_syntax_error("CREATEFRAME GF@x").code, "E2302");
    EXPECT_EQ(expect_syntax_error("ADD GF@x int@1 int@2 int@3").code, "E2302");
}

TEST(Validator, OperandKindNotPermitted){
    EXPECT_EQ(expect_syntax_error("MOVE int@1 GF@x").code, "E2303");      // var slot
    EXPECT_EQ(expect_syntax_error("JUMP GF@x").code, "E2303");            // label slot
    EXPECT_EQ(expect_syntax_error("READ GF@x integer").code, "E2303");    // type slot
    EXPECT_EQ(expect_syntax_error("WRITE label").code, "E2303");          // symb slot
    EXPECT_EQ(expect_syntax_error("WRITE gf@x").code, "E2303");           // frame is case-sensitive
    EXPECT_EQ(expect_syntax_error("WRITE char@a").code, "E2303");
}

TEST(Validator, MalformedLiterals){
    EXPECT_EQ(expect_syntax_error("WRITE int@abc").code, "E2304");
    EXPECT_EQ(expect_syntax_error("WRITE int@").code, "E2304");
    EXPECT_EQ(expect_syntax_error("WRITE bool@True").code, "E2304");
    EXPECT_EQ(expect_syntax_error("WRITE nil@null").code, "E2304");
    EXPECT_EQ(expect_syntax_error("WRITE float@1.2.3").code, "E2304");
    EXPECT_EQ(expect_syntax_error("WRITE string@a\\12").code, "E2305");
    EXPECT_EQ(expect_syntax_error("WRITE string@\\").code, "E2305");
}

TEST(Validator, StringsMustBeXmlText){
    EXPECT_EQ(expect_syntax_error("WRITE string@\\000").code, "E2305");
    EXPECT_EQ(expect_syntax_error("WRITE string@a\\001b").code, "E2305");
    EXPECT_EQ(expect_syntax_error("WRITE string@\\011").code, "E2305");
    EXPECT_EQ(expect_syntax_error("WRITE string@\\031").code, "E2305");
    EXPECT_EQ(expect_syntax_error("WRITE string@ok\xFF").code, "E2304");
    EXPECT_EQ(expect_syntax_error("WRITE string@\xC3").code, "E2304");
    EXPECT_EQ(expect_syntax_error("WRITE string@a\x01").code, "E2304");
}

TEST(Validator, XmlSafeControlEscapesAccepted){
    for(const char* src : {"WRITE string@\\009", "WRITE string@\\010", "WRITE string@\\013",
                           "WRITE string@\\032", "WRITE string@\\127"}){
        auto r = validator().try_validate(make_line(src), 1);
        EXPECT_TRUE(r.success) << src << ": " << r.diag.message;
    }
}

TEST(Validator, BadVariableName){
    auto d = expect_syntax_error("DEFVAR GF@1abc");
    EXPECT_EQ(d.code, "E2306");
    EXPECT_NE(d.message.find("operand 1 of DEFVAR"), std::string::npos);
}

TEST(Validator, ThrowingApi){
    validator v;
    EXPECT_THROW(v.validate(make_line("NOPE"), 1), syntax_error);
    try {
        v.validate(make_line("ADD GF@x int@1 bool@maybe", 12), 4);
        FAIL() << "expected syntax_error";
    } catch(const syntax_error& e){
        EXPECT_EQ(e.diag().line, 12);
        EXPECT_EQ(e.diag().col, 16);
        EXPECT_EQ(e.kind(), error_kind::syntax_error);
    }
}
