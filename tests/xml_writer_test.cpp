#include <gtest/gtest.h>
#include <sstream>
#include "ipparse/diagnostics.hpp"
#include "ipparse/xml_writer.hpp"
#include "test_support.hpp"

using namespace ipparse;
using ipparse_test::assemble_text;

TEST(XmlWriter, Escape){
    EXPECT_EQ(xml_escape("a&b"), "a&amp;b");
    EXPECT_EQ(xml_escape("<tag>"), "&lt;tag&gt;");
    EXPECT_EQ(xml_escape("say \"hi\""), "say &quot;hi&quot;");
    EXPECT_EQ(xml_escape("it's"), "it's");
    EXPECT_EQ(xml_escape("line\nnext"), "line&#10;next");
    EXPECT_EQ(xml_escape(std::string("\x7F", 1)), "&#127;");
    EXPECT_EQ(xml_escape("\xC3\xA9"), "\xC3\xA9");
    EXPECT_EQ(xml_escape("a\tb\rc"), "a&#9;b&#13;c");
}

TEST(XmlWriter, EscapeRefusesCharactersOutsideXml){
    EXPECT_THROW((void)xml_escape(std::string("a\0c", 3)), internal_error);
    EXPECT_THROW((void)xml_escape("a\x01" "b"), internal_error);
    EXPECT_THROW((void)xml_escape("\x1F"), internal_error);
    EXPECT_THROW((void)xml_escape("\xFF"), internal_error);
    EXPECT_THROW((void)xml_escape("\xED\xA0\x80"), internal_error);   // UTF-8 encoded surrogate
}

TEST(XmlWriter, NonXmlStringValueIsInternalError){
    program p;
    instruction in;
    in.opcode = "WRITE";
    in.order = 1;
    in.operands.push_back(constant{literal_kind::string_lit, std::string("a\x01" "b\0c", 5)});
    p.instructions.push_back(in);
    std::ostringstream os;
    try {
        write_xml(p, os);
        FAIL() << "expected internal_error";
    } catch(const internal_error& e){
        EXPECT_EQ(e.diag().code, "E9901");
    }
    EXPECT_TRUE(os.str().empty());
}

TEST(XmlWriter, AcceptedControlEscapesStayWellFormed){
    auto p = assemble_text(".IPPcode24\nWRITE string@\\009x\\013y\\127\n");
    auto xml = to_xml(p);
    EXPECT_NE(xml.find("<arg1 type=\"string\">&#9;x&#13;y&#127;</arg1>"), std::string::npos) << xml;
    // No character reference below &#32; other than tab, newline and carriage return.
    for(size_t at = xml.find("&#"); at != std::string::npos; at = xml.find("&#", at + 2)){
        const int code = std::stoi(xml.substr(at + 2));
        EXPECT_TRUE(code >= 32 || code == 9 || code == 10 || code == 13) << xml;
    }
}

TEST(XmlWriter, MoveScenario){
    auto p = assemble_text(".IPPcode24\nMOVE GF@x int@42\n");
    const std::string expected =
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        "<program language=\"IPPcode24\">\n"
        "  <instruction order=\"1\" opcode=\"MOVE\">\n"
        "    <arg1 type=\"var\">GF@x</arg1>\n"
        "    <arg2 type=\"int\">42</arg2>\n"
        "  </instruction>\n"
        "</program>\n";
    EXPECT_EQ(to_xml(p), expected);
}

TEST(XmlWriter, SelfClosingForms){
    auto empty = assemble_text(".IPPcode24\n");
    EXPECT_EQ(to_xml(empty), "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<program language=\"IPPcode24\"/>\n");

    auto p = assemble_text(".IPPcode24\ncreateframe\nWRITE string@\n");
    xml_options o; o.declaration = false;
    const std::string expected =
        "<program language=\"IPPcode24\">\n"
        "  <instruction order=\"1\" opcode=\"CREATEFRAME\"/>\n"
        "  <instruction order=\"2\" opcode=\"WRITE\">\n"
        "    <arg1 type=\"string\"/>\n"
        "  </instruction>\n"
        "</program>\n";
    EXPECT_EQ(to_xml(p, o), expected);
}

TEST(XmlWriter, AllKindTags){
    auto p = assemble_text(".IPPcode24\n"
                           "READ LF@v float\n"
                           "JUMPIFEQ end bool@true nil@nil\n"
                           "PUSHS float@1.5\n"
                           "WRITE string@x\n");
    auto xml = to_xml(p);
    for(const char* frag : {"<arg1 type=\"var\">LF@v</arg1>", "<arg2 type=\"type\">float</arg2>",
                            "<arg1 type=\"label\">end</arg1>", "<arg2 type=\"bool\">true</arg2>",
                            "<arg3 type=\"nil\">nil</arg3>", "<arg1 type=\"float\">1.5</arg1>",
                            "<arg1 type=\"string\">x</arg1>"})
        EXPECT_NE(xml.find(frag), std::string::npos) << frag;
}

TEST(XmlWriter, StringEscapesRoundTrip){
    auto p = assemble_text(".IPPcode24\nWRITE string@a\\010b&c<d>\\034\n");
    auto xml = to_xml(p);
    EXPECT_NE(xml.find("<arg1 type=\"string\">a&#10;b&amp;c&lt;d&gt;&quot;</arg1>"), std::string::npos) << xml;
    EXPECT_EQ(xml.find("&c"), std::string::npos);
}

TEST(XmlWriter, IndentWidth){
    auto p = assemble_text(".IPPcode24\nPUSHS int@1\n");
    xml_options o; o.indent_width = 4; o.declaration = false;
    auto xml = to_xml(p, o);
    EXPECT_NE(xml.find("\n    <instruction"), std::string::npos);
    EXPECT_NE(xml.find("\n        <arg1"), std::string::npos);
}

TEST(XmlWriter, InvariantViolationIsInternalError){
    program p;
    instruction bad;
    bad.opcode = "MOVE";
    bad.order = 1;
    bad.operands.push_back(variable{frame_kind::global, "x"});
    p.instructions.push_back(bad);
    try {
        (void)to_xml(p);
        FAIL() << "expected internal_error";
    } catch(const internal_error& e){
        EXPECT_EQ(e.kind(), error_kind::internal_error);
        EXPECT_EQ(e.diag().code, "E9901");
        EXPECT_EQ(exit_code(e.kind()), 99);
    }

    program q;
    instruction wrong;
    wrong.opcode = "JUMP";
    wrong.order = 1;
    wrong.operands.push_back(constant{literal_kind::int_lit, "1"});
    q.instructions.push_back(wrong);
    EXPECT_THROW((void)to_xml(q), internal_error);
}

TEST(XmlWriter, FailedStreamIsInternalError){
    auto p = assemble_text(".IPPcode24\nBREAK\n");
    std::ostringstream os;
    os.setstate(std::ios::badbit);
    EXPECT_THROW(write_xml(p, os), internal_error);
}
