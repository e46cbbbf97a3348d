// XML rendering of a validated program
#pragma once
#include "ipparse/program.hpp"
#include <ostream>
#include <string>
#include <string_view>

namespace ipparse {

struct xml_options {
    int indent_width = 2;
    bool declaration = true; // emit <?xml ...?> first
};

// & < > " become entities; tab, newline, carriage return and DEL become &#N;.
// Text outside the XML 1.0 character set throws internal_error.
std::string xml_escape(std::string_view s);

// Throws internal_error when an instruction disagrees with its opcode signature
// or an operand value cannot be represented in XML.
void write_xml(const program& p, std::ostream& os, const xml_options& opts = {});
std::string to_xml(const program& p, const xml_options& opts = {});

} // namespace ipparse
