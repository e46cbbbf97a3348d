// text.hpp - UTF-8 scanning and the escaping shared by the XML and JSON writers
#pragma once
#include <cstddef>
#include <string>
#include <string_view>

namespace ipparse {

// Decodes the UTF-8 sequence starting at s[pos] (pos < s.size()). On success
// stores the code point in cp and moves pos past the sequence. Overlong forms,
// surrogates and truncated sequences are rejected and leave pos unchanged.
bool next_code_point(std::string_view s, std::size_t& pos, unsigned& cp);

// XML 1.0 Char production: tab, newline, carriage return and the non-control planes.
bool is_xml_char(unsigned cp);

// Byte offset of the first malformed sequence or non-Char code point, npos if none.
std::size_t find_non_xml_char(std::string_view s);

enum class text_dialect { xml, json };

// xml:  & < > " become entities; tab, newline, carriage return and DEL become &#N;.
//       Anything an XML 1.0 document cannot carry raises internal_error (E9901).
// json: " \ and controls are backslash escaped; malformed bytes become U+FFFD.
std::string escape_text(std::string_view s, text_dialect d);

} // namespace ipparse
