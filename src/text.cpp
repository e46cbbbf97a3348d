#include "ipparse/text.hpp"
#include "ipparse/diagnostics.hpp"
#include <cstdio>

namespace ipparse {

bool next_code_point(std::string_view s, std::size_t& pos, unsigned& cp){
    const unsigned char lead = static_cast<unsigned char>(s[pos]);
    if(lead < 0x80){ cp = lead; ++pos; return true; }
    std::size_t len = 0;
    unsigned value = 0, least = 0;
    if((lead & 0xE0) == 0xC0){ len = 2; value = lead & 0x1F; least = 0x80; }
    else if((lead & 0xF0) == 0xE0){ len = 3; value = lead & 0x0F; least = 0x800; }
    else if((lead & 0xF8) == 0xF0){ len = 4; value = lead & 0x07; least = 0x10000; }
    else return false;
    if(pos + len > s.size()) return false;
    for(std::size_t i=1;i<len;++i){
        const unsigned char c = static_cast<unsigned char>(s[pos+i]);
        if((c & 0xC0) != 0x80) return false;
        value = (value << 6) | (c & 0x3F);
    }
    if(value < least || value > 0x10FFFF || (value >= 0xD800 && value <= 0xDFFF)) return false;
    cp = value;
    pos += len;
    return true;
}

bool is_xml_char(unsigned cp){
    return cp == 0x9 || cp == 0xA || cp == 0xD
        || (cp >= 0x20 && cp <= 0xD7FF)
        || (cp >= 0xE000 && cp <= 0xFFFD)
        || (cp >= 0x10000 && cp <= 0x10FFFF);
}

std::size_t find_non_xml_char(std::string_view s){
    std::size_t pos = 0;
    while(pos < s.size()){
        const std::size_t start = pos;
        unsigned cp = 0;
        if(!next_code_point(s, pos, cp) || !is_xml_char(cp)) return start;
    }
    return std::string_view::npos;
}

static void escape_xml_char(std::string& o, unsigned cp, std::string_view bytes){
    switch(cp){
        case '&': o += "&amp;"; break;
        case '<': o += "&lt;"; break;
        case '>': o += "&gt;"; break;
        case '"': o += "&quot;"; break;
        case 0x9: case 0xA: case 0xD: case 0x7F:
            o += "&#"; o += std::to_string(cp); o += ';'; break;
        default: o.append(bytes.data(), bytes.size()); break;
    }
}

static void escape_json_char(std::string& o, unsigned cp, std::string_view bytes){
    switch(cp){
        case '"': o += "\\\""; break;
        case '\\': o += "\\\\"; break;
        case '\n': o += "\\n"; break;
        case '\r': o += "\\r"; break;
        case '\t': o += "\\t"; break;
        default:
            if(cp < 0x20){ char buf[7]; std::snprintf(buf, sizeof(buf), "\\u%04X", cp); o += buf; }
            else o.append(bytes.data(), bytes.size());
            break;
    }
}

std::string escape_text(std::string_view s, text_dialect d){
    std::string o; o.reserve(s.size());
    std::size_t pos = 0;
    while(pos < s.size()){
        const std::size_t start = pos;
        unsigned cp = 0;
        const bool decoded = next_code_point(s, pos, cp);
        if(d == text_dialect::json){
            if(!decoded){ o += "\\uFFFD"; pos = start + 1; continue; }
            escape_json_char(o, cp, s.substr(start, pos - start));
            continue;
        }
        if(!decoded)
            throw internal_error("E9901", "byte " + std::to_string(static_cast<unsigned char>(s[start])) +
                                 " at offset " + std::to_string(start) + " is not valid UTF-8");
        if(!is_xml_char(cp))
            throw internal_error("E9901", "character " + std::to_string(cp) + " at offset " +
                                 std::to_string(start) + " cannot appear in an XML document");
        escape_xml_char(o, cp, s.substr(start, pos - start));
    }
    return o;
}

} // namespace ipparse
