#pragma once
#include <tao/pegtl.hpp>
#include <string>
#include <string_view>

namespace ipparse::grammar {
using namespace tao::pegtl;

// Identifiers (labels, type names, variable names)
struct ident_special : one< '_', '-', '$', '&', '%', '*', '!', '?' > {};
struct ident_first : sor< alpha, ident_special > {};
struct ident_rest : sor< alnum, ident_special > {};
struct identifier : seq< ident_first, star< ident_rest > > {};

// Variables: frame prefix is case-sensitive
struct frame : sor< TAO_PEGTL_STRING("GF"), TAO_PEGTL_STRING("LF"), TAO_PEGTL_STRING("TF") > {};
struct variable : seq< frame, one< '@' >, identifier > {};

// Literal bodies (the part after "kind@")
struct sign : one< '+', '-' > {};
struct hex_prefix : seq< one< '0' >, one< 'x', 'X' > > {};
struct hex_int : seq< hex_prefix, plus< xdigit > > {};
struct oct_int : seq< one< '0' >, one< 'o', 'O' >, plus< range< '0', '7' > > > {};
struct dec_int : plus< digit > {};
struct int_literal : seq< opt< sign >, sor< hex_int, oct_int, dec_int > > {};

struct bool_literal : sor< TAO_PEGTL_STRING("true"), TAO_PEGTL_STRING("false") > {};
struct nil_literal : TAO_PEGTL_STRING("nil") {};

struct escape_seq : seq< one< '\\' >, rep< 3, digit > > {};
struct plain_char : not_one< '\\', '#', ' ', '\t', '\n', '\r', '\v', '\f' > {};
struct string_literal : star< sor< escape_seq, plain_char > > {};

struct exponent : seq< one< 'e', 'E' >, opt< sign >, plus< digit > > {};
struct dec_mantissa : sor< seq< plus< digit >, opt< one< '.' >, star< digit > > >, seq< one< '.' >, plus< digit > > > {};
struct dec_float : seq< dec_mantissa, opt< exponent > > {};
struct hex_mantissa : sor< seq< plus< xdigit >, opt< one< '.' >, star< xdigit > > >, seq< one< '.' >, plus< xdigit > > > {};
struct hex_float : seq< hex_prefix, hex_mantissa, one< 'p', 'P' >, opt< sign >, plus< digit > > {};
struct float_literal : seq< opt< sign >, sor< hex_float, dec_float > > {};

struct type_keyword : sor< TAO_PEGTL_STRING("int"), TAO_PEGTL_STRING("bool"), TAO_PEGTL_STRING("string"),
                           TAO_PEGTL_STRING("nil"), TAO_PEGTL_STRING("float") > {};

// Header line (compared case-insensitively)
struct header : TAO_PEGTL_ISTRING(".IPPcode24") {};

// True when Rule consumes the whole of text.
template< typename Rule >
bool full_match(std::string_view text)
{
    memory_input<> in(text.data(), text.size(), "token");
    return parse< seq< Rule, eof > >(in);
}

inline void append_utf8(std::string& out, unsigned cp)
{
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

template< typename Rule >
struct decode_action : nothing< Rule > {};

template<>
struct decode_action< escape_seq >
{
    template< typename ActionInput >
    static void apply(const ActionInput& in, std::string& out)
    {
        const char* p = in.begin() + 1;
        unsigned cp = unsigned(p[0] - '0') * 100 + unsigned(p[1] - '0') * 10 + unsigned(p[2] - '0');
        append_utf8(out, cp);
    }
};

template<>
struct decode_action< plain_char >
{
    template< typename ActionInput >
    static void apply(const ActionInput& in, std::string& out)
    {
        out.append(in.begin(), in.size());
    }
};

// Decode the body of a string@ literal. \ddd becomes the character with decimal
// code ddd (UTF-8 encoded above 127). Returns false on a malformed body.
inline bool decode_string(std::string_view raw, std::string& out)
{
    out.clear();
    memory_input<> in(raw.data(), raw.size(), "string");
    if (!parse< seq< string_literal, eof >, decode_action >(in, out)) {
        out.clear();
        return false;
    }
    return true;
}

} // namespace ipparse::grammar
