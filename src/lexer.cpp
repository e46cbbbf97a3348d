#include "ipparse/lexer.hpp"

namespace ipparse {

static bool is_blank(char c){
    return c==' ' || c=='\t' || c=='\r' || c=='\n' || c=='\v' || c=='\f';
}

std::string_view strip_comment(std::string_view line){
    auto pos = line.find('#');
    return pos == std::string_view::npos ? line : line.substr(0, pos);
}

std::vector<token> tokenize_line(std::string_view line){
    std::vector<token> out;
    size_t i = 0;
    while(i < line.size()){
        while(i < line.size() && is_blank(line[i])) ++i;
        if(i >= line.size()) break;
        size_t b = i;
        while(i < line.size() && !is_blank(line[i])) ++i;
        out.push_back(token{std::string(line.substr(b, i-b)), static_cast<int>(b)+1});
    }
    return out;
}

bool lexer::next(token_line& out){
    while(src_.next_line(buf_)){
        ++line_no_;
        auto toks = tokenize_line(strip_comment(buf_));
        if(toks.empty()) continue;
        out.line = line_no_;
        out.tokens = std::move(toks);
        return true;
    }
    return false;
}

} // namespace ipparse
