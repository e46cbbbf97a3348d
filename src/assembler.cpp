#include "ipparse/assembler.hpp"
#include "ipparse/grammar.hpp"

namespace ipparse {

bool is_header_line(const token_line& line){
    return line.tokens.size()==1 && grammar::full_match<grammar::header>(line.tokens.front().text);
}

void assembler::accept(const token_line& line){
    if(!header_seen_){
        if(!is_header_line(line))
            throw header_error("E2101", "missing or incorrect header", "the first line must be .IPPcode24", line.line,
                               line.tokens.empty() ? 1 : line.tokens.front().col);
        header_seen_ = true;
        return;
    }
    prog_.instructions.push_back(validator_.validate(line, next_order_));
    ++next_order_;
}

program assembler::finish(){
    if(!header_seen_) throw header_error("E2100", "missing header", "the first line must be .IPPcode24", -1, -1);
    program out = std::move(prog_);
    prog_ = program{};
    header_seen_ = false;
    next_order_ = 1;
    return out;
}

program assemble(line_source& src, validator_options opts){
    lexer lex(src);
    assembler as(opts);
    token_line tl;
    while(lex.next(tl)) as.accept(tl);
    return as.finish();
}

parse_result parse_program(line_source& src, validator_options opts){
    parse_result r;
    try {
        r.prog = assemble(src, opts);
        r.success = true;
    } catch(const error& e){
        r.diag = e.diag();
    }
    return r;
}

} // namespace ipparse
