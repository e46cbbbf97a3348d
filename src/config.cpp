#include "ipparse/config.hpp"
#include <cstdlib>

namespace ipparse {

bool env_flag(const char* name, bool fallback){
    const char* v = std::getenv(name);
    if(!v) return fallback;
    switch(v[0]){
        case '1': case 't': case 'T': case 'y': case 'Y': return true;
        case '0': case 'f': case 'F': case 'n': case 'N': return false;
        default: return fallback;
    }
}

static bool parse_indent(const std::string& text, int& out){
    if(text.empty() || text.size() > 2) return false;
    for(char c: text) if(c < '0' || c > '9') return false;
    out = std::atoi(text.c_str());
    return true;
}

config config_from_env(){
    config cfg;
    cfg.suggest = env_flag("IPPARSE_SUGGEST", true);
    cfg.verbose = env_flag("IPPARSE_VERBOSE", false);
    if(const char* env = std::getenv("IPPARSE_INDENT")){
        int w=0; if(parse_indent(env, w)) cfg.indent_width = w;
    }
    return cfg;
}

void parse_args(int argc, char** argv, config& cfg){
    int options = 0;
    for(int i=1;i<argc;++i){
        std::string a = argv[i];
        ++options;
        if(a == "--help" || a == "-h"){ cfg.show_help = true; continue; }
        if(a.rfind("--input=",0)==0){ cfg.input_path = a.substr(8); }
        else if(a == "--input"){
            if(i+1 >= argc) throw usage_error("--input requires a file name");
            cfg.input_path = argv[++i];
        }
        else if(a.rfind("--indent=",0)==0){
            if(!parse_indent(a.substr(9), cfg.indent_width)) throw usage_error("invalid indent width '" + a.substr(9) + "'");
        }
        else throw usage_error("unknown option '" + a + "'");
        if(cfg.input_path.empty() && a.rfind("--input",0)==0) throw usage_error("--input requires a file name");
    }
    if(cfg.show_help && options > 1) throw usage_error("--help cannot be combined with other options");
}

std::string usage_text(const std::string& prog){
    return "usage: " + prog + " [--input=FILE] [--indent=N] [--help]\n"
           "Reads IPPcode24 source (from FILE or standard input), validates it and\n"
           "writes its XML representation to standard output.\n"
           "\n"
           "exit status: 0 ok, 10 bad usage, 21 bad header, 23 lexical/syntax error,\n"
           "             99 internal error\n"
           "\n"
           "environment: IPPARSE_SUGGEST=0 (or f, n) disables opcode suggestions,\n"
           "             IPPARSE_DIAG_JSON=1 mirrors diagnostics as JSON on stderr,\n"
           "             IPPARSE_VERBOSE=1 prints a summary on stderr,\n"
           "             IPPARSE_INDENT=N sets the XML indent width\n";
}

} // namespace ipparse
