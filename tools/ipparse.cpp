#include <iostream>
#include <memory>
#include <string>
#include "ipparse/assembler.hpp"
#include "ipparse/config.hpp"
#include "ipparse/diagnostics_json.hpp"
#include "ipparse/xml_writer.hpp"

using namespace ipparse;

static int report(const diagnostic& d, const std::string& source){
    std::cerr << format_diagnostic(d, source);
    maybe_print_json(d);
    return exit_code(d.kind);
}

int main(int argc, char** argv){
    config cfg = config_from_env();
    try{
        parse_args(argc, argv, cfg);
    } catch(const usage_error& e){
        std::cerr << "ipparse: " << e.what() << "\n" << usage_text("ipparse");
        return usage_exit_code;
    }
    if(cfg.show_help){ std::cout << usage_text("ipparse"); return 0; }

    std::string source = cfg.input_path.empty() ? "<stdin>" : cfg.input_path;
    try{
        std::unique_ptr<line_source> src;
        if(cfg.input_path.empty()) src = std::make_unique<stream_line_source>(std::cin);
        else src = std::make_unique<file_line_source>(cfg.input_path);

        validator_options vopts; vopts.suggest = cfg.suggest;
        auto res = parse_program(*src, vopts);
        if(!res.success) return report(res.diag, source);

        xml_options xopts; xopts.indent_width = cfg.indent_width;
        write_xml(res.prog, std::cout, xopts);
        if(cfg.verbose)
            std::cerr << "ipparse: " << res.prog.instructions.size() << " instruction(s) from " << source << "\n";
        return 0;
    } catch(const error& e){
        return report(e.diag(), source);
    } catch(const std::exception& e){
        std::cerr << "ipparse: exception: " << e.what() << "\n";
        return exit_code(error_kind::internal_error);
    }
}
