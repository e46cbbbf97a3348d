#include "ipparse/line_source.hpp"
#include "ipparse/diagnostics.hpp"

namespace ipparse {

bool stream_line_source::next_line(std::string& out){
    if(std::getline(is_, out)){
        if(!out.empty() && out.back()=='\r') out.pop_back();
        return true;
    }
    if(is_.bad()) throw internal_error("E9900", "failed to read from " + name_);
    return false;
}

file_line_source::file_line_source(const std::string& path)
    : path_(path), file_(path, std::ios::binary), inner_(file_, path) {
    if(!file_) throw internal_error("E9900", "cannot open '" + path + "'");
}

bool file_line_source::next_line(std::string& out){
    return inner_.next_line(out);
}

} // namespace ipparse
