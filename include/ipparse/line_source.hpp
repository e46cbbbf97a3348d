// Ordered sources of physical source lines
#pragma once
#include <fstream>
#include <istream>
#include <string>

namespace ipparse {

class line_source {
public:
    virtual ~line_source() = default;
    // Fetches the next line without its terminator. Returns false at end of
    // input; throws internal_error when the underlying source fails.
    virtual bool next_line(std::string& out) = 0;
    virtual std::string name() const = 0;
};

class stream_line_source : public line_source {
public:
    explicit stream_line_source(std::istream& is, std::string name = "<stdin>")
        : is_(is), name_(std::move(name)) {}
    bool next_line(std::string& out) override;
    std::string name() const override { return name_; }
private:
    std::istream& is_;
    std::string name_;
};

// Owns the file for the duration of one run.
class file_line_source : public line_source {
public:
    explicit file_line_source(const std::string& path);
    bool next_line(std::string& out) override;
    std::string name() const override { return path_; }
private:
    std::string path_;
    std::ifstream file_;
    stream_line_source inner_;
};

} // namespace ipparse
