#pragma once
#include <stdexcept>
#include <string>

namespace codescope {

// Malformed source in one file. The file contributes zero symbols.
class ParseError : public std::runtime_error {
public:
    ParseError(const std::string& file_path, const std::string& reason)
        : std::runtime_error("parse error in " + file_path + ": " + reason),
          file_path_(file_path) {}

    const std::string& file_path() const { return file_path_; }

private:
    std::string file_path_;
};

// Unreadable file or directory. The entry is skipped.
class IoError : public std::runtime_error {
public:
    IoError(const std::string& path, const std::string& reason)
        : std::runtime_error("io error at " + path + ": " + reason),
          path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace codescope
