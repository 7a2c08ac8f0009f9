// panel_text.hpp
// String helpers and raw text access for panel files (.txt and .txt.gz)

#pragma once

#include <fstream>
#include <string>
#include <vector>

#include <zlib.h>

namespace genepanel {

std::string trim(const std::string& s);
std::string to_lower(std::string s);
std::string strip_bom(const std::string& s);
bool ends_with(const std::string& s, const std::string& suf);
bool has_whitespace(const std::string& s);
std::string join(const std::vector<std::string>& vec, const std::string& sep);

// Splits on '\n' and drops a trailing '\r'. A final newline does not
// produce an extra empty line.
std::vector<std::string> split_lines(const std::string& text);

bool is_gzip(const std::string& bytes);
std::string inflate_gzip(const std::string& bytes);

// ==================== TextReader: .txt and .gz ====================

class TextReader {
public:
    explicit TextReader(const std::string& path);
    ~TextReader();

    TextReader(const TextReader&) = delete;
    TextReader& operator=(const TextReader&) = delete;

    // Whole content, byte for byte (the trailing newline is kept).
    std::string read_all();

    bool good() const {
        return is_gz_ ? (gz_ != nullptr) : static_cast<bool>(in_);
    }

private:
    std::string path_;
    bool is_gz_;
    std::ifstream in_;
    gzFile gz_;
};

std::string read_text_file(const std::string& path);

} // namespace genepanel
