// panel_text.cpp
// String helpers and raw text access for panel files (.txt and .txt.gz)

#include "panel_text.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace genepanel {

// ==================== HELPERS ====================

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n\v\f");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n\v\f");
    return s.substr(b, e - b + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return (unsigned char)std::tolower(c); });
    return s;
}

std::string strip_bom(const std::string& s) {
    static const std::string bom = "\xEF\xBB\xBF";
    if (s.compare(0, bom.size(), bom) == 0) return s.substr(bom.size());
    return s;
}

bool ends_with(const std::string& s, const std::string& suf) {
    if (s.size() < suf.size()) return false;
    return s.compare(s.size() - suf.size(), suf.size(), suf) == 0;
}

bool has_whitespace(const std::string& s) {
    return std::any_of(s.begin(), s.end(),
        [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string join(const std::vector<std::string>& vec, const std::string& sep) {
    std::ostringstream oss;
    for (size_t i = 0; i < vec.size(); ++i) {
        if (i) oss << sep;
        oss << vec[i];
    }
    return oss.str();
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> out;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, '\n')) {
        if (!item.empty() && item.back() == '\r') item.pop_back();
        out.push_back(item);
    }
    return out;
}

// ==================== gzip in memory ====================

bool is_gzip(const std::string& bytes) {
    return bytes.size() >= 2 &&
        (unsigned char)bytes[0] == 0x1f && (unsigned char)bytes[1] == 0x8b;
}

std::string inflate_gzip(const std::string& bytes) {
    z_stream zs{};
    // 16 + MAX_WBITS: expect a gzip header
    if (inflateInit2(&zs, 16 + MAX_WBITS) != Z_OK)
        throw std::runtime_error("inflateInit2 failed");

    zs.next_in = (Bytef*)bytes.data();
    zs.avail_in = (uInt)bytes.size();

    std::string out;
    std::vector<char> buf(1 << 16);
    while (true) {
        zs.next_out = (Bytef*)buf.data();
        zs.avail_out = (uInt)buf.size();
        int rc = inflate(&zs, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            inflateEnd(&zs);
            throw std::runtime_error("Corrupt gzip data");
        }
        out.append(buf.data(), buf.size() - zs.avail_out);

        if (rc == Z_STREAM_END) {
            // concatenated members are read on, as gzread does
            if (zs.avail_in < 2 || zs.next_in[0] != 0x1f || zs.next_in[1] != 0x8b) break;
            inflateReset(&zs);
            continue;
        }
        if (zs.avail_in == 0 && zs.avail_out != 0) {
            inflateEnd(&zs);
            throw std::runtime_error("Truncated gzip data");
        }
    }
    inflateEnd(&zs);
    return out;
}

// ==================== TextReader ====================

TextReader::TextReader(const std::string& path)
    : path_(path), is_gz_(ends_with(path, ".gz")), gz_(nullptr) {
    if (is_gz_) {
        gz_ = gzopen(path.c_str(), "rb");
        if (!gz_) throw std::runtime_error("Cannot open gz file: " + path);
    }
    else {
        in_.open(path, std::ios::binary);
        if (!in_) throw std::runtime_error("Cannot open file: " + path);
    }
}

TextReader::~TextReader() {
    if (is_gz_ && gz_) gzclose(gz_);
}

std::string TextReader::read_all() {
    std::string out;
    if (is_gz_) {
        const int BUF = 1 << 16;
        std::vector<char> buf(BUF);
        int n = 0;
        while ((n = gzread(gz_, buf.data(), BUF)) > 0) out.append(buf.data(), n);
        if (n < 0) throw std::runtime_error("Cannot read gz file: " + path_);
        return out;
    }
    std::ostringstream oss;
    oss << in_.rdbuf();
    if (in_.bad()) throw std::runtime_error("Cannot read file: " + path_);
    return oss.str();
}

std::string read_text_file(const std::string& path) {
    TextReader reader(path);
    return reader.read_all();
}

} // namespace genepanel
