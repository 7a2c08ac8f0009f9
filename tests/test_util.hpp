// test_util.hpp
// Scratch directories and fixture files for the tests

#pragma once

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <sys/wait.h>
#include <unistd.h>
#include <zlib.h>

namespace fs = std::filesystem;

class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = fs::temp_directory_path() /
            ("genepanel_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        fs::remove_all(path_);
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

    std::string write(const std::string& name, const std::string& content) const {
        fs::path p = path_ / name;
        std::ofstream out(p, std::ios::binary);
        out << content;
        return p.string();
    }

    std::string write_gz(const std::string& name, const std::string& content) const {
        fs::path p = path_ / name;
        gzFile gz = gzopen(p.string().c_str(), "wb");
        if (!gz) throw std::runtime_error("gzopen failed");
        if (!content.empty()) gzwrite(gz, content.data(), (unsigned)content.size());
        gzclose(gz);
        return p.string();
    }

private:
    fs::path path_;
};

// gzip-framed deflate of an in-memory buffer
inline std::string gzip_bytes(const std::string& data) {
    z_stream zs{};
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 16 + MAX_WBITS, 8,
        Z_DEFAULT_STRATEGY) != Z_OK)
        throw std::runtime_error("deflateInit2 failed");

    std::string out(deflateBound(&zs, (uLong)data.size()) + 32, '\0');
    zs.next_in = (Bytef*)data.data();
    zs.avail_in = (uInt)data.size();
    zs.next_out = (Bytef*)&out[0];
    zs.avail_out = (uInt)out.size();
    int rc = deflate(&zs, Z_FINISH);
    deflateEnd(&zs);
    if (rc != Z_STREAM_END) throw std::runtime_error("deflate failed");
    out.resize(zs.total_out);
    return out;
}

// Runs a shell command; returns its exit code and what it wrote to stdout.
inline int run_shell(const std::string& cmd, std::string* out = nullptr) {
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) return -1;
    std::string text;
    char chunk[4096];
    size_t n;
    while ((n = fread(chunk, 1, sizeof(chunk), pipe)) > 0) text.append(chunk, n);
    int status = pclose(pipe);
    if (out) *out = text;
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

inline bool git_available() {
    return run_shell("git --version >/dev/null 2>&1") == 0;
}

// Scratch git work tree with a fixed identity
class GitRepo {
public:
    GitRepo() {
        git("init -q");
        git("config user.name 'Panel Tester'");
        git("config user.email tester@example.org");
        git("config commit.gpgsign false");
        fs::create_directories(dir.path() / "panels");
    }

    std::string str() const { return dir.str(); }

    void git(const std::string& args) const {
        std::string cmd = "git -C '" + dir.str() + "' " + args + " >/dev/null 2>&1";
        if (run_shell(cmd) != 0) throw std::runtime_error("git failed: " + args);
    }

    void write(const std::string& path, const std::string& text) const { dir.write(path, text); }
    void write_gz(const std::string& path, const std::string& text) const { dir.write_gz(path, text); }

    // Stages everything, commits, and tags the commit.
    void commit(const std::string& message, const std::string& tag) const {
        git("add -A");
        git("commit -q -m '" + message + "'");
        git("tag " + tag);
    }

    TempDir dir;
};
