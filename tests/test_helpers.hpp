#pragma once

#include <kit/types.hpp>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>

#include <sys/stat.h>
#include <unistd.h>

namespace kit::test {

namespace fs = std::filesystem;

// Temporary directory removed on scope exit
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = fs::temp_directory_path() /
                ("kit_test_" + std::to_string(getpid()) + "_" + std::to_string(counter++));
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    std::string path() const { return path_.string(); }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    fs::path path_;
};

inline void write_text(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string read_text(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

// Executable /bin/sh script standing in for an installer
inline std::string write_script(const TempDir& dir, const std::string& name,
                                const std::string& body) {
    std::string path = dir.file(name);
    write_text(path, "#!/bin/sh\n" + body + "\n");
    chmod(path.c_str(), 0755);
    return path;
}

inline PackageRecord make_record(const std::string& name, bool compliant, bool verified,
                                 double trust, const std::string& ecosystem = "pip") {
    PackageRecord r;
    r.name = name;
    r.version = "1.0.0";
    r.description = name + " package";
    r.ecosystem = ecosystem;
    r.target = name;
    r.compliant = compliant;
    r.verified = verified;
    r.trust_score = trust;
    return r;
}

} // namespace kit::test
