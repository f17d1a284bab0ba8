#include "codeloop/scratch.h"

#include <cerrno>
#include <cstring>
#include <vector>

#include <stdlib.h>
#include <sys/stat.h>

namespace codeloop {

ScratchDir::~ScratchDir() {
    remove();
}

ScratchDir::ScratchDir(ScratchDir&& other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
}

ScratchDir& ScratchDir::operator=(ScratchDir&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

bool ScratchDir::create(const std::filesystem::path& root, const std::string& prefix, std::string* err) {
    remove();

    std::error_code ec;
    std::filesystem::path base = root;
    if (base.empty()) {
        base = std::filesystem::temp_directory_path(ec);
        if (ec) {
            if (err) *err = "temp_directory_path: " + ec.message();
            return false;
        }
    }
    std::filesystem::create_directories(base, ec);
    if (ec) {
        if (err) *err = "create scratch root " + base.string() + ": " + ec.message();
        return false;
    }

    std::string tmpl = (base / (prefix + "XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (::mkdtemp(buf.data()) == nullptr) {
        if (err) *err = std::string("mkdtemp failed: ") + std::strerror(errno);
        return false;
    }
    (void)::chmod(buf.data(), 0700);
    path_ = std::filesystem::path(buf.data());
    return true;
}

void ScratchDir::remove() {
    if (path_.empty()) return;
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    path_.clear();
}

} // namespace codeloop
