#pragma once

#include <filesystem>
#include <string>

namespace codeloop {

// Exclusively owned temporary directory (mode 0700), removed recursively when
// the owner goes out of scope, whichever way that happens. Move-only.
class ScratchDir {
public:
    ScratchDir() = default;
    ~ScratchDir();

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;
    ScratchDir(ScratchDir&& other) noexcept;
    ScratchDir& operator=(ScratchDir&& other) noexcept;

    // Create a fresh directory "<root>/<prefix>XXXXXX". An empty root means
    // the system temp directory. On failure returns false and fills *err.
    bool create(const std::filesystem::path& root, const std::string& prefix, std::string* err);

    const std::filesystem::path& path() const { return path_; }
    bool valid() const { return !path_.empty(); }

    // Remove now instead of at destruction. Safe to call repeatedly.
    void remove();

private:
    std::filesystem::path path_;
};

} // namespace codeloop
