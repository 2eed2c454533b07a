#pragma once

#include <filesystem>
#include <string>

namespace mirror::test_support {

/// Unique directory below the system temp directory, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "treemirror_test");
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& relative) const { return path_ / relative; }

private:
    std::filesystem::path path_;
};

std::string read_file(const std::filesystem::path& path);
void write_file(const std::filesystem::path& path, const std::string& content);

} // namespace mirror::test_support
