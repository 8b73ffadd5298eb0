#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace repomap {

class FileSystemTools {
public:
    // 🛡️ Safe Reader: whole file, std::nullopt when it cannot be read
    static std::optional<std::string> read_file_safe(const std::string& path);

    // 🛰️ Recursive source scanner used by the command line front end.
    // Hidden entries and vendored/tooling directories are skipped. A
    // regular file argument is returned as is. Result is sorted.
    static std::vector<std::string> list_source_files(const std::string& path);

    // Absolute, lexically normal form of `path` resolved against `root`.
    static std::filesystem::path normalize(const std::filesystem::path& root, const std::string& path);

    // '/' separated path of `abs` relative to `root`; the absolute path when
    // `abs` lies outside `root`.
    static std::string relative_to(const std::filesystem::path& root, const std::filesystem::path& abs);
};

} // namespace repomap
