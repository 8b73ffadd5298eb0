#include "tools/FileSystemTools.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace repomap {

namespace fs = std::filesystem;

// Segment-based containment check (lexical, no symlink resolution)
static bool is_inside_path(const fs::path& child, const fs::path& parent) {
    if (parent.empty()) return false;
    auto c = child.lexically_normal();
    auto p = parent.lexically_normal();
    auto it_c = c.begin();
    for (auto it_p = p.begin(); it_p != p.end(); ++it_p) {
        if (it_p->empty()) continue; // trailing separator
        if (it_c == c.end() || *it_c != *it_p) return false;
        ++it_c;
    }
    return true;
}

std::optional<std::string> FileSystemTools::read_file_safe(const std::string& path) {
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f) {
        spdlog::warn("❌ [I/O Probe] Cannot open: {}", path);
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    if (f.bad()) {
        spdlog::warn("❌ [I/O Probe] Read error: {}", path);
        return std::nullopt;
    }
    return buffer.str();
}

std::vector<std::string> FileSystemTools::list_source_files(const std::string& path) {
    static const std::unordered_set<std::string> skipped_dirs = {
        "node_modules", "__pycache__", "venv", "env"
    };

    std::vector<std::string> results;
    std::error_code ec;

    if (!fs::is_directory(path, ec)) {
        if (fs::is_regular_file(path, ec)) results.push_back(path);
        return results;
    }

    auto options = fs::directory_options::skip_permission_denied;
    fs::recursive_directory_iterator it(path, options, ec);
    if (ec) {
        spdlog::error("Scanner error at {}: {}", path, ec.message());
        return results;
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            spdlog::warn("Scanner error under {}: {}", path, ec.message());
            break;
        }
        const auto& entry = *it;
        std::string name = entry.path().filename().string();
        bool hidden = !name.empty() && name[0] == '.';

        if (entry.is_directory(ec)) {
            if (hidden || skipped_dirs.count(name)) it.disable_recursion_pending();
            continue;
        }
        if (hidden) continue;
        if (entry.is_regular_file(ec)) results.push_back(entry.path().string());
    }

    std::sort(results.begin(), results.end());
    spdlog::info("🛰️ SCAN COMPLETE | {} files under {}", results.size(), path);
    return results;
}

fs::path FileSystemTools::normalize(const fs::path& root, const std::string& path) {
    fs::path p(path);
    if (p.is_relative()) p = root / p;
    return p.lexically_normal();
}

std::string FileSystemTools::relative_to(const fs::path& root, const fs::path& abs) {
    fs::path base = root.lexically_normal();
    if (!is_inside_path(abs, base)) return abs.generic_string();
    return abs.lexically_relative(base).generic_string();
}

} // namespace repomap
