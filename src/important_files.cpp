#include "important_files.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iterator>
#include <unordered_set>

namespace repomap {

namespace fs = std::filesystem;

namespace {

const std::unordered_set<std::string>& root_files() {
    static const std::unordered_set<std::string> names = {
        // Docs
        "readme", "readme.md", "readme.rst", "readme.txt", "contributing.md", "changelog.md",
        "license", "license.md", "license.txt", "copying",
        // C / C++
        "cmakelists.txt", "makefile", "meson.build", "configure.ac", "conanfile.txt", "vcpkg.json",
        // Python
        "setup.py", "setup.cfg", "pyproject.toml", "requirements.txt", "pipfile", "tox.ini",
        // JavaScript / TypeScript
        "package.json", "tsconfig.json", "webpack.config.js", "vite.config.ts",
        // Others
        "cargo.toml", "go.mod", "gemfile", "build.gradle", "pom.xml", "composer.json",
        "mix.exs", "build.sbt", "dockerfile", "docker-compose.yml", "docker-compose.yaml",
        ".gitignore", ".gitlab-ci.yml", ".travis.yml", ".editorconfig", ".clang-format"
    };
    return names;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

bool is_important(const std::string& rel_path) {
    fs::path p(rel_path);
    std::string parent = p.parent_path().generic_string();
    std::string name = lower(p.filename().string());

    if (parent == ".github/workflows") {
        std::string ext = lower(p.extension().string());
        return ext == ".yml" || ext == ".yaml";
    }
    return parent.empty() && root_files().count(name) > 0;
}

std::vector<std::string> filter_important_files(const std::vector<std::string>& rel_paths) {
    std::vector<std::string> out;
    std::copy_if(rel_paths.begin(), rel_paths.end(), std::back_inserter(out), is_important);
    return out;
}

} // namespace repomap
