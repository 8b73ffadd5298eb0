#pragma once
#include <stdexcept>
#include <string>

namespace repomap {

// Fatal conditions only. Per-file problems never surface as exceptions.
class RepoMapError : public std::runtime_error {
public:
    explicit RepoMapError(const std::string& what) : std::runtime_error(what) {}
};

class ConfigError : public RepoMapError {
public:
    explicit ConfigError(const std::string& what) : RepoMapError("invalid configuration: " + what) {}
};

} // namespace repomap
