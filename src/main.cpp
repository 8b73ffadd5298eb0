#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "errors.hpp"
#include "repo_map.hpp"
#include "tools/FileSystemTools.hpp"

namespace fs = std::filesystem;

namespace {

void print_usage(const char* prog) {
    std::cout
        << "Usage: " << prog << " [paths...] [options]\n"
        << "\n"
        << "Generate a repository map showing important code structures.\n"
        << "\n"
        << "Options:\n"
        << "  --root DIR                 Repository root (default: .)\n"
        << "  --map-tokens N             Token budget for the map (default: 1024)\n"
        << "  --chat-files F...          Files currently being edited\n"
        << "  --other-files F...         Other files to consider\n"
        << "  --mentioned-files F...     Files explicitly mentioned\n"
        << "  --mentioned-idents I...    Identifiers explicitly mentioned\n"
        << "  --max-context-window N     Context window of the consumer\n"
        << "  --config FILE              JSON configuration file\n"
        << "  --force-refresh            Ignore cached tags\n"
        << "  --verbose                  Log progress to stderr\n"
        << "  -h, --help                 Show this help\n"
        << "\n"
        << "Examples:\n"
        << "  " << prog << " .                         # Map current directory\n"
        << "  " << prog << " src/ --map-tokens 2048    # Map src/ with 2048 token limit\n"
        << "  " << prog << " --chat-files main.py --other-files src/\n";
}

bool is_flag(const char* arg) {
    return std::strncmp(arg, "--", 2) == 0 || std::strcmp(arg, "-h") == 0;
}

// Consumes values up to the next flag.
std::vector<std::string> take_values(int argc, char* argv[], int& i) {
    std::vector<std::string> values;
    while (i + 1 < argc && !is_flag(argv[i + 1])) values.push_back(argv[++i]);
    return values;
}

int parse_int(const char* flag, const char* value) {
    try {
        size_t used = 0;
        int n = std::stoi(value, &used);
        if (used != std::strlen(value)) throw std::invalid_argument(value);
        return n;
    } catch (const std::exception&) {
        throw repomap::ConfigError(std::string(flag) + " expects an integer, got '" + value + "'");
    }
}

// Directories expand to their source files.
std::vector<std::string> expand(const std::vector<std::string>& paths) {
    std::vector<std::string> out;
    for (const auto& p : paths) {
        auto files = repomap::FileSystemTools::list_source_files(p);
        out.insert(out.end(), files.begin(), files.end());
    }
    return out;
}

std::vector<std::string> absolutize(const std::vector<std::string>& paths) {
    std::vector<std::string> out;
    for (const auto& p : paths) out.push_back(fs::absolute(p).lexically_normal().string());
    return out;
}

} // namespace

int main(int argc, char* argv[]) {
    // Logs go to stderr so the map on stdout stays clean.
    spdlog::set_default_logger(spdlog::stderr_color_mt("repomap"));
    spdlog::set_level(spdlog::level::warn);

    std::string root = ".";
    std::string config_path;
    std::vector<std::string> paths, chat_files, other_files, mentioned_files, mentioned_idents;
    std::optional<int> map_tokens;
    int max_context_window = -1;
    bool force_refresh = false;
    bool verbose = false;

    try {
        for (int i = 1; i < argc; ++i) {
            if (std::strcmp(argv[i], "--root") == 0 && i + 1 < argc) {
                root = argv[++i];
            } else if (std::strcmp(argv[i], "--map-tokens") == 0 && i + 1 < argc) {
                map_tokens = parse_int("--map-tokens", argv[++i]);
            } else if (std::strcmp(argv[i], "--max-context-window") == 0 && i + 1 < argc) {
                max_context_window = parse_int("--max-context-window", argv[++i]);
            } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
                config_path = argv[++i];
            } else if (std::strcmp(argv[i], "--chat-files") == 0) {
                chat_files = take_values(argc, argv, i);
            } else if (std::strcmp(argv[i], "--other-files") == 0) {
                other_files = take_values(argc, argv, i);
            } else if (std::strcmp(argv[i], "--mentioned-files") == 0) {
                mentioned_files = take_values(argc, argv, i);
            } else if (std::strcmp(argv[i], "--mentioned-idents") == 0) {
                mentioned_idents = take_values(argc, argv, i);
            } else if (std::strcmp(argv[i], "--force-refresh") == 0) {
                force_refresh = true;
            } else if (std::strcmp(argv[i], "--verbose") == 0) {
                verbose = true;
            } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
                print_usage(argv[0]);
                return 0;
            } else if (is_flag(argv[i])) {
                std::cerr << "Unknown option: " << argv[i] << "\n";
                print_usage(argv[0]);
                return 2;
            } else {
                paths.push_back(argv[i]);
            }
        }

        if (verbose) spdlog::set_level(spdlog::level::debug);

        fs::path root_path = fs::absolute(root).lexically_normal();
        repomap::RepoMapConfig config = config_path.empty()
            ? repomap::load_config(root_path)
            : repomap::load_config_file(config_path);
        if (max_context_window >= 0) config.max_context_window = max_context_window;
        spdlog::debug("Effective config: {}", config.to_json().dump());

        // Bare paths become "other" files when no roles were given.
        if (chat_files.empty() && other_files.empty() && !paths.empty()) {
            other_files = expand(paths);
        } else {
            other_files = expand(other_files);
        }

        repomap::MapRequest request;
        request.root = root_path.string();
        request.chat_files = absolutize(chat_files);
        request.other_files = absolutize(other_files);
        request.mentioned_files = absolutize(mentioned_files);
        request.mentioned_idents.insert(mentioned_idents.begin(), mentioned_idents.end());
        request.map_tokens = map_tokens;
        request.force_refresh = force_refresh;

        repomap::RepoMap repo_map(config);
        auto result = repo_map.get_repo_map(request);

        if (result.text.empty()) {
            std::cout << "No repository map generated." << std::endl;
            return 0;
        }
        if (verbose) {
            spdlog::info("Generated map: {} chars, ~{} tokens", result.text.size(), result.stats.tokens);
        }
        std::cout << result.text << std::endl;
    } catch (const repomap::RepoMapError& e) {
        spdlog::error("❌ {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("❌ Error generating repository map: {}", e.what());
        return 1;
    }
    return 0;
}
