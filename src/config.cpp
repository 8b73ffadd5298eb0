#include "config.hpp"
#include "errors.hpp"
#include <fstream>
#include <spdlog/spdlog.h>

namespace repomap {

namespace fs = std::filesystem;
using json = nlohmann::json;

void RepoMapConfig::validate() const {
    if (map_tokens < 0) throw ConfigError("map_tokens must be >= 0");
    if (map_mul_no_files < 1) throw ConfigError("map_mul_no_files must be >= 1");
    if (max_context_window < 0) throw ConfigError("max_context_window must be >= 0");
    if (!(damping >= 0.0 && damping < 1.0)) throw ConfigError("damping must be in [0, 1)");
    if (!(tolerance > 0.0)) throw ConfigError("tolerance must be > 0");
    if (max_iterations < 0) throw ConfigError("max_iterations must be >= 0");
    if (!(chat_weight > 0.0) || !(mentioned_weight > 0.0) || !(other_weight > 0.0)) {
        throw ConfigError("personalization weights must be > 0");
    }
    if (!(mentioned_ident_boost > 0.0) || !(chat_reference_boost > 0.0)) {
        throw ConfigError("boost factors must be > 0");
    }
    if (merge_gap < 0) throw ConfigError("merge_gap must be >= 0");
    if (max_line_length < 1) throw ConfigError("max_line_length must be >= 1");
    if (extract_threads < 0) throw ConfigError("extract_threads must be >= 0");
}

json RepoMapConfig::to_json() const {
    return json{
        {"map_tokens", map_tokens},
        {"map_mul_no_files", map_mul_no_files},
        {"max_context_window", max_context_window},
        {"damping", damping},
        {"tolerance", tolerance},
        {"max_iterations", max_iterations},
        {"chat_weight", chat_weight},
        {"mentioned_weight", mentioned_weight},
        {"other_weight", other_weight},
        {"mentioned_ident_boost", mentioned_ident_boost},
        {"chat_reference_boost", chat_reference_boost},
        {"merge_gap", merge_gap},
        {"max_line_length", max_line_length},
        {"max_file_bytes", max_file_bytes},
        {"extract_threads", extract_threads},
        {"cache_dir", cache_dir},
        {"sample_token_count", sample_token_count}
    };
}

RepoMapConfig RepoMapConfig::from_json(const json& j) {
    if (!j.is_object()) throw ConfigError("config root must be a JSON object");

    RepoMapConfig cfg;
    try {
        cfg.map_tokens = j.value("map_tokens", cfg.map_tokens);
        cfg.map_mul_no_files = j.value("map_mul_no_files", cfg.map_mul_no_files);
        cfg.max_context_window = j.value("max_context_window", cfg.max_context_window);
        cfg.damping = j.value("damping", cfg.damping);
        cfg.tolerance = j.value("tolerance", cfg.tolerance);
        cfg.max_iterations = j.value("max_iterations", cfg.max_iterations);
        cfg.chat_weight = j.value("chat_weight", cfg.chat_weight);
        cfg.mentioned_weight = j.value("mentioned_weight", cfg.mentioned_weight);
        cfg.other_weight = j.value("other_weight", cfg.other_weight);
        cfg.mentioned_ident_boost = j.value("mentioned_ident_boost", cfg.mentioned_ident_boost);
        cfg.chat_reference_boost = j.value("chat_reference_boost", cfg.chat_reference_boost);
        cfg.merge_gap = j.value("merge_gap", cfg.merge_gap);
        cfg.max_line_length = j.value("max_line_length", cfg.max_line_length);
        cfg.max_file_bytes = j.value("max_file_bytes", cfg.max_file_bytes);
        cfg.extract_threads = j.value("extract_threads", cfg.extract_threads);
        cfg.cache_dir = j.value("cache_dir", cfg.cache_dir);
        cfg.sample_token_count = j.value("sample_token_count", cfg.sample_token_count);
    } catch (const json::exception& e) {
        throw ConfigError(e.what());
    }
    cfg.validate();
    return cfg;
}

namespace {

json parse_config(const fs::path& config_path) {
    std::ifstream f(config_path);
    if (!f) throw ConfigError("cannot open " + config_path.string());
    try {
        return json::parse(f);
    } catch (const json::parse_error& e) {
        throw ConfigError(config_path.string() + ": " + e.what());
    }
}

} // namespace

RepoMapConfig load_config_file(const fs::path& config_path) {
    auto cfg = RepoMapConfig::from_json(parse_config(config_path));
    spdlog::info("⚙️  Config loaded from {}", config_path.string());
    return cfg;
}

RepoMapConfig load_config(const fs::path& root) {
    fs::path config_path = root / ".repomap" / "config.json";
    if (!fs::exists(config_path)) {
        config_path = root / "repomap.json";
    }
    if (!fs::exists(config_path)) return RepoMapConfig{};

    json j;
    try {
        j = parse_config(config_path);
    } catch (const ConfigError& e) {
        spdlog::error("❌ Config corrupted at {}: {}", config_path.string(), e.what());
        return RepoMapConfig{};
    }

    // Well-formed JSON with bad values is an error, not a fallback.
    auto cfg = RepoMapConfig::from_json(j);
    spdlog::info("⚙️  Config loaded from {}", config_path.string());
    return cfg;
}

} // namespace repomap
