#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr uint32_t kMaxStopGraceMs = 30000;

template <typename T>
void read(const json& section, const char* key, T& out) {
    if (section.contains(key)) out = section[key].get<T>();
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        cfg.resolve_api_key();
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("analysis")) {
            auto& a = j["analysis"];
            read(a, "api_key", cfg.analysis.api_key);
            read(a, "api_key_env", cfg.analysis.api_key_env);
            read(a, "base_url", cfg.analysis.base_url);
            read(a, "model", cfg.analysis.model);
            read(a, "max_tokens", cfg.analysis.max_tokens);
            read(a, "temperature", cfg.analysis.temperature);
            read(a, "timeout_seconds", cfg.analysis.timeout_seconds);
            read(a, "max_attempts", cfg.analysis.max_attempts);
        }

        if (j.contains("recognition")) {
            auto& r = j["recognition"];
            read(r, "url", cfg.recognition.url);
            read(r, "api_format", cfg.recognition.api_format);
            read(r, "language", cfg.recognition.language);
            read(r, "partial_interval_ms", cfg.recognition.partial_interval_ms);
            read(r, "allow_transcription", cfg.recognition.allow_transcription);
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            read(a, "sample_rate", cfg.audio.sample_rate);
            read(a, "max_seconds", cfg.audio.max_seconds);
            read(a, "stop_grace_ms", cfg.audio.stop_grace_ms);
            if (cfg.audio.stop_grace_ms > kMaxStopGraceMs) {
                std::println(stderr, "config: stop_grace_ms {} too large, using {}",
                             cfg.audio.stop_grace_ms, kMaxStopGraceMs);
                cfg.audio.stop_grace_ms = kMaxStopGraceMs;
            }
            read(a, "level_smoothing", cfg.audio.level_smoothing);
            read(a, "duck_others", cfg.audio.duck_others);
            read(a, "target_device", cfg.audio.target_device);
        }

        if (j.contains("workflow")) {
            auto& w = j["workflow"];
            read(w, "error_reset_seconds", cfg.workflow.error_reset_seconds);
            read(w, "auto_save", cfg.workflow.auto_save);
        }

        if (j.contains("preferences")) {
            auto& p = j["preferences"];
            read(p, "default_currency", cfg.preferences.default_currency);
            read(p, "preferred_categories", cfg.preferences.preferred_categories);
            read(p, "common_merchants", cfg.preferences.common_merchants);
        }

        if (j.contains("storage")) {
            read(j["storage"], "path", cfg.storage.path);
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    cfg.resolve_api_key();
    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (!dir.empty()) {
        auto config_path = fs::path(dir) / "config.json";
        if (fs::exists(config_path)) {
            return load(config_path.string());
        }
    }
    Config cfg;
    cfg.resolve_api_key();
    return cfg;
}

void Config::resolve_api_key() {
    if (analysis.api_key_env.empty()) return;
    const char* env = std::getenv(analysis.api_key_env.c_str());
    if (env && *env) analysis.api_key = env;
}

std::vector<std::string> Config::api_key_warnings() const {
    std::vector<std::string> warnings;
    const auto& key = analysis.api_key;
    if (key.empty()) {
        warnings.push_back("analysis API key is empty; set analysis.api_key or $" +
                           analysis.api_key_env);
        return warnings;
    }
    if (!key.starts_with("sk-")) {
        warnings.push_back("analysis API key does not start with \"sk-\"");
    }
    if (key.size() < 20) {
        warnings.push_back("analysis API key looks too short");
    }
    return warnings;
}

std::string Config::database_path() const {
    if (!storage.path.empty()) return storage.path;
    auto data = platform::data_dir();
    if (!data.empty()) return data + "/expenses.db";
    return "/tmp/voice-ledger/expenses.db";
}
