#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct Config {
    struct Analysis {
        std::string api_key;
        std::string api_key_env = "DEEPSEEK_API_KEY"; // wins over api_key when set
        std::string base_url = "https://api.deepseek.com/v1/chat/completions";
        std::string model = "deepseek-chat";
        int max_tokens = 1000;
        double temperature = 0.1;
        uint32_t timeout_seconds = 30;
        int max_attempts = 3;
    } analysis;

    struct Recognition {
        std::string url = "http://localhost:8080";
        std::string api_format = "whisper.cpp"; // "whisper.cpp" or "openai"
        std::string language = "zh";
        uint32_t partial_interval_ms = 1000;
        bool allow_transcription = true;
    } recognition;

    struct Audio {
        uint32_t sample_rate = 16000;
        uint32_t max_seconds = 120;
        // Upper bound on waiting for the final whisper pass after stop. The
        // final transcript usually ends the wait earlier.
        uint32_t stop_grace_ms = 3000;
        float level_smoothing = 0.3f;
        bool duck_others = true;
        std::string target_device;

        // Computed from max_seconds and sample_rate (no independent config key).
        size_t max_samples() const { return static_cast<size_t>(max_seconds) * sample_rate; }
    } audio;

    struct Workflow {
        uint32_t error_reset_seconds = 5;
        bool auto_save = false;
    } workflow;

    struct Preferences {
        std::string default_currency = "CNY";
        std::vector<std::string> preferred_categories; // category labels or ids
        std::vector<std::string> common_merchants;
    } preferences;

    struct Storage {
        std::string path; // empty: <data dir>/expenses.db
    } storage;

    static Config load(const std::string& path);
    static Config load_default();

    // Applies api_key_env from the environment.
    void resolve_api_key();

    // Non-fatal problems with the analysis key, one message each.
    std::vector<std::string> api_key_warnings() const;

    std::string database_path() const;
};
