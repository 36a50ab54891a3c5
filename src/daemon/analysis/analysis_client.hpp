#pragma once

#include "analysis/analysis_types.hpp"
#include "analysis/http_transport.hpp"

#include <chrono>
#include <expected>
#include <functional>
#include <string>
#include <string_view>

namespace analysis_progress {
inline constexpr std::string_view kConnecting = "connecting";
inline constexpr std::string_view kInterpreting = "interpreting";
inline constexpr std::string_view kExtracting = "extracting amount";
} // namespace analysis_progress

// What the workflow needs from an analysis service.
class ExpenseAnalyzer {
public:
    using ProgressCallback = std::function<void(std::string_view label)>;

    virtual ~ExpenseAnalyzer() = default;

    // Fails only on misconfiguration or when the service could not be reached
    // after retrying. Unparseable content yields a fallback result instead.
    virtual std::expected<AnalysisResult, AnalysisError>
        analyze(const AnalysisRequest& request, const ProgressCallback& progress) = 0;
};

// Chat-completion client (OpenAI-compatible endpoint, e.g. DeepSeek).
// Blocking; run it off the owner thread.
class AnalysisClient : public ExpenseAnalyzer {
public:
    struct Options {
        std::string api_key;
        std::string base_url = "https://api.deepseek.com/v1/chat/completions";
        std::string model = "deepseek-chat";
        int max_tokens = 1000;
        double temperature = 0.1;
        std::chrono::seconds timeout{30};
        int max_attempts = 3;
        bool verbose = false;
    };

    using Sleeper = std::function<void(std::chrono::seconds)>;

    AnalysisClient(HttpTransport& transport, Options opts, Sleeper sleeper = {});

    std::expected<AnalysisResult, AnalysisError>
        analyze(const AnalysisRequest& request, const ProgressCallback& progress) override;

    // Validates configuration and encodes the completion request.
    std::expected<HttpRequest, AnalysisError> build_http_request(const AnalysisRequest& request) const;

    // Delay after the given failed attempt (1-based): 1s, 2s, 4s, capped at 8s.
    static std::chrono::seconds backoff_delay(int attempt);

private:
    // One round trip; returns the completion content string.
    std::expected<std::string, AnalysisError> send_once(const HttpRequest& request);
    void log(const std::string& msg);

    HttpTransport& transport_;
    Options opts_;
    Sleeper sleeper_;
};

// "sk-abcd...wxyz" form for logs.
std::string mask_api_key(std::string_view key);
