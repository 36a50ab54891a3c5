#include "analysis/analysis_client.hpp"

#include "analysis/prompt_builder.hpp"
#include "analysis/response_parser.hpp"

#include <algorithm>
#include <format>
#include <nlohmann/json.hpp>
#include <print>
#include <thread>

using json = nlohmann::json;

namespace {

constexpr std::chrono::seconds kMaxBackoff{8};

bool valid_endpoint(std::string_view url) {
    std::string_view rest;
    if (url.starts_with("https://")) {
        rest = url.substr(8);
    } else if (url.starts_with("http://")) {
        rest = url.substr(7);
    } else {
        return false;
    }
    auto host = rest.substr(0, rest.find_first_of("/?#"));
    return !host.empty() && host.find_first_of(" \t\r\n") == std::string_view::npos;
}

} // namespace

AnalysisClient::AnalysisClient(HttpTransport& transport, Options opts, Sleeper sleeper)
    : transport_(transport), opts_(std::move(opts)), sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::seconds d) { std::this_thread::sleep_for(d); };
    }
}

std::chrono::seconds AnalysisClient::backoff_delay(int attempt) {
    if (attempt < 1) attempt = 1;
    if (attempt > 4) return kMaxBackoff;
    return std::min(std::chrono::seconds(1LL << (attempt - 1)), kMaxBackoff);
}

std::expected<HttpRequest, AnalysisError>
AnalysisClient::build_http_request(const AnalysisRequest& request) const {
    if (opts_.api_key.empty()) {
        return std::unexpected(AnalysisError{.kind = AnalysisError::Kind::MissingApiKey});
    }
    if (!valid_endpoint(opts_.base_url)) {
        return std::unexpected(AnalysisError{
            .kind = AnalysisError::Kind::InvalidUrl,
            .detail = opts_.base_url,
        });
    }

    json body = {
        {"model", opts_.model},
        {"messages", json::array({{{"role", "user"}, {"content", build_analysis_prompt(request)}}})},
        {"max_tokens", opts_.max_tokens},
        {"temperature", opts_.temperature},
        {"stream", false},
    };

    std::string encoded;
    try {
        encoded = body.dump();
    } catch (const json::type_error& e) {
        // Invalid UTF-8 in the transcript or preferences.
        return std::unexpected(AnalysisError{
            .kind = AnalysisError::Kind::RequestEncodingFailed,
            .detail = e.what(),
        });
    }

    return HttpRequest{
        .url = opts_.base_url,
        .headers = {
            {"Content-Type", "application/json"},
            {"Authorization", "Bearer " + opts_.api_key},
        },
        .body = std::move(encoded),
        .timeout = opts_.timeout,
    };
}

std::expected<AnalysisResult, AnalysisError>
AnalysisClient::analyze(const AnalysisRequest& request, const ProgressCallback& progress) {
    auto report = [&progress](std::string_view label) {
        if (progress) progress(label);
    };
    auto start = std::chrono::steady_clock::now();

    report(analysis_progress::kConnecting);

    auto http = build_http_request(request);
    if (!http) {
        std::println(stderr, "analysis: {}", http.error().user_message());
        return std::unexpected(http.error());
    }

    const int attempts = std::max(1, opts_.max_attempts);
    std::expected<std::string, AnalysisError> content =
        std::unexpected(AnalysisError{.kind = AnalysisError::Kind::Network});

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        content = send_once(*http);
        if (content) break;

        const auto& err = content.error();
        std::println(stderr, "analysis: attempt {}/{} failed: {}", attempt, attempts, err.user_message());
        if (!err.is_retryable()) {
            return std::unexpected(err);
        }
        if (attempt < attempts) {
            auto delay = backoff_delay(attempt);
            log(std::format("retrying request {} in {}s", request.request_id, delay.count()));
            sleeper_(delay);
        }
    }
    if (!content) {
        return std::unexpected(content.error());
    }

    report(analysis_progress::kInterpreting);
    auto parsed = parse_completion(*content, request);

    report(analysis_progress::kExtracting);
    AnalysisResult result;
    if (parsed) {
        result = std::move(*parsed);
    } else {
        log(std::format("completion for {} not parseable, using fallback", request.request_id));
        result = fallback_result(request);
    }

    result.processing_s =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    log(std::format("request {} analyzed in {:.2f}s, confidence {:.2f}",
                    request.request_id, result.processing_s, result.confidence));
    return result;
}

std::expected<std::string, AnalysisError> AnalysisClient::send_once(const HttpRequest& request) {
    auto resp = transport_.post(request);
    if (!resp) {
        return std::unexpected(AnalysisError{
            .kind = AnalysisError::Kind::Network,
            .detail = resp.error(),
        });
    }
    if (resp->status != 200) {
        return std::unexpected(AnalysisError{
            .kind = AnalysisError::Kind::ApiError,
            .status = static_cast<int>(resp->status),
            .detail = resp->body.substr(0, 200),
        });
    }

    auto envelope = json::parse(resp->body, nullptr, /*allow_exceptions=*/false);
    if (!envelope.is_object()) {
        return std::unexpected(AnalysisError{
            .kind = AnalysisError::Kind::InvalidResponse,
            .detail = "response is not a JSON object",
        });
    }
    auto choices = envelope.find("choices");
    if (choices == envelope.end() || !choices->is_array() || choices->empty()) {
        return std::unexpected(AnalysisError{
            .kind = AnalysisError::Kind::InvalidResponse,
            .detail = "response has no choices",
        });
    }

    // A missing content string is treated as unparseable content, not a transport failure.
    const auto& choice = choices->front();
    if (choice.is_object()) {
        auto message = choice.find("message");
        if (message != choice.end() && message->is_object()) {
            auto text = message->find("content");
            if (text != message->end() && text->is_string()) {
                return text->get<std::string>();
            }
        }
    }
    return std::string{};
}

void AnalysisClient::log(const std::string& msg) {
    if (opts_.verbose) {
        std::println(stderr, "[voice-ledger] analysis: {}", msg);
    }
}

std::string mask_api_key(std::string_view key) {
    if (key.empty()) return "(not set)";
    if (key.size() <= 11) return std::string(key.size(), '*');
    return std::format("{}...{}", key.substr(0, 7), key.substr(key.size() - 4));
}
