#include "analysis/analysis_types.hpp"

#include <format>
#include <random>

AnalysisRequest AnalysisRequest::make(std::string voice_text,
                                      std::optional<UserPreferences> preferences,
                                      std::string context) {
    return AnalysisRequest{
        .voice_text = std::move(voice_text),
        .context = std::move(context),
        .preferences = std::move(preferences),
        .request_id = generate_request_id(),
        .timestamp = Clock::now(),
    };
}

bool AnalysisResult::is_valid() const {
    return extracted_amount && *extracted_amount > Decimal() && !title.empty() && confidence > 0.3;
}

bool AnalysisError::is_config_error() const {
    return kind == Kind::MissingApiKey || kind == Kind::InvalidUrl ||
           kind == Kind::RequestEncodingFailed;
}

std::string AnalysisError::user_message() const {
    switch (kind) {
        case Kind::MissingApiKey:
            return "analysis API key is not configured";
        case Kind::InvalidUrl:
            return "analysis service URL is invalid";
        case Kind::RequestEncodingFailed:
            return "could not encode the analysis request";
        case Kind::InvalidResponse:
            return "analysis service returned an invalid response";
        case Kind::ApiError:
            if (is_auth_failure()) {
                return std::format("analysis service rejected the API key (HTTP {})", status);
            }
            if (status == 429) {
                return "analysis service rate limit reached, try again later";
            }
            if (status >= 500) {
                return std::format("analysis service error (HTTP {}), try again later", status);
            }
            return std::format("analysis service returned HTTP {}", status);
        case Kind::Network:
            return "network error contacting the analysis service: " + detail;
    }
    return "analysis failed";
}

std::string generate_request_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};

    uint64_t hi = rng();
    uint64_t lo = rng();
    hi = (hi & 0xffffffffffff0fffULL) | 0x0000000000004000ULL; // version 4
    lo = (lo & 0x3fffffffffffffffULL) | 0x8000000000000000ULL; // RFC 4122 variant

    return std::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                       hi >> 32, (hi >> 16) & 0xffff, hi & 0xffff,
                       lo >> 48, lo & 0xffffffffffffULL);
}
