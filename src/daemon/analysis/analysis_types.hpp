#pragma once

#include "expense/category.hpp"
#include "expense/decimal.hpp"
#include "expense/expense_candidate.hpp"

#include <optional>
#include <string>
#include <vector>

struct UserPreferences {
    std::vector<ExpenseCategory> preferred_categories;
    std::vector<std::string> common_merchants;
    std::string default_currency = "CNY";
};

// One logical analysis attempt. The id stays the same across retries.
struct AnalysisRequest {
    std::string voice_text;
    std::string context; // optional, empty when absent
    std::optional<UserPreferences> preferences;
    std::string request_id;
    Clock::time_point timestamp;

    static AnalysisRequest make(std::string voice_text,
                                std::optional<UserPreferences> preferences = std::nullopt,
                                std::string context = {});
};

// A further expense extracted from the same utterance.
struct AlternativeInterpretation {
    std::optional<Decimal> amount;
    ExpenseCategory category = ExpenseCategory::Other;
    std::string title;
    std::string description;
    double confidence = 0.0;
};

struct AnalysisResult {
    std::string original_text;
    std::optional<Decimal> extracted_amount;
    ExpenseCategory category = ExpenseCategory::Other;
    std::string title;
    std::string description;
    double confidence = 0.0;
    std::vector<std::string> tags; // unique, in first-seen order
    std::vector<AlternativeInterpretation> alternatives;
    double processing_s = 0.0;
    Clock::time_point timestamp;

    // Amount present and positive, title non-empty, confidence above 0.3.
    bool is_valid() const;
    ConfidenceLevel confidence_level() const { return ::confidence_level(confidence); }
};

struct AnalysisError {
    enum class Kind {
        MissingApiKey,
        InvalidUrl,
        RequestEncodingFailed,
        InvalidResponse,
        ApiError,
        Network,
    };

    Kind kind;
    int status = 0; // ApiError only
    std::string detail;

    // Misconfiguration: reported before any request is sent.
    bool is_config_error() const;
    bool is_auth_failure() const { return kind == Kind::ApiError && (status == 401 || status == 403); }
    bool is_retryable() const { return !is_config_error() && !is_auth_failure(); }

    std::string user_message() const;
};

// Random 128-bit identifier in canonical UUID text form.
std::string generate_request_id();
