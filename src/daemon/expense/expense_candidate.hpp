#pragma once

#include "expense/category.hpp"
#include "expense/decimal.hpp"

#include <chrono>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

using Clock = std::chrono::system_clock;

struct ValidationError {
    enum class Field { Amount, Title, Confidence, Date };

    Field field;
    std::string message;
};

enum class ConfidenceLevel { High, Medium, Low };

ConfidenceLevel confidence_level(double confidence);
std::string_view to_string(ConfidenceLevel level);

// Amount in [0.01, 999999.99] with at most two fractional digits.
std::expected<void, ValidationError> validate_amount(const Decimal& amount);
// Trimmed title of 1-100 characters, no control characters, none of <>|\/:*?"
std::expected<void, ValidationError> validate_title(std::string_view title);
std::expected<void, ValidationError> validate_confidence(double confidence);
// Within one year either side of now.
std::expected<void, ValidationError> validate_date(Clock::time_point date, Clock::time_point now);

// An expense the user has not accepted yet. Only obtainable through create(),
// so a candidate in hand has passed validation at construction time.
class ExpenseCandidate {
public:
    struct Fields {
        Decimal amount;
        ExpenseCategory category = ExpenseCategory::Other;
        std::string title;
        std::string description;
        std::string original_voice_text;
        double confidence = 1.0;
        std::vector<std::string> tags;
        Clock::time_point date = Clock::now();
    };

    static std::expected<ExpenseCandidate, ValidationError>
        create(Fields fields, Clock::time_point now = Clock::now());

    // Rebuilds a candidate that passed validation when it was stored. The date
    // window is relative to the save time, so it is not re-checked here.
    static ExpenseCandidate restore(Fields fields) { return ExpenseCandidate(std::move(fields)); }

    // Re-checks every invariant against the current time.
    std::expected<void, ValidationError> validate(Clock::time_point now = Clock::now()) const;

    const Decimal& amount() const { return f_.amount; }
    int64_t amount_cents() const;
    ExpenseCategory category() const { return f_.category; }
    const std::string& title() const { return f_.title; }
    const std::string& description() const { return f_.description; }
    const std::string& original_voice_text() const { return f_.original_voice_text; }
    double confidence() const { return f_.confidence; }
    const std::vector<std::string>& tags() const { return f_.tags; }
    Clock::time_point date() const { return f_.date; }

    const Fields& fields() const { return f_; }

private:
    explicit ExpenseCandidate(Fields f) : f_(std::move(f)) {}

    Fields f_;
};
