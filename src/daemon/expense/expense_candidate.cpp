#include "expense/expense_candidate.hpp"

#include <algorithm>
#include <format>

namespace {

const Decimal kMinAmount = Decimal::from_cents(1);
const Decimal kMaxAmount = Decimal::from_cents(99999999);
constexpr size_t kMaxTitleChars = 100;
constexpr std::string_view kForbiddenTitleChars = "<>|\\/:*?\"";

std::string trim(std::string_view s) {
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(first, last - first + 1));
}

// Counts UTF-8 code points (continuation bytes are skipped).
size_t utf8_length(std::string_view s) {
    return static_cast<size_t>(std::count_if(s.begin(), s.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

ValidationError fail(ValidationError::Field field, std::string message) {
    return ValidationError{field, std::move(message)};
}

} // namespace

ConfidenceLevel confidence_level(double confidence) {
    if (confidence >= 0.8) return ConfidenceLevel::High;
    if (confidence >= 0.6) return ConfidenceLevel::Medium;
    return ConfidenceLevel::Low;
}

std::string_view to_string(ConfidenceLevel level) {
    switch (level) {
        case ConfidenceLevel::High: return "high";
        case ConfidenceLevel::Medium: return "medium";
        case ConfidenceLevel::Low: return "low";
    }
    return "low";
}

std::expected<void, ValidationError> validate_amount(const Decimal& amount) {
    if (amount < kMinAmount) {
        return std::unexpected(fail(ValidationError::Field::Amount,
                                    "amount must be at least 0.01"));
    }
    if (amount > kMaxAmount) {
        return std::unexpected(fail(ValidationError::Field::Amount,
                                    "amount must not exceed 999999.99"));
    }
    if (amount.fractional_digits() > 2) {
        return std::unexpected(fail(ValidationError::Field::Amount,
                                    "amount supports at most two decimal places"));
    }
    return {};
}

std::expected<void, ValidationError> validate_title(std::string_view title) {
    auto trimmed = trim(title);
    if (trimmed.empty()) {
        return std::unexpected(fail(ValidationError::Field::Title, "title must not be empty"));
    }
    if (utf8_length(trimmed) > kMaxTitleChars) {
        return std::unexpected(fail(ValidationError::Field::Title,
                                    std::format("title must not exceed {} characters",
                                                kMaxTitleChars)));
    }
    for (char c : trimmed) {
        auto uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7F) {
            return std::unexpected(fail(ValidationError::Field::Title,
                                        "title contains control characters"));
        }
        if (kForbiddenTitleChars.find(c) != std::string_view::npos) {
            return std::unexpected(fail(ValidationError::Field::Title,
                                        "title contains invalid characters"));
        }
    }
    return {};
}

std::expected<void, ValidationError> validate_confidence(double confidence) {
    if (!(confidence >= 0.0 && confidence <= 1.0)) {
        return std::unexpected(fail(ValidationError::Field::Confidence,
                                    "confidence must be between 0.0 and 1.0"));
    }
    return {};
}

std::expected<void, ValidationError> validate_date(Clock::time_point date,
                                                   Clock::time_point now) {
    auto window = std::chrono::duration_cast<Clock::duration>(std::chrono::years{1});
    if (date < now - window) {
        return std::unexpected(fail(ValidationError::Field::Date,
                                    "date must not be more than one year ago"));
    }
    if (date > now + window) {
        return std::unexpected(fail(ValidationError::Field::Date,
                                    "date must not be more than one year ahead"));
    }
    return {};
}

std::expected<ExpenseCandidate, ValidationError>
ExpenseCandidate::create(Fields fields, Clock::time_point now) {
    fields.title = trim(fields.title);
    fields.description = trim(fields.description);

    std::vector<std::string> tags;
    for (auto& tag : fields.tags) {
        auto t = trim(tag);
        if (!t.empty() && std::ranges::find(tags, t) == tags.end()) {
            tags.push_back(std::move(t));
        }
    }
    fields.tags = std::move(tags);

    ExpenseCandidate candidate(std::move(fields));
    if (auto ok = candidate.validate(now); !ok) {
        return std::unexpected(ok.error());
    }
    return candidate;
}

std::expected<void, ValidationError> ExpenseCandidate::validate(Clock::time_point now) const {
    if (auto r = validate_amount(f_.amount); !r) return r;
    if (auto r = validate_title(f_.title); !r) return r;
    if (auto r = validate_confidence(f_.confidence); !r) return r;
    return validate_date(f_.date, now);
}

int64_t ExpenseCandidate::amount_cents() const {
    return f_.amount.to_cents().value_or(0);
}
