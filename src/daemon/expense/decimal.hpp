#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Exact base-10 number: units * 10^-scale. Amounts never pass through binary
// floating point once parsed.
class Decimal {
public:
    static constexpr int kMaxScale = 9;

    Decimal() = default;
    Decimal(int64_t units, int scale);

    static Decimal from_cents(int64_t cents) { return Decimal(cents, 2); }

    // Accepts an optional sign, digits, an optional fraction and an optional
    // exponent ("25", "25.5", "-0.01", "  12.30 ", "2.5e1"). Grouping and
    // currency symbols are rejected.
    static std::optional<Decimal> parse(std::string_view text);

    // Converts through the shortest round-trip decimal representation, so 12.345
    // stays 12.345 rather than its binary approximation.
    static std::optional<Decimal> from_double(double value);

    int64_t units() const { return units_; }
    int scale() const { return scale_; }

    bool is_zero() const { return units_ == 0; }
    bool is_negative() const { return units_ < 0; }

    // Number of significant fractional digits (trailing zeros do not count).
    int fractional_digits() const { return scale_; }

    // Value in hundredths; empty if that would drop digits.
    std::optional<int64_t> to_cents() const;

    // Canonical text, at least min_scale fractional digits ("25.00" for 25 with 2).
    std::string to_string(int min_scale = 0) const;

    friend bool operator==(const Decimal& a, const Decimal& b);
    friend std::strong_ordering operator<=>(const Decimal& a, const Decimal& b);

private:
    void normalize();

    int64_t units_ = 0;
    int scale_ = 0;
};
