#include "expense/decimal.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>

namespace {

constexpr int kMaxDigits = 18;
constexpr int kMaxExponent = 30;

__int128 pow10(int n) {
    __int128 v = 1;
    for (int i = 0; i < n; ++i) v *= 10;
    return v;
}

} // namespace

Decimal::Decimal(int64_t units, int scale) : units_(units), scale_(scale) {
    normalize();
}

void Decimal::normalize() {
    while (scale_ > 0 && units_ % 10 == 0) {
        units_ /= 10;
        --scale_;
    }
    if (units_ == 0) scale_ = 0;
}

std::optional<Decimal> Decimal::parse(std::string_view text) {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return std::nullopt;
    auto last = text.find_last_not_of(" \t\r\n");
    text = text.substr(first, last - first + 1);

    bool negative = false;
    if (text.front() == '+' || text.front() == '-') {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }
    if (text.empty()) return std::nullopt;

    int exponent = 0;
    if (auto e = text.find_first_of("eE"); e != std::string_view::npos) {
        auto exp_text = text.substr(e + 1);
        bool plus = !exp_text.empty() && exp_text.front() == '+';
        if (plus) exp_text.remove_prefix(1);
        if (exp_text.empty() || exp_text.front() == '+' || (plus && exp_text.front() == '-')) {
            return std::nullopt;
        }
        const char* end = exp_text.data() + exp_text.size();
        auto [ptr, ec] = std::from_chars(exp_text.data(), end, exponent);
        if (ec != std::errc{} || ptr != end) return std::nullopt;
        if (exponent > kMaxExponent || exponent < -kMaxExponent) return std::nullopt;
        text = text.substr(0, e);
        if (text.empty()) return std::nullopt;
    }

    int64_t units = 0;
    int scale = 0;
    int digits = 0;
    bool seen_point = false;

    for (char c : text) {
        if (c == '.') {
            if (seen_point) return std::nullopt;
            seen_point = true;
            continue;
        }
        if (c < '0' || c > '9') return std::nullopt;
        if (!seen_point && units == 0 && c == '0') continue; // leading zeros
        if (++digits > kMaxDigits) return std::nullopt;
        units = units * 10 + (c - '0');
        if (seen_point) {
            if (++scale > kMaxScale) return std::nullopt;
        }
    }

    // At least one digit somewhere ("." and "-." are not numbers).
    if (text.find_first_of("0123456789") == std::string_view::npos) return std::nullopt;

    scale -= exponent;
    for (; scale < 0; ++scale) {
        if (units != 0 && ++digits > kMaxDigits) return std::nullopt;
        units *= 10;
    }
    if (scale > kMaxScale) {
        // Trailing zeros do not count against the scale.
        while (scale > kMaxScale && units != 0 && units % 10 == 0) {
            units /= 10;
            --scale;
        }
        if (units == 0) scale = 0;
        if (scale > kMaxScale) return std::nullopt;
    }

    return Decimal(negative ? -units : units, scale);
}

std::optional<Decimal> Decimal::from_double(double value) {
    if (!std::isfinite(value)) return std::nullopt;

    std::array<char, 64> buf{};
    auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value,
                                   std::chars_format::fixed);
    if (ec != std::errc{}) return std::nullopt;
    return parse(std::string_view(buf.data(), static_cast<size_t>(end - buf.data())));
}

std::optional<int64_t> Decimal::to_cents() const {
    if (scale_ > 2) return std::nullopt;
    return units_ * static_cast<int64_t>(pow10(2 - scale_));
}

std::string Decimal::to_string(int min_scale) const {
    int scale = std::max(scale_, min_scale);
    __int128 scaled = static_cast<__int128>(units_) * pow10(scale - scale_);

    bool negative = scaled < 0;
    if (negative) scaled = -scaled;

    std::string digits;
    do {
        digits.insert(digits.begin(), static_cast<char>('0' + static_cast<int>(scaled % 10)));
        scaled /= 10;
    } while (scaled > 0);

    if (static_cast<int>(digits.size()) <= scale) {
        digits.insert(0, static_cast<size_t>(scale) - digits.size() + 1, '0');
    }
    if (scale > 0) {
        digits.insert(digits.size() - static_cast<size_t>(scale), 1, '.');
    }
    return negative ? "-" + digits : digits;
}

bool operator==(const Decimal& a, const Decimal& b) {
    return a.units_ == b.units_ && a.scale_ == b.scale_;
}

std::strong_ordering operator<=>(const Decimal& a, const Decimal& b) {
    int scale = std::max(a.scale_, b.scale_);
    __int128 lhs = static_cast<__int128>(a.units_) * pow10(scale - a.scale_);
    __int128 rhs = static_cast<__int128>(b.units_) * pow10(scale - b.scale_);
    if (lhs < rhs) return std::strong_ordering::less;
    if (lhs > rhs) return std::strong_ordering::greater;
    return std::strong_ordering::equal;
}
