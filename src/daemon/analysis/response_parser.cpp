#include "analysis/response_parser.hpp"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <format>
#include <limits>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

std::string_view trim(std::string_view s) {
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::optional<Decimal> amount_from_json(const json& v) {
    if (v.is_number_unsigned()) {
        auto u = v.get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return std::nullopt;
        return Decimal(static_cast<int64_t>(u), 0);
    }
    if (v.is_number_integer()) {
        return Decimal(v.get<int64_t>(), 0);
    }
    if (v.is_number_float()) {
        double d = v.get<double>();
        if (auto exact = Decimal::from_double(d)) return exact;
        // More digits than an amount can carry; keep cents.
        if (!std::isfinite(d) || std::fabs(d) > 1e15) return std::nullopt;
        return Decimal(std::llround(d * 100.0), 2);
    }
    if (v.is_string()) {
        return Decimal::parse(v.get_ref<const std::string&>());
    }
    return std::nullopt;
}

ExpenseCategory category_from_json(const json& obj) {
    auto it = obj.find("category");
    if (it == obj.end() || !it->is_string()) return ExpenseCategory::Other;
    return category_from_label(it->get_ref<const std::string&>()).value_or(ExpenseCategory::Other);
}

std::string string_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return {};
    return std::string(trim(it->get_ref<const std::string&>()));
}

std::optional<double> confidence_field(const json& obj) {
    auto it = obj.find("confidence");
    if (it == obj.end() || !it->is_number()) return std::nullopt;
    double c = it->get<double>();
    if (!std::isfinite(c)) return std::nullopt;
    return std::clamp(c, 0.0, 1.0);
}

void collect_tags(const json& obj, std::vector<std::string>& out) {
    auto it = obj.find("tags");
    if (it == obj.end() || !it->is_array()) return;
    for (const auto& t : *it) {
        if (!t.is_string()) continue;
        auto tag = std::string(trim(t.get_ref<const std::string&>()));
        if (tag.empty() || std::ranges::find(out, tag) != out.end()) continue;
        out.push_back(std::move(tag));
    }
}

AlternativeInterpretation alternative_from_json(const json& item, double default_confidence) {
    AlternativeInterpretation alt;
    if (auto it = item.find("amount"); it != item.end()) alt.amount = amount_from_json(*it);
    alt.category = category_from_json(item);
    alt.title = string_field(item, "title");
    alt.description = string_field(item, "description");
    alt.confidence = confidence_field(item).value_or(default_confidence);
    return alt;
}

std::optional<json> parse_object(std::string_view text) {
    auto j = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (j.is_object()) return j;

    // Tolerate prose around the object.
    auto open = text.find('{');
    auto close = text.rfind('}');
    if (open == std::string_view::npos || close == std::string_view::npos || close < open) {
        return std::nullopt;
    }
    j = json::parse(text.substr(open, close - open + 1), nullptr, false);
    if (j.is_object()) return j;
    return std::nullopt;
}

} // namespace

std::string_view strip_code_fence(std::string_view content) {
    auto text = trim(content);
    if (!text.starts_with("```")) return text;

    auto newline = text.find('\n');
    if (newline == std::string_view::npos) return {};
    text.remove_prefix(newline + 1);

    text = trim(text);
    if (text.ends_with("```")) text.remove_suffix(3);
    return trim(text);
}

std::optional<AnalysisResult> parse_completion(std::string_view content,
                                               const AnalysisRequest& request) {
    auto parsed = parse_object(strip_code_fence(content));
    if (!parsed) return std::nullopt;
    const json& root = *parsed;

    AnalysisResult result;
    result.original_text = request.voice_text;
    result.timestamp = Clock::now();

    const double top_confidence = confidence_field(root).value_or(kDefaultConfidence);
    collect_tags(root, result.tags);

    const json* primary = &root;
    if (auto it = root.find("expenses"); it != root.end()) {
        if (!it->is_array() || it->empty() || !it->front().is_object()) return std::nullopt;
        primary = &it->front();
        for (size_t i = 1; i < it->size(); ++i) {
            const auto& item = (*it)[i];
            if (!item.is_object()) continue;
            result.alternatives.push_back(alternative_from_json(item, top_confidence));
        }
    } else if (auto alts = root.find("alternatives"); alts != root.end() && alts->is_array()) {
        for (const auto& item : *alts) {
            if (!item.is_object()) continue;
            result.alternatives.push_back(alternative_from_json(item, top_confidence));
        }
    }

    auto amount_it = primary->find("amount");
    if (amount_it == primary->end()) return std::nullopt;
    result.extracted_amount = amount_from_json(*amount_it);
    if (!result.extracted_amount) return std::nullopt;

    result.category = category_from_json(*primary);
    result.title = string_field(*primary, "title");
    result.description = string_field(*primary, "description");
    result.confidence = confidence_field(*primary).value_or(top_confidence);
    if (primary != &root) collect_tags(*primary, result.tags);

    return result;
}

AnalysisResult fallback_result(const AnalysisRequest& request) {
    std::time_t t = Clock::to_time_t(request.timestamp);
    std::tm local{};
    localtime_r(&t, &local);

    std::string title = "待补充支出";
    std::string description = "无法解析语音内容，请手动输入";
    if (local.tm_hour >= 5 && local.tm_hour < 10) {
        title = "早餐";
        description = "可能是早餐支出，请补充金额";
    } else if (local.tm_hour >= 17 && local.tm_hour < 21) {
        title = "晚餐";
        description = "可能是晚餐支出，请补充金额";
    }

    return AnalysisResult{
        .original_text = request.voice_text,
        .extracted_amount = std::nullopt,
        .category = ExpenseCategory::Other,
        .title = std::move(title),
        .description = std::move(description),
        .confidence = kFallbackConfidence,
        .timestamp = Clock::now(),
    };
}
