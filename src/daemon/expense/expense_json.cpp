#include "expense/expense_json.hpp"

using json = nlohmann::json;

namespace {

int64_t to_unix(Clock::time_point t) {
    return std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
}

} // namespace

json to_json(const ExpenseCandidate& e) {
    return json{
        {"amount", e.amount().to_string(2)},
        {"category", category_id(e.category())},
        {"category_label", category_label(e.category())},
        {"title", e.title()},
        {"description", e.description()},
        {"voice_text", e.original_voice_text()},
        {"confidence", e.confidence()},
        {"confidence_level", to_string(confidence_level(e.confidence()))},
        {"tags", e.tags()},
        {"date", to_unix(e.date())},
    };
}

json to_json(const ExpenseRecord& r) {
    auto j = to_json(r.expense);
    j["id"] = r.id;
    j["created_at"] = to_unix(r.created_at);
    j["updated_at"] = to_unix(r.updated_at);
    j["verified"] = r.verified;
    return j;
}

std::optional<Decimal> decimal_from_json(const json& v) {
    if (v.is_number_integer()) return Decimal(v.get<int64_t>(), 0);
    if (v.is_number_float()) return Decimal::from_double(v.get<double>());
    if (v.is_string()) return Decimal::parse(v.get_ref<const std::string&>());
    return std::nullopt;
}

std::expected<ExpenseCandidate, std::string>
apply_edits(const ExpenseCandidate::Fields& base, const json& edits) {
    if (!edits.is_null() && !edits.is_object()) {
        return std::unexpected(std::string("edits must be an object"));
    }

    auto f = base;
    try {
        if (edits.contains("amount")) {
            auto amount = decimal_from_json(edits["amount"]);
            if (!amount) return std::unexpected(std::string("amount is not a number"));
            f.amount = *amount;
        }
        if (edits.contains("category")) {
            auto c = parse_category(edits["category"].get<std::string>());
            if (!c) return std::unexpected("unknown category: " + edits["category"].get<std::string>());
            f.category = *c;
        }
        if (edits.contains("title")) f.title = edits["title"].get<std::string>();
        if (edits.contains("description")) f.description = edits["description"].get<std::string>();
        if (edits.contains("tags")) f.tags = edits["tags"].get<std::vector<std::string>>();
        if (edits.contains("date")) {
            f.date = Clock::time_point(std::chrono::seconds(edits["date"].get<int64_t>()));
        }
    } catch (const json::exception& e) {
        return std::unexpected(std::string("invalid field: ") + e.what());
    }

    auto candidate = ExpenseCandidate::create(std::move(f));
    if (!candidate) return std::unexpected(candidate.error().message);
    return std::move(*candidate);
}
