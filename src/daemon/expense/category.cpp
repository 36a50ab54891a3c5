#include "expense/category.hpp"

namespace {

struct CategoryNames {
    ExpenseCategory category;
    std::string_view id;
    std::string_view label;
};

constexpr std::array<CategoryNames, 12> kNames = {{
    {ExpenseCategory::Food, "food", "餐饮"},
    {ExpenseCategory::Transport, "transport", "交通"},
    {ExpenseCategory::Shopping, "shopping", "购物"},
    {ExpenseCategory::Entertainment, "entertainment", "娱乐"},
    {ExpenseCategory::Healthcare, "healthcare", "医疗"},
    {ExpenseCategory::Housing, "housing", "住房"},
    {ExpenseCategory::Education, "education", "教育"},
    {ExpenseCategory::Utilities, "utilities", "水电费"},
    {ExpenseCategory::Clothing, "clothing", "服装"},
    {ExpenseCategory::Gift, "gift", "礼品"},
    {ExpenseCategory::Travel, "travel", "旅行"},
    {ExpenseCategory::Other, "other", "其他"},
}};

const CategoryNames& names_of(ExpenseCategory c) {
    for (const auto& n : kNames) {
        if (n.category == c) return n;
    }
    return kNames.back();
}

} // namespace

std::string_view category_id(ExpenseCategory c) {
    return names_of(c).id;
}

std::string_view category_label(ExpenseCategory c) {
    return names_of(c).label;
}

std::optional<ExpenseCategory> category_from_label(std::string_view label) {
    for (const auto& n : kNames) {
        if (n.label == label) return n.category;
    }
    return std::nullopt;
}

std::optional<ExpenseCategory> category_from_id(std::string_view id) {
    for (const auto& n : kNames) {
        if (n.id == id) return n.category;
    }
    return std::nullopt;
}

std::optional<ExpenseCategory> parse_category(std::string_view text) {
    if (auto c = category_from_id(text)) return c;
    return category_from_label(text);
}

std::string category_vocabulary(std::string_view separator) {
    std::string out;
    for (const auto& n : kNames) {
        if (!out.empty()) out += separator;
        out += n.label;
    }
    return out;
}
