#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

enum class ExpenseCategory {
    Food,
    Transport,
    Shopping,
    Entertainment,
    Healthcare,
    Housing,
    Education,
    Utilities,
    Clothing,
    Gift,
    Travel,
    Other,
};

inline constexpr std::array<ExpenseCategory, 12> kAllCategories = {
    ExpenseCategory::Food,          ExpenseCategory::Transport, ExpenseCategory::Shopping,
    ExpenseCategory::Entertainment, ExpenseCategory::Healthcare, ExpenseCategory::Housing,
    ExpenseCategory::Education,     ExpenseCategory::Utilities, ExpenseCategory::Clothing,
    ExpenseCategory::Gift,          ExpenseCategory::Travel,    ExpenseCategory::Other,
};

// Stable identifier used in config, storage and IPC ("food", "transport", ...).
std::string_view category_id(ExpenseCategory c);

// Vocabulary label the analysis service answers with ("餐饮", "交通", ...).
std::string_view category_label(ExpenseCategory c);

// Exact, case-sensitive match against the label vocabulary.
std::optional<ExpenseCategory> category_from_label(std::string_view label);

std::optional<ExpenseCategory> category_from_id(std::string_view id);

// Accepts either an identifier or a label.
std::optional<ExpenseCategory> parse_category(std::string_view text);

// Labels joined with the given separator, in declaration order.
std::string category_vocabulary(std::string_view separator);
