#pragma once

#include "expense/expense_candidate.hpp"
#include "storage/expense_storage.hpp"

#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// Wire form used on the IPC socket. Amounts travel as decimal strings ("25.00")
// and dates as Unix seconds.
nlohmann::json to_json(const ExpenseCandidate& expense);
nlohmann::json to_json(const ExpenseRecord& record);

// Accepts a JSON number or numeric string.
std::optional<Decimal> decimal_from_json(const nlohmann::json& v);

// Overlays the fields present in edits ("amount", "category", "title",
// "description", "tags", "date") on base and validates the result.
std::expected<ExpenseCandidate, std::string>
apply_edits(const ExpenseCandidate::Fields& base, const nlohmann::json& edits);
