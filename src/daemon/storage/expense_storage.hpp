#pragma once

#include "expense/expense_candidate.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

struct ExpenseRecord {
    int64_t id = 0;
    ExpenseCandidate expense;
    Clock::time_point created_at;
    Clock::time_point updated_at;
    bool verified = false;
};

// Persistence collaborator. Every call is terminal for the candidate it
// concerns: errors are reported, never retried.
class ExpenseStorage {
public:
    virtual ~ExpenseStorage() = default;

    virtual std::expected<int64_t, std::string> save(const ExpenseCandidate& expense) = 0;
    virtual std::expected<void, std::string> update(int64_t id, const ExpenseCandidate& expense) = 0;
    virtual std::expected<void, std::string> remove(int64_t id) = 0;

    virtual std::expected<std::optional<ExpenseRecord>, std::string> find(int64_t id) = 0;
    // Newest first.
    virtual std::expected<std::vector<ExpenseRecord>, std::string> fetch_all(int limit) = 0;
    // Dates in [from, to], newest first.
    virtual std::expected<std::vector<ExpenseRecord>, std::string>
        fetch_range(Clock::time_point from, Clock::time_point to,
                    std::optional<ExpenseCategory> category) = 0;
    // Substring match on title, description or voice text.
    virtual std::expected<std::vector<ExpenseRecord>, std::string> search(const std::string& query) = 0;
};
