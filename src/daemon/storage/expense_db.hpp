#pragma once

#include "storage/expense_storage.hpp"

#include <sqlite3.h>
#include <string>

class ExpenseDb : public ExpenseStorage {
public:
    ExpenseDb();
    ~ExpenseDb() override;

    ExpenseDb(const ExpenseDb&) = delete;
    ExpenseDb& operator=(const ExpenseDb&) = delete;

    bool open(const std::string& path);
    void close();

    std::expected<int64_t, std::string> save(const ExpenseCandidate& expense) override;
    std::expected<void, std::string> update(int64_t id, const ExpenseCandidate& expense) override;
    std::expected<void, std::string> remove(int64_t id) override;

    std::expected<std::optional<ExpenseRecord>, std::string> find(int64_t id) override;
    std::expected<std::vector<ExpenseRecord>, std::string> fetch_all(int limit) override;
    std::expected<std::vector<ExpenseRecord>, std::string>
        fetch_range(Clock::time_point from, Clock::time_point to,
                    std::optional<ExpenseCategory> category) override;
    std::expected<std::vector<ExpenseRecord>, std::string> search(const std::string& query) override;

private:
    bool create_tables();
    bool prepare(const char* sql, sqlite3_stmt** stmt);
    void bind_expense(sqlite3_stmt* stmt, const ExpenseCandidate& expense);
    std::expected<std::vector<ExpenseRecord>, std::string> collect(sqlite3_stmt* stmt);
    std::string last_error() const;

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* update_stmt_ = nullptr;
    sqlite3_stmt* delete_stmt_ = nullptr;
    sqlite3_stmt* find_stmt_ = nullptr;
    sqlite3_stmt* all_stmt_ = nullptr;
    sqlite3_stmt* range_stmt_ = nullptr;
    sqlite3_stmt* search_stmt_ = nullptr;
};
