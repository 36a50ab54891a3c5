#include "storage/expense_db.hpp"

#include <filesystem>
#include <format>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Column order shared by every SELECT.
constexpr const char* kColumns =
    "id, amount_cents, category, title, description, voice_text, confidence, "
    "tags, date, created_at, updated_at, verified";

int64_t to_unix(Clock::time_point t) {
    return std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
}

Clock::time_point from_unix(int64_t s) {
    return Clock::time_point(std::chrono::seconds(s));
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    auto* p = sqlite3_column_text(stmt, col);
    return p ? reinterpret_cast<const char*>(p) : "";
}

std::vector<std::string> tags_from_text(const std::string& text) {
    auto j = json::parse(text, nullptr, /*allow_exceptions=*/false);
    std::vector<std::string> tags;
    if (!j.is_array()) return tags;
    for (const auto& t : j) {
        if (t.is_string()) tags.push_back(t.get<std::string>());
    }
    return tags;
}

} // namespace

ExpenseDb::ExpenseDb() = default;

ExpenseDb::~ExpenseDb() {
    close();
}

bool ExpenseDb::open(const std::string& path) {
    fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) return false;

    auto select = [](const char* tail) { return std::string("SELECT ") + kColumns + " FROM expenses " + tail; };
    static const std::string find_sql = select("WHERE id = ?");
    static const std::string all_sql = select("ORDER BY date DESC, id DESC LIMIT ?");
    static const std::string range_sql =
        select("WHERE date BETWEEN ?1 AND ?2 AND (?3 IS NULL OR category = ?3) "
               "ORDER BY date DESC, id DESC");
    static const std::string search_sql =
        select("WHERE instr(title, ?1) > 0 OR instr(description, ?1) > 0 "
               "OR instr(voice_text, ?1) > 0 ORDER BY date DESC, id DESC");

    return prepare("INSERT INTO expenses (amount_cents, category, title, description, voice_text, "
                   "confidence, tags, date, created_at, updated_at, verified) "
                   "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?9, 1)",
                   &insert_stmt_) &&
           prepare("UPDATE expenses SET amount_cents = ?1, category = ?2, title = ?3, "
                   "description = ?4, voice_text = ?5, confidence = ?6, tags = ?7, date = ?8, "
                   "updated_at = ?9 WHERE id = ?10",
                   &update_stmt_) &&
           prepare("DELETE FROM expenses WHERE id = ?", &delete_stmt_) &&
           prepare(find_sql.c_str(), &find_stmt_) &&
           prepare(all_sql.c_str(), &all_stmt_) &&
           prepare(range_sql.c_str(), &range_stmt_) &&
           prepare(search_sql.c_str(), &search_stmt_);
}

void ExpenseDb::close() {
    for (auto** stmt : {&insert_stmt_, &update_stmt_, &delete_stmt_, &find_stmt_, &all_stmt_,
                        &range_stmt_, &search_stmt_}) {
        if (*stmt) {
            sqlite3_finalize(*stmt);
            *stmt = nullptr;
        }
    }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool ExpenseDb::prepare(const char* sql, sqlite3_stmt** stmt) {
    if (sqlite3_prepare_v2(db_, sql, -1, stmt, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

void ExpenseDb::bind_expense(sqlite3_stmt* stmt, const ExpenseCandidate& e) {
    json tags = e.tags();
    auto tags_text = tags.dump();

    sqlite3_bind_int64(stmt, 1, e.amount_cents());
    sqlite3_bind_text(stmt, 2, std::string(category_id(e.category())).c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, e.title().c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, e.description().c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, e.original_voice_text().c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 6, e.confidence());
    sqlite3_bind_text(stmt, 7, tags_text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 8, to_unix(e.date()));
    sqlite3_bind_int64(stmt, 9, to_unix(Clock::now()));
}

std::expected<int64_t, std::string> ExpenseDb::save(const ExpenseCandidate& expense) {
    if (!insert_stmt_) return std::unexpected(std::string("database not open"));
    if (auto ok = expense.validate(); !ok) return std::unexpected(ok.error().message);

    sqlite3_reset(insert_stmt_);
    sqlite3_clear_bindings(insert_stmt_);
    bind_expense(insert_stmt_, expense);

    if (sqlite3_step(insert_stmt_) != SQLITE_DONE) {
        std::println(stderr, "db: insert failed: {}", sqlite3_errmsg(db_));
        return std::unexpected(last_error());
    }
    return sqlite3_last_insert_rowid(db_);
}

std::expected<void, std::string> ExpenseDb::update(int64_t id, const ExpenseCandidate& expense) {
    if (!update_stmt_) return std::unexpected(std::string("database not open"));
    if (auto ok = expense.validate(); !ok) return std::unexpected(ok.error().message);

    sqlite3_reset(update_stmt_);
    sqlite3_clear_bindings(update_stmt_);
    bind_expense(update_stmt_, expense);
    sqlite3_bind_int64(update_stmt_, 10, id);

    if (sqlite3_step(update_stmt_) != SQLITE_DONE) {
        std::println(stderr, "db: update failed: {}", sqlite3_errmsg(db_));
        return std::unexpected(last_error());
    }
    if (sqlite3_changes(db_) == 0) {
        return std::unexpected(std::format("no expense with id {}", id));
    }
    return {};
}

std::expected<void, std::string> ExpenseDb::remove(int64_t id) {
    if (!delete_stmt_) return std::unexpected(std::string("database not open"));

    sqlite3_reset(delete_stmt_);
    sqlite3_bind_int64(delete_stmt_, 1, id);

    if (sqlite3_step(delete_stmt_) != SQLITE_DONE) {
        std::println(stderr, "db: delete failed: {}", sqlite3_errmsg(db_));
        return std::unexpected(last_error());
    }
    if (sqlite3_changes(db_) == 0) {
        return std::unexpected(std::format("no expense with id {}", id));
    }
    return {};
}

std::expected<std::optional<ExpenseRecord>, std::string> ExpenseDb::find(int64_t id) {
    if (!find_stmt_) return std::unexpected(std::string("database not open"));

    sqlite3_reset(find_stmt_);
    sqlite3_bind_int64(find_stmt_, 1, id);
    auto rows = collect(find_stmt_);
    if (!rows) return std::unexpected(rows.error());
    if (rows->empty()) return std::optional<ExpenseRecord>{};
    return std::optional<ExpenseRecord>{std::move(rows->front())};
}

std::expected<std::vector<ExpenseRecord>, std::string> ExpenseDb::fetch_all(int limit) {
    if (!all_stmt_) return std::unexpected(std::string("database not open"));

    sqlite3_reset(all_stmt_);
    sqlite3_bind_int(all_stmt_, 1, limit);
    return collect(all_stmt_);
}

std::expected<std::vector<ExpenseRecord>, std::string>
ExpenseDb::fetch_range(Clock::time_point from, Clock::time_point to,
                       std::optional<ExpenseCategory> category) {
    if (!range_stmt_) return std::unexpected(std::string("database not open"));

    sqlite3_reset(range_stmt_);
    sqlite3_clear_bindings(range_stmt_);
    sqlite3_bind_int64(range_stmt_, 1, to_unix(from));
    sqlite3_bind_int64(range_stmt_, 2, to_unix(to));
    if (category) {
        sqlite3_bind_text(range_stmt_, 3, std::string(category_id(*category)).c_str(), -1,
                          SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(range_stmt_, 3);
    }
    return collect(range_stmt_);
}

std::expected<std::vector<ExpenseRecord>, std::string> ExpenseDb::search(const std::string& query) {
    if (!search_stmt_) return std::unexpected(std::string("database not open"));

    sqlite3_reset(search_stmt_);
    sqlite3_bind_text(search_stmt_, 1, query.c_str(), -1, SQLITE_TRANSIENT);
    return collect(search_stmt_);
}

std::expected<std::vector<ExpenseRecord>, std::string> ExpenseDb::collect(sqlite3_stmt* stmt) {
    std::vector<ExpenseRecord> records;

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        ExpenseCandidate::Fields f;
        f.amount = Decimal::from_cents(sqlite3_column_int64(stmt, 1));
        f.category = category_from_id(column_text(stmt, 2)).value_or(ExpenseCategory::Other);
        f.title = column_text(stmt, 3);
        f.description = column_text(stmt, 4);
        f.original_voice_text = column_text(stmt, 5);
        f.confidence = sqlite3_column_double(stmt, 6);
        f.tags = tags_from_text(column_text(stmt, 7));
        f.date = from_unix(sqlite3_column_int64(stmt, 8));

        records.push_back(ExpenseRecord{
            .id = sqlite3_column_int64(stmt, 0),
            .expense = ExpenseCandidate::restore(std::move(f)),
            .created_at = from_unix(sqlite3_column_int64(stmt, 9)),
            .updated_at = from_unix(sqlite3_column_int64(stmt, 10)),
            .verified = sqlite3_column_int(stmt, 11) != 0,
        });
    }

    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: query failed: {}", sqlite3_errmsg(db_));
        return std::unexpected(last_error());
    }
    return records;
}

std::string ExpenseDb::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "database not open";
}

bool ExpenseDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS expenses (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            amount_cents INTEGER NOT NULL,
            category TEXT NOT NULL,
            title TEXT NOT NULL,
            description TEXT NOT NULL DEFAULT '',
            voice_text TEXT NOT NULL DEFAULT '',
            confidence REAL NOT NULL,
            tags TEXT NOT NULL DEFAULT '[]',
            date INTEGER NOT NULL,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            verified INTEGER NOT NULL DEFAULT 1
        );
        CREATE INDEX IF NOT EXISTS idx_expenses_date ON expenses(date);
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
