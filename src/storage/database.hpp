#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace larder::storage {

/**
 * Map an SQLite result code to the engine's error taxonomy.
 * SQLITE_FULL becomes StorageQuotaExceeded, corruption becomes Corrupted.
 */
[[nodiscard]] Error sqlite_error(int rc, std::string message);

/**
 * SQLite statement wrapper with RAII.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}

    [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }
    [[nodiscard]] explicit operator bool() const { return stmt_ != nullptr; }

    Status bind_text(int index, std::string_view text);
    Status bind_int(int index, int value);
    Status bind_int64(int index, int64_t value);
    Status bind_double(int index, double value);
    Status bind_null(int index);
    Status bind_optional_text(int index, const std::optional<std::string>& text);

    Status bind_value(int index, std::string_view v) { return bind_text(index, v); }
    Status bind_value(int index, const std::string& v) { return bind_text(index, v); }
    Status bind_value(int index, const char* v) { return bind_text(index, v); }
    Status bind_value(int index, int v) { return bind_int(index, v); }
    Status bind_value(int index, int64_t v) { return bind_int64(index, v); }
    Status bind_value(int index, double v) { return bind_double(index, v); }
    Status bind_value(int index, bool v) { return bind_int(index, v ? 1 : 0); }
    Status bind_value(int index, std::nullptr_t) { return bind_null(index); }
    Status bind_value(int index, const std::optional<std::string>& v) {
        return bind_optional_text(index, v);
    }

    /**
     * Bind `args` to parameters 1..N, stopping at the first failure.
     */
    template<typename... Args>
    Status bind_all(const Args&... args) {
        int index = 0;
        Status status = Status::ok();
        ((status = status.is_ok() ? bind_value(++index, args) : status), ...);
        return status;
    }

    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] std::optional<std::string> column_optional_text(int index) const;
    [[nodiscard]] int column_int(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;
    [[nodiscard]] double column_double(int index) const;
    [[nodiscard]] bool column_is_null(int index) const;

    /**
     * Advance the statement. Ok(true) while a row is available.
     */
    Result<bool, Error> step();

    /**
     * Run a statement that yields no rows.
     */
    Status run();

    Status reset();

private:
    std::shared_ptr<sqlite3_stmt> stmt_;
};

/**
 * Step `stmt` to completion, converting each row with `row_fn`, which returns
 * either T or Result<T, Error>.
 */
template<typename T, typename F>
[[nodiscard]] Result<std::vector<T>, Error> collect_rows(Statement& stmt, F&& row_fn) {
    std::vector<T> out;
    while (true) {
        auto stepped = stmt.step();
        if (stepped.is_err()) {
            return Result<std::vector<T>, Error>::err(stepped.unwrap_err());
        }
        if (!stepped.unwrap()) break;

        if constexpr (std::is_same_v<std::invoke_result_t<F, Statement&>, T>) {
            out.push_back(row_fn(stmt));
        } else {
            auto row = row_fn(stmt);
            if (row.is_err()) {
                return Result<std::vector<T>, Error>::err(row.unwrap_err());
            }
            out.push_back(std::move(row).unwrap());
        }
    }
    return Result<std::vector<T>, Error>::ok(std::move(out));
}

/**
 * PageStats - Size accounting straight from the pager.
 */
struct PageStats {
    int64_t page_count{0};
    int64_t page_size{0};
    int64_t freelist_count{0};

    [[nodiscard]] int64_t used_bytes() const { return page_count * page_size; }
    [[nodiscard]] int64_t free_bytes() const { return freelist_count * page_size; }
};

/**
 * Database - SQLite connection.
 *
 * Opened in WAL mode with synchronous=FULL so that a committed write has
 * reached the disk by the time the call returns, and with a busy timeout so
 * that a second process sharing the file waits instead of failing.
 *
 * Transactions nest: the outermost scope is BEGIN IMMEDIATE, inner scopes are
 * savepoints.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    [[nodiscard]] static Result<Database, Error> open(const std::string& path);

    /**
     * In-memory database for tests.
     */
    [[nodiscard]] static Result<Database, Error> open_memory();

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }
    [[nodiscard]] bool is_memory() const { return path_.empty() || path_ == ":memory:"; }
    [[nodiscard]] const std::string& path() const { return path_; }

    void close();

    [[nodiscard]] sqlite3* handle() const { return db_; }

    [[nodiscard]] Result<Statement, Error> prepare(std::string_view sql);

    /**
     * Execute one or more statements without results.
     */
    [[nodiscard]] Status execute(const std::string& sql);

    /**
     * Prepare, bind `args` and run a statement that yields no rows.
     */
    template<typename... Args>
    [[nodiscard]] Status run(std::string_view sql, const Args&... args) {
        auto prepared = prepare(sql);
        if (prepared.is_err()) {
            return Status::err(prepared.unwrap_err());
        }
        auto stmt = std::move(prepared).unwrap();
        auto bound = stmt.bind_all(args...);
        if (bound.is_err()) {
            return bound;
        }
        return stmt.run();
    }

    /**
     * Run a single-value query such as `SELECT COUNT(*) ...`.
     */
    [[nodiscard]] Result<int64_t, Error> scalar(std::string_view sql);

    [[nodiscard]] Status begin();
    [[nodiscard]] Status commit();
    [[nodiscard]] Status rollback();

    [[nodiscard]] bool in_transaction() const { return depth_ > 0; }

    /**
     * Run `f` inside a transaction. Commits when it returns ok, rolls back
     * when it returns an error.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& f) -> decltype(f()) {
        using ResultType = decltype(f());

        auto begun = begin();
        if (begun.is_err()) {
            return ResultType::err(begun.unwrap_err());
        }

        auto result = f();
        if (result.is_err()) {
            auto rolled_back = rollback();
            if (rolled_back.is_err()) {
                return ResultType::err(Error{
                    result.unwrap_err().message + " (rollback failed: " +
                    rolled_back.unwrap_err().message + ")",
                    result.unwrap_err().code, result.unwrap_err().kind});
            }
            return result;
        }

        auto committed = commit();
        if (committed.is_err()) {
            return ResultType::err(committed.unwrap_err());
        }
        return result;
    }

    [[nodiscard]] Result<PageStats, Error> page_stats();

    /**
     * Size of the -wal file beside the database, 0 when absent or in memory.
     */
    [[nodiscard]] int64_t wal_bytes() const;

    [[nodiscard]] int64_t last_insert_rowid() const;
    [[nodiscard]] int changes() const;
    [[nodiscard]] std::string last_error() const;

private:
    Database(sqlite3* db, std::string path) : db_(db), path_(std::move(path)) {}

    sqlite3* db_ = nullptr;
    std::string path_;
    int depth_ = 0;
};

/**
 * Transaction RAII guard. Rolls back unless committed.
 */
class TransactionGuard {
public:
    explicit TransactionGuard(Database& db);
    ~TransactionGuard();

    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;

    [[nodiscard]] const Status& status() const { return begun_; }
    [[nodiscard]] Status commit();

private:
    Database& db_;
    Status begun_;
    bool active_ = false;
};

} // namespace larder::storage
