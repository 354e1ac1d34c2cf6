#include "storage/database.hpp"

#include "log/logging.hpp"
#include <QFileInfo>

namespace larder::storage {

Error sqlite_error(int rc, std::string message) {
    switch (rc & 0xFF) {
        case SQLITE_FULL:
            return Error::of(ErrorKind::StorageQuotaExceeded, std::move(message), rc);
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Error::of(ErrorKind::Corrupted, std::move(message), rc);
        default:
            return Error::of(ErrorKind::Storage, std::move(message), rc);
    }
}

// ============================================================================
// Statement
// ============================================================================

namespace {

Status bind_status(int rc, const char* what) {
    if (rc != SQLITE_OK) {
        return Status::err(sqlite_error(rc, std::string("Failed to bind ") + what));
    }
    return Status::ok();
}

} // namespace

Status Statement::bind_text(int index, std::string_view text) {
    return bind_status(sqlite3_bind_text(stmt_.get(), index, text.data(),
                                         static_cast<int>(text.size()), SQLITE_TRANSIENT),
                       "text");
}

Status Statement::bind_int(int index, int value) {
    return bind_status(sqlite3_bind_int(stmt_.get(), index, value), "int");
}

Status Statement::bind_int64(int index, int64_t value) {
    return bind_status(sqlite3_bind_int64(stmt_.get(), index, value), "int64");
}

Status Statement::bind_double(int index, double value) {
    return bind_status(sqlite3_bind_double(stmt_.get(), index, value), "double");
}

Status Statement::bind_null(int index) {
    return bind_status(sqlite3_bind_null(stmt_.get(), index), "null");
}

Status Statement::bind_optional_text(int index, const std::optional<std::string>& text) {
    return text ? bind_text(index, *text) : bind_null(index);
}

std::string Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) return "";
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_.get(), index)));
}

std::optional<std::string> Statement::column_optional_text(int index) const {
    if (column_is_null(index)) return std::nullopt;
    return column_text(index);
}

int Statement::column_int(int index) const {
    return sqlite3_column_int(stmt_.get(), index);
}

int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_.get(), index);
}

double Statement::column_double(int index) const {
    return sqlite3_column_double(stmt_.get(), index);
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL;
}

Result<bool, Error> Statement::step() {
    const int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return Result<bool, Error>::ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Result<bool, Error>::ok(false);
    }
    sqlite3* db = sqlite3_db_handle(stmt_.get());
    return Result<bool, Error>::err(sqlite_error(rc, db ? sqlite3_errmsg(db) : "Step failed"));
}

Status Statement::run() {
    auto stepped = step();
    if (stepped.is_err()) {
        return Status::err(stepped.unwrap_err());
    }
    return Status::ok();
}

Status Statement::reset() {
    const int rc = sqlite3_reset(stmt_.get());
    if (rc != SQLITE_OK) {
        return Status::err(sqlite_error(rc, "Reset failed"));
    }
    return Status::ok();
}

// ============================================================================
// Database
// ============================================================================

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept
    : db_(other.db_), path_(std::move(other.path_)), depth_(other.depth_) {
    other.db_ = nullptr;
    other.depth_ = 0;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        path_ = std::move(other.path_);
        depth_ = other.depth_;
        other.db_ = nullptr;
        other.depth_ = 0;
    }
    return *this;
}

Result<Database, Error> Database::open(const std::string& path) {
    sqlite3* raw = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
    const int rc = sqlite3_open_v2(path.c_str(), &raw, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = raw ? sqlite3_errmsg(raw) : "Unknown error";
        if (raw) sqlite3_close(raw);
        return Result<Database, Error>::err(sqlite_error(rc, message));
    }

    Database db(raw, path);
    sqlite3_busy_timeout(raw, 5000);

    auto pragmas = db.execute(
        "PRAGMA foreign_keys = ON;"
        "PRAGMA synchronous = FULL;");
    if (pragmas.is_err()) {
        return Result<Database, Error>::err(pragmas.unwrap_err());
    }
    if (!db.is_memory()) {
        auto wal = db.execute("PRAGMA journal_mode = WAL;");
        if (wal.is_err()) {
            return Result<Database, Error>::err(wal.unwrap_err());
        }
    }

    qCDebug(larderStorageLog) << "opened database" << QString::fromStdString(path);
    return Result<Database, Error>::ok(std::move(db));
}

Result<Database, Error> Database::open_memory() {
    return open(":memory:");
}

void Database::close() {
    if (db_) {
        const int rc = sqlite3_close_v2(db_);
        if (rc != SQLITE_OK) {
            qCWarning(larderStorageLog) << "sqlite3_close failed:" << rc;
        }
        db_ = nullptr;
        depth_ = 0;
    }
}

Result<Statement, Error> Database::prepare(std::string_view sql) {
    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Statement, Error>::err(sqlite_error(rc, last_error()));
    }
    return Result<Statement, Error>::ok(Statement(stmt));
}

Status Database::execute(const std::string& sql) {
    char* error_msg = nullptr;
    const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string message = error_msg ? error_msg : "Unknown error";
        sqlite3_free(error_msg);
        return Status::err(sqlite_error(rc, message));
    }
    return Status::ok();
}

Result<int64_t, Error> Database::scalar(std::string_view sql) {
    auto prepared = prepare(sql);
    if (prepared.is_err()) {
        return forward_err<int64_t>(prepared);
    }
    auto stmt = std::move(prepared).unwrap();
    auto stepped = stmt.step();
    if (stepped.is_err()) {
        return forward_err<int64_t>(stepped);
    }
    return Result<int64_t, Error>::ok(stepped.unwrap() ? stmt.column_int64(0) : 0);
}

Status Database::begin() {
    auto begun = depth_ == 0
        ? execute("BEGIN IMMEDIATE;")
        : execute("SAVEPOINT sp_" + std::to_string(depth_) + ";");
    if (begun.is_ok()) {
        ++depth_;
    }
    return begun;
}

Status Database::commit() {
    if (depth_ == 0) {
        return Status::err(Error{"No active transaction"});
    }
    const int level = depth_ - 1;
    auto committed = level == 0
        ? execute("COMMIT;")
        : execute("RELEASE SAVEPOINT sp_" + std::to_string(level) + ";");
    if (committed.is_ok()) {
        --depth_;
    } else if (level == 0) {
        // A failed COMMIT may leave the transaction open; never leak it.
        if (!sqlite3_get_autocommit(db_)) {
            auto rolled_back = execute("ROLLBACK;");
            if (rolled_back.is_err()) {
                qCWarning(larderStorageLog) << "rollback after failed commit failed:"
                                            << QString::fromStdString(rolled_back.unwrap_err().message);
            }
        }
        depth_ = 0;
    }
    return committed;
}

Status Database::rollback() {
    if (depth_ == 0) {
        return Status::err(Error{"No active transaction"});
    }
    const int level = depth_ - 1;
    --depth_;
    if (level == 0) {
        return execute("ROLLBACK;");
    }
    const auto name = "sp_" + std::to_string(level);
    return execute("ROLLBACK TO SAVEPOINT " + name + "; RELEASE SAVEPOINT " + name + ";");
}

Result<PageStats, Error> Database::page_stats() {
    PageStats stats;
    auto count = scalar("PRAGMA page_count;");
    if (count.is_err()) return forward_err<PageStats>(count);
    auto size = scalar("PRAGMA page_size;");
    if (size.is_err()) return forward_err<PageStats>(size);
    auto freelist = scalar("PRAGMA freelist_count;");
    if (freelist.is_err()) return forward_err<PageStats>(freelist);

    stats.page_count = count.unwrap();
    stats.page_size = size.unwrap();
    stats.freelist_count = freelist.unwrap();
    return Result<PageStats, Error>::ok(stats);
}

int64_t Database::wal_bytes() const {
    if (is_memory()) return 0;
    const QFileInfo wal(QString::fromStdString(path_ + "-wal"));
    return wal.exists() ? wal.size() : 0;
}

int64_t Database::last_insert_rowid() const {
    return sqlite3_last_insert_rowid(db_);
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

// ============================================================================
// TransactionGuard
// ============================================================================

TransactionGuard::TransactionGuard(Database& db)
    : db_(db), begun_(db.begin()), active_(begun_.is_ok()) {}

TransactionGuard::~TransactionGuard() {
    if (active_) {
        auto rolled_back = db_.rollback();
        if (rolled_back.is_err()) {
            qCWarning(larderStorageLog) << "rollback failed:"
                                        << QString::fromStdString(rolled_back.unwrap_err().message);
        }
    }
}

Status TransactionGuard::commit() {
    if (!active_) {
        return begun_.is_err() ? begun_ : Status::err(Error{"No active transaction"});
    }
    auto committed = db_.commit();
    if (committed.is_ok()) {
        active_ = false;
    }
    return committed;
}

} // namespace larder::storage
