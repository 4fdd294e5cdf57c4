#include "switchboard/store/database.hpp"

#include <memory>
#include <sqlite3.h>

#include "switchboard/errors.hpp"
#include "switchboard/logging.hpp"

namespace switchboard::store {

Statement::Statement(Database& db, const std::string& sql) : db_(db) {
    if (sqlite3_prepare_v2(db_.handle(), sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
        throw StoreError("prepare failed: " + db_.last_error() + " [" + sql + "]");
    }
}

Statement::~Statement() {
    if (stmt_ != nullptr) {
        sqlite3_finalize(stmt_);
    }
}

Statement& Statement::bind(int index, const std::string& value) {
    sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
    return *this;
}

Statement& Statement::bind(int index, const char* value) {
    sqlite3_bind_text(stmt_, index, value, -1, SQLITE_TRANSIENT);
    return *this;
}

Statement& Statement::bind(int index, std::int64_t value) {
    sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
    return *this;
}

Statement& Statement::bind(int index, int value) {
    sqlite3_bind_int(stmt_, index, value);
    return *this;
}

Statement& Statement::bind(int index, bool value) {
    sqlite3_bind_int(stmt_, index, value ? 1 : 0);
    return *this;
}

Statement& Statement::bind_null(int index) {
    sqlite3_bind_null(stmt_, index);
    return *this;
}

bool Statement::step() {
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw StoreError("step failed: " + db_.last_error());
}

void Statement::run() {
    while (step()) {
    }
}

std::int64_t Statement::column_int64(int index) const {
    return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, index));
}

int Statement::column_int(int index) const {
    return sqlite3_column_int(stmt_, index);
}

std::string Statement::column_text(int index) const {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, index));
    return text == nullptr ? std::string() : std::string(text);
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
}

std::optional<std::string> Statement::column_optional_text(int index) const {
    if (column_is_null(index)) {
        return std::nullopt;
    }
    return column_text(index);
}

std::optional<std::int64_t> Statement::column_optional_int64(int index) const {
    if (column_is_null(index)) {
        return std::nullopt;
    }
    return column_int64(index);
}

std::optional<int> Statement::column_optional_int(int index) const {
    if (column_is_null(index)) {
        return std::nullopt;
    }
    return column_int(index);
}

Database::Database(const std::filesystem::path& path) {
    const auto location = path.string();
    if (location != ":memory:" && !path.parent_path().empty()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    if (sqlite3_open(location.c_str(), &db_) != SQLITE_OK) {
        const std::string message = db_ == nullptr ? "out of memory" : sqlite3_errmsg(db_);
        if (db_ != nullptr) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw StoreError("cannot open database " + location + ": " + message);
    }
    sqlite3_busy_timeout(db_, 5000);
    exec("PRAGMA foreign_keys = ON;");
    if (location != ":memory:") {
        exec("PRAGMA journal_mode = WAL;");
    }
    logging::debug("Database opened", {kv("path", location)});
}

Database::~Database() {
    if (db_ != nullptr) {
        sqlite3_close(db_);
    }
}

std::shared_ptr<Database> Database::open_in_memory() {
    return std::make_shared<Database>(":memory:");
}

void Database::exec(const std::string& sql) {
    char* err = nullptr;
    const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        const std::string message = err == nullptr ? "sqlite error" : err;
        if (err != nullptr) {
            sqlite3_free(err);
        }
        throw StoreError(message);
    }
}

std::int64_t Database::last_insert_id() const {
    return static_cast<std::int64_t>(sqlite3_last_insert_rowid(db_));
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

std::string Database::last_error() const {
    return db_ == nullptr ? "database closed" : sqlite3_errmsg(db_);
}

Transaction::Transaction(Database& db) : db_(db) {
    db_.exec("BEGIN IMMEDIATE;");
}

Transaction::~Transaction() {
    if (done_) {
        return;
    }
    char* err = nullptr;
    if (sqlite3_exec(db_.handle(), "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
        logging::error("Rollback failed", {kv("error", err == nullptr ? "sqlite error" : err)});
    }
    if (err != nullptr) {
        sqlite3_free(err);
    }
}

void Transaction::commit() {
    db_.exec("COMMIT;");
    done_ = true;
}

}
