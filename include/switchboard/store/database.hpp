#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace switchboard::store {

class Database;

class Statement {
public:
    Statement(Database& db, const std::string& sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int index, const std::string& value);
    Statement& bind(int index, const char* value);
    Statement& bind(int index, std::int64_t value);
    Statement& bind(int index, int value);
    Statement& bind(int index, bool value);
    Statement& bind_null(int index);

    template <typename T>
    Statement& bind(int index, const std::optional<T>& value) {
        if (value) {
            return bind(index, *value);
        }
        return bind_null(index);
    }

    // Returns true while a row is available; false once the statement is done.
    bool step();
    void run();

    std::int64_t column_int64(int index) const;
    int column_int(int index) const;
    std::string column_text(int index) const;
    bool column_is_null(int index) const;
    std::optional<std::string> column_optional_text(int index) const;
    std::optional<std::int64_t> column_optional_int64(int index) const;
    std::optional<int> column_optional_int(int index) const;

private:
    Database& db_;
    sqlite3_stmt* stmt_ = nullptr;
};

// One connection guarded by a single mutex. Callers hold lock() across a transaction.
class Database {
public:
    explicit Database(const std::filesystem::path& path);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    static std::shared_ptr<Database> open_in_memory();

    void exec(const std::string& sql);
    std::int64_t last_insert_id() const;
    int changes() const;
    std::string last_error() const;

    std::unique_lock<std::mutex> lock() { return std::unique_lock<std::mutex>(mutex_); }

    sqlite3* handle() { return db_; }

private:
    sqlite3* db_ = nullptr;
    std::mutex mutex_;
};

// BEGIN IMMEDIATE on construction; rolls back unless commit() ran.
class Transaction {
public:
    explicit Transaction(Database& db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    Database& db_;
    bool done_ = false;
};

}
