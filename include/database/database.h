#pragma once

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <stdexcept>
#include <cstdint>

struct sqlite3;
struct sqlite3_stmt;

namespace cryptotrade {
namespace database {

class DatabaseError : public std::runtime_error {
public:
    DatabaseError(int code, const std::string& message);
    int code() const noexcept { return code_; }
    int primaryCode() const noexcept { return code_ & 0xff; }
    // Busy, locked, I/O and similar conditions that leave nothing committed.
    bool transient() const noexcept;
    bool constraint() const noexcept;
    
private:
    int code_;
};

class Statement {
public:
    Statement();
    Statement(sqlite3* db, sqlite3_stmt* stmt);
    ~Statement();
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    
    bool valid() const { return stmt_ != nullptr; }
    
    Statement& bind(int index, int64_t value);
    Statement& bind(int index, int value);
    Statement& bind(int index, uint64_t value);
    Statement& bind(int index, double value);
    Statement& bind(int index, const std::string& value);
    Statement& bindNull(int index);
    
    // True while a row is available, false once the statement is done.
    bool step();
    // Runs to completion and returns sqlite3_changes().
    int execute();
    void reset();
    
    int64_t columnInt64(int index) const;
    double columnDouble(int index) const;
    std::string columnText(int index) const;
    bool columnIsNull(int index) const;
    
private:
    void check(int rc, const char* what) const;
    
    sqlite3* db_;
    sqlite3_stmt* stmt_;
};

enum class TransactionMode {
    DEFERRED,
    IMMEDIATE
};

class Database {
public:
    Database();
    ~Database();
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    
    bool open(const std::string& path, uint32_t busyTimeoutMs = 5000);
    void close();
    bool isOpen() const;
    std::string getPath() const;
    int lastErrorCode() const;
    std::string lastError() const;
    
    void exec(const std::string& sql);
    Statement prepare(const std::string& sql);
    
    int64_t lastInsertId() const;
    int changes() const;
    
    void beginTransaction(TransactionMode mode = TransactionMode::IMMEDIATE);
    void commitTransaction();
    bool rollbackTransaction();
    bool inTransaction() const;
    
    uint64_t size() const;
    bool backup(const std::string& destPath);
    
private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Rolls back on scope exit unless commit() ran.
class TransactionGuard {
public:
    TransactionGuard(Database& db, TransactionMode mode);
    ~TransactionGuard();
    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;
    
    void commit();
    
private:
    Database& db_;
    bool done_;
};

// Hands out one connection per caller; SQLite's own locking serializes writers.
class ConnectionPool {
public:
    class Lease {
    public:
        Lease(ConnectionPool* pool, std::unique_ptr<Database> db);
        ~Lease();
        Lease(Lease&& other) noexcept;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease& operator=(Lease&&) = delete;
        
        Database& operator*() { return *db_; }
        Database* operator->() { return db_.get(); }
        
    private:
        ConnectionPool* pool_;
        std::unique_ptr<Database> db_;
    };
    
    ConnectionPool(std::string path, uint32_t maxConnections, uint32_t busyTimeoutMs);
    ~ConnectionPool();
    
    Lease acquire();
    void close();
    const std::string& path() const { return path_; }
    size_t openConnections() const;
    
private:
    void release(std::unique_ptr<Database> db);
    
    std::string path_;
    uint32_t maxConnections_;
    uint32_t busyTimeoutMs_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::vector<std::unique_ptr<Database>> idle_;
    size_t created_;
    bool closed_;
};

}
}
