#include "database/database.h"
#include <sqlite3.h>
#include <utility>

namespace cryptotrade {
namespace database {

DatabaseError::DatabaseError(int code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

bool DatabaseError::transient() const noexcept {
    switch (primaryCode()) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
        case SQLITE_IOERR:
        case SQLITE_CANTOPEN:
        case SQLITE_FULL:
        case SQLITE_PROTOCOL:
            return true;
        default:
            return false;
    }
}

bool DatabaseError::constraint() const noexcept {
    return primaryCode() == SQLITE_CONSTRAINT;
}

Statement::Statement() : db_(nullptr), stmt_(nullptr) {}

Statement::Statement(sqlite3* db, sqlite3_stmt* stmt) : db_(db), stmt_(stmt) {}

Statement::~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

Statement::Statement(Statement&& other) noexcept : db_(other.db_), stmt_(other.stmt_) {
    other.db_ = nullptr;
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) sqlite3_finalize(stmt_);
        db_ = other.db_;
        stmt_ = other.stmt_;
        other.db_ = nullptr;
        other.stmt_ = nullptr;
    }
    return *this;
}

void Statement::check(int rc, const char* what) const {
    if (rc == SQLITE_OK) return;
    std::string msg = std::string(what) + ": " + (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
    throw DatabaseError(rc, msg);
}

Statement& Statement::bind(int index, int64_t value) {
    check(sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)), "bind");
    return *this;
}

Statement& Statement::bind(int index, int value) {
    return bind(index, static_cast<int64_t>(value));
}

Statement& Statement::bind(int index, uint64_t value) {
    return bind(index, static_cast<int64_t>(value));
}

Statement& Statement::bind(int index, double value) {
    check(sqlite3_bind_double(stmt_, index, value), "bind");
    return *this;
}

Statement& Statement::bind(int index, const std::string& value) {
    check(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT), "bind");
    return *this;
}

Statement& Statement::bindNull(int index) {
    check(sqlite3_bind_null(stmt_, index), "bind");
    return *this;
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    check(rc, "step");
    return false;
}

int Statement::execute() {
    while (step()) {}
    int n = sqlite3_changes(db_);
    sqlite3_reset(stmt_);
    return n;
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

int64_t Statement::columnInt64(int index) const {
    return static_cast<int64_t>(sqlite3_column_int64(stmt_, index));
}

double Statement::columnDouble(int index) const {
    return sqlite3_column_double(stmt_, index);
}

std::string Statement::columnText(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_, index);
    if (!text) return {};
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, index)));
}

bool Statement::columnIsNull(int index) const {
    return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
}

struct Database::Impl {
    sqlite3* db = nullptr;
    std::string path;
    bool isOpen = false;
    int lastCode = SQLITE_OK;
    std::string lastError;
    
    void fail(int rc, const std::string& what) {
        lastCode = rc;
        lastError = what + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
        throw DatabaseError(rc, lastError);
    }
};

Database::Database() : impl_(std::make_unique<Impl>()) {}

Database::~Database() { close(); }

bool Database::open(const std::string& path, uint32_t busyTimeoutMs) {
    if (impl_->isOpen) return false;
    
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(path.c_str(), &impl_->db, flags, nullptr);
    if (rc != SQLITE_OK) {
        impl_->lastCode = rc;
        impl_->lastError = impl_->db ? sqlite3_errmsg(impl_->db) : sqlite3_errstr(rc);
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        return false;
    }
    
    sqlite3_extended_result_codes(impl_->db, 1);
    sqlite3_busy_timeout(impl_->db, static_cast<int>(busyTimeoutMs));
    
    const char* pragmas[] = {
        "PRAGMA journal_mode=WAL;",
        "PRAGMA synchronous=NORMAL;",
        "PRAGMA foreign_keys=ON;"
    };
    for (const char* pragma : pragmas) {
        char* errMsg = nullptr;
        rc = sqlite3_exec(impl_->db, pragma, nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            impl_->lastCode = rc;
            impl_->lastError = errMsg ? errMsg : sqlite3_errstr(rc);
            sqlite3_free(errMsg);
            sqlite3_close(impl_->db);
            impl_->db = nullptr;
            return false;
        }
    }
    
    impl_->path = path;
    impl_->isOpen = true;
    return true;
}

void Database::close() {
    if (impl_->db) {
        sqlite3_close_v2(impl_->db);
        impl_->db = nullptr;
    }
    impl_->isOpen = false;
}

bool Database::isOpen() const {
    return impl_->isOpen;
}

std::string Database::getPath() const {
    return impl_->path;
}

int Database::lastErrorCode() const {
    return impl_->lastCode;
}

std::string Database::lastError() const {
    return impl_->lastError;
}

void Database::exec(const std::string& sql) {
    if (!impl_->db) throw DatabaseError(SQLITE_MISUSE, "database not open");
    char* errMsg = nullptr;
    int rc = sqlite3_exec(impl_->db, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        impl_->lastCode = rc;
        impl_->lastError = errMsg ? errMsg : sqlite3_errstr(rc);
        sqlite3_free(errMsg);
        throw DatabaseError(rc, impl_->lastError);
    }
}

Statement Database::prepare(const std::string& sql) {
    if (!impl_->db) throw DatabaseError(SQLITE_MISUSE, "database not open");
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(impl_->db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(stmt);
        impl_->fail(rc, "prepare");
    }
    return Statement(impl_->db, stmt);
}

int64_t Database::lastInsertId() const {
    return impl_->db ? static_cast<int64_t>(sqlite3_last_insert_rowid(impl_->db)) : 0;
}

int Database::changes() const {
    return impl_->db ? sqlite3_changes(impl_->db) : 0;
}

void Database::beginTransaction(TransactionMode mode) {
    exec(mode == TransactionMode::IMMEDIATE ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
}

void Database::commitTransaction() {
    exec("COMMIT;");
}

bool Database::rollbackTransaction() {
    if (!impl_->db) return false;
    if (sqlite3_get_autocommit(impl_->db)) return true;
    return sqlite3_exec(impl_->db, "ROLLBACK;", nullptr, nullptr, nullptr) == SQLITE_OK;
}

bool Database::inTransaction() const {
    return impl_->db && !sqlite3_get_autocommit(impl_->db);
}

uint64_t Database::size() const {
    if (!impl_->db) return 0;
    
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(impl_->db, "SELECT page_count * page_size FROM pragma_page_count(), pragma_page_size();", 
                           -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    
    uint64_t sz = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        sz = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return sz;
}

bool Database::backup(const std::string& destPath) {
    if (!impl_->db) return false;
    
    sqlite3* destDb;
    if (sqlite3_open(destPath.c_str(), &destDb) != SQLITE_OK) {
        sqlite3_close(destDb);
        return false;
    }
    
    sqlite3_backup* bkp = sqlite3_backup_init(destDb, "main", impl_->db, "main");
    if (!bkp) {
        sqlite3_close(destDb);
        return false;
    }
    
    sqlite3_backup_step(bkp, -1);
    sqlite3_backup_finish(bkp);
    
    int rc = sqlite3_errcode(destDb);
    sqlite3_close(destDb);
    
    return rc == SQLITE_OK;
}

TransactionGuard::TransactionGuard(Database& db, TransactionMode mode) : db_(db), done_(false) {
    db_.beginTransaction(mode);
}

TransactionGuard::~TransactionGuard() {
    if (!done_) db_.rollbackTransaction();
}

void TransactionGuard::commit() {
    db_.commitTransaction();
    done_ = true;
}

ConnectionPool::Lease::Lease(ConnectionPool* pool, std::unique_ptr<Database> db)
    : pool_(pool), db_(std::move(db)) {}

ConnectionPool::Lease::~Lease() {
    if (pool_ && db_) pool_->release(std::move(db_));
}

ConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), db_(std::move(other.db_)) {
    other.pool_ = nullptr;
}

ConnectionPool::ConnectionPool(std::string path, uint32_t maxConnections, uint32_t busyTimeoutMs)
    : path_(std::move(path)),
      maxConnections_(maxConnections == 0 ? 1 : maxConnections),
      busyTimeoutMs_(busyTimeoutMs),
      created_(0),
      closed_(false) {}

ConnectionPool::~ConnectionPool() {
    close();
}

ConnectionPool::Lease ConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait(lock, [this] { return closed_ || !idle_.empty() || created_ < maxConnections_; });
    if (closed_) {
        throw DatabaseError(SQLITE_MISUSE, "connection pool closed");
    }
    if (!idle_.empty()) {
        auto db = std::move(idle_.back());
        idle_.pop_back();
        return Lease(this, std::move(db));
    }
    created_++;
    lock.unlock();
    
    auto db = std::make_unique<Database>();
    if (!db->open(path_, busyTimeoutMs_)) {
        int code = db->lastErrorCode();
        std::string msg = "open " + path_ + ": " + db->lastError();
        lock.lock();
        created_--;
        cv_.notify_one();
        throw DatabaseError(code == SQLITE_OK ? SQLITE_CANTOPEN : code, msg);
    }
    return Lease(this, std::move(db));
}

void ConnectionPool::release(std::unique_ptr<Database> db) {
    db->rollbackTransaction();
    std::lock_guard<std::mutex> lock(mtx_);
    if (closed_) {
        created_--;
        return;
    }
    idle_.push_back(std::move(db));
    cv_.notify_one();
}

void ConnectionPool::close() {
    std::lock_guard<std::mutex> lock(mtx_);
    closed_ = true;
    created_ -= idle_.size();
    idle_.clear();
    cv_.notify_all();
}

size_t ConnectionPool::openConnections() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return created_;
}

}
}
