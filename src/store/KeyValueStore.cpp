#include "store/KeyValueStore.hpp"
#include "util/Logger.hpp"
#include <sqlite3.h>
#include <system_error>

namespace photodb::store {

namespace {

// Resets and clears bindings when a statement goes out of scope
struct StatementReset {
    sqlite3_stmt* st;
    ~StatementReset() {
        sqlite3_reset(st);
        sqlite3_clear_bindings(st);
    }
};

bool bind_blob(sqlite3_stmt* st, int index, const Bytes& bytes) {
    return sqlite3_bind_blob(st, index, bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT) == SQLITE_OK;
}

}  // namespace

KeyValueStore::KeyValueStore(const std::filesystem::path& db_path)
    : db_path_(db_path) {
    std::error_code ec;
    if (db_path_.has_parent_path()) {
        std::filesystem::create_directories(db_path_.parent_path(), ec);
        if (ec) {
            throw StoreError("cannot create directory for " + db_path_.string() + ": " + ec.message());
        }
    }

    if (sqlite3_open_v2(db_path_.c_str(), &db_,
                        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                        nullptr) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "out of memory";
        close_locked();
        throw StoreError("failed to open " + db_path_.string() + ": " + err);
    }

    try {
        // Exclusive locking before WAL: no shared-memory index, single process owner
        exec_or_throw("PRAGMA locking_mode=EXCLUSIVE;");
        exec_or_throw("PRAGMA journal_mode=WAL;");
        exec_or_throw("PRAGMA synchronous=FULL;");
        exec_or_throw(
            "CREATE TABLE IF NOT EXISTS kv ("
            "  key   BLOB PRIMARY KEY,"
            "  value BLOB NOT NULL"
            ") WITHOUT ROWID;");
        // Take the exclusive lock now so a second process fails here, not mid-run
        exec_or_throw("BEGIN EXCLUSIVE; COMMIT;");

        get_stmt_ = prepare_or_throw("SELECT value FROM kv WHERE key = ?1;");
        insert_stmt_ = prepare_or_throw("INSERT OR IGNORE INTO kv (key, value) VALUES (?1, ?2);");
        upsert_stmt_ = prepare_or_throw("INSERT OR REPLACE INTO kv (key, value) VALUES (?1, ?2);");
        delete_stmt_ = prepare_or_throw("DELETE FROM kv WHERE key = ?1;");
        count_stmt_ = prepare_or_throw("SELECT COUNT(*) FROM kv;");
    } catch (const StoreError&) {
        close_locked();
        throw;
    }

    util::Logger::info("KeyValueStore: Opened " + db_path_.string());
}

KeyValueStore::~KeyValueStore() {
    close();
}

void KeyValueStore::exec_or_throw(const char* sql) {
    char* errmsg = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg) != SQLITE_OK) {
        std::string err = errmsg ? errmsg : last_error();
        sqlite3_free(errmsg);
        throw StoreError("store " + db_path_.string() + ": '" + sql + "' failed: " + err);
    }
}

sqlite3_stmt* KeyValueStore::prepare_or_throw(const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &st, nullptr) != SQLITE_OK) {
        throw StoreError("store " + db_path_.string() + ": prepare failed: " + last_error());
    }
    return st;
}

std::string KeyValueStore::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "store closed";
}

std::optional<Bytes> KeyValueStore::get(const Bytes& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        util::Logger::error("KeyValueStore: get on closed store " + db_path_.string());
        return std::nullopt;
    }

    StatementReset reset{get_stmt_};
    if (!bind_blob(get_stmt_, 1, key)) {
        util::Logger::error("KeyValueStore: get bind failed: " + last_error());
        return std::nullopt;
    }

    int rc = sqlite3_step(get_stmt_);
    if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        util::Logger::error("KeyValueStore: get failed in " + db_path_.string() + ": " + last_error());
        return std::nullopt;
    }

    const void* blob = sqlite3_column_blob(get_stmt_, 0);
    int len = sqlite3_column_bytes(get_stmt_, 0);
    if (!blob || len <= 0) {
        return Bytes{};
    }
    return Bytes(static_cast<const char*>(blob), static_cast<size_t>(len));
}

bool KeyValueStore::put(const Bytes& key, const Bytes& value, bool overwrite) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        util::Logger::error("KeyValueStore: put on closed store " + db_path_.string());
        return false;
    }

    sqlite3_stmt* st = overwrite ? upsert_stmt_ : insert_stmt_;
    StatementReset reset{st};
    if (!bind_blob(st, 1, key) || !bind_blob(st, 2, value)) {
        util::Logger::error("KeyValueStore: put bind failed: " + last_error());
        return false;
    }

    if (sqlite3_step(st) != SQLITE_DONE) {
        util::Logger::error("KeyValueStore: put failed in " + db_path_.string() + ": " + last_error());
        return false;
    }

    // INSERT OR IGNORE reports zero changes when the key already existed
    return sqlite3_changes(db_) > 0;
}

bool KeyValueStore::remove(const Bytes& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        util::Logger::error("KeyValueStore: delete on closed store " + db_path_.string());
        return false;
    }

    StatementReset reset{delete_stmt_};
    if (!bind_blob(delete_stmt_, 1, key)) {
        util::Logger::error("KeyValueStore: delete bind failed: " + last_error());
        return false;
    }

    if (sqlite3_step(delete_stmt_) != SQLITE_DONE) {
        util::Logger::error("KeyValueStore: delete failed in " + db_path_.string() + ": " + last_error());
        return false;
    }
    return true;
}

size_t KeyValueStore::size() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return 0;

    StatementReset reset{count_stmt_};
    if (sqlite3_step(count_stmt_) != SQLITE_ROW) {
        util::Logger::error("KeyValueStore: count failed in " + db_path_.string() + ": " + last_error());
        return 0;
    }
    return static_cast<size_t>(sqlite3_column_int64(count_stmt_, 0));
}

void KeyValueStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    close_locked();
}

bool KeyValueStore::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

void KeyValueStore::close_locked() {
    for (sqlite3_stmt** st : {&get_stmt_, &insert_stmt_, &upsert_stmt_, &delete_stmt_, &count_stmt_}) {
        if (*st) {
            sqlite3_finalize(*st);
            *st = nullptr;
        }
    }
    if (db_) {
        if (sqlite3_close(db_) != SQLITE_OK) {
            util::Logger::error("KeyValueStore: close failed for " + db_path_.string() + ": " + sqlite3_errmsg(db_));
        } else {
            util::Logger::debug("KeyValueStore: Closed " + db_path_.string());
        }
        db_ = nullptr;
    }
}

}  // namespace photodb::store
