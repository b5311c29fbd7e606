#pragma once

#include "store/Codec.hpp"
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <mutex>

struct sqlite3;
struct sqlite3_stmt;

namespace photodb::store {

// Thrown only when a store cannot be opened; everything else returns sentinels.
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * Durable byte-key/byte-value table backed by one SQLite database file.
 *
 * One exclusive handle per process. Every operation holds a store-wide lock
 * for its whole duration, so callers on different threads may share one
 * instance. Errors are logged and reported as absent/false, the same as
 * "not found".
 */
class KeyValueStore {
public:
    // Opens or creates the database. Throws StoreError on failure.
    explicit KeyValueStore(const std::filesystem::path& db_path);
    ~KeyValueStore();

    KeyValueStore(const KeyValueStore&) = delete;
    KeyValueStore& operator=(const KeyValueStore&) = delete;

    [[nodiscard]] std::optional<Bytes> get(const Bytes& key);

    // overwrite == false is a conditional insert: fails without mutation if the key exists
    [[nodiscard]] bool put(const Bytes& key, const Bytes& value, bool overwrite);

    // True if the key is gone afterwards (also when it never existed)
    bool remove(const Bytes& key);

    [[nodiscard]] size_t size();

    // Idempotent; the destructor calls it too
    void close();

    [[nodiscard]] bool is_open() const;
    [[nodiscard]] const std::filesystem::path& path() const { return db_path_; }

private:
    void exec_or_throw(const char* sql);
    sqlite3_stmt* prepare_or_throw(const char* sql);
    void close_locked();
    std::string last_error() const;

    std::filesystem::path db_path_;
    mutable std::mutex mutex_;

    sqlite3* db_ = nullptr;
    sqlite3_stmt* get_stmt_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* upsert_stmt_ = nullptr;
    sqlite3_stmt* delete_stmt_ = nullptr;
    sqlite3_stmt* count_stmt_ = nullptr;
};

}  // namespace photodb::store
