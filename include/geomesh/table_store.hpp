/**
 * GeoMesh Converter - Table Store
 *
 * Storage for columnar tables. Every save() hands back a fresh, immutable
 * reference; load() resolves it. Stored tables are never modified, so
 * references stay valid for the lifetime of the store.
 */

#pragma once

#include "result.hpp"
#include "table.hpp"
#include "types.hpp"
#include "compression.hpp"

#include <filesystem>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>

// Forward declare SQLite
struct sqlite3;
struct sqlite3_stmt;

namespace geomesh {

class TableStore {
public:
    virtual ~TableStore() = default;

    virtual Result<TableRef> save(const Table& table) = 0;
    virtual Result<Table> load(const TableRef& ref) const = 0;
    virtual bool contains(const TableRef& ref) const = 0;
};

/**
 * SQLite-backed table store.
 *
 * One row per save, keyed by a random 128-bit hex id. The payload checksum
 * is stored beside the blob and verified on load. All database access is
 * serialized, so independent export/import calls may share one store.
 * A path of ":memory:" keeps everything in memory.
 */
class SqliteTableStore : public TableStore {
public:
    explicit SqliteTableStore(std::filesystem::path db_path,
                              CompressionType compression = CompressionType::LZ4);
    ~SqliteTableStore() override;

    SqliteTableStore(const SqliteTableStore&) = delete;
    SqliteTableStore& operator=(const SqliteTableStore&) = delete;

    Result<void> open();
    void close();
    bool is_open() const;

    Result<TableRef> save(const Table& table) override;
    Result<Table> load(const TableRef& ref) const override;
    bool contains(const TableRef& ref) const override;

    size_t table_count() const;
    size_t total_blob_size() const;

    const std::filesystem::path& path() const { return db_path_; }
    CompressionType compression() const { return compression_; }

protected:
    // Called with the store locked. A taken id is retried with a new one.
    virtual std::string generate_ref();

private:
    struct StoredBlob {
        std::vector<uint8_t> blob;
        std::string checksum;
    };

    Result<void> create_schema();
    Result<StoredBlob> fetch_blob(const TableRef& ref) const;

    sqlite3_stmt* get_or_prepare_stmt(const std::string& name, const char* sql) const;
    void clear_stmt_cache();

    mutable std::mutex db_mutex_;
    sqlite3* db_ = nullptr;
    std::filesystem::path db_path_;
    CompressionType compression_;
    std::mt19937_64 rng_;

    // Prepared statement cache (name -> statement)
    mutable std::unordered_map<std::string, sqlite3_stmt*> stmt_cache_;
};

} // namespace geomesh
