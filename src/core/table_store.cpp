/**
 * GeoMesh Converter - Table Store Implementation
 *
 * SQLite database with a single "tables" relation holding encoded blobs.
 */

#include "geomesh/table_store.hpp"
#include "geomesh/table_codec.hpp"
#include "geomesh/logging.hpp"

#include <sqlite3.h>
#include <chrono>
#include <cstdio>
#include <system_error>

namespace geomesh {

namespace {

// Resets a cached statement when leaving scope so it can be reused
struct StmtReset {
    sqlite3_stmt* stmt;
    ~StmtReset() {
        if (stmt) {
            sqlite3_reset(stmt);
            sqlite3_clear_bindings(stmt);
        }
    }
};

constexpr int kMaxRefAttempts = 8;

} // namespace

SqliteTableStore::SqliteTableStore(std::filesystem::path db_path, CompressionType compression)
    : db_path_(std::move(db_path)), compression_(compression), rng_(std::random_device{}()) {}

SqliteTableStore::~SqliteTableStore() {
    close();
}

Result<void> SqliteTableStore::open() {
    std::lock_guard<std::mutex> lock(db_mutex_);

    if (db_) return Result<void>::success();

    const std::string path = db_path_.string();
    if (path != ":memory:" && db_path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(db_path_.parent_path(), ec);
        if (ec) {
            return Error::io_error("Failed to create store directory: " + ec.message(),
                                   db_path_.parent_path().string());
        }
    }

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        Error err = Error::database_error(std::string("Failed to open database: ") + sqlite3_errmsg(db_), path);
        sqlite3_close(db_);
        db_ = nullptr;
        return err;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA temp_store=MEMORY;", nullptr, nullptr, nullptr);

    auto schema = create_schema();
    if (!schema) {
        sqlite3_close(db_);
        db_ = nullptr;
        return schema.error();
    }

    LOG_DEBUG("TableStore", "Opened " << path << " (compression=" << compression_name(compression_) << ")");
    return Result<void>::success();
}

void SqliteTableStore::close() {
    std::lock_guard<std::mutex> lock(db_mutex_);

    clear_stmt_cache();

    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SqliteTableStore::is_open() const {
    std::lock_guard<std::mutex> lock(db_mutex_);
    return db_ != nullptr;
}

Result<void> SqliteTableStore::create_schema() {
    const char* schema = R"(
        CREATE TABLE IF NOT EXISTS tables (
            ref TEXT PRIMARY KEY NOT NULL,
            checksum TEXT NOT NULL,
            row_count INTEGER NOT NULL,
            column_count INTEGER NOT NULL,
            compression INTEGER NOT NULL,
            raw_size INTEGER NOT NULL,
            blob BLOB NOT NULL,
            created_at INTEGER NOT NULL
        );
    )";

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, schema, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        Error err = Error::database_error(std::string("Failed to create schema: ") +
                                          (err_msg ? err_msg : sqlite3_errstr(rc)));
        sqlite3_free(err_msg);
        return err;
    }

    return Result<void>::success();
}

sqlite3_stmt* SqliteTableStore::get_or_prepare_stmt(const std::string& name, const char* sql) const {
    auto it = stmt_cache_.find(name);
    if (it != stmt_cache_.end()) {
        sqlite3_reset(it->second);
        return it->second;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR("TableStore", "Failed to prepare statement '" << name << "': " << sqlite3_errmsg(db_));
        return nullptr;
    }

    stmt_cache_[name] = stmt;
    return stmt;
}

void SqliteTableStore::clear_stmt_cache() {
    for (auto& [name, stmt] : stmt_cache_) {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }
    stmt_cache_.clear();
}

std::string SqliteTableStore::generate_ref() {
    char buf[33];
    std::snprintf(buf, sizeof(buf), "%016llx%016llx",
                  static_cast<unsigned long long>(rng_()),
                  static_cast<unsigned long long>(rng_()));
    return buf;
}

Result<SqliteTableStore::StoredBlob> SqliteTableStore::fetch_blob(const TableRef& ref) const {
    sqlite3_stmt* stmt = get_or_prepare_stmt("select_blob", "SELECT blob, checksum FROM tables WHERE ref = ?;");
    if (!stmt) {
        return Error::database_error(sqlite3_errmsg(db_), "select_blob");
    }
    StmtReset reset{stmt};

    sqlite3_bind_text(stmt, 1, ref.id.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) {
        return Error::table_not_found(ref.id);
    }
    if (rc != SQLITE_ROW) {
        return Error::database_error(sqlite3_errmsg(db_), ref.id);
    }

    StoredBlob stored;
    const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, 0));
    int size = sqlite3_column_bytes(stmt, 0);
    if (data) stored.blob.assign(data, data + size);
    const auto* checksum = sqlite3_column_text(stmt, 1);
    if (checksum) stored.checksum = reinterpret_cast<const char*>(checksum);
    return stored;
}

Result<TableRef> SqliteTableStore::save(const Table& table) {
    TRY_ASSIGN(encoded, encode_table(table, compression_));

    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return Error::database_error("Table store is not open", db_path_.string());
    }

    sqlite3_stmt* stmt = get_or_prepare_stmt("insert_table",
        "INSERT INTO tables (ref, checksum, row_count, column_count, compression, raw_size, blob, created_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
    if (!stmt) {
        return Error::database_error(sqlite3_errmsg(db_), "insert_table");
    }

    auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    for (int attempt = 0; attempt < kMaxRefAttempts; ++attempt) {
        TableRef ref{generate_ref()};
        StmtReset reset{stmt};

        sqlite3_bind_text(stmt, 1, ref.id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, encoded.checksum.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(table.row_count()));
        sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(table.column_count()));
        sqlite3_bind_int(stmt, 5, static_cast<int>(encoded.compression));
        sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(encoded.raw_size));
        sqlite3_bind_blob64(stmt, 7, encoded.blob.data(), encoded.blob.size(), SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 8, static_cast<sqlite3_int64>(now));

        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_DONE) {
            LOG_DEBUG("TableStore", "Saved " << ref.id << " (" << table.row_count() << " rows, "
                      << encoded.blob.size() << " bytes)");
            return ref;
        }
        if (sqlite3_extended_errcode(db_) != SQLITE_CONSTRAINT_PRIMARYKEY) {
            return Error::database_error(std::string("Failed to insert table: ") + sqlite3_errmsg(db_), ref.id);
        }
        LOG_WARNING("TableStore", "Reference " << ref.id << " already taken, retrying");
    }

    return Error::database_error("No free table reference after " + std::to_string(kMaxRefAttempts) + " attempts",
                                 db_path_.string());
}

Result<Table> SqliteTableStore::load(const TableRef& ref) const {
    StoredBlob stored;
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!db_) {
            return Error::database_error("Table store is not open", db_path_.string());
        }
        TRY_ASSIGN(fetched, fetch_blob(ref));
        stored = std::move(fetched);
    }

    auto raw = decode_blob(stored.blob);
    if (!raw) {
        return raw.error().with_context(ref.id);
    }
    if (table_checksum(*raw) != stored.checksum) {
        return Error::invalid_format("Stored table does not match its checksum", ref.id);
    }
    auto table = deserialize_table(*raw);
    if (!table) {
        return table.error().with_context(ref.id);
    }
    return table;
}

bool SqliteTableStore::contains(const TableRef& ref) const {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return false;

    sqlite3_stmt* stmt = get_or_prepare_stmt("contains", "SELECT 1 FROM tables WHERE ref = ?;");
    if (!stmt) return false;
    StmtReset reset{stmt};

    sqlite3_bind_text(stmt, 1, ref.id.c_str(), -1, SQLITE_TRANSIENT);
    return sqlite3_step(stmt) == SQLITE_ROW;
}

size_t SqliteTableStore::table_count() const {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return 0;

    sqlite3_stmt* stmt = get_or_prepare_stmt("count", "SELECT COUNT(*) FROM tables;");
    if (!stmt) return 0;
    StmtReset reset{stmt};

    if (sqlite3_step(stmt) == SQLITE_ROW) {
        return static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }
    return 0;
}

size_t SqliteTableStore::total_blob_size() const {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return 0;

    sqlite3_stmt* stmt = get_or_prepare_stmt("blob_size", "SELECT COALESCE(SUM(LENGTH(blob)), 0) FROM tables;");
    if (!stmt) return 0;
    StmtReset reset{stmt};

    if (sqlite3_step(stmt) == SQLITE_ROW) {
        return static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }
    return 0;
}

} // namespace geomesh
