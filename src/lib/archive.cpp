#include "osm2mbtiles.h"

#include "sqlite3.h"

#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace osm2mbtiles {

namespace {

struct stmt_deleter {
    void operator()(sqlite3_stmt *stmt) const noexcept {
        if (stmt != nullptr) {
            sqlite3_finalize(stmt);
        }
    }
};

using statement_ptr = std::unique_ptr<sqlite3_stmt, stmt_deleter>;

statement_ptr prepare(sqlite3 *db, const char *sql, const std::string &what) {
    sqlite3_stmt *raw_stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw_stmt, nullptr) != SQLITE_OK) {
        throw osm2mbtiles_error("Failed to prepare " + what + ": " + sqlite3_errmsg(db));
    }
    return statement_ptr(raw_stmt);
}

// Metadata values may carry embedded NULs, so the length comes from SQLite.
std::string column_text(sqlite3_stmt *stmt, int column) {
    const unsigned char *text = sqlite3_column_text(stmt, column);
    if (text == nullptr) {
        return std::string();
    }
    return std::string(reinterpret_cast<const char *>(text), static_cast<std::size_t>(sqlite3_column_bytes(stmt, column)));
}

constexpr const char *kCreateMetadataSql = "CREATE TABLE metadata (name TEXT PRIMARY KEY, value TEXT)";
constexpr const char *kCreateTilesSql =
    "CREATE TABLE tiles (zoom_level INTEGER, tile_column INTEGER, tile_row INTEGER, tile_data BLOB, "
    "PRIMARY KEY (zoom_level, tile_column, tile_row))";

void remove_existing(const fs::path &path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        throw osm2mbtiles_error("Failed to remove existing file '" + path.string() + "': " + ec.message());
    }
}

}  // namespace

Archive::Archive() : _path(""), _db(nullptr) {

}

Archive::Archive(const std::string &path) : _path(""), _db(nullptr) {
    open(path);
}

Archive::~Archive() {
    close();
}

void Archive::close() {
    if (_insert_stmt != nullptr) {
        sqlite3_finalize(_insert_stmt);
        _insert_stmt = nullptr;
    }
    if (_db != nullptr) {
        if (_in_transaction) {
            rollback();
        }
        sqlite3_close(_db);
    }
    _db = nullptr;
    _in_transaction = false;
}

void Archive::open(const std::string &path) {
    if (path.empty()) {
        throw std::invalid_argument("Archive path must not be empty");
    }
    close();
    if (sqlite3_open(path.c_str(), &_db) != SQLITE_OK) {
        std::string message = "Unable to open archive: " + path;
        if (_db != nullptr) {
            message += ": ";
            message += sqlite3_errmsg(_db);
            sqlite3_close(_db);
            _db = nullptr;
        }
        throw osm2mbtiles_error(message);
    }
    _path = path;
}

void Archive::create(const std::string &path) {
    if (path.empty()) {
        throw std::invalid_argument("Archive path must not be empty");
    }
    close();

    // A leftover hot journal would be replayed into the new database.
    remove_existing(path);
    remove_existing(path + "-journal");

    open(path);

    for (const char *sql : {kCreateMetadataSql, kCreateTilesSql}) {
        if (sqlite3_exec(_db, sql, nullptr, nullptr, nullptr) != SQLITE_OK) {
            const std::string message = "Failed to create schema in '" + path + "': " + sqlite3_errmsg(_db);
            close();
            throw osm2mbtiles_error(message);
        }
    }
}

void Archive::require_open() const {
    if (_db == nullptr) {
        throw osm2mbtiles_error("Archive is not open");
    }
}

std::map<std::string, std::string> Archive::metadata() const {
    require_open();
    statement_ptr stmt = prepare(_db, "SELECT name, value FROM metadata", "metadata query");

    std::map<std::string, std::string> entries;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        entries[column_text(stmt.get(), 0)] = column_text(stmt.get(), 1);
    }
    if (rc != SQLITE_DONE) {
        throw osm2mbtiles_error("Failed to read metadata of '" + _path + "': " + sqlite3_errmsg(_db));
    }
    return entries;
}

void Archive::setMetadata(const std::map<std::string, std::string> &entries,
                          bool overwrite_existing) {
    require_open();
    if (entries.empty()) {
        return;
    }

    if (sqlite3_exec(_db, "BEGIN IMMEDIATE TRANSACTION", nullptr, nullptr, nullptr) != SQLITE_OK) {
        throw osm2mbtiles_error("Failed to begin transaction: " + std::string(sqlite3_errmsg(_db)));
    }

    const char *insert_sql = overwrite_existing
                                 ? "INSERT INTO metadata(name, value) VALUES(?1, ?2) ON CONFLICT(name) DO UPDATE SET value=excluded.value"
                                 : "INSERT INTO metadata(name, value) VALUES(?1, ?2)";

    statement_ptr stmt;
    try {
        stmt = prepare(_db, insert_sql, "metadata statement");
    } catch (const osm2mbtiles_error &) {
        sqlite3_exec(_db, "ROLLBACK", nullptr, nullptr, nullptr);
        throw;
    }

    for (const auto &entry : entries) {
        sqlite3_reset(stmt.get());
        sqlite3_clear_bindings(stmt.get());
        sqlite3_bind_text(stmt.get(), 1, entry.first.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 2, entry.second.c_str(), -1, SQLITE_TRANSIENT);

        const int rc = sqlite3_step(stmt.get());
        if (rc != SQLITE_DONE) {
            const std::string message = "Failed to write metadata entry '" + entry.first + "': " +
                                        std::string(sqlite3_errmsg(_db));
            stmt.reset();
            sqlite3_exec(_db, "ROLLBACK", nullptr, nullptr, nullptr);
            throw osm2mbtiles_error(message);
        }
    }

    stmt.reset();
    if (sqlite3_exec(_db, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
        const std::string message = "Failed to commit metadata changes: " + std::string(sqlite3_errmsg(_db));
        sqlite3_exec(_db, "ROLLBACK", nullptr, nullptr, nullptr);
        throw osm2mbtiles_error(message);
    }
}

void Archive::setMetadata(const std::string &key, const std::string &value,
                          bool overwrite_existing) {
    std::map<std::string, std::string> entries({{key, value}});
    setMetadata(entries, overwrite_existing);
}

void Archive::beginTransaction() {
    require_open();
    if (_in_transaction) {
        throw osm2mbtiles_error("A transaction is already active on '" + _path + "'");
    }
    if (sqlite3_exec(_db, "BEGIN IMMEDIATE TRANSACTION", nullptr, nullptr, nullptr) != SQLITE_OK) {
        throw osm2mbtiles_error("Failed to begin transaction: " + std::string(sqlite3_errmsg(_db)));
    }
    _in_transaction = true;
}

void Archive::commit() {
    require_open();
    if (!_in_transaction) {
        throw osm2mbtiles_error("No active transaction to commit on '" + _path + "'");
    }
    // The cached insert statement must not hold the write lock past COMMIT.
    if (_insert_stmt != nullptr) {
        sqlite3_reset(_insert_stmt);
    }
    if (sqlite3_exec(_db, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
        const std::string message = "Failed to commit tile data: " + std::string(sqlite3_errmsg(_db));
        rollback();
        throw osm2mbtiles_error(message);
    }
    _in_transaction = false;
}

void Archive::rollback() noexcept {
    if (_db == nullptr || !_in_transaction) {
        return;
    }
    if (_insert_stmt != nullptr) {
        sqlite3_reset(_insert_stmt);
    }
    sqlite3_exec(_db, "ROLLBACK", nullptr, nullptr, nullptr);
    _in_transaction = false;
}

InsertResult Archive::insertTile(const TileCoordinate &tile, const std::vector<std::byte> &data) {
    require_open();
    if (_insert_stmt == nullptr) {
        const char *insert_sql =
            "INSERT INTO tiles(zoom_level, tile_column, tile_row, tile_data) VALUES(?1, ?2, ?3, ?4)";
        if (sqlite3_prepare_v2(_db, insert_sql, -1, &_insert_stmt, nullptr) != SQLITE_OK) {
            _insert_stmt = nullptr;
            throw osm2mbtiles_error("Failed to prepare insert statement: " + std::string(sqlite3_errmsg(_db)));
        }
    }

    sqlite3_reset(_insert_stmt);
    sqlite3_clear_bindings(_insert_stmt);
    sqlite3_bind_int(_insert_stmt, 1, tile.zoom);
    sqlite3_bind_int(_insert_stmt, 2, tile.column);
    sqlite3_bind_int(_insert_stmt, 3, tile.row);
    int bind_rc = SQLITE_OK;
    if (data.empty()) {
        // A null pointer would bind NULL instead of an empty blob.
        bind_rc = sqlite3_bind_zeroblob(_insert_stmt, 4, 0);
    } else {
        bind_rc = sqlite3_bind_blob64(_insert_stmt, 4, data.data(), static_cast<sqlite3_uint64>(data.size()),
                                      SQLITE_TRANSIENT);
    }
    if (bind_rc != SQLITE_OK) {
        throw osm2mbtiles_error("Failed to bind " + std::to_string(data.size()) + " bytes for tile " +
                                std::to_string(tile.zoom) + "/" + std::to_string(tile.column) + "/" +
                                std::to_string(tile.row) + ": " + sqlite3_errstr(bind_rc));
    }

    const int rc = sqlite3_step(_insert_stmt);
    if (rc == SQLITE_DONE) {
        sqlite3_reset(_insert_stmt);
        return InsertResult::Inserted;
    }

    const int extended = sqlite3_extended_errcode(_db);
    const std::string message = sqlite3_errmsg(_db);
    sqlite3_reset(_insert_stmt);
    if (extended == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return InsertResult::Duplicate;
    }
    throw osm2mbtiles_error("Failed to write tile " + std::to_string(tile.zoom) + "/" + std::to_string(tile.column) +
                            "/" + std::to_string(tile.row) + ": " + message);
}

ArchiveStats Archive::queryStats() const {
    require_open();
    statement_ptr stmt =
        prepare(_db, "SELECT COUNT(*), MIN(zoom_level), MAX(zoom_level) FROM tiles", "tile statistics query");
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw osm2mbtiles_error("SQLite error while reading tile statistics: " + std::string(sqlite3_errmsg(_db)));
    }

    ArchiveStats stats;
    stats.tile_count = static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
    if (sqlite3_column_type(stmt.get(), 1) != SQLITE_NULL) {
        stats.min_zoom = sqlite3_column_int(stmt.get(), 1);
    }
    if (sqlite3_column_type(stmt.get(), 2) != SQLITE_NULL) {
        stats.max_zoom = sqlite3_column_int(stmt.get(), 2);
    }

    std::error_code ec;
    const auto size = fs::file_size(_path, ec);
    if (ec) {
        throw osm2mbtiles_error("Failed to read size of '" + _path + "': " + ec.message());
    }
    stats.file_size = size;
    return stats;
}

}  // namespace osm2mbtiles
