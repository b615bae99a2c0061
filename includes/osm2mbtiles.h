#ifndef OSM2MBTILES_H
#define OSM2MBTILES_H
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace osm2mbtiles {

constexpr const char *kVersion = "1.0";
constexpr const char *kMBTilesVersion = "1.1";

// Highest zoom level whose rows and columns still fit the int columns.
constexpr int kMaxZoom = 30;

class osm2mbtiles_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Silent
};

// LOG(...) output goes to standard error; standard output is left to the
// statistics report. Messages below the current level are dropped.
class Logger {
public:
    static void set_level(LogLevel level);
    static LogLevel level();

    // Warning for 0, each further step lowers the threshold, floor at Debug.
    static LogLevel level_for_verbosity(int verbosity);
};

struct TileCoordinate {
    int zoom = 0;
    int column = 0;
    int row = 0;
};

inline bool operator==(const TileCoordinate &lhs, const TileCoordinate &rhs) {
    return lhs.zoom == rhs.zoom && lhs.column == rhs.column && lhs.row == rhs.row;
}

// Flips an XYZ row (origin north) into the TMS numbering (origin south)
// used by the tiles table. Throws osm2mbtiles_error when out of range.
int xyz_to_tms_y(int xyz_y, int z);

// Parses "<zoom>/<column>/<row>.<ext>" relative to the tile root into XYZ
// coordinates. Throws osm2mbtiles_error on anything malformed.
TileCoordinate parse_tile_path(const std::filesystem::path &relative);

bool is_supported_tile_extension(const std::filesystem::path &path,
                                 const std::vector<std::string> &extensions);

struct ArchiveStats {
    std::size_t tile_count = 0;
    std::optional<int> min_zoom;
    std::optional<int> max_zoom;
    std::uintmax_t file_size = 0;
};

enum class InsertResult {
    Inserted,
    Duplicate,
};

class Archive {
  public:
    Archive();
    explicit Archive(const std::string &path);
    ~Archive();

    Archive(const Archive &) = delete;
    Archive &operator=(const Archive &) = delete;

    // Removes whatever lives at `path` and creates an empty archive with
    // the metadata and tiles tables.
    void create(const std::string &path);
    void open(const std::string &path);
    void close();
    bool isOpen() const { return _db != nullptr; }
    const std::string &path() const { return _path; }

    std::map<std::string, std::string> metadata() const;
    void setMetadata(const std::map<std::string, std::string> &entries,
        bool overwrite_existing = true);
    void setMetadata(const std::string &key, const std::string &value,
        bool overwrite_existing = true);

    void beginTransaction();
    void commit();
    void rollback() noexcept;

    // `tile.row` must already be in TMS numbering.
    InsertResult insertTile(const TileCoordinate &tile, const std::vector<std::byte> &data);

    ArchiveStats queryStats() const;

  private:
    void require_open() const;

    std::string _path;
    sqlite3 *_db;
    sqlite3_stmt *_insert_stmt = nullptr;
    bool _in_transaction = false;
};

enum class ImportFailureKind {
    Malformed,
    Unreadable,
    Duplicate,
};

std::string to_string(ImportFailureKind kind);

struct ImportFailure {
    std::filesystem::path path;
    ImportFailureKind kind = ImportFailureKind::Malformed;
    std::string message;
};

struct ImportOptions {
    std::vector<std::string> extensions = {"png", "jpg", "jpeg"};
};

struct ImportResult {
    std::size_t imported = 0;
    std::size_t ignored = 0;
    std::optional<int> min_zoom;
    std::optional<int> max_zoom;
    std::vector<ImportFailure> failures;
};

ImportResult import_tiles(Archive &archive, const std::filesystem::path &root,
                          const ImportOptions &options = {});

std::string format_statistics(const ArchiveStats &stats, const std::string &db_path,
                              const std::string &map_dir);

std::pair<std::string, std::string> parse_metadata_assignment(const std::string &assignment);
std::map<std::string, std::string> load_metadata_file(const std::filesystem::path &path);

// Throws osm2mbtiles_error for invalid values and returns the names of
// required entries that are missing.
std::vector<std::string> validate_metadata(const std::map<std::string, std::string> &metadata);

struct ConvertOptions {
    std::string db_path;
    std::string map_dir = "";  // empty: create the archive without tiles
    std::map<std::string, std::string> metadata;
    ImportOptions import_options = {};
};

struct ConvertSummary {
    std::optional<ImportResult> import_result;
    ArchiveStats stats;
};

ConvertSummary convert(const ConvertOptions &options);

}  // namespace osm2mbtiles

#endif // OSM2MBTILES_H
