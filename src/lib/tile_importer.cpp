#include "osm2mbtiles.h"

#include "aixlog.hpp"

#include <algorithm>
#include <array>
#include <filesystem>
#include <fstream>
#include <ios>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace osm2mbtiles {

namespace {

// Number of row conversions echoed at debug level at the start of a walk.
constexpr int kTracedConversions = 100;

constexpr std::size_t kReadChunkSize = 64 * 1024;

struct TileFile {
    fs::path path;
    fs::path relative;
};

std::vector<TileFile> collect_tile_files(const fs::path &root, const ImportOptions &options, std::size_t &ignored) {
    std::vector<TileFile> files;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw osm2mbtiles_error("Failed to read map directory '" + root.string() + "': " + ec.message());
    }

    fs::recursive_directory_iterator end;
    for (; it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) {
            continue;
        }
        if (!is_supported_tile_extension(it->path(), options.extensions)) {
            ++ignored;
            continue;
        }
        files.push_back({it->path(), it->path().lexically_relative(root)});
    }
    if (ec) {
        throw osm2mbtiles_error("Failed to walk map directory '" + root.string() + "': " + ec.message());
    }

    std::sort(files.begin(), files.end(), [](const TileFile &lhs, const TileFile &rhs) {
        return lhs.relative.generic_string() < rhs.relative.generic_string();
    });
    return files;
}

bool read_tile_data(const fs::path &path, std::vector<std::byte> &data, std::string &error) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        error = "Failed to open tile file '" + path.string() + "'";
        return false;
    }

    // istream::read turns a filebuf I/O error into badbit, unlike
    // istreambuf_iterator which lets the exception escape.
    std::array<char, kReadChunkSize> chunk;
    try {
        while (file.read(chunk.data(), static_cast<std::streamsize>(chunk.size())) || file.gcount() > 0) {
            const auto *first = reinterpret_cast<const std::byte *>(chunk.data());
            data.insert(data.end(), first, first + file.gcount());
        }
    } catch (const std::ios_base::failure &ex) {
        error = "Failed to read tile file '" + path.string() + "': " + ex.what();
        return false;
    }
    if (file.bad()) {
        error = "Failed to read tile file '" + path.string() + "': I/O error";
        return false;
    }
    return true;
}

void record_failure(ImportResult &result, const TileFile &file, ImportFailureKind kind, std::string message) {
    LOG(WARNING) << "Skipping " << file.relative.generic_string() << " (" << to_string(kind) << "): " << message;
    result.failures.push_back({file.path, kind, std::move(message)});
}

}  // namespace

std::string to_string(ImportFailureKind kind) {
    switch (kind) {
        case ImportFailureKind::Malformed:
            return "malformed";
        case ImportFailureKind::Unreadable:
            return "unreadable";
        case ImportFailureKind::Duplicate:
            return "duplicate";
    }
    return "unknown";
}

ImportResult import_tiles(Archive &archive, const fs::path &root, const ImportOptions &options) {
    if (!archive.isOpen()) {
        throw std::invalid_argument("Archive must be open before importing tiles");
    }
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw osm2mbtiles_error("Map directory does not exist: " + root.string());
    }

    LOG(INFO) << "Importing map tiles at " << root.string();

    ImportResult result;
    const std::vector<TileFile> files = collect_tile_files(root, options, result.ignored);
    LOG(DEBUG) << "Found " << files.size() << " tile files, ignored " << result.ignored << " other files";

    int traced = 0;
    archive.beginTransaction();
    try {
        for (const auto &file : files) {
            TileCoordinate source;
            try {
                source = parse_tile_path(file.relative);
            } catch (const osm2mbtiles_error &ex) {
                record_failure(result, file, ImportFailureKind::Malformed, ex.what());
                continue;
            }

            TileCoordinate target = source;
            target.row = xyz_to_tms_y(source.row, source.zoom);
            if (traced < kTracedConversions) {
                LOG(DEBUG) << "Zoom " << source.zoom << " (" << (1LL << source.zoom) << " rows), source row "
                           << source.row << " -> row " << target.row;
                ++traced;
            }

            std::vector<std::byte> data;
            std::string error;
            if (!read_tile_data(file.path, data, error)) {
                record_failure(result, file, ImportFailureKind::Unreadable, error);
                continue;
            }

            if (archive.insertTile(target, data) == InsertResult::Duplicate) {
                record_failure(result, file, ImportFailureKind::Duplicate,
                               "tile " + std::to_string(target.zoom) + "/" + std::to_string(target.column) + "/" +
                                   std::to_string(target.row) + " was already imported from an earlier file");
                continue;
            }

            ++result.imported;
            result.min_zoom = result.min_zoom ? std::min(*result.min_zoom, source.zoom) : source.zoom;
            result.max_zoom = result.max_zoom ? std::max(*result.max_zoom, source.zoom) : source.zoom;
            if (result.imported % 1000 == 0) {
                LOG(INFO) << "Imported " << result.imported << " tiles...";
            }
        }
        archive.commit();
    } catch (const std::exception &) {
        archive.rollback();
        throw;
    }

    if (result.min_zoom) {
        LOG(INFO) << "Import completed. Total tiles: " << result.imported << ", zoom levels " << *result.min_zoom
                  << " - " << *result.max_zoom;
    } else {
        LOG(INFO) << "Import completed. No tiles imported";
    }
    if (!result.failures.empty()) {
        LOG(WARNING) << "Skipped " << result.failures.size() << " tile files";
    }
    return result;
}

}  // namespace osm2mbtiles
