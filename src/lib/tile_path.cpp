#include "osm2mbtiles.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace osm2mbtiles {

namespace {

bool equals_ignore_case(const std::string &lhs, const std::string &rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) != std::tolower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }
    return true;
}

std::string extension_without_dot(const std::string &ext) {
    if (!ext.empty() && ext[0] == '.') {
        return ext.substr(1);
    }
    return ext;
}

int parse_segment(const std::string &segment, const char *what, const fs::path &relative) {
    const bool all_digits = !segment.empty() && std::all_of(segment.begin(), segment.end(), [](unsigned char ch) {
        return std::isdigit(ch) != 0;
    });
    if (!all_digits) {
        throw osm2mbtiles_error(std::string("Invalid ") + what + " '" + segment + "' in tile path '" +
                                relative.generic_string() + "'");
    }

    int value = 0;
    const char *first = segment.data();
    const char *last = segment.data() + segment.size();
    const auto result = std::from_chars(first, last, value);
    if (result.ec != std::errc() || result.ptr != last) {
        throw osm2mbtiles_error(std::string(what) + " '" + segment + "' is out of range in tile path '" +
                                relative.generic_string() + "'");
    }
    return value;
}

}  // namespace

int xyz_to_tms_y(int xyz_y, int z) {
    if (z < 0 || z > kMaxZoom) {
        throw osm2mbtiles_error("Unsupported zoom level: " + std::to_string(z));
    }
    const long long max_value = (1LL << z) - 1;
    const long long result = max_value - static_cast<long long>(xyz_y);
    if (result < 0 || result > std::numeric_limits<int>::max()) {
        throw osm2mbtiles_error("Tile row " + std::to_string(xyz_y) + " is outside the grid for zoom level " +
                                std::to_string(z));
    }
    return static_cast<int>(result);
}

TileCoordinate parse_tile_path(const fs::path &relative) {
    std::vector<std::string> segments;
    for (const auto &part : relative) {
        segments.push_back(part.string());
    }
    if (segments.size() != 3) {
        throw osm2mbtiles_error("Tile path '" + relative.generic_string() +
                                "' does not follow the <zoom>/<column>/<row>.<ext> layout");
    }

    TileCoordinate tile;
    tile.zoom = parse_segment(segments[0], "zoom level", relative);
    tile.column = parse_segment(segments[1], "column", relative);
    tile.row = parse_segment(fs::path(segments[2]).stem().string(), "row", relative);

    if (tile.zoom > kMaxZoom) {
        throw osm2mbtiles_error("Zoom level " + std::to_string(tile.zoom) + " exceeds the supported maximum of " +
                                std::to_string(kMaxZoom) + " in tile path '" + relative.generic_string() + "'");
    }
    const long long grid_size = 1LL << tile.zoom;
    if (tile.column >= grid_size || tile.row >= grid_size) {
        throw osm2mbtiles_error("Tile path '" + relative.generic_string() + "' lies outside the " +
                                std::to_string(grid_size) + "x" + std::to_string(grid_size) + " grid of zoom level " +
                                std::to_string(tile.zoom));
    }
    return tile;
}

bool is_supported_tile_extension(const fs::path &path, const std::vector<std::string> &extensions) {
    const std::string ext = extension_without_dot(path.extension().string());
    if (ext.empty()) {
        return false;
    }
    return std::any_of(extensions.begin(), extensions.end(), [&](const std::string &candidate) {
        return equals_ignore_case(ext, extension_without_dot(candidate));
    });
}

}  // namespace osm2mbtiles
