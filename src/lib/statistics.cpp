#include "osm2mbtiles.h"

#include <sstream>
#include <string>

namespace osm2mbtiles {

namespace {

std::string zoom_or_na(const std::optional<int> &zoom) {
    return zoom ? std::to_string(*zoom) : std::string("n/a");
}

}  // namespace

std::string format_statistics(const ArchiveStats &stats, const std::string &db_path,
                              const std::string &map_dir) {
    std::ostringstream out;
    out << "Map statistics\n";
    out << "--------------\n";
    out << "map db:            " << db_path << '\n';
    out << "file size:         " << stats.file_size << " bytes\n";
    out << "tile directory:    " << map_dir << '\n';
    out << "number of tiles:   " << stats.tile_count << '\n';
    out << "zoom levels:       " << zoom_or_na(stats.min_zoom) << " - " << zoom_or_na(stats.max_zoom) << '\n';
    return out.str();
}

}  // namespace osm2mbtiles
