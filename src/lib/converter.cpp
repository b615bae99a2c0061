#include "osm2mbtiles.h"

#include "aixlog.hpp"

#include <string>

namespace osm2mbtiles {

ConvertSummary convert(const ConvertOptions &options) {
    if (options.db_path.empty()) {
        throw std::invalid_argument("An output archive path is required");
    }

    const auto missing = validate_metadata(options.metadata);
    for (const auto &name : missing) {
        LOG(WARNING) << "Required metadata '" << name << "' is not set";
    }

    LOG(INFO) << "Creating " << options.db_path;
    Archive archive;
    archive.create(options.db_path);
    archive.setMetadata(options.metadata);

    ConvertSummary summary;
    if (!options.map_dir.empty()) {
        summary.import_result = import_tiles(archive, options.map_dir, options.import_options);
    }
    summary.stats = archive.queryStats();
    return summary;
}

}  // namespace osm2mbtiles
