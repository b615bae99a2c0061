#include <CLI/CLI.hpp>
#include "cli.h"
#include "osm2mbtiles.h"

#include "aixlog.hpp"

#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace osm2mbtiles {
namespace cli {

int run(int argc, const char *const *argv) {
    CLI::App app{"Import an OpenStreetMap <zoom>/<column>/<row> tile tree into an MBTiles archive"};
    app.allow_non_standard_option_names();
    app.set_version_flag("--version", std::string(kVersion));
    app.failure_message(CLI::FailureMessage::help);

    int verbosity = 0;
    app.add_flag("-v,--verbose", verbosity, "Increase logging verbosity");
    app.add_flag_function("--verbose-extra", [&](int count) { verbosity += count * 2; },
                          "Enable extra verbose logging");

    std::string db_path;
    std::string map_dir;
    std::vector<std::string> meta_assignments;
    std::string metadata_file;
    std::vector<std::string> extensions = ImportOptions{}.extensions;

    app.add_option("-db,--db", db_path, "Output .mbtiles path; an existing file is replaced")
        ->required();
    app.add_option("-mapdir,--mapdir", map_dir, "Tile directory laid out as <zoom>/<column>/<row>.<ext>")
        ->check(CLI::ExistingDirectory);
    app.add_option("-meta,--meta", meta_assignments, "Metadata entry written as name=value (repeatable)");
    app.add_option("-metadata-file,--metadata-file", metadata_file, "File with one name=value metadata entry per line")
        ->check(CLI::ExistingFile);
    app.add_option("-ext,--ext", extensions, "Accepted tile file extensions")
        ->delimiter(',')
        ->default_str("png,jpg,jpeg");

    try {
        app.parse(argc, argv);
    } catch (const CLI::Success &e) {
        return app.exit(e);
    } catch (const CLI::ParseError &e) {
        app.exit(e);
        return kExitFailure;
    }

    Logger::set_level(Logger::level_for_verbosity(verbosity));

    LOG(INFO) << "osm2mbtiles " << kVersion << " - generating for MBTiles v"
              << kMBTilesVersion;

    try {
        ConvertOptions options;
        options.db_path = db_path;
        options.map_dir = map_dir;
        options.import_options.extensions = extensions;
        if (!metadata_file.empty()) {
            options.metadata = load_metadata_file(metadata_file);
        }
        for (const auto &assignment : meta_assignments) {
            auto entry = parse_metadata_assignment(assignment);
            options.metadata[entry.first] = entry.second;
        }

        const auto summary = convert(options);
        if (!summary.import_result) {
            std::cout << "Created empty archive '" << db_path << "'" << std::endl;
            return kExitSuccess;
        }

        std::cout << format_statistics(summary.stats, db_path, map_dir) << std::flush;

        const auto &failures = summary.import_result->failures;
        if (!failures.empty()) {
            std::cout << "Skipped " << failures.size() << " tile files:" << '\n';
            for (const auto &failure : failures) {
                std::cout << "  " << failure.path.string() << " (" << to_string(failure.kind)
                          << ")" << '\n';
            }
            std::cout << std::flush;
            return kExitIncompleteImport;
        }
        return kExitSuccess;
    } catch (const std::exception &ex) {
        LOG(ERROR) << ex.what();
        return kExitFailure;
    }
}

}  // namespace cli
}  // namespace osm2mbtiles
