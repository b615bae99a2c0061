#ifndef OSM2MBTILES_CLI_H
#define OSM2MBTILES_CLI_H
#pragma once

namespace osm2mbtiles {
namespace cli {

constexpr int kExitSuccess = 0;
// Bad arguments, unreadable metadata, or an archive that could not be written.
constexpr int kExitFailure = 1;
// The archive was written but some tile files had to be skipped.
constexpr int kExitIncompleteImport = 2;

// Parses the command line, runs the conversion and prints the report.
// Returns the process exit status.
int run(int argc, const char *const *argv);

}  // namespace cli
}  // namespace osm2mbtiles

#endif // OSM2MBTILES_CLI_H
