#include "cli.h"

int main(int argc, char **argv) {
    return osm2mbtiles::cli::run(argc, argv);
}
