#include <gtest/gtest.h>
#include "osm2mbtiles.h"
#include "test_helpers.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using osm2mbtiles::Archive;
using osm2mbtiles::ImportFailureKind;
using osm2mbtiles::ImportResult;
using osm2mbtiles_test::TempDir;
using osm2mbtiles_test::write_file;

namespace fs = std::filesystem;

class TileImporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        map_dir_ = temp_.path() / "tiles";
        fs::create_directories(map_dir_);
        db_path_ = (temp_.path() / "out.mbtiles").string();
        archive_.create(db_path_);
    }

    void add_tile(const std::string &relative, const std::string &content) {
        write_file(map_dir_ / relative, content);
    }

    ImportResult import(const osm2mbtiles::ImportOptions &options = {}) {
        return osm2mbtiles::import_tiles(archive_, map_dir_, options);
    }

    std::vector<osm2mbtiles_test::StoredTile> stored() {
        archive_.close();
        return osm2mbtiles_test::read_tiles(db_path_);
    }

    TempDir temp_;
    fs::path map_dir_;
    std::string db_path_;
    Archive archive_;
};

TEST_F(TileImporterTest, ImportsTwoLevelPyramid) {
    add_tile("0/0/0.png", "z0");
    add_tile("1/0/0.png", "z1 c0 r0");
    add_tile("1/0/1.png", "z1 c0 r1");
    add_tile("1/1/0.png", "z1 c1 r0");
    add_tile("1/1/1.png", "z1 c1 r1");

    const ImportResult result = import();
    EXPECT_EQ(result.imported, 5u);
    EXPECT_TRUE(result.failures.empty());
    ASSERT_TRUE(result.min_zoom.has_value());
    ASSERT_TRUE(result.max_zoom.has_value());
    EXPECT_EQ(*result.min_zoom, 0);
    EXPECT_EQ(*result.max_zoom, 1);

    const auto stats = archive_.queryStats();
    EXPECT_EQ(stats.tile_count, 5u);
    EXPECT_EQ(stats.min_zoom.value_or(-1), 0);
    EXPECT_EQ(stats.max_zoom.value_or(-1), 1);
}

TEST_F(TileImporterTest, StoresRowsInTmsOrder) {
    add_tile("0/0/0.png", "z0");
    add_tile("1/0/0.png", "z1 c0 r0");
    add_tile("1/0/1.png", "z1 c0 r1");
    add_tile("3/5/2.png", "z3 c5 r2");

    import();
    const auto tiles = stored();
    ASSERT_EQ(tiles.size(), 4u);

    // Ordered by zoom, column, stored row.
    EXPECT_EQ(tiles[0].zoom, 0);
    EXPECT_EQ(tiles[0].row, 0);
    EXPECT_EQ(tiles[0].data, "z0");

    EXPECT_EQ(tiles[1].column, 0);
    EXPECT_EQ(tiles[1].row, 0);
    EXPECT_EQ(tiles[1].data, "z1 c0 r1");
    EXPECT_EQ(tiles[2].row, 1);
    EXPECT_EQ(tiles[2].data, "z1 c0 r0");

    EXPECT_EQ(tiles[3].zoom, 3);
    EXPECT_EQ(tiles[3].column, 5);
    EXPECT_EQ(tiles[3].row, (1 << 3) - 2 - 1);
    EXPECT_EQ(tiles[3].data, "z3 c5 r2");
}

TEST_F(TileImporterTest, EmptyDirectoryImportsNothing) {
    const ImportResult result = import();
    EXPECT_EQ(result.imported, 0u);
    EXPECT_EQ(result.ignored, 0u);
    EXPECT_FALSE(result.min_zoom.has_value());
    EXPECT_FALSE(result.max_zoom.has_value());

    const auto stats = archive_.queryStats();
    EXPECT_EQ(stats.tile_count, 0u);
    EXPECT_FALSE(stats.min_zoom.has_value());
    EXPECT_FALSE(stats.max_zoom.has_value());
}

TEST_F(TileImporterTest, IgnoresFilesWithOtherExtensions) {
    add_tile("0/0/0.png", "tile");
    add_tile("0/0/0.png.aux", "sidecar");
    add_tile("README.txt", "notes");
    add_tile("1/0/0", "no extension");

    const ImportResult result = import();
    EXPECT_EQ(result.imported, 1u);
    EXPECT_EQ(result.ignored, 3u);
    EXPECT_TRUE(result.failures.empty());
}

TEST_F(TileImporterTest, MatchesExtensionsCaseInsensitively) {
    add_tile("1/0/0.PNG", "upper");
    add_tile("1/1/0.Jpg", "mixed");
    add_tile("1/1/1.jpeg", "jpeg");

    EXPECT_EQ(import().imported, 3u);
}

TEST_F(TileImporterTest, RestrictsToConfiguredExtensions) {
    add_tile("1/0/0.png", "png");
    add_tile("1/1/0.jpg", "jpg");

    osm2mbtiles::ImportOptions options;
    options.extensions = {"png"};
    const ImportResult result = import(options);
    EXPECT_EQ(result.imported, 1u);
    EXPECT_EQ(result.ignored, 1u);
}

TEST_F(TileImporterTest, MalformedPathsAreReportedAndSkipped) {
    add_tile("1/0/0.png", "good");
    add_tile("x/0/0.png", "bad zoom");
    add_tile("1/0/top.png", "bad row");
    add_tile("1/4/0.png", "column outside grid");
    add_tile("stray.png", "too shallow");
    add_tile("1/0/extra/0.png", "too deep");

    const ImportResult result = import();
    EXPECT_EQ(result.imported, 1u);
    ASSERT_EQ(result.failures.size(), 5u);
    for (const auto &failure : result.failures) {
        EXPECT_EQ(failure.kind, ImportFailureKind::Malformed) << failure.path;
        EXPECT_FALSE(failure.message.empty());
    }
    EXPECT_EQ(stored().size(), 1u);
}

TEST_F(TileImporterTest, DuplicateKeyKeepsFirstFileInPathOrder) {
    // Both files land on zoom 1, column 0, stored row 1.
    add_tile("1/0/0.jpg", "from jpg");
    add_tile("1/0/0.png", "from png");

    const ImportResult result = import();
    EXPECT_EQ(result.imported, 1u);
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.failures[0].kind, ImportFailureKind::Duplicate);
    EXPECT_EQ(result.failures[0].path.filename().string(), "0.png");

    const auto tiles = stored();
    ASSERT_EQ(tiles.size(), 1u);
    EXPECT_EQ(tiles[0].row, 1);
    EXPECT_EQ(tiles[0].data, "from jpg");
}

TEST_F(TileImporterTest, DuplicateThroughLeadingZerosIsRejected) {
    add_tile("2/1/3.png", "plain");
    add_tile("2/1/03.png", "zero padded");

    const ImportResult result = import();
    EXPECT_EQ(result.imported, 1u);
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.failures[0].kind, ImportFailureKind::Duplicate);
    // "03.png" sorts before "3.png".
    EXPECT_EQ(stored().at(0).data, "zero padded");
}

TEST_F(TileImporterTest, UnreadableFileIsSkippedOthersImported) {
    add_tile("1/0/0.png", "a");
    add_tile("1/0/1.png", "b");
    add_tile("1/1/0.png", "c");
    const fs::path locked = map_dir_ / "1" / "1" / "1.png";
    write_file(locked, "locked");
    fs::permissions(locked, fs::perms::none);
    if (std::ifstream(locked).good()) {
        GTEST_SKIP() << "File permissions are not enforced for this user";
    }

    const ImportResult result = import();
    EXPECT_EQ(result.imported, 3u);
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.failures[0].kind, ImportFailureKind::Unreadable);
    EXPECT_EQ(result.failures[0].path, locked);
    EXPECT_EQ(stored().size(), 3u);
}

TEST_F(TileImporterTest, ReadErrorSkipsOnlyThatFile) {
    // Reading /proc/self/mem from offset 0 fails with EIO, whatever the user.
    const fs::path failing_source = "/proc/self/mem";
    if (!fs::exists(failing_source)) {
        GTEST_SKIP() << "No /proc/self/mem on this system";
    }
    add_tile("1/0/0.png", "a");
    add_tile("1/0/1.png", "b");
    const fs::path failing = map_dir_ / "1" / "1" / "0.png";
    fs::create_symlink(failing_source, failing);

    const ImportResult result = import();
    EXPECT_EQ(result.imported, 2u);
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.failures[0].kind, ImportFailureKind::Unreadable);
    EXPECT_EQ(result.failures[0].path, failing);
    EXPECT_EQ(result.min_zoom.value_or(-1), 1);

    const auto tiles = stored();
    ASSERT_EQ(tiles.size(), 2u);
    EXPECT_EQ(tiles[0].data, "b");
    EXPECT_EQ(tiles[1].data, "a");
}

TEST_F(TileImporterTest, LargeTileIsStoredByteForByte) {
    std::string content(3 * 64 * 1024 + 17, '\0');
    for (std::size_t i = 0; i < content.size(); ++i) {
        content[i] = static_cast<char>(i % 251);
    }
    add_tile("4/3/2.png", content);

    EXPECT_EQ(import().imported, 1u);
    const auto tiles = stored();
    ASSERT_EQ(tiles.size(), 1u);
    EXPECT_EQ(tiles[0].data.size(), content.size());
    EXPECT_TRUE(tiles[0].data == content);
}

TEST_F(TileImporterTest, MissingRootIsFatal) {
    EXPECT_THROW(osm2mbtiles::import_tiles(archive_, temp_.path() / "nope"), osm2mbtiles::osm2mbtiles_error);
}

TEST_F(TileImporterTest, ClosedArchiveIsRejected) {
    Archive closed;
    EXPECT_THROW(osm2mbtiles::import_tiles(closed, map_dir_), std::invalid_argument);
}

TEST_F(TileImporterTest, EveryImportedFileBecomesOneRecord) {
    int files = 0;
    for (int column = 0; column < 4; ++column) {
        for (int row = 0; row < 4; ++row) {
            add_tile("2/" + std::to_string(column) + "/" + std::to_string(row) + ".png",
                     std::to_string(column) + ":" + std::to_string(row));
            ++files;
        }
    }

    EXPECT_EQ(import().imported, static_cast<std::size_t>(files));
    const auto tiles = stored();
    ASSERT_EQ(tiles.size(), static_cast<std::size_t>(files));
    for (const auto &tile : tiles) {
        const int source_row = (1 << tile.zoom) - tile.row - 1;
        EXPECT_EQ(tile.data, std::to_string(tile.column) + ":" + std::to_string(source_row));
    }
}
