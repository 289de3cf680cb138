#include "chunkvault/errors.hpp"
#include "chunkvault/paths.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>

using namespace chunkvault;
namespace fs = std::filesystem;

namespace {

class PathsTest : public chunkvault_test::TempDirTest {};

} // namespace

TEST_F(PathsTest, DefaultsFollowTheInputFile) {
    std::string input = write_file("media/movie.final.mkv", pattern(10));
    RunPaths paths = resolve_paths(input);

    EXPECT_EQ(paths.output_dir, path("media"));
    EXPECT_EQ(paths.log_path, path("media/movie.final.log"));
    EXPECT_EQ(paths.inventory_path, path("media/movie.final.json"));
}

TEST_F(PathsTest, ExplicitDirectoriesWin) {
    std::string input = write_file("movie.mkv", pattern(10));
    RunPaths paths = resolve_paths(input, path("out"), path("logs"), path("inv"));

    EXPECT_EQ(paths.output_dir, path("out"));
    EXPECT_EQ(paths.log_path, path("logs/movie.log"));
    EXPECT_EQ(paths.inventory_path, path("inv/movie.json"));
}

TEST_F(PathsTest, ValidateInputFile) {
    std::string input = write_file("movie.mkv", pattern(10));
    EXPECT_NO_THROW(validate_input_file(input));

    try {
        validate_input_file(path("absent.mkv"));
        FAIL() << "expected ChunkError";
    } catch (const ChunkError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::INPUT_NOT_FOUND);
    }

    EXPECT_THROW(validate_input_file(dir_.string()), ChunkError);
}

TEST_F(PathsTest, DiskSpaceCheck) {
    DiskSpaceCheck small = check_disk_space(1, path("space"));
    EXPECT_TRUE(small.sufficient) << small.message;
    EXPECT_GT(small.free_bytes, 1u);
    EXPECT_TRUE(fs::is_directory(path("space")));

    DiskSpaceCheck huge = check_disk_space(UINT64_MAX, path("space"));
    EXPECT_FALSE(huge.sufficient);
    EXPECT_NE(huge.message.find("Insufficient"), std::string::npos);
}

TEST_F(PathsTest, FindInventoryPicksMostRecent) {
    std::string chunk = write_file("movie.chunk001.bin", pattern(10));
    std::string older = write_text("old.json", "{}");
    std::string newer = write_text("new.json", "{}");
    fs::last_write_time(older, fs::file_time_type::clock::now() - std::chrono::hours(1));

    EXPECT_EQ(fs::path(find_inventory(chunk)).filename().string(), "new.json");
}

TEST_F(PathsTest, FindInventoryWithoutJsonFails) {
    std::string chunk = write_file("movie.chunk001.bin", pattern(10));
    EXPECT_THROW(find_inventory(chunk), ChunkError);
}
