#include "chunkvault/chunk_writer.hpp"
#include "chunkvault/config.hpp"
#include "chunkvault/errors.hpp"
#include "chunkvault/merge.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using namespace chunkvault;
namespace fs = std::filesystem;
using chunkvault_test::RecordingProgressLog;

namespace {

class MergeTest : public chunkvault_test::TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        source_ = write_file("movie.bin", pattern(10000));
    }

    std::string chunk_into(const std::string& name, std::optional<int64_t> target, uint64_t chunk_size = 4096) {
        ChunkWriter writer(log_, ChunkConfig::config_for_testing());
        writer.write_chunks(source_, path("chunks"), path(name), chunk_size, target);
        return path(name);
    }

    std::string source_;
    RecordingProgressLog log_;
};

} // namespace

TEST_F(MergeTest, CompletedChunksFromEveryInputAreKept) {
    std::string a = chunk_into("a.json", 1);
    std::string b = chunk_into("b.json", 3);

    Inventory merged = merge_inventories({a, b}, path("merged.json"), log_, false);

    EXPECT_EQ(merged.completed_indices(), (std::vector<uint64_t>{1, 3}));
    EXPECT_EQ(merged.pending_indices(), std::vector<uint64_t>{2});
    EXPECT_EQ(*merged.chunk_status, ChunkStatusSummary(2, 1));
    EXPECT_EQ(merged.merged_from, (std::vector<std::string>{a, b}));

    InventoryStore store(log_, false);
    Inventory reloaded = store.load(path("merged.json"));
    EXPECT_EQ(reloaded.merged_from.size(), 2u);
    EXPECT_TRUE(store.verify_integrity(reloaded).empty());
}

TEST_F(MergeTest, DifferentChunkSizesCannotMerge) {
    std::string a = chunk_into("a.json", 1);
    std::string b = chunk_into("b.json", 1, 2048);

    try {
        merge_inventories({a, b}, path("merged.json"), log_, false);
        FAIL() << "expected ChunkError";
    } catch (const ChunkError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::INVENTORY_MISMATCH);
        EXPECT_NE(std::string(e.what()).find("chunk_size"), std::string::npos);
    }
    EXPECT_FALSE(fs::exists(path("merged.json")));
}

TEST_F(MergeTest, DifferentSourcesCannotMerge) {
    std::string a = chunk_into("a.json", 1);
    source_ = write_file("movie.bin", pattern(10000, 3));
    std::string b = chunk_into("b.json", 2);

    EXPECT_THROW(merge_inventories({a, b}, path("merged.json"), log_, false), ChunkError);
}

TEST_F(MergeTest, NoInputsIsAnError) {
    EXPECT_THROW(merge_inventories({}, path("merged.json"), log_, false), std::invalid_argument);
}
