#include "chunkvault/chunk_writer.hpp"
#include "chunkvault/config.hpp"
#include "chunkvault/errors.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace chunkvault;
namespace fs = std::filesystem;
using chunkvault_test::RecordingProgressLog;

namespace {

class ChunkWriterTest : public chunkvault_test::TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        data_ = pattern(10000);
        source_ = write_file("source.bin", data_);
        chunks_dir_ = path("chunks");
        inventory_path_ = path("source.json");
        config_ = ChunkConfig::config_for_testing();
    }

    std::vector<uint8_t> slice(size_t begin, size_t end) const {
        return std::vector<uint8_t>(data_.begin() + begin, data_.begin() + end);
    }

    ErrorKind error_kind_of(ChunkWriter& writer, uint64_t chunk_size, std::optional<int64_t> target) {
        try {
            writer.write_chunks(source_, chunks_dir_, inventory_path_, chunk_size, target);
        } catch (const ChunkError& e) {
            return e.kind();
        }
        return ErrorKind::NONE;
    }

    std::vector<uint8_t> data_;
    std::string source_;
    std::string chunks_dir_;
    std::string inventory_path_;
    ChunkConfig config_;
    RecordingProgressLog log_;
};

} // namespace

TEST_F(ChunkWriterTest, SplitsUnevenFileIntoThreeChunks) {
    ChunkWriter writer(log_, config_);
    Inventory inventory = writer.write_chunks(source_, chunks_dir_, inventory_path_);

    EXPECT_TRUE(inventory.is_complete());
    EXPECT_EQ(inventory.total_chunks, 3u);
    EXPECT_EQ(inventory.hash_algorithm, process_hash_algorithm());
    EXPECT_EQ(inventory.original_hash, hash_bytes(inventory.hash_algorithm, data_));

    EXPECT_EQ(read_file(chunks_dir_ + "/source.chunk001.bin"), slice(0, 4096));
    EXPECT_EQ(read_file(chunks_dir_ + "/source.chunk002.bin"), slice(4096, 8192));
    EXPECT_EQ(read_file(chunks_dir_ + "/source.chunk003.bin"), slice(8192, 10000));
    EXPECT_FALSE(fs::exists(chunks_dir_ + "/source.chunk003.bin.part"));

    const ChunkRecord& last = inventory.chunks.at(3);
    EXPECT_EQ(last.actual_size, std::optional<uint64_t>(1808));
    EXPECT_EQ(last.hash, std::optional<std::string>(hash_bytes(inventory.hash_algorithm, slice(8192, 10000))));

    ASSERT_EQ(log_.chunks.size(), 3u);
    EXPECT_EQ(log_.chunks[2].offset, 8192u);
    EXPECT_TRUE(log_.has_sequence("HASH", "COMPLETE"));
    EXPECT_TRUE(log_.has_sequence("INVENTORY", "CREATED"));
    EXPECT_TRUE(log_.has_sequence("CHUNKING", "COMPLETE"));
}

TEST_F(ChunkWriterTest, RerunOfCompletedInventoryWritesNothing) {
    ChunkWriter writer(log_, config_);
    writer.write_chunks(source_, chunks_dir_, inventory_path_);
    auto first_write = fs::last_write_time(chunks_dir_ + "/source.chunk001.bin");

    RecordingProgressLog second_log;
    ChunkWriter again(second_log, config_);
    Inventory inventory = again.write_chunks(source_, chunks_dir_, inventory_path_);

    EXPECT_TRUE(inventory.is_complete());
    EXPECT_TRUE(second_log.chunks.empty());
    EXPECT_EQ(fs::last_write_time(chunks_dir_ + "/source.chunk001.bin"), first_write);
}

TEST_F(ChunkWriterTest, ResumedRunHashesWithRecordedAlgorithm) {
    // An inventory recorded with another algorithm than this process picks
    HashAlgorithm recorded = process_hash_algorithm() == HashAlgorithm::MD5 ? HashAlgorithm::SHA256
                                                                             : HashAlgorithm::MD5;
    InventoryStore store(log_, false);
    SourceInfo source;
    source.path = source_;
    source.size = data_.size();
    source.hash = hash_bytes(recorded, data_);
    source.algorithm = recorded;
    store.persist(store.create(source, 4096, inventory_path_), inventory_path_);

    ChunkWriter writer(log_, config_);
    Inventory inventory = writer.write_chunks(source_, chunks_dir_, inventory_path_, 4096);

    EXPECT_TRUE(log_.has_sequence("INVENTORY", "RESUMED"));
    EXPECT_FALSE(log_.has_sequence("INVENTORY", "CREATED"));
    EXPECT_EQ(inventory.hash_algorithm, recorded);
    EXPECT_EQ(inventory.chunks.at(1).hash, std::optional<std::string>(hash_bytes(recorded, slice(0, 4096))));
}

TEST_F(ChunkWriterTest, ResumeWritesOnlyRemainingChunks) {
    ChunkWriter writer(log_, config_);
    Inventory partial = writer.write_chunks(source_, chunks_dir_, inventory_path_, config_.chunk_size, 2);
    EXPECT_EQ(partial.completed_indices(), std::vector<uint64_t>{2});
    EXPECT_FALSE(fs::exists(chunks_dir_ + "/source.chunk001.bin"));

    RecordingProgressLog resume_log;
    ChunkWriter resumed(resume_log, config_);
    Inventory inventory = resumed.write_chunks(source_, chunks_dir_, inventory_path_);

    EXPECT_TRUE(inventory.is_complete());
    EXPECT_TRUE(resume_log.has_sequence("INVENTORY", "RESUMED"));
    ASSERT_EQ(resume_log.chunks.size(), 2u);
    EXPECT_EQ(resume_log.chunks[0].chunk_id, "source.chunk001.bin");
    EXPECT_EQ(resume_log.chunks[1].chunk_id, "source.chunk003.bin");
}

TEST_F(ChunkWriterTest, TrustedHashSkipsRehashOnResume) {
    ChunkWriter writer(log_, config_);
    writer.write_chunks(source_, chunks_dir_, inventory_path_, config_.chunk_size, 1);

    ChunkConfig trusting = config_;
    trusting.trust_recorded_hash = true;
    RecordingProgressLog resume_log;
    ChunkWriter resumed(resume_log, trusting);
    Inventory inventory = resumed.write_chunks(source_, chunks_dir_, inventory_path_);

    EXPECT_TRUE(inventory.is_complete());
    EXPECT_TRUE(resume_log.has_sequence("HASH", "SKIPPED"));
    EXPECT_FALSE(resume_log.has_sequence("HASH", "START"));
}

TEST_F(ChunkWriterTest, ChangedSourceIsRejected) {
    ChunkWriter writer(log_, config_);
    writer.write_chunks(source_, chunks_dir_, inventory_path_, config_.chunk_size, 1);

    write_file("source.bin", pattern(10000, 99));
    EXPECT_EQ(error_kind_of(writer, config_.chunk_size, std::nullopt), ErrorKind::INVENTORY_MISMATCH);
}

TEST_F(ChunkWriterTest, DifferentChunkSizeIsRejected) {
    ChunkWriter writer(log_, config_);
    writer.write_chunks(source_, chunks_dir_, inventory_path_, config_.chunk_size, 1);

    EXPECT_EQ(error_kind_of(writer, 2048, std::nullopt), ErrorKind::INVENTORY_MISMATCH);
}

TEST_F(ChunkWriterTest, TargetIndexOutOfRange) {
    ChunkWriter writer(log_, config_);
    EXPECT_EQ(error_kind_of(writer, config_.chunk_size, 4), ErrorKind::CHUNK_INDEX_OUT_OF_RANGE);
    EXPECT_EQ(error_kind_of(writer, config_.chunk_size, 0), ErrorKind::CHUNK_INDEX_OUT_OF_RANGE);
}

TEST_F(ChunkWriterTest, MissingInputIsReported) {
    ChunkWriter writer(log_, config_);
    try {
        writer.write_chunks(path("absent.bin"), chunks_dir_, inventory_path_);
        FAIL() << "expected ChunkError";
    } catch (const ChunkError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::INPUT_NOT_FOUND);
    }
    EXPECT_FALSE(fs::exists(inventory_path_));
}

TEST_F(ChunkWriterTest, CorruptInventoryIsReplaced) {
    write_text("source.json", "{ \"original_filename\": ");

    ChunkWriter writer(log_, config_);
    Inventory inventory = writer.write_chunks(source_, chunks_dir_, inventory_path_);

    EXPECT_TRUE(inventory.is_complete());
    EXPECT_FALSE(log_.errors.empty());
}

TEST_F(ChunkWriterTest, FailedChunkWriteLeavesChunkPending) {
    // A directory where the temp file should go makes the open fail
    fs::create_directories(chunks_dir_ + "/source.chunk002.bin.part");

    ChunkWriter writer(log_, config_);
    EXPECT_EQ(error_kind_of(writer, 4096, std::nullopt), ErrorKind::STORAGE_WRITE_FAILURE);

    InventoryStore store(log_, false);
    Inventory persisted = store.load(inventory_path_);
    EXPECT_EQ(persisted.chunks.at(1).status, ChunkStatus::COMPLETED);
    EXPECT_EQ(persisted.chunks.at(2).status, ChunkStatus::PENDING);
    EXPECT_EQ(persisted.chunks.at(3).status, ChunkStatus::PENDING);
    EXPECT_EQ(persisted.pending_indices(), (std::vector<uint64_t>{2, 3}));
    EXPECT_TRUE(fs::exists(chunks_dir_ + "/source.chunk001.bin"));
    EXPECT_FALSE(fs::exists(chunks_dir_ + "/source.chunk002.bin"));
    EXPECT_FALSE(log_.errors.empty());

    // Once the path is clear the next run finishes the job
    fs::remove(chunks_dir_ + "/source.chunk002.bin.part");
    Inventory resumed = writer.write_chunks(source_, chunks_dir_, inventory_path_);
    EXPECT_TRUE(resumed.is_complete());
}

TEST_F(ChunkWriterTest, EmptyFileHasNoChunks) {
    std::string empty = write_file("empty.bin", {});
    ChunkWriter writer(log_, config_);
    Inventory inventory = writer.write_chunks(empty, chunks_dir_, path("empty.json"));

    EXPECT_EQ(inventory.total_chunks, 0u);
    EXPECT_TRUE(inventory.chunks.empty());
    EXPECT_TRUE(inventory.is_complete());
    EXPECT_TRUE(fs::exists(path("empty.json")));
    EXPECT_TRUE(log_.chunks.empty());
}

TEST_F(ChunkWriterTest, ChunkSizeEqualToFileSize) {
    ChunkWriter writer(log_, config_);
    Inventory inventory = writer.write_chunks(source_, chunks_dir_, inventory_path_, data_.size());

    EXPECT_EQ(inventory.total_chunks, 1u);
    EXPECT_EQ(read_file(chunks_dir_ + "/source.chunk001.bin"), data_);
}
