#include "chunkvault/backup.hpp"
#include "chunkvault/chunk_writer.hpp"
#include "chunkvault/config.hpp"
#include "chunkvault/errors.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <cstring>
#include <string>

using namespace chunkvault;
namespace fs = std::filesystem;
using chunkvault_test::RecordingProgressLog;

namespace {

class BackupTest : public chunkvault_test::TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        source_ = write_file("movie.bin", pattern(10000));
        inventory_path_ = path("movie.json");
        ChunkWriter writer(log_, ChunkConfig::config_for_testing());
        writer.write_chunks(source_, path("chunks"), inventory_path_, 4096, 2);
    }

    std::string source_;
    std::string inventory_path_;
    RecordingProgressLog log_;
};

} // namespace

TEST_F(BackupTest, ZstdBackupRestoresInventory) {
    InventoryBackup backup(log_, false);
    std::string backup_path = backup.create_backup(inventory_path_, BackupCodec::ZSTD_FAST);

    EXPECT_EQ(fs::path(backup_path).extension().string(), ".zst");
    EXPECT_NE(backup_path.find("movie.json."), std::string::npos);
    EXPECT_NE(backup_path.find(".backup"), std::string::npos);

    std::vector<uint8_t> raw = read_file(backup_path);
    ASSERT_GE(raw.size(), BACKUP_HEADER_SIZE);
    EXPECT_EQ(std::memcmp(raw.data(), BACKUP_MAGIC, 4), 0);

    Inventory restored = backup.restore_backup(backup_path, path("restored.json"));
    EXPECT_EQ(restored.completed_indices(), std::vector<uint64_t>{2});
    EXPECT_EQ(restored.total_chunks, 3u);

    InventoryStore store(log_, false);
    EXPECT_TRUE(store.verify_integrity(store.load(path("restored.json"))).empty());
}

TEST_F(BackupTest, PlainBackupIsACopy) {
    InventoryBackup backup(log_, false);
    std::string backup_path = backup.create_backup(inventory_path_, BackupCodec::NONE);

    EXPECT_EQ(read_text(backup_path), read_text(inventory_path_));
    EXPECT_EQ(backup.restore_backup(backup_path, path("restored.json")).total_chunks, 3u);
}

TEST_F(BackupTest, BackupsInTheSameSecondDoNotCollide) {
    InventoryBackup backup(log_, false);
    std::string first = backup.create_backup(inventory_path_, BackupCodec::LZ4_FAST);
    std::string second = backup.create_backup(inventory_path_, BackupCodec::LZ4_FAST);

    EXPECT_NE(first, second);
    EXPECT_TRUE(fs::exists(first));
    EXPECT_TRUE(fs::exists(second));
}

TEST_F(BackupTest, CorruptBackupIsRejected) {
    InventoryBackup backup(log_, false);
    std::string backup_path = backup.create_backup(inventory_path_, BackupCodec::ZSTD_FAST);

    std::vector<uint8_t> raw = read_file(backup_path);
    raw.resize(BACKUP_HEADER_SIZE + 4);
    std::string broken = write_file("broken.backup.zst", raw);

    try {
        backup.restore_backup(broken, path("restored.json"));
        FAIL() << "expected ChunkError";
    } catch (const ChunkError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::INVENTORY_LOAD_ERROR);
    }
    EXPECT_FALSE(fs::exists(path("restored.json")));
}

TEST_F(BackupTest, ForgedHeaderSizeIsRejected) {
    InventoryBackup backup(log_, false);
    std::string backup_path = backup.create_backup(inventory_path_, BackupCodec::ZSTD_FAST);
    std::vector<uint8_t> raw = read_file(backup_path);
    ASSERT_EQ(raw[4], static_cast<uint8_t>(BackupCodec::ZSTD_FAST));

    // 0x7fffffffffffffff, little-endian
    std::vector<uint8_t> huge = raw;
    for (size_t i = 5; i < 12; i++) {
        huge[i] = 0xFF;
    }
    huge[12] = 0x7F;
    std::string forged = write_file("forged.backup.zst", huge);

    try {
        backup.restore_backup(forged, path("restored.json"));
        FAIL() << "expected ChunkError";
    } catch (const ChunkError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::INVENTORY_LOAD_ERROR);
    }

    // Under the limit but disagreeing with the frame
    std::vector<uint8_t> off_by_one = raw;
    off_by_one[5] = static_cast<uint8_t>(off_by_one[5] + 1);
    std::string skewed = write_file("skewed.backup.zst", off_by_one);

    try {
        backup.restore_backup(skewed, path("restored.json"));
        FAIL() << "expected ChunkError";
    } catch (const ChunkError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::INVENTORY_LOAD_ERROR);
    }
    EXPECT_FALSE(fs::exists(path("restored.json")));
}

TEST_F(BackupTest, UnloadableInventoryIsNotBackedUp) {
    write_text("bad.json", "{}");
    InventoryBackup backup(log_, false);
    EXPECT_THROW(backup.create_backup(path("bad.json"), BackupCodec::NONE), ChunkError);
}
