#include "chunkvault/compression.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace chunkvault;

namespace {

std::vector<uint8_t> repetitive_json() {
    std::string text = "{\n  \"chunks\": {\n";
    for (int i = 1; i <= 200; i++) {
        text += "    \"" + std::to_string(i) + "\": {\"status\": \"completed\", \"expected_size\": 4096},\n";
    }
    text += "  }\n}\n";
    return std::vector<uint8_t>(text.begin(), text.end());
}

} // namespace

TEST(CompressionTest, EveryCodecRestoresInventoryText) {
    std::vector<uint8_t> data = repetitive_json();

    for (BackupCodec codec : {BackupCodec::NONE, BackupCodec::LZ4_FAST, BackupCodec::LZ4_HIGH,
                              BackupCodec::ZSTD_FAST, BackupCodec::ZSTD_MAX}) {
        std::vector<uint8_t> packed = compress_with_codec(data, codec);
        if (codec != BackupCodec::NONE) {
            EXPECT_LT(packed.size(), data.size()) << codec_name(codec);
        }
        EXPECT_EQ(decompress_with_codec(packed, codec, data.size()), data) << codec_name(codec);
    }
}

TEST(CompressionTest, CorruptPayloadThrows) {
    std::vector<uint8_t> data = repetitive_json();
    std::vector<uint8_t> packed = compress_with_codec(data, BackupCodec::ZSTD_FAST);
    packed.resize(packed.size() / 2);

    EXPECT_THROW(decompress_with_codec(packed, BackupCodec::ZSTD_FAST, data.size()), std::runtime_error);
    EXPECT_THROW(decompress_with_codec(data, BackupCodec::NONE, data.size() + 1), std::runtime_error);
}

TEST(CompressionTest, ZstdSizeMustMatchFrame) {
    std::vector<uint8_t> data = repetitive_json();
    std::vector<uint8_t> packed = compress_with_codec(data, BackupCodec::ZSTD_FAST);

    EXPECT_THROW(decompress_with_codec(packed, BackupCodec::ZSTD_FAST, data.size() + 1), std::runtime_error);
    EXPECT_THROW(decompress_with_codec(packed, BackupCodec::ZSTD_FAST, static_cast<size_t>(1) << 40), std::runtime_error);
    EXPECT_THROW(decompress_with_codec(data, BackupCodec::ZSTD_FAST, data.size()), std::runtime_error);
}

TEST(CompressionTest, CodecNamesAndExtensions) {
    EXPECT_EQ(parse_codec("zstd-max"), BackupCodec::ZSTD_MAX);
    EXPECT_EQ(parse_codec("lz4hc"), BackupCodec::LZ4_HIGH);
    EXPECT_FALSE(parse_codec("gzip").has_value());

    EXPECT_STREQ(codec_extension(BackupCodec::NONE), "");
    EXPECT_STREQ(codec_extension(BackupCodec::LZ4_FAST), ".lz4");
    EXPECT_STREQ(codec_extension(BackupCodec::ZSTD_FAST), ".zst");
}
