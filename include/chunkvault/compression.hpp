#ifndef CHUNKVAULT_COMPRESSION_HPP
#define CHUNKVAULT_COMPRESSION_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chunkvault {

/**
 * Codecs available for inventory backups
 */
enum class BackupCodec {
    NONE,           // Plain copy
    LZ4_FAST,       // LZ4 default
    LZ4_HIGH,       // LZ4 HC, max level
    ZSTD_FAST,      // Zstandard level 3
    ZSTD_MAX        // Zstandard level 19
};

/**
 * CLI / file-header name of a codec ("none", "lz4", "lz4hc", "zstd", "zstd-max")
 */
const char* codec_name(BackupCodec codec);

std::optional<BackupCodec> parse_codec(const std::string& name);

/**
 * File suffix appended to backups written with this codec ("", ".lz4", ".zst")
 */
const char* codec_extension(BackupCodec codec);

/**
 * Compress a buffer
 * @throws std::runtime_error if the codec reports an error
 */
std::vector<uint8_t> compress_with_codec(const std::vector<uint8_t>& data, BackupCodec codec);

/**
 * Decompress a buffer produced by compress_with_codec
 * @param original_size Exact size of the uncompressed payload
 * @throws std::runtime_error on corrupt input or size mismatch
 */
std::vector<uint8_t> decompress_with_codec(const std::vector<uint8_t>& data,
                                           BackupCodec codec,
                                           size_t original_size);

} // namespace chunkvault

#endif // CHUNKVAULT_COMPRESSION_HPP
