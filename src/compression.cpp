#include "chunkvault/compression.hpp"
#include <stdexcept>
#include <string>
#include <lz4.h>
#include <lz4hc.h>
#include <zstd.h>

namespace chunkvault {

namespace {

void check_lz4_limits(size_t size) {
    if (size > static_cast<size_t>(LZ4_MAX_INPUT_SIZE)) {
        throw std::runtime_error("LZ4 input too large: " + std::to_string(size) + " bytes");
    }
}

std::vector<uint8_t> zstd_compress(const std::vector<uint8_t>& data, int level) {
    size_t max_dst_size = ZSTD_compressBound(data.size());
    std::vector<uint8_t> compressed(max_dst_size);

    size_t compressed_size = ZSTD_compress(
        compressed.data(),
        max_dst_size,
        data.data(),
        data.size(),
        level
    );

    if (ZSTD_isError(compressed_size)) {
        throw std::runtime_error(std::string("ZSTD compression failed: ") +
                                 ZSTD_getErrorName(compressed_size));
    }

    compressed.resize(compressed_size);
    return compressed;
}

} // namespace

const char* codec_name(BackupCodec codec) {
    switch (codec) {
        case BackupCodec::NONE: return "none";
        case BackupCodec::LZ4_FAST: return "lz4";
        case BackupCodec::LZ4_HIGH: return "lz4hc";
        case BackupCodec::ZSTD_FAST: return "zstd";
        case BackupCodec::ZSTD_MAX: return "zstd-max";
    }
    return "unknown";
}

std::optional<BackupCodec> parse_codec(const std::string& name) {
    if (name == "none") return BackupCodec::NONE;
    if (name == "lz4") return BackupCodec::LZ4_FAST;
    if (name == "lz4hc") return BackupCodec::LZ4_HIGH;
    if (name == "zstd") return BackupCodec::ZSTD_FAST;
    if (name == "zstd-max") return BackupCodec::ZSTD_MAX;
    return std::nullopt;
}

const char* codec_extension(BackupCodec codec) {
    switch (codec) {
        case BackupCodec::NONE: return "";
        case BackupCodec::LZ4_FAST:
        case BackupCodec::LZ4_HIGH: return ".lz4";
        case BackupCodec::ZSTD_FAST:
        case BackupCodec::ZSTD_MAX: return ".zst";
    }
    return "";
}

std::vector<uint8_t> compress_with_codec(const std::vector<uint8_t>& data, BackupCodec codec) {
    switch (codec) {
        case BackupCodec::NONE:
            return data;

        case BackupCodec::LZ4_FAST: {
            check_lz4_limits(data.size());
            int max_dst_size = LZ4_compressBound(static_cast<int>(data.size()));
            std::vector<uint8_t> compressed(max_dst_size);

            int compressed_size = LZ4_compress_default(
                reinterpret_cast<const char*>(data.data()),
                reinterpret_cast<char*>(compressed.data()),
                static_cast<int>(data.size()),
                max_dst_size
            );

            if (compressed_size <= 0 && !data.empty()) {
                throw std::runtime_error("LZ4 compression failed");
            }

            compressed.resize(compressed_size > 0 ? compressed_size : 0);
            return compressed;
        }

        case BackupCodec::LZ4_HIGH: {
            check_lz4_limits(data.size());
            int max_dst_size = LZ4_compressBound(static_cast<int>(data.size()));
            std::vector<uint8_t> compressed(max_dst_size);

            int compressed_size = LZ4_compress_HC(
                reinterpret_cast<const char*>(data.data()),
                reinterpret_cast<char*>(compressed.data()),
                static_cast<int>(data.size()),
                max_dst_size,
                LZ4HC_CLEVEL_MAX
            );

            if (compressed_size <= 0 && !data.empty()) {
                throw std::runtime_error("LZ4 HC compression failed");
            }

            compressed.resize(compressed_size > 0 ? compressed_size : 0);
            return compressed;
        }

        case BackupCodec::ZSTD_FAST:
            return zstd_compress(data, 3);

        case BackupCodec::ZSTD_MAX:
            return zstd_compress(data, 19);
    }

    throw std::runtime_error("Unknown backup codec");
}

std::vector<uint8_t> decompress_with_codec(const std::vector<uint8_t>& data,
                                           BackupCodec codec,
                                           size_t original_size) {
    switch (codec) {
        case BackupCodec::NONE:
            if (data.size() != original_size) {
                throw std::runtime_error("Stored payload size mismatch");
            }
            return data;

        case BackupCodec::LZ4_FAST:
        case BackupCodec::LZ4_HIGH: {
            check_lz4_limits(original_size);
            std::vector<uint8_t> decompressed(original_size);
            if (original_size == 0) {
                return decompressed;
            }

            int result = LZ4_decompress_safe(
                reinterpret_cast<const char*>(data.data()),
                reinterpret_cast<char*>(decompressed.data()),
                static_cast<int>(data.size()),
                static_cast<int>(original_size)
            );

            if (result < 0 || static_cast<size_t>(result) != original_size) {
                throw std::runtime_error("LZ4 decompression failed");
            }

            return decompressed;
        }

        case BackupCodec::ZSTD_FAST:
        case BackupCodec::ZSTD_MAX: {
            // The frame records its own content size; never allocate on trust
            unsigned long long frame_size = ZSTD_getFrameContentSize(data.data(), data.size());
            if (frame_size == ZSTD_CONTENTSIZE_ERROR) {
                throw std::runtime_error("ZSTD data is not a valid frame");
            }
            if (frame_size == ZSTD_CONTENTSIZE_UNKNOWN) {
                throw std::runtime_error("ZSTD frame does not record its content size");
            }
            if (frame_size != original_size) {
                throw std::runtime_error("ZSTD frame holds " + std::to_string(frame_size) +
                                         " bytes, expected " + std::to_string(original_size));
            }

            std::vector<uint8_t> decompressed(original_size);

            size_t result = ZSTD_decompress(
                decompressed.data(),
                original_size,
                data.data(),
                data.size()
            );

            if (ZSTD_isError(result)) {
                throw std::runtime_error(std::string("ZSTD decompression failed: ") +
                                         ZSTD_getErrorName(result));
            }
            if (result != original_size) {
                throw std::runtime_error("ZSTD decompression produced unexpected size");
            }

            return decompressed;
        }
    }

    throw std::runtime_error("Unknown backup codec");
}

} // namespace chunkvault
