#include "chunkvault/config.hpp"
#include "chunkvault/hasher.hpp"

namespace chunkvault {

ChunkConfig::ChunkConfig()
    : chunk_size(1000 * MEGABYTE)
    , hash_buffer_size(DEFAULT_HASH_BUFFER_SIZE)
    , trust_recorded_hash(false)
    , sync_writes(true)
    , show_progress(true)
    , backup_codec(BackupCodec::ZSTD_FAST) {
}

ChunkConfig ChunkConfig::default_config() {
    return ChunkConfig();
}

ChunkConfig ChunkConfig::config_for_removable_media() {
    ChunkConfig config;
    // FAT32 caps files at 4GiB - 1
    config.chunk_size = 4000 * MEGABYTE;
    return config;
}

ChunkConfig ChunkConfig::config_for_archives() {
    ChunkConfig config;
    config.chunk_size = 2000 * MEGABYTE;
    config.hash_buffer_size = 64 * MEGABYTE;
    config.trust_recorded_hash = true;
    config.backup_codec = BackupCodec::ZSTD_MAX;
    return config;
}

ChunkConfig ChunkConfig::config_for_testing() {
    ChunkConfig config;
    config.chunk_size = 4096;
    config.hash_buffer_size = 1024;
    config.sync_writes = false;
    config.show_progress = false;
    config.backup_codec = BackupCodec::NONE;
    return config;
}

std::optional<ChunkConfig> ChunkConfig::config_for_preset(const std::string& name) {
    if (name == "default") {
        return default_config();
    }
    if (name == "removable") {
        return config_for_removable_media();
    }
    if (name == "archives") {
        return config_for_archives();
    }
    return std::nullopt;
}

} // namespace chunkvault
