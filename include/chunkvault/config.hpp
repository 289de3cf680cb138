#ifndef CHUNKVAULT_CONFIG_HPP
#define CHUNKVAULT_CONFIG_HPP

#include "chunkvault/compression.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace chunkvault {

constexpr uint64_t MEGABYTE = 1024ULL * 1024ULL;

/**
 * Chunking configuration
 */
struct ChunkConfig {
    // Chunk geometry
    uint64_t chunk_size;          // Bytes per chunk (last chunk may be shorter)

    // Hashing
    size_t hash_buffer_size;      // Read buffer for whole-file hashing
    bool trust_recorded_hash;     // Resumed runs reuse the inventory hash when sizes agree

    // Durability
    bool sync_writes;             // fsync chunk files and inventory before rename

    // Console
    bool show_progress;           // Print a progress line per chunk

    // Inventory backups
    BackupCodec backup_codec;

    ChunkConfig();
    static ChunkConfig default_config();
    static ChunkConfig config_for_removable_media();  // Chunks that fit FAT32 volumes
    static ChunkConfig config_for_archives();         // Very large files, cheap resume
    static ChunkConfig config_for_testing();          // Small chunks, no fsync, quiet

    /**
     * Preset by name: "default", "removable" or "archives"
     * @return nullopt for an unknown name
     */
    static std::optional<ChunkConfig> config_for_preset(const std::string& name);
};

} // namespace chunkvault

#endif // CHUNKVAULT_CONFIG_HPP
