#ifndef CHUNKVAULT_CHUNK_WRITER_HPP
#define CHUNKVAULT_CHUNK_WRITER_HPP

#include "chunkvault/config.hpp"
#include "chunkvault/inventory.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace chunkvault {

class ProgressLog;

/**
 * Splits a source file into chunk files, resumably
 *
 * Every run hashes the source (unless config.trust_recorded_hash allows a
 * resumed run to skip it), loads or creates the inventory, then writes each
 * pending chunk: read its range, write it to "<chunk>.part", rename into
 * place, hash it, mark it completed and persist the inventory. A crash
 * loses at most the chunk in flight; the next run picks up from the
 * persisted inventory.
 *
 * Loading and creating are two steps here rather than one
 * InventoryStore::load_or_create() call. The recorded hash algorithm (and,
 * with trust_recorded_hash, the recorded hash itself) has to be known
 * before the source is hashed, and a new inventory can only be built after.
 */
class ChunkWriter {
public:
    ChunkWriter(ProgressLog& log, const ChunkConfig& config = ChunkConfig::default_config());

    /**
     * Write pending chunks (or one specific chunk)
     * @param input_path Source file
     * @param output_dir Directory for chunk files (created if needed)
     * @param inventory_path Inventory file to resume from / create
     * @param chunk_size Bytes per chunk; must match an existing inventory
     * @param target_index Process only this 1-based chunk
     * @return The inventory as last persisted
     * @throws ChunkError on invalid input, mismatched inventory, bad index or I/O failure
     */
    Inventory write_chunks(const std::string& input_path,
                           const std::string& output_dir,
                           const std::string& inventory_path,
                           uint64_t chunk_size,
                           std::optional<int64_t> target_index = std::nullopt);

    /**
     * Same, with chunk_size taken from the config
     */
    Inventory write_chunks(const std::string& input_path,
                           const std::string& output_dir,
                           const std::string& inventory_path);

    const ChunkConfig& config() const { return config_; }

private:
    ProgressLog& log_;
    ChunkConfig config_;
    InventoryStore store_;

    SourceInfo describe_source(const std::string& input_path,
                               const std::optional<Inventory>& existing);
    void check_resumable(const Inventory& existing,
                         const SourceInfo& source,
                         uint64_t chunk_size,
                         const std::string& inventory_path) const;
    void print_progress(uint64_t index, uint64_t total, const std::string& chunk_id, bool single) const;
};

} // namespace chunkvault

#endif // CHUNKVAULT_CHUNK_WRITER_HPP
