#ifndef CHUNKVAULT_INVENTORY_HPP
#define CHUNKVAULT_INVENTORY_HPP

#include "chunkvault/hasher.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace chunkvault {

class ProgressLog;

/**
 * Per-chunk state: pending until its file is written and hashed
 */
enum class ChunkStatus {
    PENDING,
    COMPLETED
};

const char* chunk_status_name(ChunkStatus status);

/**
 * Inventory entry for one chunk
 */
struct ChunkRecord {
    ChunkStatus status;
    std::string chunk_id;                   // Chunk file name, stable across runs
    uint64_t chunk_number;                  // 1-based index
    uint64_t offset;                        // Start offset in the source file
    uint64_t expected_size;                 // Size computed at inventory creation

    // Present once completed
    std::optional<uint64_t> actual_size;
    std::optional<std::string> hash;
    std::optional<std::string> completed_at;
    std::optional<double> processing_time;  // Seconds

    ChunkRecord();
};

/**
 * Derived counters; recomputed from the chunk table, never incremented
 */
struct ChunkStatusSummary {
    uint64_t total_processed;
    uint64_t chunks_remaining;

    ChunkStatusSummary();
    ChunkStatusSummary(uint64_t processed, uint64_t remaining);

    bool operator==(const ChunkStatusSummary& other) const;
};

/**
 * Facts about the source file needed to create an inventory
 */
struct SourceInfo {
    std::string path;
    uint64_t size;
    std::string hash;
    HashAlgorithm algorithm;

    SourceInfo();
};

/**
 * Durable record of one chunking operation
 * Treated as a value: mutations produce a new Inventory that replaces the
 * previous one wholesale before it is persisted.
 */
struct Inventory {
    std::string original_filename;
    uint64_t original_size;
    std::string original_hash;
    HashAlgorithm hash_algorithm;
    uint64_t chunk_size;
    uint64_t total_chunks;
    std::string inventory_type;
    std::string inventory_file;
    std::string created_at;
    std::string last_updated;
    std::optional<ChunkStatusSummary> chunk_status;  // As stored on disk
    std::map<uint64_t, ChunkRecord> chunks;          // 1-based index -> record
    std::vector<std::string> merged_from;

    Inventory();

    ChunkStatusSummary computed_summary() const;
    uint64_t completed_count() const;
    std::vector<uint64_t> pending_indices() const;
    std::vector<uint64_t> completed_indices() const;
    bool is_complete() const;
};

/**
 * JSON (de)serialization in the on-disk key layout
 * inventory_from_json throws ChunkError(INVENTORY_LOAD_ERROR) naming every
 * missing required field.
 */
nlohmann::ordered_json inventory_to_json(const Inventory& inventory);
Inventory inventory_from_json(const nlohmann::ordered_json& document);

/**
 * Loads, creates, updates and persists inventories
 */
class InventoryStore {
public:
    /**
     * @param log Receives load-failure and creation notices
     * @param sync_writes fsync the inventory before it replaces the previous version
     */
    explicit InventoryStore(ProgressLog& log, bool sync_writes = true);

    /**
     * Build a new inventory with every chunk pending
     * Offsets and expected sizes come from chunk_boundaries().
     */
    Inventory create(const SourceInfo& source,
                     uint64_t chunk_size,
                     const std::string& inventory_path) const;

    /**
     * Read and validate an inventory file
     * @throws ChunkError(INVENTORY_LOAD_ERROR)
     */
    Inventory load(const std::string& path) const;

    /**
     * load() when the file exists and parses; otherwise nullopt
     * A file that exists but fails to load is reported to the log.
     */
    std::optional<Inventory> try_load(const std::string& path) const;

    /**
     * Existing inventory at path, or a freshly created one
     * For callers whose SourceInfo does not depend on what is on disk.
     * ChunkWriter cannot use it: it must see the existing inventory before
     * hashing the source, so it calls try_load() and create() itself.
     */
    Inventory load_or_create(const std::string& path,
                             const SourceInfo& source,
                             uint64_t chunk_size) const;

    /**
     * Mark a chunk completed and recompute the summary
     * @return The updated inventory; the caller persists it immediately
     * @throws std::out_of_range if index is not in 1..total_chunks
     */
    Inventory record_chunk_completion(const Inventory& inventory,
                                      uint64_t index,
                                      uint64_t size,
                                      const std::string& hash,
                                      double processing_time) const;

    /**
     * Atomically replace the inventory file at path
     * @throws ChunkError(STORAGE_WRITE_FAILURE)
     */
    void persist(const Inventory& inventory, const std::string& path) const;

    /**
     * Structural problems of a loaded inventory; empty when sound
     */
    std::vector<std::string> verify_integrity(const Inventory& inventory) const;

    /**
     * verify_integrity() on a file; parse and field errors become issues
     * @throws ChunkError(INVENTORY_LOAD_ERROR) only if the file cannot be read
     */
    std::vector<std::string> verify_integrity_file(const std::string& path) const;

private:
    ProgressLog& log_;
    bool sync_writes_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_INVENTORY_HPP
