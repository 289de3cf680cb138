#include "chunkvault/merge.hpp"
#include "chunkvault/errors.hpp"
#include "chunkvault/progress_log.hpp"
#include "chunkvault/timestamp.hpp"
#include <stdexcept>

namespace chunkvault {

namespace {

void check_same_source(const Inventory& reference, const std::string& reference_path,
                       const Inventory& other, const std::string& other_path) {
    std::string field;
    if (other.original_hash != reference.original_hash) {
        field = "original_hash";
    } else if (other.original_size != reference.original_size) {
        field = "original_size";
    } else if (other.chunk_size != reference.chunk_size) {
        field = "chunk_size";
    } else if (other.hash_algorithm != reference.hash_algorithm) {
        field = "hash_type";
    } else if (other.total_chunks != reference.total_chunks) {
        field = "total_chunks";
    }

    if (!field.empty()) {
        throw ChunkError(ErrorKind::INVENTORY_MISMATCH,
                         "Cannot merge " + other_path + " into " + reference_path + ": " + field + " differs");
    }
}

} // namespace

Inventory merge_inventories(const std::vector<std::string>& inventory_paths,
                            const std::string& output_path,
                            ProgressLog& log,
                            bool sync_writes) {
    if (inventory_paths.empty()) {
        throw std::invalid_argument("merge needs at least one inventory");
    }

    InventoryStore store(log, sync_writes);

    std::vector<Inventory> inputs;
    inputs.reserve(inventory_paths.size());
    for (const auto& path : inventory_paths) {
        inputs.push_back(store.load(path));
    }

    const Inventory& reference = inputs.front();
    for (size_t i = 1; i < inputs.size(); i++) {
        check_same_source(reference, inventory_paths.front(), inputs[i], inventory_paths[i]);
    }

    SourceInfo source;
    source.path = reference.original_filename;
    source.size = reference.original_size;
    source.hash = reference.original_hash;
    source.algorithm = reference.hash_algorithm;

    Inventory merged = store.create(source, reference.chunk_size, output_path);
    merged.inventory_type = reference.inventory_type;

    for (size_t i = 0; i < inputs.size(); i++) {
        for (const auto& [index, record] : inputs[i].chunks) {
            if (record.status != ChunkStatus::COMPLETED) {
                continue;
            }
            auto slot = merged.chunks.find(index);
            if (slot == merged.chunks.end()) {
                throw ChunkError(ErrorKind::INVENTORY_MISMATCH,
                                 inventory_paths[i] + " has chunk " + std::to_string(index) +
                                 " outside 1.." + std::to_string(merged.total_chunks));
            }
            if (slot->second.status == ChunkStatus::COMPLETED) {
                continue;
            }
            if (record.offset != slot->second.offset || record.expected_size != slot->second.expected_size) {
                throw ChunkError(ErrorKind::INVENTORY_MISMATCH,
                                 inventory_paths[i] + " chunk " + std::to_string(index) +
                                 " does not match the chunk layout");
            }
            slot->second = record;
        }
    }

    merged.merged_from = inventory_paths;
    merged.chunk_status = merged.computed_summary();
    merged.last_updated = iso_timestamp();
    store.persist(merged, output_path);

    log.sequence("MERGE", "COMPLETE",
                 std::to_string(inventory_paths.size()) + " inventories -> " + output_path + " (" +
                 std::to_string(merged.completed_count()) + "/" + std::to_string(merged.total_chunks) +
                 " completed)");
    return merged;
}

} // namespace chunkvault
