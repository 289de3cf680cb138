#ifndef CHUNKVAULT_MERGE_HPP
#define CHUNKVAULT_MERGE_HPP

#include "chunkvault/inventory.hpp"
#include <string>
#include <vector>

namespace chunkvault {

class ProgressLog;

/**
 * Combine inventories of the same source written by separate runs
 *
 * Every input must describe the same file (hash, size, hash_type) split
 * with the same chunk size. A chunk completed in any input is completed
 * in the result; the rest stay pending. The result is persisted to
 * output_path and lists its inputs in merged_from.
 *
 * @throws ChunkError(INVENTORY_MISMATCH) when inputs disagree,
 *         ChunkError(INVENTORY_LOAD_ERROR) when an input cannot be loaded
 * @throws std::invalid_argument when no inputs are given
 */
Inventory merge_inventories(const std::vector<std::string>& inventory_paths,
                            const std::string& output_path,
                            ProgressLog& log,
                            bool sync_writes = true);

} // namespace chunkvault

#endif // CHUNKVAULT_MERGE_HPP
