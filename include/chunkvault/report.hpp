#ifndef CHUNKVAULT_REPORT_HPP
#define CHUNKVAULT_REPORT_HPP

#include "chunkvault/inventory.hpp"
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace chunkvault {

/**
 * Human-facing view of an inventory
 */
struct InventorySummary {
    std::string original_filename;
    uint64_t original_size;
    std::string hash_type;
    uint64_t chunk_size;
    uint64_t total_chunks;
    uint64_t completed;
    uint64_t pending;
    std::vector<uint64_t> completed_indices;
    std::vector<uint64_t> pending_indices;
    std::string created_at;
    std::string last_updated;

    InventorySummary();

    double percent_complete() const;
};

InventorySummary summarize(const Inventory& inventory);

void print_status(const InventorySummary& summary, std::ostream& out);

/**
 * "1-3, 5, 8-9"
 */
std::string format_index_ranges(const std::vector<uint64_t>& indices);

} // namespace chunkvault

#endif // CHUNKVAULT_REPORT_HPP
