#include "chunkvault/report.hpp"
#include <iomanip>

namespace chunkvault {

InventorySummary::InventorySummary()
    : original_size(0)
    , chunk_size(0)
    , total_chunks(0)
    , completed(0)
    , pending(0) {
}

double InventorySummary::percent_complete() const {
    if (total_chunks == 0) {
        return 100.0;
    }
    return static_cast<double>(completed) / total_chunks * 100.0;
}

InventorySummary summarize(const Inventory& inventory) {
    InventorySummary summary;
    summary.original_filename = inventory.original_filename;
    summary.original_size = inventory.original_size;
    summary.hash_type = hash_algorithm_name(inventory.hash_algorithm);
    summary.chunk_size = inventory.chunk_size;
    summary.total_chunks = inventory.total_chunks;
    summary.completed_indices = inventory.completed_indices();
    summary.pending_indices = inventory.pending_indices();
    summary.completed = summary.completed_indices.size();
    summary.pending = summary.total_chunks - summary.completed;
    summary.created_at = inventory.created_at;
    summary.last_updated = inventory.last_updated;
    return summary;
}

std::string format_index_ranges(const std::vector<uint64_t>& indices) {
    std::string out;
    size_t i = 0;
    while (i < indices.size()) {
        size_t j = i;
        while (j + 1 < indices.size() && indices[j + 1] == indices[j] + 1) {
            j++;
        }
        if (!out.empty()) out += ", ";
        out += std::to_string(indices[i]);
        if (j > i) out += "-" + std::to_string(indices[j]);
        i = j + 1;
    }
    return out;
}

void print_status(const InventorySummary& summary, std::ostream& out) {
    out << "\n=== Inventory Status ===" << std::endl;
    out << "File:          " << summary.original_filename << std::endl;
    out << "Size:          " << summary.original_size << " bytes" << std::endl;
    out << "Hash type:     " << summary.hash_type << std::endl;
    out << "Chunk size:    " << summary.chunk_size << " bytes" << std::endl;
    out << "Chunks:        " << summary.completed << "/" << summary.total_chunks << " completed ("
        << std::fixed << std::setprecision(1) << summary.percent_complete() << "%)" << std::endl;
    if (!summary.pending_indices.empty()) {
        out << "Pending:       " << format_index_ranges(summary.pending_indices) << std::endl;
    }
    if (!summary.created_at.empty()) {
        out << "Created:       " << summary.created_at << std::endl;
    }
    if (!summary.last_updated.empty()) {
        out << "Last updated:  " << summary.last_updated << std::endl;
    }
}

} // namespace chunkvault
