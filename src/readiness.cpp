#include "chunkvault/readiness.hpp"
#include "chunkvault/errors.hpp"
#include "chunkvault/inventory.hpp"
#include "chunkvault/progress_log.hpp"
#include "chunkvault/reconstructor.hpp"
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace chunkvault {

ReadinessReport::ReadinessReport()
    : ready(false) {
}

ReadinessReport ReconstructionReadinessChecker::check(const std::string& inventory_path,
                                                      const std::optional<std::string>& chunks_dir) const {
    ReadinessReport report;

    std::error_code ec;
    if (!fs::is_regular_file(inventory_path, ec)) {
        report.issues.push_back("Inventory file not found: " + inventory_path);
        return report;
    }

    NullProgressLog quiet;
    InventoryStore store(quiet);

    Inventory inventory;
    try {
        inventory = store.load(inventory_path);
    } catch (const ChunkError& e) {
        report.issues.push_back(e.what());
        return report;
    }

    for (const auto& issue : store.verify_integrity(inventory)) {
        report.issues.push_back(issue);
    }

    uint64_t completed = inventory.completed_count();
    if (completed < inventory.total_chunks) {
        report.issues.push_back("Incomplete chunks: " + std::to_string(completed) + " of " +
                                std::to_string(inventory.total_chunks) + " completed");
    }

    PresenceReport presence = check_chunk_presence(inventory, chunks_dir.value_or(default_chunks_dir(inventory_path)));
    for (const auto& chunk : presence.missing) {
        report.issues.push_back("Missing chunk file: " + chunk);
    }
    for (const auto& chunk : presence.size_mismatches) {
        report.issues.push_back("Chunk " + chunk);
    }

    report.ready = report.issues.empty();
    return report;
}

void ReconstructionReadinessChecker::print_status(const ReadinessReport& report, std::ostream& out) {
    if (report.ready) {
        out << "Ready for reconstruction" << std::endl;
        return;
    }

    out << "Not ready for reconstruction:" << std::endl;
    for (const auto& issue : report.issues) {
        out << "  - " << issue << std::endl;
    }
}

} // namespace chunkvault
