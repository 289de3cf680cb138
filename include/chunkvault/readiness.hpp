#ifndef CHUNKVAULT_READINESS_HPP
#define CHUNKVAULT_READINESS_HPP

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace chunkvault {

/**
 * Whether an inventory and its chunk files are ready for reconstruction
 */
struct ReadinessReport {
    bool ready;
    std::vector<std::string> issues;

    ReadinessReport();
};

/**
 * Read-only pre-flight check for reconstruction
 *
 * Reports a missing inventory, load errors (with the missing field names),
 * structural problems, pending chunks, missing chunk files and size
 * mismatches. Never writes anything.
 */
class ReconstructionReadinessChecker {
public:
    ReadinessReport check(const std::string& inventory_path,
                          const std::optional<std::string>& chunks_dir = std::nullopt) const;

    static void print_status(const ReadinessReport& report, std::ostream& out);
};

} // namespace chunkvault

#endif // CHUNKVAULT_READINESS_HPP
