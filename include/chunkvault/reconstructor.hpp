#ifndef CHUNKVAULT_RECONSTRUCTOR_HPP
#define CHUNKVAULT_RECONSTRUCTOR_HPP

#include "chunkvault/errors.hpp"
#include "chunkvault/inventory.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chunkvault {

class ProgressLog;

/**
 * Reconstruction request
 */
struct ReconstructOptions {
    std::string inventory_path;
    std::optional<std::string> output_dir;  // Default: current working directory
    std::optional<std::string> chunks_dir;  // Default: directory of the inventory
    bool validate;                          // Check chunk and whole-file hashes

    ReconstructOptions();
};

/**
 * Outcome of a reconstruction
 */
struct ReconstructResult {
    bool success;
    ErrorKind error_kind;
    std::string error;
    std::string output_path;
    uint64_t bytes_written;
    std::vector<std::string> problems;      // Per-chunk details of a failed presence check

    ReconstructResult();
};

/**
 * Chunk files found / missing for the completed records of an inventory
 */
struct PresenceReport {
    std::vector<std::string> found;
    std::vector<std::string> missing;          // chunk ids
    std::vector<std::string> size_mismatches;  // "<id> (size mismatch: expected X, got Y)"

    bool ok() const { return missing.empty() && size_mismatches.empty(); }
};

/**
 * Check that every completed chunk has a file of the recorded size in chunks_dir
 * Collects every problem instead of stopping at the first.
 */
PresenceReport check_chunk_presence(const Inventory& inventory, const std::string& chunks_dir);

/**
 * Chunk directory used when none is given: the inventory's own directory
 */
std::string default_chunks_dir(const std::string& inventory_path);

/**
 * Rebuilds the original file from its chunks
 *
 * Steps run strictly in order: load inventory, reject pending chunks,
 * presence/size check, refuse an existing destination, stream chunks in
 * index order (checking each chunk hash before it is written when
 * validating), then compare final size and whole-file hash. The output
 * file is removed if anything fails after it was created.
 */
class ChunkReconstructor {
public:
    explicit ChunkReconstructor(ProgressLog& log, bool show_progress = true);

    ReconstructResult reconstruct(const ReconstructOptions& options);

private:
    ProgressLog& log_;
    bool show_progress_;

    void print_presence(const Inventory& inventory, const PresenceReport& presence) const;
    ReconstructResult fail(ReconstructResult result, ErrorKind kind, const std::string& message) const;
};

} // namespace chunkvault

#endif // CHUNKVAULT_RECONSTRUCTOR_HPP
