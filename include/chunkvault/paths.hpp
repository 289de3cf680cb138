#ifndef CHUNKVAULT_PATHS_HPP
#define CHUNKVAULT_PATHS_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace chunkvault {

/**
 * Where a chunking run puts its chunks, log and inventory
 */
struct RunPaths {
    std::string output_dir;
    std::string log_path;
    std::string inventory_path;
};

/**
 * Defaults are the input file's directory, "<stem>.log" and "<stem>.json"
 */
RunPaths resolve_paths(const std::string& input_file,
                       const std::optional<std::string>& output_dir = std::nullopt,
                       const std::optional<std::string>& log_dir = std::nullopt,
                       const std::optional<std::string>& inventory_dir = std::nullopt);

/**
 * @throws ChunkError(INPUT_NOT_FOUND) if missing or not a regular file,
 *         ChunkError(INPUT_NOT_READABLE) if it cannot be read
 */
void validate_input_file(const std::string& path);

struct DiskSpaceCheck {
    bool sufficient;
    uint64_t free_bytes;
    uint64_t required_bytes;
    std::string message;
};

/**
 * Free space in dir (created if needed) against the bytes a run will write
 */
DiskSpaceCheck check_disk_space(uint64_t required_bytes, const std::string& dir);

/**
 * Most recently modified *.json next to a chunk file
 * @throws ChunkError(INVENTORY_LOAD_ERROR) if the directory has none
 */
std::string find_inventory(const std::string& chunk_path);

} // namespace chunkvault

#endif // CHUNKVAULT_PATHS_HPP
