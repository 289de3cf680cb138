#ifndef CHUNKVAULT_ERRORS_HPP
#define CHUNKVAULT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace chunkvault {

/**
 * Failure categories reported by chunking, inventory and reconstruction
 */
enum class ErrorKind {
    NONE,
    INPUT_NOT_FOUND,
    INPUT_NOT_READABLE,
    INVENTORY_LOAD_ERROR,     // Unreadable, unparsable or missing required fields
    INVENTORY_MISMATCH,       // Inventory does not describe this source / chunk size
    INCOMPLETE_INVENTORY,     // Some chunk records are still pending
    CHUNK_INDEX_OUT_OF_RANGE,
    CHUNK_FILE_MISSING,
    CHUNK_SIZE_MISMATCH,
    CHUNK_HASH_MISMATCH,
    OUTPUT_ALREADY_EXISTS,
    FINAL_SIZE_MISMATCH,
    FINAL_HASH_MISMATCH,
    STORAGE_WRITE_FAILURE
};

/**
 * Stable identifier for an error kind (used in CLI output and logs)
 */
const char* error_kind_name(ErrorKind kind);

/**
 * Exception carrying an ErrorKind alongside the human-readable message
 */
class ChunkError : public std::runtime_error {
public:
    ChunkError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_ERRORS_HPP
