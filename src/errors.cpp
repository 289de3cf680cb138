#include "chunkvault/errors.hpp"

namespace chunkvault {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "none";
        case ErrorKind::INPUT_NOT_FOUND: return "input-not-found";
        case ErrorKind::INPUT_NOT_READABLE: return "input-not-readable";
        case ErrorKind::INVENTORY_LOAD_ERROR: return "inventory-load-error";
        case ErrorKind::INVENTORY_MISMATCH: return "inventory-mismatch";
        case ErrorKind::INCOMPLETE_INVENTORY: return "incomplete-inventory";
        case ErrorKind::CHUNK_INDEX_OUT_OF_RANGE: return "chunk-index-out-of-range";
        case ErrorKind::CHUNK_FILE_MISSING: return "chunk-file-missing";
        case ErrorKind::CHUNK_SIZE_MISMATCH: return "chunk-size-mismatch";
        case ErrorKind::CHUNK_HASH_MISMATCH: return "chunk-hash-mismatch";
        case ErrorKind::OUTPUT_ALREADY_EXISTS: return "output-already-exists";
        case ErrorKind::FINAL_SIZE_MISMATCH: return "final-size-mismatch";
        case ErrorKind::FINAL_HASH_MISMATCH: return "final-hash-mismatch";
        case ErrorKind::STORAGE_WRITE_FAILURE: return "storage-write-failure";
    }
    return "unknown";
}

ChunkError::ChunkError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message)
    , kind_(kind) {
}

} // namespace chunkvault
