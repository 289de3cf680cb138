#include "chunkvault/boundary.hpp"
#include "chunkvault/errors.hpp"
#include <algorithm>
#include <stdexcept>

namespace chunkvault {

ChunkRange::ChunkRange()
    : start(0)
    , end(0) {
}

ChunkRange::ChunkRange(uint64_t start, uint64_t end)
    : start(start)
    , end(end) {
}

uint64_t total_chunks(uint64_t file_size, uint64_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk size must be greater than zero");
    }
    return file_size / chunk_size + (file_size % chunk_size != 0 ? 1 : 0);
}

ChunkRange chunk_boundaries(uint64_t file_size, uint64_t chunk_size, int64_t chunk_index) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk size must be greater than zero");
    }

    // Index 0 and negatives would wrap around below
    if (chunk_index < 1 ||
        static_cast<uint64_t>(chunk_index - 1) >= total_chunks(file_size, chunk_size)) {
        throw ChunkError(ErrorKind::CHUNK_INDEX_OUT_OF_RANGE,
                         "Chunk number " + std::to_string(chunk_index) + " is beyond file size");
    }

    uint64_t start = static_cast<uint64_t>(chunk_index - 1) * chunk_size;
    uint64_t end = std::min(start + chunk_size, file_size);
    return ChunkRange(start, end);
}

std::string make_chunk_id(const std::string& base_stem, uint64_t chunk_index) {
    std::string number = std::to_string(chunk_index);
    if (number.length() < 3) {
        number = std::string(3 - number.length(), '0') + number;
    }
    return base_stem + ".chunk" + number + ".bin";
}

} // namespace chunkvault
