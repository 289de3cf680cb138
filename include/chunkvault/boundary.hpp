#ifndef CHUNKVAULT_BOUNDARY_HPP
#define CHUNKVAULT_BOUNDARY_HPP

#include <cstdint>
#include <string>

namespace chunkvault {

/**
 * Half-open byte range [start, end) of one chunk in the source file
 */
struct ChunkRange {
    uint64_t start;
    uint64_t end;

    ChunkRange();
    ChunkRange(uint64_t start, uint64_t end);

    uint64_t size() const { return end - start; }
};

/**
 * Number of chunks needed to cover file_size bytes: ceil(file_size / chunk_size)
 * A file that is an exact multiple of chunk_size gets no trailing empty chunk.
 * @throws std::invalid_argument if chunk_size is zero
 */
uint64_t total_chunks(uint64_t file_size, uint64_t chunk_size);

/**
 * Byte range covered by a chunk
 * @param file_size Size of the source file
 * @param chunk_size Fixed chunk size
 * @param chunk_index 1-based chunk index
 * @throws ChunkError(CHUNK_INDEX_OUT_OF_RANGE) if the chunk starts at or beyond file_size
 */
ChunkRange chunk_boundaries(uint64_t file_size, uint64_t chunk_size, int64_t chunk_index);

/**
 * Chunk file name: "<stem>.chunk<NNN>.bin", index padded to at least 3 digits
 */
std::string make_chunk_id(const std::string& base_stem, uint64_t chunk_index);

} // namespace chunkvault

#endif // CHUNKVAULT_BOUNDARY_HPP
