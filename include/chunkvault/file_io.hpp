#ifndef CHUNKVAULT_FILE_IO_HPP
#define CHUNKVAULT_FILE_IO_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace chunkvault {

/**
 * Write a buffer to target through "<target><temp_suffix>" and rename it into place
 * Readers of target see either the previous content or the new one, never a mix.
 * The temporary file is removed on failure.
 * @param sync fsync the temporary file before the rename
 * @throws ChunkError(STORAGE_WRITE_FAILURE)
 */
void write_file_atomically(const std::string& target,
                           const uint8_t* data,
                           size_t size,
                           const std::string& temp_suffix,
                           bool sync);

/**
 * Write all bytes to an open descriptor, retrying on EINTR and short writes
 * @return false on error (errno is preserved)
 */
bool write_all(int fd, const uint8_t* data, size_t size);

/**
 * Read a whole file into memory
 * @throws ChunkError(INPUT_NOT_FOUND) if the file cannot be opened,
 *         ChunkError(INPUT_NOT_READABLE) on a read error
 */
std::vector<uint8_t> read_whole_file(const std::string& path);

} // namespace chunkvault

#endif // CHUNKVAULT_FILE_IO_HPP
