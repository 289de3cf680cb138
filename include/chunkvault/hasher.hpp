#ifndef CHUNKVAULT_HASHER_HPP
#define CHUNKVAULT_HASHER_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chunkvault {

/**
 * Digest algorithms understood by inventories
 * XXHASH64 is preferred (fast, non-cryptographic); SHA256 is the fallback.
 * MD5 is accepted for inventories written by older tools.
 */
enum class HashAlgorithm {
    XXHASH64,
    SHA256,
    MD5
};

constexpr size_t DEFAULT_HASH_BUFFER_SIZE = 16 * 1024 * 1024;  // 16MB

/**
 * Identifier recorded in the inventory ("xxhash64", "sha256", "md5")
 */
const char* hash_algorithm_name(HashAlgorithm algorithm);

/**
 * Parse an inventory identifier, nullopt if unknown
 */
std::optional<HashAlgorithm> parse_hash_algorithm(const std::string& name);

/**
 * Streaming digest
 * update() may be called with any split of the input; finalize() is valid once.
 */
class Hasher {
public:
    virtual ~Hasher() = default;

    virtual void update(const uint8_t* data, size_t size) = 0;

    void update(const std::vector<uint8_t>& data) {
        update(data.data(), data.size());
    }

    /**
     * Lowercase hex digest in canonical byte order
     * @throws std::logic_error when called a second time
     */
    virtual std::string finalize() = 0;

    virtual HashAlgorithm algorithm() const = 0;
};

/**
 * Fresh hasher for the given algorithm
 */
std::unique_ptr<Hasher> make_hasher(HashAlgorithm algorithm);

/**
 * Algorithm used for new inventories in this process
 * Selected once on first call: xxhash64 unless its state cannot be created,
 * then sha256. CHUNKVAULT_HASH may name a preferred algorithm.
 */
HashAlgorithm process_hash_algorithm();

/**
 * One-shot digest of an in-memory buffer
 */
std::string hash_bytes(HashAlgorithm algorithm, const uint8_t* data, size_t size);
std::string hash_bytes(HashAlgorithm algorithm, const std::vector<uint8_t>& data);

/**
 * Whole-file digest plus the number of bytes hashed
 */
struct FileDigest {
    std::string hash;
    uint64_t size;

    FileDigest();
};

/**
 * Stream a file through a hasher using fixed-size reads
 * @throws ChunkError(INPUT_NOT_FOUND / INPUT_NOT_READABLE)
 */
FileDigest hash_file(const std::string& path,
                     HashAlgorithm algorithm,
                     size_t buffer_size = DEFAULT_HASH_BUFFER_SIZE);

} // namespace chunkvault

#endif // CHUNKVAULT_HASHER_HPP
