#include "chunkvault/hasher.hpp"
#include "chunkvault/errors.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <openssl/evp.h>
#include <xxhash.h>

namespace fs = std::filesystem;

namespace chunkvault {

namespace {

std::string to_hex(const unsigned char* bytes, size_t length) {
    std::ostringstream ss;
    for (size_t i = 0; i < length; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
    }
    return ss.str();
}

class XxHash64Hasher : public Hasher {
public:
    XxHash64Hasher()
        : state_(XXH64_createState())
        , finalized_(false) {
        if (!state_) {
            throw std::runtime_error("Failed to allocate XXH64 state");
        }
        XXH64_reset(state_, 0);
    }

    ~XxHash64Hasher() override {
        XXH64_freeState(state_);
    }

    XxHash64Hasher(const XxHash64Hasher&) = delete;
    XxHash64Hasher& operator=(const XxHash64Hasher&) = delete;

    void update(const uint8_t* data, size_t size) override {
        if (finalized_) {
            throw std::logic_error("xxhash64 hasher already finalized");
        }
        XXH64_update(state_, data, size);
    }

    std::string finalize() override {
        if (finalized_) {
            throw std::logic_error("xxhash64 hasher already finalized");
        }
        finalized_ = true;

        XXH64_canonical_t canonical;
        XXH64_canonicalFromHash(&canonical, XXH64_digest(state_));
        return to_hex(canonical.digest, sizeof(canonical.digest));
    }

    HashAlgorithm algorithm() const override { return HashAlgorithm::XXHASH64; }

private:
    XXH64_state_t* state_;
    bool finalized_;
};

class EvpHasher : public Hasher {
public:
    explicit EvpHasher(HashAlgorithm algorithm)
        : algorithm_(algorithm)
        , ctx_(EVP_MD_CTX_new())
        , finalized_(false) {
        if (!ctx_) {
            throw std::runtime_error("Failed to create EVP_MD_CTX");
        }

        const EVP_MD* md = algorithm == HashAlgorithm::MD5 ? EVP_md5() : EVP_sha256();
        if (EVP_DigestInit_ex(ctx_, md, nullptr) != 1) {
            EVP_MD_CTX_free(ctx_);
            throw std::runtime_error("Failed to initialize digest");
        }
    }

    ~EvpHasher() override {
        EVP_MD_CTX_free(ctx_);
    }

    EvpHasher(const EvpHasher&) = delete;
    EvpHasher& operator=(const EvpHasher&) = delete;

    void update(const uint8_t* data, size_t size) override {
        if (finalized_) {
            throw std::logic_error("digest already finalized");
        }
        if (EVP_DigestUpdate(ctx_, data, size) != 1) {
            throw std::runtime_error("Failed to update digest");
        }
    }

    std::string finalize() override {
        if (finalized_) {
            throw std::logic_error("digest already finalized");
        }
        finalized_ = true;

        unsigned char md[EVP_MAX_MD_SIZE];
        unsigned int md_len = 0;
        if (EVP_DigestFinal_ex(ctx_, md, &md_len) != 1) {
            throw std::runtime_error("Failed to finalize digest");
        }
        return to_hex(md, md_len);
    }

    HashAlgorithm algorithm() const override { return algorithm_; }

private:
    HashAlgorithm algorithm_;
    EVP_MD_CTX* ctx_;
    bool finalized_;
};

bool xxhash_available() {
    XXH64_state_t* probe = XXH64_createState();
    if (!probe) {
        return false;
    }
    XXH64_freeState(probe);
    return true;
}

HashAlgorithm select_process_algorithm() {
    HashAlgorithm preferred = HashAlgorithm::XXHASH64;

    const char* requested = std::getenv("CHUNKVAULT_HASH");
    if (requested != nullptr && *requested != '\0') {
        auto parsed = parse_hash_algorithm(requested);
        if (parsed.has_value()) {
            preferred = *parsed;
        } else {
            std::cerr << "Warning: unknown CHUNKVAULT_HASH '" << requested
                      << "', using default" << std::endl;
        }
    }

    if (preferred == HashAlgorithm::XXHASH64 && !xxhash_available()) {
        std::cerr << "Warning: xxhash64 unavailable, falling back to sha256" << std::endl;
        return HashAlgorithm::SHA256;
    }
    return preferred;
}

} // namespace

// ==================== Algorithm names ====================

const char* hash_algorithm_name(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::XXHASH64: return "xxhash64";
        case HashAlgorithm::SHA256: return "sha256";
        case HashAlgorithm::MD5: return "md5";
    }
    return "unknown";
}

std::optional<HashAlgorithm> parse_hash_algorithm(const std::string& name) {
    if (name == "xxhash64" || name == "xxh64") return HashAlgorithm::XXHASH64;
    if (name == "sha256") return HashAlgorithm::SHA256;
    if (name == "md5") return HashAlgorithm::MD5;
    return std::nullopt;
}

// ==================== Hashers ====================

std::unique_ptr<Hasher> make_hasher(HashAlgorithm algorithm) {
    if (algorithm == HashAlgorithm::XXHASH64) {
        return std::make_unique<XxHash64Hasher>();
    }
    return std::make_unique<EvpHasher>(algorithm);
}

HashAlgorithm process_hash_algorithm() {
    static const HashAlgorithm selected = select_process_algorithm();
    return selected;
}

std::string hash_bytes(HashAlgorithm algorithm, const uint8_t* data, size_t size) {
    auto hasher = make_hasher(algorithm);
    hasher->update(data, size);
    return hasher->finalize();
}

std::string hash_bytes(HashAlgorithm algorithm, const std::vector<uint8_t>& data) {
    return hash_bytes(algorithm, data.data(), data.size());
}

// ==================== File hashing ====================

FileDigest::FileDigest()
    : size(0) {
}

FileDigest hash_file(const std::string& path, HashAlgorithm algorithm, size_t buffer_size) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        std::error_code ec;
        if (fs::exists(path, ec)) {
            throw ChunkError(ErrorKind::INPUT_NOT_READABLE, "Cannot open file for hashing: " + path);
        }
        throw ChunkError(ErrorKind::INPUT_NOT_FOUND, "File not found for hashing: " + path);
    }

    auto hasher = make_hasher(algorithm);
    std::vector<uint8_t> buffer(buffer_size > 0 ? buffer_size : DEFAULT_HASH_BUFFER_SIZE);

    FileDigest digest;
    while (file) {
        file.read(reinterpret_cast<char*>(buffer.data()), buffer.size());
        std::streamsize bytes_read = file.gcount();
        if (bytes_read > 0) {
            hasher->update(buffer.data(), static_cast<size_t>(bytes_read));
            digest.size += static_cast<uint64_t>(bytes_read);
        }
    }

    if (file.bad()) {
        throw ChunkError(ErrorKind::INPUT_NOT_READABLE, "Error calculating file hash: " + path);
    }

    digest.hash = hasher->finalize();
    return digest;
}

} // namespace chunkvault
