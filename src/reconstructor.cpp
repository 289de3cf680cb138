#include "chunkvault/reconstructor.hpp"
#include "chunkvault/file_io.hpp"
#include "chunkvault/hasher.hpp"
#include "chunkvault/progress_log.hpp"
#include "chunkvault/timestamp.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <system_error>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace chunkvault {

namespace {

/**
 * Destination file that deletes itself unless kept
 */
class OutputFile {
public:
    explicit OutputFile(std::string path)
        : path_(std::move(path))
        , fd_(-1)
        , created_(false)
        , keep_(false) {
    }

    ~OutputFile() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        if (created_ && !keep_) {
            ::unlink(path_.c_str());
            std::cerr << "Removed incomplete file: " << path_ << std::endl;
        }
    }

    OutputFile(const OutputFile&) = delete;
    OutputFile& operator=(const OutputFile&) = delete;

    void open_exclusive() {
        fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
        if (fd_ < 0) {
            if (errno == EEXIST) {
                throw ChunkError(ErrorKind::OUTPUT_ALREADY_EXISTS, "Output file already exists: " + path_);
            }
            throw ChunkError(ErrorKind::STORAGE_WRITE_FAILURE,
                             "open failed for " + path_ + ": " + std::strerror(errno));
        }
        created_ = true;
    }

    void append(const std::vector<uint8_t>& data) {
        if (!write_all(fd_, data.data(), data.size())) {
            throw ChunkError(ErrorKind::STORAGE_WRITE_FAILURE,
                             "write failed for " + path_ + ": " + std::strerror(errno));
        }
    }

    void finish() {
        if (::fsync(fd_) != 0) {
            throw ChunkError(ErrorKind::STORAGE_WRITE_FAILURE,
                             "fsync failed for " + path_ + ": " + std::strerror(errno));
        }
        int rc = ::close(fd_);
        fd_ = -1;
        if (rc != 0) {
            throw ChunkError(ErrorKind::STORAGE_WRITE_FAILURE,
                             "close failed for " + path_ + ": " + std::strerror(errno));
        }
    }

    void keep() { keep_ = true; }

private:
    std::string path_;
    int fd_;
    bool created_;
    bool keep_;
};

std::string format_bytes(uint64_t value) {
    std::string digits = std::to_string(value);
    std::string out;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0) {
            out.push_back(',');
        }
        out.push_back(*it);
        count++;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

} // namespace

// ==================== Options / results ====================

ReconstructOptions::ReconstructOptions()
    : validate(true) {
}

ReconstructResult::ReconstructResult()
    : success(false)
    , error_kind(ErrorKind::NONE)
    , bytes_written(0) {
}

// ==================== Presence check ====================

std::string default_chunks_dir(const std::string& inventory_path) {
    fs::path parent = fs::path(inventory_path).parent_path();
    return parent.empty() ? std::string(".") : parent.string();
}

PresenceReport check_chunk_presence(const Inventory& inventory, const std::string& chunks_dir) {
    PresenceReport report;

    for (const auto& [index, record] : inventory.chunks) {
        if (record.status != ChunkStatus::COMPLETED) {
            continue;
        }

        fs::path chunk_path = fs::path(chunks_dir) / record.chunk_id;
        std::error_code ec;
        if (!fs::is_regular_file(chunk_path, ec)) {
            report.missing.push_back(record.chunk_id);
            continue;
        }

        if (record.actual_size) {
            uint64_t on_disk = fs::file_size(chunk_path, ec);
            if (ec || on_disk != *record.actual_size) {
                report.size_mismatches.push_back(
                    record.chunk_id + " (size mismatch: expected " + std::to_string(*record.actual_size) +
                    ", got " + (ec ? std::string("unreadable") : std::to_string(on_disk)) + ")");
                continue;
            }
        }

        report.found.push_back(record.chunk_id);
    }

    return report;
}

// ==================== ChunkReconstructor ====================

ChunkReconstructor::ChunkReconstructor(ProgressLog& log, bool show_progress)
    : log_(log)
    , show_progress_(show_progress) {
}

ReconstructResult ChunkReconstructor::reconstruct(const ReconstructOptions& options) {
    ReconstructResult result;
    InventoryStore store(log_);

    log_.sequence("RECONSTRUCT", "START", "Inventory: " + options.inventory_path);

    Inventory inventory;
    try {
        inventory = store.load(options.inventory_path);
    } catch (const ChunkError& e) {
        return fail(result, e.kind(), std::string("Failed to load inventory: ") + e.what());
    }

    const std::string chunks_dir = options.chunks_dir.value_or(default_chunks_dir(options.inventory_path));
    fs::path output_dir = options.output_dir ? fs::path(*options.output_dir) : fs::current_path();
    result.output_path = (output_dir / inventory.original_filename).string();

    // A partially chunked inventory would only ever yield a truncated file
    std::vector<uint64_t> pending = inventory.pending_indices();
    if (!pending.empty() || inventory.chunks.size() != inventory.total_chunks) {
        return fail(result, ErrorKind::INCOMPLETE_INVENTORY,
                    "Inventory is incomplete: " + std::to_string(inventory.completed_count()) + " of " +
                    std::to_string(inventory.total_chunks) + " chunks completed; finish chunking first");
    }

    if (show_progress_) {
        std::cout << "\nValidating chunk files..." << std::endl;
    }
    PresenceReport presence = check_chunk_presence(inventory, chunks_dir);
    print_presence(inventory, presence);

    if (!presence.ok()) {
        result.problems = presence.missing;
        result.problems.insert(result.problems.end(),
                               presence.size_mismatches.begin(), presence.size_mismatches.end());
        ErrorKind kind = presence.missing.empty() ? ErrorKind::CHUNK_SIZE_MISMATCH : ErrorKind::CHUNK_FILE_MISSING;
        return fail(result, kind,
                    "Cannot proceed with reconstruction: " + std::to_string(result.problems.size()) +
                    " chunks missing or incomplete");
    }

    std::error_code ec;
    if (fs::exists(result.output_path, ec)) {
        return fail(result, ErrorKind::OUTPUT_ALREADY_EXISTS, "Output file already exists: " + result.output_path);
    }

    if (show_progress_) {
        std::cout << "\nReconstructing file: " << result.output_path << std::endl;
        std::cout << "Using inventory: " << options.inventory_path << std::endl;
        std::cout << "Expected file size: " << format_bytes(inventory.original_size) << " bytes" << std::endl;
        std::cout << "Total chunks: " << inventory.total_chunks << std::endl;
        std::cout << "Hash type: " << hash_algorithm_name(inventory.hash_algorithm) << std::endl;
        std::cout << "Validation: " << (options.validate ? "enabled" : "disabled") << std::endl;
    }

    try {
        fs::create_directories(output_dir, ec);
        if (ec) {
            throw ChunkError(ErrorKind::STORAGE_WRITE_FAILURE,
                             "Cannot create output directory " + output_dir.string() + ": " + ec.message());
        }

        OutputFile output(result.output_path);
        output.open_exclusive();

        std::unique_ptr<Hasher> file_hasher;
        if (options.validate) {
            file_hasher = make_hasher(inventory.hash_algorithm);
        }

        for (uint64_t index : inventory.completed_indices()) {
            Clock::time_point chunk_start = Clock::now();
            const ChunkRecord& record = inventory.chunks.at(index);
            const std::string chunk_path = (fs::path(chunks_dir) / record.chunk_id).string();

            if (show_progress_) {
                double progress = static_cast<double>(index) / inventory.total_chunks * 100.0;
                std::cout << "\rProcessing chunk " << index << "/" << inventory.total_chunks
                          << " (" << std::fixed << std::setprecision(1) << progress << "%) - "
                          << record.chunk_id << std::flush;
            }

            std::vector<uint8_t> data = read_whole_file(chunk_path);

            if (options.validate) {
                if (!record.hash) {
                    log_.error("No hash recorded for " + record.chunk_id + ", skipping chunk validation");
                } else {
                    std::string chunk_hash = hash_bytes(inventory.hash_algorithm, data);
                    if (chunk_hash != *record.hash) {
                        throw ChunkError(ErrorKind::CHUNK_HASH_MISMATCH,
                                         "Chunk hash mismatch for " + record.chunk_id +
                                         ":\nExpected: " + *record.hash + "\nGot: " + chunk_hash);
                    }
                }
            }

            output.append(data);
            result.bytes_written += data.size();
            if (file_hasher) {
                file_hasher->update(data);
            }

            ChunkEvent event;
            event.chunk_id = record.chunk_id;
            event.status = "assembled";
            event.start_time = chunk_start;
            event.end_time = Clock::now();
            event.size = data.size();
            event.hash = record.hash.value_or("");
            event.output_path = result.output_path;
            event.offset = record.offset;
            log_.chunk_operation(event);
        }

        output.finish();

        if (show_progress_) {
            std::cout << "\n\nReconstruction complete!" << std::endl;
            std::cout << "Written to: " << result.output_path << std::endl;
            std::cout << "Final size: " << format_bytes(result.bytes_written) << " bytes" << std::endl;
        }

        if (result.bytes_written != inventory.original_size) {
            throw ChunkError(ErrorKind::FINAL_SIZE_MISMATCH,
                             "File size mismatch:\nExpected: " + format_bytes(inventory.original_size) +
                             " bytes\nGot:      " + format_bytes(result.bytes_written) + " bytes");
        }

        if (file_hasher) {
            std::string final_hash = file_hasher->finalize();
            if (final_hash != inventory.original_hash) {
                throw ChunkError(ErrorKind::FINAL_HASH_MISMATCH,
                                 "File hash mismatch:\nExpected: " + inventory.original_hash +
                                 "\nGot:      " + final_hash);
            }
            if (show_progress_) {
                std::cout << "Hash verification: PASSED" << std::endl;
            }
        }

        output.keep();
    } catch (const ChunkError& e) {
        return fail(result, e.kind(), e.what());
    }

    result.success = true;
    log_.sequence("RECONSTRUCT", "COMPLETE",
                  result.output_path + " (" + std::to_string(result.bytes_written) + " bytes)");
    return result;
}

void ChunkReconstructor::print_presence(const Inventory& inventory, const PresenceReport& presence) const {
    if (!show_progress_) {
        return;
    }

    std::cout << "\nChunk Files Status:" << std::endl;
    std::cout << "Total chunks required: " << inventory.total_chunks << std::endl;
    std::cout << "Completed chunks: " << inventory.completed_count() << std::endl;
    std::cout << "Chunks found: " << presence.found.size() << std::endl;
    std::cout << "Chunks missing: " << presence.missing.size() + presence.size_mismatches.size() << std::endl;

    if (!presence.ok()) {
        std::cout << "\nMissing chunks:" << std::endl;
        for (const auto& chunk : presence.missing) {
            std::cout << "  - " << chunk << std::endl;
        }
        for (const auto& chunk : presence.size_mismatches) {
            std::cout << "  - " << chunk << std::endl;
        }
    }
}

ReconstructResult ChunkReconstructor::fail(ReconstructResult result, ErrorKind kind,
                                           const std::string& message) const {
    result.success = false;
    result.error_kind = kind;
    result.error = message;
    log_.error(message);
    for (const auto& problem : result.problems) {
        log_.error("  - " + problem);
    }
    return result;
}

} // namespace chunkvault
