#include "chunkvault/chunk_writer.hpp"
#include "chunkvault/errors.hpp"
#include "chunkvault/file_io.hpp"
#include "chunkvault/hasher.hpp"
#include "chunkvault/progress_log.hpp"
#include "chunkvault/timestamp.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace chunkvault {

ChunkWriter::ChunkWriter(ProgressLog& log, const ChunkConfig& config)
    : log_(log)
    , config_(config)
    , store_(log, config.sync_writes) {
}

Inventory ChunkWriter::write_chunks(const std::string& input_path,
                                    const std::string& output_dir,
                                    const std::string& inventory_path) {
    return write_chunks(input_path, output_dir, inventory_path, config_.chunk_size);
}

Inventory ChunkWriter::write_chunks(const std::string& input_path,
                                    const std::string& output_dir,
                                    const std::string& inventory_path,
                                    uint64_t chunk_size,
                                    std::optional<int64_t> target_index) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk size must be greater than zero");
    }

    std::error_code ec;
    if (!fs::is_regular_file(input_path, ec)) {
        throw ChunkError(ErrorKind::INPUT_NOT_FOUND, "Input file not found: " + input_path);
    }

    std::optional<Inventory> existing = store_.try_load(inventory_path);
    SourceInfo source = describe_source(input_path, existing);

    Inventory inventory;
    if (existing) {
        check_resumable(*existing, source, chunk_size, inventory_path);
        inventory = *existing;
        inventory.chunk_status = inventory.computed_summary();
        log_.sequence("INVENTORY", "RESUMED",
                      std::to_string(inventory.completed_count()) + "/" +
                      std::to_string(inventory.total_chunks) + " chunks already completed");
    } else {
        log_.info("Creating new inventory: " + inventory_path);
        inventory = store_.create(source, chunk_size, inventory_path);
        store_.persist(inventory, inventory_path);
        log_.sequence("INVENTORY", "CREATED",
                      inventory_path + " (" + std::to_string(inventory.total_chunks) + " chunks)");
    }

    const uint64_t total = inventory.total_chunks;
    std::vector<uint64_t> to_process;
    if (target_index.has_value()) {
        if (*target_index < 1 || static_cast<uint64_t>(*target_index) > total) {
            throw ChunkError(ErrorKind::CHUNK_INDEX_OUT_OF_RANGE,
                             "Chunk number must be between 1 and " + std::to_string(total) +
                             ", got " + std::to_string(*target_index));
        }
        to_process.push_back(static_cast<uint64_t>(*target_index));
        log_.info("Processing single chunk " + std::to_string(*target_index) + "/" + std::to_string(total));
    } else {
        to_process = inventory.pending_indices();
    }

    log_.sequence("CHUNKING", "START", "Processing " + std::to_string(to_process.size()) + " chunks");

    if (!to_process.empty()) {
        fs::create_directories(output_dir, ec);
        if (ec) {
            throw ChunkError(ErrorKind::STORAGE_WRITE_FAILURE,
                             "Cannot create output directory " + output_dir + ": " + ec.message());
        }

        // Held for the whole run, closed on every exit path
        std::ifstream input(input_path, std::ios::binary);
        if (!input) {
            throw ChunkError(ErrorKind::INPUT_NOT_READABLE, "Input file is not readable: " + input_path);
        }

        std::vector<uint8_t> buffer;
        for (uint64_t index : to_process) {
            Clock::time_point chunk_start = Clock::now();
            const ChunkRecord record = inventory.chunks.at(index);
            const std::string output_path = (fs::path(output_dir) / record.chunk_id).string();

            print_progress(index, total, record.chunk_id, target_index.has_value());

            try {
                buffer.resize(static_cast<size_t>(record.expected_size));
                input.seekg(static_cast<std::streamoff>(record.offset), std::ios::beg);
                input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
                if (static_cast<uint64_t>(input.gcount()) != record.expected_size) {
                    throw ChunkError(ErrorKind::INPUT_NOT_READABLE,
                                     "Short read for " + record.chunk_id + ": expected " +
                                     std::to_string(record.expected_size) + " bytes, got " +
                                     std::to_string(input.gcount()));
                }

                write_file_atomically(output_path, buffer.data(), buffer.size(), ".part", config_.sync_writes);
                std::string chunk_hash = hash_bytes(inventory.hash_algorithm, buffer);

                Clock::time_point chunk_end = Clock::now();
                inventory = store_.record_chunk_completion(inventory, index, buffer.size(), chunk_hash,
                                                           seconds_between(chunk_start, chunk_end));
                store_.persist(inventory, inventory_path);

                ChunkEvent event;
                event.chunk_id = record.chunk_id;
                event.status = "completed";
                event.start_time = chunk_start;
                event.end_time = chunk_end;
                event.size = buffer.size();
                event.hash = chunk_hash;
                event.output_path = output_path;
                event.offset = record.offset;
                log_.chunk_operation(event);
            } catch (const ChunkError& e) {
                log_.error("Chunk " + record.chunk_id + " failed: " + e.what());
                if (config_.show_progress) {
                    std::cout << std::endl;
                }
                throw;
            }
        }
    }

    ChunkStatusSummary summary = inventory.computed_summary();
    log_.sequence("CHUNKING", "COMPLETE",
                  "Processed " + std::to_string(summary.total_processed) + "/" + std::to_string(total) +
                  ", remaining " + std::to_string(summary.chunks_remaining));

    if (config_.show_progress) {
        std::cout << "\n\nChunking Status:" << std::endl;
        std::cout << "Processed: " << summary.total_processed << "/" << total << std::endl;
        std::cout << "Remaining: " << summary.chunks_remaining << std::endl;
    }

    return inventory;
}

SourceInfo ChunkWriter::describe_source(const std::string& input_path,
                                        const std::optional<Inventory>& existing) {
    SourceInfo source;
    source.path = input_path;
    // A resumed run must hash with the algorithm the inventory recorded
    source.algorithm = existing ? existing->hash_algorithm : process_hash_algorithm();
    const std::string algorithm_name = hash_algorithm_name(source.algorithm);

    if (existing && config_.trust_recorded_hash) {
        std::error_code ec;
        uint64_t on_disk = fs::file_size(input_path, ec);
        if (!ec && on_disk == existing->original_size) {
            source.size = existing->original_size;
            source.hash = existing->original_hash;
            log_.sequence("HASH", "SKIPPED", "Reusing recorded " + algorithm_name + " hash");
            return source;
        }
    }

    log_.sequence("HASH", "START", "Calculating file " + algorithm_name + " hash...");
    FileDigest digest = hash_file(input_path, source.algorithm, config_.hash_buffer_size);
    log_.sequence("HASH", "COMPLETE", "Hash: " + digest.hash.substr(0, 16) + "...");

    source.size = digest.size;
    source.hash = digest.hash;
    return source;
}

void ChunkWriter::check_resumable(const Inventory& existing,
                                  const SourceInfo& source,
                                  uint64_t chunk_size,
                                  const std::string& inventory_path) const {
    if (existing.original_size != source.size || existing.original_hash != source.hash) {
        throw ChunkError(ErrorKind::INVENTORY_MISMATCH,
                         "Inventory " + inventory_path + " describes a different file (" +
                         std::to_string(existing.original_size) + " bytes, hash " + existing.original_hash +
                         "); source is " + std::to_string(source.size) + " bytes, hash " + source.hash);
    }

    if (existing.chunk_size != chunk_size) {
        throw ChunkError(ErrorKind::INVENTORY_MISMATCH,
                         "Inventory " + inventory_path + " was created with chunk size " +
                         std::to_string(existing.chunk_size) + ", requested " + std::to_string(chunk_size) +
                         "; remove the inventory to start over");
    }

    Inventory recomputed = existing;
    recomputed.chunk_status = recomputed.computed_summary();
    std::vector<std::string> issues = store_.verify_integrity(recomputed);
    if (!issues.empty()) {
        std::string message = "Inventory " + inventory_path + " cannot be resumed:";
        for (const auto& issue : issues) {
            message += "\n  - " + issue;
        }
        throw ChunkError(ErrorKind::INVENTORY_LOAD_ERROR, message);
    }
}

void ChunkWriter::print_progress(uint64_t index, uint64_t total, const std::string& chunk_id, bool single) const {
    if (!config_.show_progress) {
        return;
    }

    double progress = single || total == 0 ? 100.0 : static_cast<double>(index) / total * 100.0;
    std::cout << "\rProcessing chunk " << index << "/" << total
              << " (" << std::fixed << std::setprecision(1) << progress << "%) - " << chunk_id
              << std::flush;
}

} // namespace chunkvault
