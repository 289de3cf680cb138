#include "chunkvault/inventory.hpp"
#include "chunkvault/boundary.hpp"
#include "chunkvault/errors.hpp"
#include "chunkvault/file_io.hpp"
#include "chunkvault/progress_log.hpp"
#include "chunkvault/timestamp.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::ordered_json;

namespace chunkvault {

namespace {

const char* const REQUIRED_FIELDS[] = {
    "original_filename",
    "original_size",
    "original_hash",
    "hash_type",
    "chunk_size",
    "total_chunks",
    "chunks"
};

const char* const REQUIRED_CHUNK_FIELDS[] = {
    "status",
    "chunk_id",
    "offset",
    "expected_size"
};

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string out;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) out += separator;
        out += parts[i];
    }
    return out;
}

std::optional<uint64_t> parse_index(const std::string& key) {
    if (key.empty() || key.size() > 19) {
        return std::nullopt;
    }
    for (char c : key) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }
    return std::stoull(key);
}

ChunkStatus parse_status(const std::string& value, const std::string& key) {
    if (value == "pending") return ChunkStatus::PENDING;
    if (value == "completed") return ChunkStatus::COMPLETED;
    throw ChunkError(ErrorKind::INVENTORY_LOAD_ERROR,
                     "Chunk " + key + " has unknown status '" + value + "'");
}

json record_to_json(const ChunkRecord& record) {
    json j;
    j["status"] = chunk_status_name(record.status);
    j["chunk_id"] = record.chunk_id;
    j["chunk_number"] = record.chunk_number;
    j["offset"] = record.offset;
    j["expected_size"] = record.expected_size;
    if (record.actual_size) j["size"] = *record.actual_size;
    if (record.hash) j["hash"] = *record.hash;
    if (record.processing_time) j["processing_time"] = *record.processing_time;
    if (record.completed_at) j["completed_at"] = *record.completed_at;
    return j;
}

ChunkRecord record_from_json(const json& j, uint64_t index, const std::string& key) {
    ChunkRecord record;
    record.status = parse_status(j.at("status").get<std::string>(), key);
    record.chunk_id = j.at("chunk_id").get<std::string>();
    record.chunk_number = j.contains("chunk_number") ? j.at("chunk_number").get<uint64_t>() : index;
    record.offset = j.at("offset").get<uint64_t>();
    record.expected_size = j.at("expected_size").get<uint64_t>();

    if (j.contains("size")) record.actual_size = j.at("size").get<uint64_t>();
    if (j.contains("hash")) record.hash = j.at("hash").get<std::string>();
    if (j.contains("processing_time")) record.processing_time = j.at("processing_time").get<double>();
    if (j.contains("completed_at")) record.completed_at = j.at("completed_at").get<std::string>();
    return record;
}

} // namespace

const char* chunk_status_name(ChunkStatus status) {
    return status == ChunkStatus::COMPLETED ? "completed" : "pending";
}

// ==================== ChunkRecord ====================

ChunkRecord::ChunkRecord()
    : status(ChunkStatus::PENDING)
    , chunk_number(0)
    , offset(0)
    , expected_size(0) {
}

// ==================== ChunkStatusSummary ====================

ChunkStatusSummary::ChunkStatusSummary()
    : total_processed(0)
    , chunks_remaining(0) {
}

ChunkStatusSummary::ChunkStatusSummary(uint64_t processed, uint64_t remaining)
    : total_processed(processed)
    , chunks_remaining(remaining) {
}

bool ChunkStatusSummary::operator==(const ChunkStatusSummary& other) const {
    return total_processed == other.total_processed && chunks_remaining == other.chunks_remaining;
}

// ==================== SourceInfo ====================

SourceInfo::SourceInfo()
    : size(0)
    , algorithm(HashAlgorithm::XXHASH64) {
}

// ==================== Inventory ====================

Inventory::Inventory()
    : original_size(0)
    , hash_algorithm(HashAlgorithm::XXHASH64)
    , chunk_size(0)
    , total_chunks(0)
    , inventory_type("progressive") {
}

ChunkStatusSummary Inventory::computed_summary() const {
    uint64_t processed = completed_count();
    uint64_t remaining = total_chunks > processed ? total_chunks - processed : 0;
    return ChunkStatusSummary(processed, remaining);
}

uint64_t Inventory::completed_count() const {
    return static_cast<uint64_t>(std::count_if(chunks.begin(), chunks.end(), [](const auto& entry) {
        return entry.second.status == ChunkStatus::COMPLETED;
    }));
}

std::vector<uint64_t> Inventory::pending_indices() const {
    std::vector<uint64_t> result;
    for (const auto& [index, record] : chunks) {
        if (record.status == ChunkStatus::PENDING) {
            result.push_back(index);
        }
    }
    return result;
}

std::vector<uint64_t> Inventory::completed_indices() const {
    std::vector<uint64_t> result;
    for (const auto& [index, record] : chunks) {
        if (record.status == ChunkStatus::COMPLETED) {
            result.push_back(index);
        }
    }
    return result;
}

bool Inventory::is_complete() const {
    return chunks.size() == total_chunks && completed_count() == total_chunks;
}

// ==================== JSON ====================

nlohmann::ordered_json inventory_to_json(const Inventory& inventory) {
    ChunkStatusSummary summary = inventory.computed_summary();

    json j;
    j["original_filename"] = inventory.original_filename;
    j["original_size"] = inventory.original_size;
    j["original_hash"] = inventory.original_hash;
    j["hash_type"] = hash_algorithm_name(inventory.hash_algorithm);
    j["chunk_size"] = inventory.chunk_size;
    j["total_chunks"] = inventory.total_chunks;
    j["inventory_type"] = inventory.inventory_type;
    j["creation_time"] = inventory.created_at;
    j["last_updated"] = inventory.last_updated;
    j["inventory_file"] = inventory.inventory_file;
    j["chunk_status"] = {
        {"total_processed", summary.total_processed},
        {"chunks_remaining", summary.chunks_remaining}
    };
    if (!inventory.merged_from.empty()) {
        j["merged_from"] = inventory.merged_from;
    }

    json chunks = json::object();
    for (const auto& [index, record] : inventory.chunks) {
        chunks[std::to_string(index)] = record_to_json(record);
    }
    j["chunks"] = std::move(chunks);
    return j;
}

Inventory inventory_from_json(const nlohmann::ordered_json& document) {
    if (!document.is_object()) {
        throw ChunkError(ErrorKind::INVENTORY_LOAD_ERROR, "Inventory root is not a JSON object");
    }

    std::vector<std::string> missing;
    for (const char* field : REQUIRED_FIELDS) {
        if (!document.contains(field)) {
            missing.emplace_back(field);
        }
    }

    if (document.contains("chunks")) {
        const json& chunks = document.at("chunks");
        if (!chunks.is_object()) {
            throw ChunkError(ErrorKind::INVENTORY_LOAD_ERROR, "Inventory field 'chunks' is not an object");
        }
        for (const auto& [key, value] : chunks.items()) {
            if (!value.is_object()) {
                throw ChunkError(ErrorKind::INVENTORY_LOAD_ERROR, "Chunk " + key + " is not an object");
            }
            for (const char* field : REQUIRED_CHUNK_FIELDS) {
                if (!value.contains(field)) {
                    missing.push_back("chunks." + key + "." + field);
                }
            }
        }
    }

    if (!missing.empty()) {
        throw ChunkError(ErrorKind::INVENTORY_LOAD_ERROR,
                         "Missing required fields in inventory: " + join(missing, ", "));
    }

    Inventory inventory;
    try {
        inventory.original_filename = document.at("original_filename").get<std::string>();
        inventory.original_size = document.at("original_size").get<uint64_t>();
        inventory.original_hash = document.at("original_hash").get<std::string>();
        inventory.chunk_size = document.at("chunk_size").get<uint64_t>();
        inventory.total_chunks = document.at("total_chunks").get<uint64_t>();

        const std::string hash_type = document.at("hash_type").get<std::string>();
        auto algorithm = parse_hash_algorithm(hash_type);
        if (!algorithm) {
            throw ChunkError(ErrorKind::INVENTORY_LOAD_ERROR, "Unsupported hash_type '" + hash_type + "'");
        }
        inventory.hash_algorithm = *algorithm;

        if (document.contains("inventory_type")) {
            inventory.inventory_type = document.at("inventory_type").get<std::string>();
        }
        if (document.contains("inventory_file")) {
            inventory.inventory_file = document.at("inventory_file").get<std::string>();
        }
        if (document.contains("creation_time")) {
            inventory.created_at = document.at("creation_time").get<std::string>();
        }
        if (document.contains("last_updated")) {
            inventory.last_updated = document.at("last_updated").get<std::string>();
        }
        if (document.contains("merged_from")) {
            inventory.merged_from = document.at("merged_from").get<std::vector<std::string>>();
        }

        if (document.contains("chunk_status")) {
            const json& status = document.at("chunk_status");
            if (status.contains("total_processed") && status.contains("chunks_remaining")) {
                inventory.chunk_status = ChunkStatusSummary(
                    status.at("total_processed").get<uint64_t>(),
                    status.at("chunks_remaining").get<uint64_t>());
            }
        }

        for (const auto& [key, value] : document.at("chunks").items()) {
            auto index = parse_index(key);
            if (!index) {
                throw ChunkError(ErrorKind::INVENTORY_LOAD_ERROR, "Invalid chunk index '" + key + "'");
            }
            inventory.chunks[*index] = record_from_json(value, *index, key);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ChunkError(ErrorKind::INVENTORY_LOAD_ERROR, std::string("Invalid inventory field: ") + e.what());
    }

    return inventory;
}

// ==================== InventoryStore ====================

InventoryStore::InventoryStore(ProgressLog& log, bool sync_writes)
    : log_(log)
    , sync_writes_(sync_writes) {
}

Inventory InventoryStore::create(const SourceInfo& source,
                                 uint64_t chunk_size,
                                 const std::string& inventory_path) const {
    Inventory inventory;
    fs::path source_path(source.path);
    std::string stem = source_path.stem().string();

    inventory.original_filename = source_path.filename().string();
    inventory.original_size = source.size;
    inventory.original_hash = source.hash;
    inventory.hash_algorithm = source.algorithm;
    inventory.chunk_size = chunk_size;
    inventory.total_chunks = total_chunks(source.size, chunk_size);
    inventory.inventory_file = fs::path(inventory_path).filename().string();
    inventory.created_at = iso_timestamp();
    inventory.last_updated = inventory.created_at;

    // Full topology up front, every chunk pending
    for (uint64_t index = 1; index <= inventory.total_chunks; index++) {
        ChunkRange range = chunk_boundaries(source.size, chunk_size, static_cast<int64_t>(index));

        ChunkRecord record;
        record.status = ChunkStatus::PENDING;
        record.chunk_id = make_chunk_id(stem, index);
        record.chunk_number = index;
        record.offset = range.start;
        record.expected_size = range.size();
        inventory.chunks[index] = record;
    }

    inventory.chunk_status = inventory.computed_summary();
    return inventory;
}

Inventory InventoryStore::load(const std::string& path) const {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        throw ChunkError(ErrorKind::INVENTORY_LOAD_ERROR, "Inventory file not found: " + path);
    }

    std::ifstream in(path);
    if (!in) {
        throw ChunkError(ErrorKind::INVENTORY_LOAD_ERROR, "Cannot open inventory: " + path);
    }

    json document;
    try {
        document = json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw ChunkError(ErrorKind::INVENTORY_LOAD_ERROR,
                         "Failed to parse inventory " + path + ": " + e.what());
    }

    return inventory_from_json(document);
}

std::optional<Inventory> InventoryStore::try_load(const std::string& path) const {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::nullopt;
    }

    try {
        Inventory inventory = load(path);
        log_.info("Loaded existing inventory: " + path);
        return inventory;
    } catch (const ChunkError& e) {
        log_.error(std::string("Error loading inventory: ") + e.what());
        return std::nullopt;
    }
}

Inventory InventoryStore::load_or_create(const std::string& path,
                                         const SourceInfo& source,
                                         uint64_t chunk_size) const {
    auto existing = try_load(path);
    if (existing) {
        return *existing;
    }

    log_.info("Creating new inventory: " + path);
    return create(source, chunk_size, path);
}

Inventory InventoryStore::record_chunk_completion(const Inventory& inventory,
                                                  uint64_t index,
                                                  uint64_t size,
                                                  const std::string& hash,
                                                  double processing_time) const {
    if (index < 1 || index > inventory.total_chunks) {
        throw std::out_of_range("Chunk index " + std::to_string(index) +
                                " outside 1.." + std::to_string(inventory.total_chunks));
    }

    auto it = inventory.chunks.find(index);
    if (it == inventory.chunks.end()) {
        throw std::out_of_range("Chunk index " + std::to_string(index) + " has no record");
    }

    Inventory updated = inventory;
    ChunkRecord& record = updated.chunks.at(index);
    record.status = ChunkStatus::COMPLETED;
    record.actual_size = size;
    record.hash = hash;
    record.processing_time = processing_time;
    record.completed_at = iso_timestamp();

    updated.chunk_status = updated.computed_summary();
    updated.last_updated = iso_timestamp();
    return updated;
}

void InventoryStore::persist(const Inventory& inventory, const std::string& path) const {
    std::string text = inventory_to_json(inventory).dump(2);
    text.push_back('\n');
    write_file_atomically(path,
                          reinterpret_cast<const uint8_t*>(text.data()),
                          text.size(),
                          ".tmp",
                          sync_writes_);
}

std::vector<std::string> InventoryStore::verify_integrity(const Inventory& inventory) const {
    std::vector<std::string> issues;

    if (inventory.chunk_size == 0) {
        issues.push_back("chunk_size is zero");
    } else {
        uint64_t expected_total = total_chunks(inventory.original_size, inventory.chunk_size);
        if (expected_total != inventory.total_chunks) {
            issues.push_back("total_chunks is " + std::to_string(inventory.total_chunks) +
                             " but original_size and chunk_size imply " + std::to_string(expected_total));
        }
    }

    // Indices must be exactly 1..total_chunks
    bool dense = inventory.chunks.size() == inventory.total_chunks &&
                 (inventory.chunks.empty() ||
                  (inventory.chunks.begin()->first == 1 &&
                   inventory.chunks.rbegin()->first == inventory.total_chunks));
    if (!dense) {
        issues.push_back("Chunk numbers are not sequential: expected 1.." +
                         std::to_string(inventory.total_chunks) + ", found " +
                         std::to_string(inventory.chunks.size()) + " records");
    }

    if (!inventory.chunk_status) {
        issues.push_back("Missing chunk status summary");
    } else {
        ChunkStatusSummary computed = inventory.computed_summary();
        if (!(computed == *inventory.chunk_status)) {
            issues.push_back("Chunk status counter mismatch: stored " +
                             std::to_string(inventory.chunk_status->total_processed) + " processed / " +
                             std::to_string(inventory.chunk_status->chunks_remaining) + " remaining, actual " +
                             std::to_string(computed.total_processed) + " / " +
                             std::to_string(computed.chunks_remaining));
        }
    }

    for (const auto& [index, record] : inventory.chunks) {
        const std::string label = "Chunk " + std::to_string(index);

        if (record.chunk_number != index) {
            issues.push_back(label + " records chunk_number " + std::to_string(record.chunk_number));
        }
        if (record.chunk_id.empty()) {
            issues.push_back(label + " has an empty chunk_id");
        }

        if (inventory.chunk_size > 0) {
            uint64_t start = (index - 1) * inventory.chunk_size;
            if (index == 0 || start >= inventory.original_size) {
                issues.push_back(label + " lies beyond the end of the source file");
            } else {
                uint64_t expected = std::min(inventory.chunk_size, inventory.original_size - start);
                if (record.offset != start) {
                    issues.push_back(label + " offset " + std::to_string(record.offset) +
                                     " should be " + std::to_string(start));
                }
                if (record.expected_size != expected) {
                    issues.push_back(label + " expected_size " + std::to_string(record.expected_size) +
                                     " should be " + std::to_string(expected));
                }
            }
        }

        if (record.status != ChunkStatus::COMPLETED) {
            continue;
        }

        std::vector<std::string> missing;
        if (!record.actual_size) missing.emplace_back("size");
        if (!record.hash) missing.emplace_back("hash");
        if (!missing.empty()) {
            issues.push_back(label + " missing fields: " + join(missing, ", "));
        }

        if (record.actual_size && *record.actual_size != record.expected_size) {
            issues.push_back(label + " size " + std::to_string(*record.actual_size) +
                             " differs from expected " + std::to_string(record.expected_size));
        }
    }

    return issues;
}

std::vector<std::string> InventoryStore::verify_integrity_file(const std::string& path) const {
    std::ifstream in(path);
    if (!in) {
        throw ChunkError(ErrorKind::INVENTORY_LOAD_ERROR, "Cannot read inventory: " + path);
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw ChunkError(ErrorKind::INVENTORY_LOAD_ERROR, "Cannot read inventory: " + path);
    }

    json document = json::parse(buffer.str(), nullptr, false);
    if (document.is_discarded()) {
        return {"Inventory is not valid JSON: " + path};
    }

    try {
        return verify_integrity(inventory_from_json(document));
    } catch (const ChunkError& e) {
        return {e.what()};
    }
}

} // namespace chunkvault
