#include "chunkvault/backup.hpp"
#include "chunkvault/errors.hpp"
#include "chunkvault/file_io.hpp"
#include "chunkvault/progress_log.hpp"
#include "chunkvault/timestamp.hpp"
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace chunkvault {

namespace {

void append_header(std::vector<uint8_t>& out, BackupCodec codec, uint64_t original_size) {
    out.insert(out.end(), BACKUP_MAGIC, BACKUP_MAGIC + 4);
    out.push_back(static_cast<uint8_t>(codec));
    for (int shift = 0; shift < 64; shift += 8) {
        out.push_back(static_cast<uint8_t>((original_size >> shift) & 0xFF));
    }
}

bool has_header(const std::vector<uint8_t>& data) {
    return data.size() >= BACKUP_HEADER_SIZE && std::memcmp(data.data(), BACKUP_MAGIC, 4) == 0;
}

std::vector<uint8_t> unpack(const std::vector<uint8_t>& data, const std::string& backup_path) {
    // Uncompressed backups are plain inventory JSON
    if (!has_header(data)) {
        return data;
    }

    uint8_t codec_byte = data[4];
    if (codec_byte > static_cast<uint8_t>(BackupCodec::ZSTD_MAX)) {
        throw ChunkError(ErrorKind::INVENTORY_LOAD_ERROR,
                         "Unknown backup codec " + std::to_string(codec_byte) + " in " + backup_path);
    }

    uint64_t original_size = 0;
    for (int i = 0; i < 8; i++) {
        original_size |= static_cast<uint64_t>(data[5 + i]) << (8 * i);
    }

    if (original_size > MAX_BACKUP_INVENTORY_SIZE) {
        throw ChunkError(ErrorKind::INVENTORY_LOAD_ERROR,
                         "Corrupt backup " + backup_path + ": header claims " + std::to_string(original_size) +
                         " bytes, limit is " + std::to_string(MAX_BACKUP_INVENTORY_SIZE));
    }

    std::vector<uint8_t> payload(data.begin() + BACKUP_HEADER_SIZE, data.end());
    try {
        return decompress_with_codec(payload, static_cast<BackupCodec>(codec_byte),
                                     static_cast<size_t>(original_size));
    } catch (const std::runtime_error& e) {
        throw ChunkError(ErrorKind::INVENTORY_LOAD_ERROR,
                         "Corrupt backup " + backup_path + ": " + e.what());
    }
}

} // namespace

InventoryBackup::InventoryBackup(ProgressLog& log, bool sync_writes)
    : log_(log)
    , sync_writes_(sync_writes)
    , store_(log, sync_writes) {
}

std::string InventoryBackup::create_backup(const std::string& inventory_path, BackupCodec codec) const {
    Inventory inventory = store_.load(inventory_path);
    std::vector<uint8_t> raw = read_whole_file(inventory_path);

    std::string base = inventory_path + "." + compact_timestamp() + ".backup";
    std::string backup_path = base + codec_extension(codec);
    std::error_code ec;
    for (int attempt = 1; fs::exists(backup_path, ec); attempt++) {
        backup_path = base + "_" + std::to_string(attempt) + codec_extension(codec);
    }

    std::vector<uint8_t> contents;
    if (codec == BackupCodec::NONE) {
        contents = std::move(raw);
    } else {
        std::vector<uint8_t> compressed;
        try {
            compressed = compress_with_codec(raw, codec);
        } catch (const std::runtime_error& e) {
            throw ChunkError(ErrorKind::STORAGE_WRITE_FAILURE,
                             "Backup compression failed for " + inventory_path + ": " + e.what());
        }
        contents.reserve(BACKUP_HEADER_SIZE + compressed.size());
        append_header(contents, codec, raw.size());
        contents.insert(contents.end(), compressed.begin(), compressed.end());
    }

    write_file_atomically(backup_path, contents.data(), contents.size(), ".tmp", sync_writes_);
    log_.sequence("BACKUP", "COMPLETE",
                  inventory.original_filename + " -> " + backup_path + " (" + codec_name(codec) + ", " +
                  std::to_string(contents.size()) + " bytes)");
    return backup_path;
}

Inventory InventoryBackup::restore_backup(const std::string& backup_path, const std::string& target_path) const {
    std::vector<uint8_t> payload = unpack(read_whole_file(backup_path), backup_path);

    nlohmann::ordered_json document = nlohmann::ordered_json::parse(payload.begin(), payload.end(), nullptr, false);
    if (document.is_discarded()) {
        throw ChunkError(ErrorKind::INVENTORY_LOAD_ERROR, "Backup is not valid JSON: " + backup_path);
    }

    Inventory inventory = inventory_from_json(document);
    store_.persist(inventory, target_path);
    log_.sequence("RESTORE", "COMPLETE", backup_path + " -> " + target_path);
    return inventory;
}

} // namespace chunkvault
