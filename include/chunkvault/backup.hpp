#ifndef CHUNKVAULT_BACKUP_HPP
#define CHUNKVAULT_BACKUP_HPP

#include "chunkvault/compression.hpp"
#include "chunkvault/inventory.hpp"
#include <cstdint>
#include <string>

namespace chunkvault {

// Header of compressed backups: magic, codec byte, little-endian original size
constexpr char BACKUP_MAGIC[4] = {'C', 'V', 'B', 'K'};
constexpr size_t BACKUP_HEADER_SIZE = 4 + 1 + 8;

// Largest inventory a backup may expand to
constexpr uint64_t MAX_BACKUP_INVENTORY_SIZE = 256ULL * 1024ULL * 1024ULL;

/**
 * Point-in-time copies of an inventory file
 */
class InventoryBackup {
public:
    explicit InventoryBackup(ProgressLog& log, bool sync_writes = true);

    /**
     * Write "<inventory>.<YYYYmmdd_HHMMSS>.backup" (plus ".lz4" / ".zst")
     * The inventory must load cleanly; a broken one is not worth keeping.
     * @return Path of the backup file
     * @throws ChunkError(INVENTORY_LOAD_ERROR) or ChunkError(STORAGE_WRITE_FAILURE)
     */
    std::string create_backup(const std::string& inventory_path, BackupCodec codec) const;

    /**
     * Decompress a backup, check it is a loadable inventory and
     * atomically write it to target_path
     * @return The restored inventory
     * @throws ChunkError(INVENTORY_LOAD_ERROR) on a corrupt backup
     */
    Inventory restore_backup(const std::string& backup_path, const std::string& target_path) const;

private:
    ProgressLog& log_;
    bool sync_writes_;
    InventoryStore store_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_BACKUP_HPP
