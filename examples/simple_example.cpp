#include "chunkvault/chunk_writer.hpp"
#include "chunkvault/config.hpp"
#include "chunkvault/progress_log.hpp"
#include "chunkvault/reconstructor.hpp"
#include "chunkvault/report.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using namespace chunkvault;

int main() {
    std::cout << "=== chunkvault - Simple Example ===\n" << std::endl;

    fs::path work_dir = fs::temp_directory_path() / "chunkvault_simple_example";
    fs::remove_all(work_dir);
    fs::create_directories(work_dir / "restored");

    // 1. Make a source file that does not divide evenly into chunks
    fs::path source = work_dir / "sample.dat";
    {
        std::ofstream out(source, std::ios::binary);
        for (int i = 0; i < 10000; i++) {
            out.put(static_cast<char>(i * 31 % 251));
        }
    }
    std::cout << "✓ Created " << source << " (10000 bytes)\n" << std::endl;

    // 2. Split it into 4096-byte chunks
    ChunkConfig config = ChunkConfig::config_for_testing();
    SessionLog log((work_dir / "sample.log").string(), source.string());

    std::string inventory_path = (work_dir / "sample.json").string();
    ChunkWriter writer(log, config);
    Inventory inventory = writer.write_chunks(source.string(), work_dir.string(), inventory_path);

    std::cout << "Chunks written:" << std::endl;
    for (const auto& [index, record] : inventory.chunks) {
        std::cout << "  " << record.chunk_id << "  offset " << record.offset
                  << "  size " << record.expected_size << std::endl;
    }
    print_status(summarize(inventory), std::cout);

    // 3. Running again finds nothing left to do
    writer.write_chunks(source.string(), work_dir.string(), inventory_path);
    std::cout << "\n✓ Second run wrote no chunks\n" << std::endl;

    // 4. Put the file back together and check it against the recorded hash
    ReconstructOptions options;
    options.inventory_path = inventory_path;
    options.output_dir = (work_dir / "restored").string();

    ChunkReconstructor reconstructor(log, false);
    ReconstructResult result = reconstructor.reconstruct(options);
    log.close();

    if (!result.success) {
        std::cerr << "Reconstruction failed: " << result.error << std::endl;
        return 1;
    }

    std::cout << "✓ Reconstructed " << result.output_path << " (" << result.bytes_written << " bytes)" << std::endl;
    std::cout << "\n=== Example Complete! ===" << std::endl;
    std::cout << "Files are in: " << work_dir << std::endl;
    return 0;
}
