#include "chunkvault/backup.hpp"
#include "chunkvault/chunk_writer.hpp"
#include "chunkvault/config.hpp"
#include "chunkvault/errors.hpp"
#include "chunkvault/inventory.hpp"
#include "chunkvault/merge.hpp"
#include "chunkvault/paths.hpp"
#include "chunkvault/progress_log.hpp"
#include "chunkvault/readiness.hpp"
#include "chunkvault/reconstructor.hpp"
#include "chunkvault/report.hpp"
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <getopt.h>

namespace fs = std::filesystem;
using namespace chunkvault;

namespace {

enum class Mode {
    NONE,
    CHUNK,
    RECONSTRUCT,
    STATUS,
    CHECK,
    VERIFY,
    BACKUP,
    RESTORE,
    MERGE
};

// Long-only options
enum {
    OPT_STATUS = 256,
    OPT_CHECK,
    OPT_VERIFY,
    OPT_BACKUP,
    OPT_RESTORE,
    OPT_MERGE,
    OPT_CODEC,
    OPT_PRESET,
    OPT_TRUST_HASH,
    OPT_NO_VALIDATE,
    OPT_HELP
};

struct CliOptions {
    Mode mode = Mode::NONE;
    std::string target;                   // File, chunk file or inventory the mode acts on
    std::vector<std::string> operands;    // Positional arguments after the options
    std::optional<uint64_t> chunk_size_mb;  // Overrides the preset's chunk size
    std::optional<int64_t> chunk_number;
    std::optional<std::string> output_dir;
    std::optional<std::string> log_dir;
    std::optional<std::string> inventory_dir;
    std::string codec;
    std::string preset = "default";
    bool trust_hash = false;
    bool validate = true;
};

const struct option LONG_OPTIONS[] = {
    {"file",        required_argument, nullptr, 'f'},
    {"reconstruct", required_argument, nullptr, 'r'},
    {"size",        required_argument, nullptr, 's'},
    {"chunk",       required_argument, nullptr, 'c'},
    {"output",      required_argument, nullptr, 'o'},
    {"log",         required_argument, nullptr, 'l'},
    {"inventory",   required_argument, nullptr, 'i'},
    {"status",      required_argument, nullptr, OPT_STATUS},
    {"check",       required_argument, nullptr, OPT_CHECK},
    {"verify",      required_argument, nullptr, OPT_VERIFY},
    {"backup",      required_argument, nullptr, OPT_BACKUP},
    {"restore",     required_argument, nullptr, OPT_RESTORE},
    {"merge",       required_argument, nullptr, OPT_MERGE},
    {"codec",       required_argument, nullptr, OPT_CODEC},
    {"preset",      required_argument, nullptr, OPT_PRESET},
    {"trust-hash",  no_argument,       nullptr, OPT_TRUST_HASH},
    {"no-validate", no_argument,       nullptr, OPT_NO_VALIDATE},
    {"help",        no_argument,       nullptr, OPT_HELP},
    {nullptr,       0,                 nullptr, 0}
};

void print_usage(const char* prog) {
    std::cout << "Usage:\n"
              << "  " << prog << " -f FILE [-s MB] [-c N] [-o DIR] [-l DIR] [-i DIR] [--preset NAME] [--trust-hash]\n"
              << "  " << prog << " -r CHUNK_FILE [-o DIR] [--no-validate]\n"
              << "  " << prog << " --status INVENTORY\n"
              << "  " << prog << " --check INVENTORY\n"
              << "  " << prog << " --verify INVENTORY\n"
              << "  " << prog << " --backup INVENTORY [--codec none|lz4|lz4hc|zstd|zstd-max]\n"
              << "  " << prog << " --restore BACKUP TARGET\n"
              << "  " << prog << " --merge OUTPUT INVENTORY...\n"
              << "\n"
              << "  -f, --file FILE          Split FILE into chunks (resumes an existing inventory)\n"
              << "  -s, --size MB            Chunk size in MB (default: taken from the preset)\n"
              << "  -c, --chunk N            Process only chunk N\n"
              << "  -o, --output DIR         Directory for chunks, or for the reconstructed file\n"
              << "  -l, --log DIR            Directory for the log file (default: input file directory)\n"
              << "  -i, --inventory DIR      Directory for the inventory (default: input file directory)\n"
              << "      --preset NAME        default (1000 MB), removable (4000 MB) or archives (2000 MB,\n"
              << "                           reuses the recorded hash on resume)\n"
              << "      --trust-hash         On resume, skip rehashing when the file size is unchanged\n"
              << "  -r, --reconstruct CHUNK  Rebuild the file from the chunks next to CHUNK\n"
              << "      --no-validate        Skip hash validation during reconstruction\n";
}

int64_t parse_integer(const std::string& text, const char* what) {
    size_t consumed = 0;
    int64_t value = 0;
    try {
        value = std::stoll(text, &consumed);
    } catch (const std::logic_error&) {
        throw std::invalid_argument(std::string("Invalid ") + what + ": " + text);
    }
    if (consumed != text.size()) {
        throw std::invalid_argument(std::string("Invalid ") + what + ": " + text);
    }
    return value;
}

void set_mode(CliOptions& opts, Mode mode, const char* arg) {
    if (opts.mode != Mode::NONE) {
        throw std::invalid_argument("Only one of -f, -r, --status, --check, --verify, --backup, "
                                    "--restore, --merge may be given");
    }
    opts.mode = mode;
    opts.target = arg;
}

CliOptions parse_command_line(int argc, char* argv[]) {
    CliOptions opts;
    opterr = 0;

    while (true) {
        int long_index = -1;
        int c = getopt_long(argc, argv, ":f:r:s:c:o:l:i:h", LONG_OPTIONS, &long_index);
        if (c == -1) {
            break;
        }

        switch (c) {
            case 'f': set_mode(opts, Mode::CHUNK, optarg); break;
            case 'r': set_mode(opts, Mode::RECONSTRUCT, optarg); break;
            case OPT_STATUS: set_mode(opts, Mode::STATUS, optarg); break;
            case OPT_CHECK: set_mode(opts, Mode::CHECK, optarg); break;
            case OPT_VERIFY: set_mode(opts, Mode::VERIFY, optarg); break;
            case OPT_BACKUP: set_mode(opts, Mode::BACKUP, optarg); break;
            case OPT_RESTORE: set_mode(opts, Mode::RESTORE, optarg); break;
            case OPT_MERGE: set_mode(opts, Mode::MERGE, optarg); break;

            case 's': {
                int64_t size = parse_integer(optarg, "chunk size");
                if (size <= 0) {
                    throw std::invalid_argument("Chunk size must be a positive number of MB");
                }
                opts.chunk_size_mb = static_cast<uint64_t>(size);
                break;
            }
            case 'c': opts.chunk_number = parse_integer(optarg, "chunk number"); break;
            case 'o': opts.output_dir = optarg; break;
            case 'l': opts.log_dir = optarg; break;
            case 'i': opts.inventory_dir = optarg; break;
            case OPT_CODEC: opts.codec = optarg; break;
            case OPT_PRESET: opts.preset = optarg; break;
            case OPT_TRUST_HASH: opts.trust_hash = true; break;
            case OPT_NO_VALIDATE: opts.validate = false; break;

            case 'h':
            case OPT_HELP:
                print_usage(argv[0]);
                std::exit(0);

            case ':':
                throw std::invalid_argument(std::string("Missing argument for ") + argv[optind - 1]);

            default:
                throw std::invalid_argument(std::string("Unknown option: ") + argv[optind - 1]);
        }
    }

    for (int i = optind; i < argc; i++) {
        opts.operands.emplace_back(argv[i]);
    }

    if (opts.mode == Mode::NONE) {
        throw std::invalid_argument("One of -f, -r, --status, --check, --verify, --backup, "
                                    "--restore, --merge is required");
    }
    return opts;
}

// ==================== Modes ====================

int run_chunking(const CliOptions& opts) {
    auto preset = ChunkConfig::config_for_preset(opts.preset);
    if (!preset) {
        throw std::invalid_argument("Unknown preset: " + opts.preset);
    }
    ChunkConfig config = *preset;
    if (opts.chunk_size_mb) {
        config.chunk_size = *opts.chunk_size_mb * MEGABYTE;
    }
    if (opts.trust_hash) {
        config.trust_recorded_hash = true;
    }

    validate_input_file(opts.target);

    RunPaths paths = resolve_paths(opts.target, opts.output_dir, opts.log_dir, opts.inventory_dir);
    for (const std::string& dir : {paths.output_dir,
                                   fs::path(paths.log_path).parent_path().string(),
                                   fs::path(paths.inventory_path).parent_path().string()}) {
        std::cout << "Creating directory if not exists: " << dir << std::endl;
        fs::create_directories(dir);
    }

    uint64_t file_size = fs::file_size(opts.target);
    DiskSpaceCheck space = check_disk_space(file_size, paths.output_dir);
    std::cout << space.message << std::endl;
    if (!space.sufficient) {
        throw std::runtime_error(space.message);
    }

    SessionLog log(paths.log_path, opts.target);
    log.info(space.message);

    ChunkWriter writer(log, config);
    Inventory inventory = writer.write_chunks(opts.target, paths.output_dir, paths.inventory_path,
                                              config.chunk_size, opts.chunk_number);
    log.close();

    std::cout << "\nProcessing completed successfully!" << std::endl;
    std::cout << "Input file: " << opts.target << std::endl;
    std::cout << "Output directory: " << paths.output_dir << std::endl;
    std::cout << "Log file: " << paths.log_path << std::endl;
    std::cout << "Inventory file: " << paths.inventory_path << std::endl;
    std::cout << "\nSummary:" << std::endl;
    std::cout << "Total chunks: " << inventory.total_chunks << std::endl;
    std::cout << "Original file size: " << inventory.original_size << " bytes" << std::endl;
    std::cout << "Original file hash: " << inventory.original_hash << std::endl;
    return 0;
}

int run_reconstruction(const CliOptions& opts) {
    std::cout << "Starting file reconstruction..." << std::endl;

    std::string inventory_path = find_inventory(opts.target);
    std::cout << "Using inventory file: " << inventory_path << std::endl;

    ReconstructOptions request;
    request.inventory_path = inventory_path;
    request.output_dir = opts.output_dir;
    request.chunks_dir = fs::absolute(opts.target).parent_path().string();
    request.validate = opts.validate;

    SessionLog log(fs::path(inventory_path).replace_extension(".log").string(), inventory_path);
    ChunkReconstructor reconstructor(log);
    ReconstructResult result = reconstructor.reconstruct(request);
    log.close();

    if (!result.success) {
        std::cerr << "\nError [" << error_kind_name(result.error_kind) << "]: " << result.error << std::endl;
        for (const auto& problem : result.problems) {
            std::cerr << "  - " << problem << std::endl;
        }
        return 1;
    }
    return 0;
}

int run_status(const CliOptions& opts) {
    NullProgressLog quiet;
    InventoryStore store(quiet);
    print_status(summarize(store.load(opts.target)), std::cout);
    return 0;
}

int run_check(const CliOptions& opts) {
    ReconstructionReadinessChecker checker;
    ReadinessReport report = checker.check(opts.target);
    ReconstructionReadinessChecker::print_status(report, std::cout);
    return report.ready ? 0 : 1;
}

int run_verify(const CliOptions& opts) {
    NullProgressLog quiet;
    InventoryStore store(quiet);
    std::vector<std::string> issues = store.verify_integrity_file(opts.target);
    if (issues.empty()) {
        std::cout << "Inventory integrity verified: " << opts.target << std::endl;
        return 0;
    }

    std::cout << "Inventory integrity problems in " << opts.target << ":" << std::endl;
    for (const auto& issue : issues) {
        std::cout << "  - " << issue << std::endl;
    }
    return 1;
}

int run_backup(const CliOptions& opts) {
    BackupCodec codec = ChunkConfig::default_config().backup_codec;
    if (!opts.codec.empty()) {
        auto parsed = parse_codec(opts.codec);
        if (!parsed) {
            throw std::invalid_argument("Unknown codec: " + opts.codec);
        }
        codec = *parsed;
    }

    NullProgressLog quiet;
    InventoryBackup backup(quiet);
    std::cout << "Backup written: " << backup.create_backup(opts.target, codec) << std::endl;
    return 0;
}

int run_restore(const CliOptions& opts) {
    if (opts.operands.size() != 1) {
        throw std::invalid_argument("--restore needs BACKUP and TARGET");
    }

    NullProgressLog quiet;
    InventoryBackup backup(quiet);
    Inventory inventory = backup.restore_backup(opts.target, opts.operands.front());
    std::cout << "Restored " << inventory.original_filename << " inventory to " << opts.operands.front()
              << std::endl;
    return 0;
}

int run_merge(const CliOptions& opts) {
    if (opts.operands.empty()) {
        throw std::invalid_argument("--merge needs OUTPUT and at least one INVENTORY");
    }

    NullProgressLog quiet;
    Inventory merged = merge_inventories(opts.operands, opts.target, quiet);
    std::cout << "Merged " << opts.operands.size() << " inventories into " << opts.target << std::endl;
    print_status(summarize(merged), std::cout);
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        CliOptions opts = parse_command_line(argc, argv);

        switch (opts.mode) {
            case Mode::CHUNK: return run_chunking(opts);
            case Mode::RECONSTRUCT: return run_reconstruction(opts);
            case Mode::STATUS: return run_status(opts);
            case Mode::CHECK: return run_check(opts);
            case Mode::VERIFY: return run_verify(opts);
            case Mode::BACKUP: return run_backup(opts);
            case Mode::RESTORE: return run_restore(opts);
            case Mode::MERGE: return run_merge(opts);
            case Mode::NONE: break;
        }
        return 1;

    } catch (const ChunkError& e) {
        std::cerr << "Error [" << error_kind_name(e.kind()) << "]: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
