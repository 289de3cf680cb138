#include "chunkvault/paths.hpp"
#include "chunkvault/errors.hpp"
#include <cstdio>
#include <filesystem>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace chunkvault {

namespace {

std::string gigabytes(uint64_t bytes) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2fGB", static_cast<double>(bytes) / (1024.0 * 1024.0 * 1024.0));
    return buffer;
}

} // namespace

RunPaths resolve_paths(const std::string& input_file,
                       const std::optional<std::string>& output_dir,
                       const std::optional<std::string>& log_dir,
                       const std::optional<std::string>& inventory_dir) {
    fs::path input = fs::absolute(input_file);
    fs::path input_dir = input.parent_path();
    std::string stem = input.stem().string();

    RunPaths paths;
    paths.output_dir = output_dir ? *output_dir : input_dir.string();
    paths.log_path = (fs::path(log_dir ? *log_dir : input_dir.string()) / (stem + ".log")).string();
    paths.inventory_path = (fs::path(inventory_dir ? *inventory_dir : input_dir.string()) / (stem + ".json")).string();
    return paths;
}

void validate_input_file(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        throw ChunkError(ErrorKind::INPUT_NOT_FOUND, "Input file not found: " + path);
    }
    if (!fs::is_regular_file(path, ec)) {
        throw ChunkError(ErrorKind::INPUT_NOT_FOUND, "Path is not a file: " + path);
    }
    if (::access(path.c_str(), R_OK) != 0) {
        throw ChunkError(ErrorKind::INPUT_NOT_READABLE, "Input file is not readable: " + path);
    }
}

DiskSpaceCheck check_disk_space(uint64_t required_bytes, const std::string& dir) {
    DiskSpaceCheck check;
    check.sufficient = false;
    check.free_bytes = 0;
    check.required_bytes = required_bytes;

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (!ec) {
        fs::space_info info = fs::space(dir, ec);
        if (!ec) {
            check.free_bytes = info.available;
        }
    }
    if (ec) {
        check.message = "Error checking disk space: " + ec.message();
        return check;
    }

    check.sufficient = check.free_bytes > required_bytes;
    if (check.sufficient) {
        check.message = "Sufficient disk space available (" + gigabytes(check.free_bytes) + " free, " +
                        gigabytes(required_bytes) + " required)";
    } else {
        check.message = "Insufficient disk space: " + gigabytes(check.free_bytes) + " free, " +
                        gigabytes(required_bytes) + " required";
    }
    return check;
}

std::string find_inventory(const std::string& chunk_path) {
    fs::path search_dir = fs::absolute(chunk_path).parent_path();

    std::error_code ec;
    fs::directory_iterator it(search_dir, ec);
    if (ec) {
        throw ChunkError(ErrorKind::INVENTORY_LOAD_ERROR,
                         "Cannot read directory " + search_dir.string() + ": " + ec.message());
    }

    std::optional<fs::path> newest;
    fs::file_time_type newest_time;
    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec) || entry.path().extension() != ".json") {
            continue;
        }
        fs::file_time_type modified = entry.last_write_time(ec);
        if (ec) {
            continue;
        }
        if (!newest || modified > newest_time) {
            newest = entry.path();
            newest_time = modified;
        }
    }

    if (!newest) {
        throw ChunkError(ErrorKind::INVENTORY_LOAD_ERROR,
                         "No inventory file found in directory: " + search_dir.string());
    }
    return newest->string();
}

} // namespace chunkvault
