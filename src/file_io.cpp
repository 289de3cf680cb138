#include "chunkvault/file_io.hpp"
#include "chunkvault/errors.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace chunkvault {

bool write_all(int fd, const uint8_t* data, size_t size) {
    size_t written_total = 0;
    while (written_total < size) {
        ssize_t written = ::write(fd, data + written_total, size - written_total);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        written_total += static_cast<size_t>(written);
    }
    return true;
}

void write_file_atomically(const std::string& target,
                           const uint8_t* data,
                           size_t size,
                           const std::string& temp_suffix,
                           bool sync) {
    fs::path target_path(target);
    fs::path parent = target_path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw ChunkError(ErrorKind::STORAGE_WRITE_FAILURE,
                             "Cannot create directory " + parent.string() + ": " + ec.message());
        }
    }

    const std::string temp_path = target + temp_suffix;
    int fd = ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw ChunkError(ErrorKind::STORAGE_WRITE_FAILURE,
                         "open failed for " + temp_path + ": " + std::strerror(errno));
    }

    std::string failure;
    if (!write_all(fd, data, size)) {
        failure = "write failed for " + temp_path + ": " + std::strerror(errno);
    } else if (sync && ::fsync(fd) != 0) {
        failure = "fsync failed for " + temp_path + ": " + std::strerror(errno);
    }

    if (::close(fd) != 0 && failure.empty()) {
        failure = "close failed for " + temp_path + ": " + std::strerror(errno);
    }

    if (failure.empty()) {
        std::error_code ec;
        fs::rename(temp_path, target_path, ec);
        if (ec) {
            failure = "rename failed for " + temp_path + ": " + ec.message();
        }
    }

    if (!failure.empty()) {
        ::unlink(temp_path.c_str());
        throw ChunkError(ErrorKind::STORAGE_WRITE_FAILURE, failure);
    }
}

std::vector<uint8_t> read_whole_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) {
        throw ChunkError(ErrorKind::INPUT_NOT_FOUND, "Cannot open file: " + path);
    }

    std::streamsize size = in.tellg();
    if (size < 0) {
        throw ChunkError(ErrorKind::INPUT_NOT_READABLE, "Cannot determine size of: " + path);
    }
    in.seekg(0, std::ios::beg);

    std::vector<uint8_t> data(static_cast<size_t>(size));
    if (size > 0 && !in.read(reinterpret_cast<char*>(data.data()), size)) {
        throw ChunkError(ErrorKind::INPUT_NOT_READABLE, "Failed to read file: " + path);
    }
    return data;
}

} // namespace chunkvault
