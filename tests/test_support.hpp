#ifndef CHUNKVAULT_TEST_SUPPORT_HPP
#define CHUNKVAULT_TEST_SUPPORT_HPP

#include "chunkvault/progress_log.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace chunkvault_test {

namespace fs = std::filesystem;

/**
 * Progress log that keeps everything for assertions
 */
class RecordingProgressLog : public chunkvault::ProgressLog {
public:
    struct Sequence {
        std::string step;
        std::string status;
        std::string message;
    };

    void sequence(const std::string& step, const std::string& status,
                  const std::string& message) override {
        sequences.push_back({step, status, message});
    }
    void chunk_operation(const chunkvault::ChunkEvent& event) override { chunks.push_back(event); }
    void info(const std::string& message) override { infos.push_back(message); }
    void error(const std::string& message) override { errors.push_back(message); }

    bool has_sequence(const std::string& step, const std::string& status) const {
        for (const auto& entry : sequences) {
            if (entry.step == step && entry.status == status) {
                return true;
            }
        }
        return false;
    }

    std::vector<Sequence> sequences;
    std::vector<chunkvault::ChunkEvent> chunks;
    std::vector<std::string> infos;
    std::vector<std::string> errors;
};

/**
 * Fresh directory under the system temp dir, removed after each test
 */
class TempDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() /
               ("chunkvault-" + std::string(info->test_suite_name()) + "-" + info->name() + "-" +
                std::to_string(stamp));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string path(const std::string& name) const { return (dir_ / name).string(); }

    std::vector<uint8_t> pattern(size_t size, uint32_t seed = 7) const {
        std::vector<uint8_t> data(size);
        uint32_t state = seed;
        for (auto& byte : data) {
            state = state * 1103515245u + 12345u;
            byte = static_cast<uint8_t>(state >> 16);
        }
        return data;
    }

    std::string write_file(const std::string& name, const std::vector<uint8_t>& data) const {
        std::string file = path(name);
        fs::create_directories(fs::path(file).parent_path());
        std::ofstream out(file, std::ios::binary);
        out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
        return file;
    }

    std::string write_text(const std::string& name, const std::string& text) const {
        return write_file(name, std::vector<uint8_t>(text.begin(), text.end()));
    }

    static std::vector<uint8_t> read_file(const std::string& file) {
        std::ifstream in(file, std::ios::binary);
        return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    static std::string read_text(const std::string& file) {
        std::vector<uint8_t> bytes = read_file(file);
        return std::string(bytes.begin(), bytes.end());
    }

    fs::path dir_;
};

} // namespace chunkvault_test

#endif // CHUNKVAULT_TEST_SUPPORT_HPP
