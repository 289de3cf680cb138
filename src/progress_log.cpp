#include "chunkvault/progress_log.hpp"
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace chunkvault {

// ==================== ChunkEvent ====================

ChunkEvent::ChunkEvent()
    : size(0)
    , offset(0) {
}

// ==================== SessionLog ====================

SessionLog::SessionLog(const std::string& log_path, const std::string& input_file)
    : log_path_(log_path)
    , session_start_(Clock::now())
    , closed_(false)
    , warned_(false) {

    fs::path parent = fs::path(log_path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            std::cerr << "Warning: Failed to create log directory " << parent << ": "
                      << ec.message() << std::endl;
        }
    }

    out_.open(log_path_, std::ios::app);

    write_line("=== Session Start: " + compact_timestamp(session_start_) + " ===");
    write_line("Input File: " + input_file);
    write_line("Start Time: " + iso_timestamp(session_start_));
    write_line(std::string(50, '='));
}

SessionLog::~SessionLog() {
    close();
}

void SessionLog::sequence(const std::string& step, const std::string& status,
                          const std::string& message) {
    std::ostringstream line;
    line << std::left << std::setw(15) << step << " | "
         << std::setw(10) << status << " | " << message;
    write_line(line.str());
}

void SessionLog::chunk_operation(const ChunkEvent& event) {
    double size_mb = static_cast<double>(event.size) / (1024.0 * 1024.0);

    std::ostringstream line;
    line << "Chunk: " << event.chunk_id
         << " | Status: " << event.status
         << " | Size: " << std::fixed << std::setprecision(2) << size_mb << "MB"
         << " | Offset: " << event.offset
         << " | Duration: " << seconds_between(event.start_time, event.end_time) << "s"
         << " | Hash: " << event.hash
         << " | Path: " << event.output_path;
    write_line(line.str());
}

void SessionLog::info(const std::string& message) {
    write_line("INFO: " + message);
}

void SessionLog::error(const std::string& message) {
    write_line("ERROR: " + message);
}

void SessionLog::close() {
    if (closed_) {
        return;
    }

    Clock::time_point end = Clock::now();
    std::ostringstream duration;
    duration << std::fixed << std::setprecision(2) << seconds_between(session_start_, end);

    write_line(std::string(50, '='));
    write_line("Session End: " + iso_timestamp(end));
    write_line("Total Duration: " + duration.str() + " seconds");
    write_line(std::string(50, '='));

    closed_ = true;
    out_.close();
}

void SessionLog::write_line(const std::string& message) {
    if (out_.is_open()) {
        out_ << log_timestamp() << " | " << message << '\n';
        out_.flush();
    }

    // Report once, keep going
    if ((!out_.is_open() || !out_) && !warned_) {
        warned_ = true;
        std::cerr << "Warning: Failed to write to log file: " << log_path_ << std::endl;
    }
}

} // namespace chunkvault
