#ifndef CHUNKVAULT_PROGRESS_LOG_HPP
#define CHUNKVAULT_PROGRESS_LOG_HPP

#include "chunkvault/timestamp.hpp"
#include <cstdint>
#include <fstream>
#include <string>

namespace chunkvault {

/**
 * One finished chunk, as reported to the progress log
 */
struct ChunkEvent {
    std::string chunk_id;
    std::string status;
    Clock::time_point start_time;
    Clock::time_point end_time;
    uint64_t size;
    std::string hash;
    std::string output_path;
    uint64_t offset;

    ChunkEvent();
};

/**
 * Progress sink used by chunking and reconstruction
 * Calls are fire-and-forget: implementations must not throw, and a
 * failed write never aborts the caller's operation.
 */
class ProgressLog {
public:
    virtual ~ProgressLog() = default;

    virtual void sequence(const std::string& step, const std::string& status,
                          const std::string& message) = 0;
    virtual void chunk_operation(const ChunkEvent& event) = 0;
    virtual void info(const std::string& message) = 0;
    virtual void error(const std::string& message) = 0;
};

/**
 * Discards everything
 */
class NullProgressLog : public ProgressLog {
public:
    void sequence(const std::string&, const std::string&, const std::string&) override {}
    void chunk_operation(const ChunkEvent&) override {}
    void info(const std::string&) override {}
    void error(const std::string&) override {}
};

/**
 * Line-oriented session log file
 *
 * Each line is "YYYY-mm-dd HH:MM:SS.mmm | message". A session header is
 * written on construction and a footer with the total duration by close()
 * (or the destructor). The file is opened in append mode so several
 * sessions against the same source accumulate in one log.
 */
class SessionLog : public ProgressLog {
public:
    SessionLog(const std::string& log_path, const std::string& input_file);
    ~SessionLog() override;

    SessionLog(const SessionLog&) = delete;
    SessionLog& operator=(const SessionLog&) = delete;

    void sequence(const std::string& step, const std::string& status,
                  const std::string& message) override;
    void chunk_operation(const ChunkEvent& event) override;
    void info(const std::string& message) override;
    void error(const std::string& message) override;

    /**
     * Write the session footer; later calls are no-ops
     */
    void close();

    const std::string& path() const { return log_path_; }

private:
    std::string log_path_;
    Clock::time_point session_start_;
    std::ofstream out_;
    bool closed_;
    bool warned_;

    void write_line(const std::string& message);
};

} // namespace chunkvault

#endif // CHUNKVAULT_PROGRESS_LOG_HPP
