#pragma once
#include <spdlog/details/file_helper.h>
#include <spdlog/sinks/base_sink.h>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace hive::runtime::logs {

// Writes to <dir>/current.log. When the next record would push the file past
// max_bytes it is renamed to <dir>/<YYYY-MM-DD_HH-MM-SS>[_N].log and a fresh
// current.log is started. At most max_files rotated files are kept.
class TimestampRotatingFileSink : public spdlog::sinks::base_sink<std::mutex> {
public:
    TimestampRotatingFileSink(std::string dir, size_t max_bytes, size_t max_files);

    std::string current_path() const;

    // Rotated files, oldest first
    std::vector<std::string> rotated_files() const;

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override;
    void flush_() override;

private:
    std::string dir_;
    size_t max_bytes_;
    size_t max_files_;
    size_t current_size_ = 0;
    spdlog::details::file_helper file_;
    std::string last_stamp_;
    int stamp_seq_ = 0;

    void rotate_();
    void prune_();
    std::string next_rotated_name_();
};

} // namespace hive::runtime::logs
