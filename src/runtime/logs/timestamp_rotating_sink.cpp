#include "runtime/logs/timestamp_rotating_sink.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>

namespace fs = std::filesystem;

namespace hive::runtime::logs {

namespace {
constexpr const char* CURRENT_NAME = "current.log";
}

TimestampRotatingFileSink::TimestampRotatingFileSink(std::string dir, size_t max_bytes,
                                                     size_t max_files)
    : dir_(std::move(dir))
    , max_bytes_(max_bytes)
    , max_files_(max_files) {
    fs::create_directories(dir_);
    file_.open(current_path(), false);
    current_size_ = file_.size();
}

std::string TimestampRotatingFileSink::current_path() const {
    return (fs::path(dir_) / CURRENT_NAME).string();
}

std::vector<std::string> TimestampRotatingFileSink::rotated_files() const {
    struct Entry {
        std::string path;
        fs::file_time_type mtime;
    };
    std::vector<Entry> entries;

    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir_, ec)) {
        auto name = entry.path().filename().string();
        if (name == CURRENT_NAME || name.front() == '.' || entry.path().extension() != ".log") {
            continue;
        }
        entries.push_back({entry.path().string(), entry.last_write_time(ec)});
    }

    std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
        if (a.mtime != b.mtime) {
            return a.mtime < b.mtime;
        }
        // Same-second suffixes: _2 sorts before _10
        if (a.path.size() != b.path.size()) {
            return a.path.size() < b.path.size();
        }
        return a.path < b.path;
    });

    std::vector<std::string> paths;
    for (auto& e : entries) {
        paths.push_back(std::move(e.path));
    }
    return paths;
}

void TimestampRotatingFileSink::sink_it_(const spdlog::details::log_msg& msg) {
    spdlog::memory_buf_t formatted;
    formatter_->format(msg, formatted);

    if (max_bytes_ > 0 && current_size_ > 0 && current_size_ + formatted.size() > max_bytes_) {
        rotate_();
    }

    file_.write(formatted);
    current_size_ += formatted.size();
}

void TimestampRotatingFileSink::flush_() {
    file_.flush();
}

std::string TimestampRotatingFileSink::next_rotated_name_() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d_%H-%M-%S", &tm);

    // Several rotations can land in the same second; a pruned name is never reused
    if (last_stamp_ == stamp) {
        stamp_seq_++;
    } else {
        last_stamp_ = stamp;
        stamp_seq_ = 0;
    }

    std::string base = (fs::path(dir_) / stamp).string();
    while (true) {
        std::string candidate = stamp_seq_ == 0 ? base + ".log"
                                                : base + "_" + std::to_string(stamp_seq_) + ".log";
        if (!fs::exists(candidate)) {
            return candidate;
        }
        stamp_seq_++;
    }
}

void TimestampRotatingFileSink::rotate_() {
    file_.close();

    std::error_code ec;
    fs::rename(current_path(), next_rotated_name_(), ec);
    if (ec) {
        // Keep appending to the oversized file rather than lose records
        file_.open(current_path(), false);
        current_size_ = file_.size();
        throw spdlog::spdlog_ex("failed rotating " + current_path() + ": " + ec.message());
    }

    file_.open(current_path(), true);
    current_size_ = 0;
    prune_();
}

void TimestampRotatingFileSink::prune_() {
    auto files = rotated_files();
    if (files.size() <= max_files_) {
        return;
    }
    size_t excess = files.size() - max_files_;
    for (size_t i = 0; i < excess; i++) {
        std::error_code ec;
        fs::remove(files[i], ec);
    }
}

} // namespace hive::runtime::logs
