#pragma once
#include <sys/types.h>
#include <string>
#include <vector>
#include "services/brain/backend.hpp"

namespace hive::services::brain {

// Long-lived helper process: one JSON request per stdin line, one JSON
// response per stdout line. Restarted on the next request if it dies.
class SubprocessBrainBackend : public BrainBackend {
public:
    SubprocessBrainBackend(std::vector<std::string> command, int timeout_seconds);
    ~SubprocessBrainBackend() override;

    SubprocessBrainBackend(const SubprocessBrainBackend&) = delete;
    SubprocessBrainBackend& operator=(const SubprocessBrainBackend&) = delete;

    BrainResponse complete(const std::string& payload) override;
    bool is_configured() const override { return !command_.empty(); }
    std::string describe() const override;

private:
    std::vector<std::string> command_;
    int timeout_seconds_;
    pid_t subprocess_pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    std::string buffered_;

    bool start_subprocess();
    void stop_subprocess();
    bool read_line(std::string& line);
    static std::string to_single_line(const std::string& payload);
    static BrainResponse parse_response(const std::string& line);
};

} // namespace hive::services::brain
