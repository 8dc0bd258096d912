#pragma once
#include <stdexcept>
#include <string>

namespace hive {

// Base for every error the orchestration core raises
class HiveError : public std::runtime_error {
public:
    explicit HiveError(const std::string& what) : std::runtime_error(what) {}
};

// Fatal, never retried (bad config, unknown agent type, missing binaries)
class ConfigurationError : public HiveError {
public:
    explicit ConfigurationError(const std::string& what) : HiveError(what) {}
};

// fork/pipe/exec failure while launching an agent process
class ProcessLaunchError : public HiveError {
public:
    explicit ProcessLaunchError(const std::string& what) : HiveError(what) {}
};

// Lifecycle store could not persist a record
class StateStoreError : public HiveError {
public:
    explicit StateStoreError(const std::string& what) : HiveError(what) {}
};

} // namespace hive
