#pragma once
#include <string>
#include "services/brain/backend.hpp"

namespace hive::services::brain {

// POSTs the payload to an HTTP(S) endpoint. The reply body is either a
// {"success", "content", "error"} object or taken verbatim as the content.
class HttpBrainBackend : public BrainBackend {
public:
    explicit HttpBrainBackend(const kernel::BrainConfig& config);

    BrainResponse complete(const std::string& payload) override;
    bool is_configured() const override { return !host_.empty(); }
    std::string describe() const override { return host_ + path_; }

    // Split "scheme://host[:port]/path" into base URL and path
    static bool split_endpoint(const std::string& endpoint, std::string& base, std::string& path);

private:
    std::string host_;      // scheme://host[:port]
    std::string path_;
    std::string api_key_;
    int timeout_seconds_;

    BrainResponse parse_response(const std::string& body);
};

} // namespace hive::services::brain
