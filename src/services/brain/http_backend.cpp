#include "services/brain/http_backend.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>

#include <cstdlib>

using json = nlohmann::json;

namespace hive::services::brain {

bool HttpBrainBackend::split_endpoint(const std::string& endpoint, std::string& base, std::string& path) {
    auto scheme_end = endpoint.find("://");
    if (scheme_end == std::string::npos) {
        return false;
    }
    auto scheme = endpoint.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") {
        return false;
    }

    auto path_start = endpoint.find('/', scheme_end + 3);
    if (path_start == std::string::npos) {
        base = endpoint;
        path = "/";
    } else {
        base = endpoint.substr(0, path_start);
        path = endpoint.substr(path_start);
    }
    return base.size() > scheme_end + 3;
}

HttpBrainBackend::HttpBrainBackend(const kernel::BrainConfig& config)
    : timeout_seconds_(config.timeout_seconds) {
    if (!split_endpoint(config.endpoint, host_, path_)) {
        spdlog::error("Invalid brain endpoint '{}'", config.endpoint);
        host_.clear();
        path_.clear();
    }
    if (!config.api_key_env.empty()) {
        if (const char* key = std::getenv(config.api_key_env.c_str())) {
            api_key_ = key;
        }
    }
}

BrainResponse HttpBrainBackend::parse_response(const std::string& body) {
    BrainResponse response;
    try {
        json j = json::parse(body);
        if (j.is_object() && (j.contains("success") || j.contains("content"))) {
            response.success = j.value("success", true);
            response.content = j.value("content", "");
            response.error = j.value("error", "");
            return response;
        }
    } catch (const json::parse_error&) {
        // Plain-text reply
    }
    response.success = true;
    response.content = body;
    return response;
}

BrainResponse HttpBrainBackend::complete(const std::string& payload) {
    BrainResponse response;
    if (!is_configured()) {
        response.error = "brain endpoint not configured";
        return response;
    }

    try {
        httplib::Client cli(host_);
        cli.set_connection_timeout(timeout_seconds_);
        cli.set_read_timeout(timeout_seconds_);
        cli.set_write_timeout(timeout_seconds_);

        httplib::Headers headers;
        if (!api_key_.empty()) {
            headers.emplace("Authorization", "Bearer " + api_key_);
        }

        spdlog::debug("Calling brain endpoint {}{}", host_, path_);
        auto result = cli.Post(path_, headers, payload, "application/json");

        if (!result) {
            response.error = "HTTP request failed: " + httplib::to_string(result.error());
            spdlog::error("Brain request failed: {}", response.error);
            return response;
        }

        spdlog::debug("Brain endpoint response: {} ({}B)", result->status, result->body.size());

        if (result->status != 200) {
            response.error = "HTTP " + std::to_string(result->status);
            if (!result->body.empty()) {
                response.error += ": " + result->body.substr(0, 512);
            }
            spdlog::error("Brain endpoint error: {}", response.error);
            return response;
        }

        return parse_response(result->body);

    } catch (const std::exception& e) {
        response.error = std::string("Exception: ") + e.what();
        spdlog::error("Brain endpoint exception: {}", e.what());
    }

    return response;
}

} // namespace hive::services::brain
