#include "assetup/core/config.h"

#include <cctype>
#include <stdexcept>

#include <Poco/AutoPtr.h>
#include <Poco/Util/JSONConfiguration.h>

namespace assetup::core {

namespace {

bool IsBlank(const std::string& value) {
    for (char c : value) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

void RequirePositive(int value, const char* key) {
    if (value <= 0) {
        throw std::invalid_argument(std::string(key) + " must be positive");
    }
}

}  // namespace

Config LoadConfig(const std::string& path) {
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg(
        new Poco::Util::JSONConfiguration(path));

    Config config;
    config.api.base_url = cfg->getString("api.base_url", config.api.base_url);
    config.api.api_key = cfg->getString("api.api_key", "");
    config.api.timeout_seconds = cfg->getInt("api.timeout_seconds", config.api.timeout_seconds);

    config.upload.batch_size = cfg->getInt("upload.batch_size", config.upload.batch_size);
    config.upload.max_concurrency =
        cfg->getInt("upload.max_concurrency", config.upload.max_concurrency);
    config.upload.url_page_size = cfg->getInt("upload.url_page_size", config.upload.url_page_size);

    config.status.max_attempts = cfg->getInt("status.max_attempts", config.status.max_attempts);
    config.status.interval_ms = cfg->getInt("status.interval_ms", config.status.interval_ms);
    config.status.page_size = cfg->getInt("status.page_size", config.status.page_size);

    config.observability.log_level =
        cfg->getString("observability.log_level", config.observability.log_level);

    ValidateConfig(config);
    return config;
}

void ValidateConfig(const Config& config) {
    if (IsBlank(config.api.base_url)) {
        throw std::invalid_argument("api.base_url must not be empty");
    }
    RequirePositive(config.api.timeout_seconds, "api.timeout_seconds");
    RequirePositive(config.upload.batch_size, "upload.batch_size");
    RequirePositive(config.upload.max_concurrency, "upload.max_concurrency");
    RequirePositive(config.upload.url_page_size, "upload.url_page_size");
    RequirePositive(config.status.max_attempts, "status.max_attempts");
    RequirePositive(config.status.page_size, "status.page_size");
    if (config.status.interval_ms < 0) {
        throw std::invalid_argument("status.interval_ms must not be negative");
    }
}

}  // namespace assetup::core
