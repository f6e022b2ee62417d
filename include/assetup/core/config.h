#pragma once

#include <string>

namespace assetup::core {

/// @brief Remote asset service endpoint and credential.
struct ApiConfig {
    std::string base_url{"https://api.twelvelabs.io/v1.3"};
    std::string api_key;
    int timeout_seconds{300};
};

/// @brief Batch partitioning and worker pool sizing.
struct UploadConfig {
    int batch_size{10};
    int max_concurrency{5};
    int url_page_size{10};
};

/// @brief Fallback status polling policy used when no report carried the asset URL.
struct StatusPollConfig {
    int max_attempts{1};
    int interval_ms{2000};
    int page_size{50};
};

/// @brief Observability settings (logging).
struct ObservabilityConfig {
    std::string log_level{"information"};
};

/// @brief Top-level configuration for the upload client.
struct Config {
    ApiConfig api;
    UploadConfig upload;
    StatusPollConfig status;
    ObservabilityConfig observability;
};

/// @brief Load client configuration from a JSON file, falling back to defaults per key.
Config LoadConfig(const std::string& path);
/// @brief Throws std::invalid_argument when a setting is out of range.
void ValidateConfig(const Config& config);

}  // namespace assetup::core
