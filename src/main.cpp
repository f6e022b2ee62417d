#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include <Poco/Exception.h>

#include "assetup/core/cancellation.h"
#include "assetup/core/config.h"
#include "assetup/core/logger.h"
#include "assetup/http/http_client.h"
#include "assetup/observability/metrics.h"
#include "assetup/upload/multipart_uploader.h"

namespace {

assetup::core::CancellationToken g_cancellation;

void HandleInterrupt(int) {
    // Repeated interrupts only re-set the flag; the run unwinds and removes its scratch blobs.
    g_cancellation.Cancel();
}

/// @brief Closes the client's open sockets once the token fires.
///
/// Signal handlers may only touch the atomic flag, so a helper thread turns
/// the flag into PocoHttpClient::AbortInFlight().
class InterruptWatcher {
public:
    explicit InterruptWatcher(std::shared_ptr<assetup::http::PocoHttpClient> http)
        : http_(std::move(http)), thread_([this] { Watch(); }) {}

    ~InterruptWatcher() {
        stopping_.store(true);
        thread_.join();
    }

    InterruptWatcher(const InterruptWatcher&) = delete;
    InterruptWatcher& operator=(const InterruptWatcher&) = delete;

private:
    void Watch() {
        while (!stopping_.load()) {
            if (g_cancellation.cancelled()) {
                assetup::core::LogWarning("Interrupt received, aborting in-flight requests");
                http_->AbortInFlight();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    std::shared_ptr<assetup::http::PocoHttpClient> http_;
    std::atomic<bool> stopping_{false};
    std::thread thread_;
};

bool HasFlag(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == key) {
            return true;
        }
    }
    return false;
}

std::string GetArgValue(int argc, char** argv, const std::string& key,
                        const std::string& default_value) {
    for (int i = 1; i < argc - 1; ++i) {
        if (argv[i] == key) {
            return argv[i + 1];
        }
    }
    return default_value;
}

int GetIntArg(int argc, char** argv, const std::string& key, int default_value) {
    const auto raw = GetArgValue(argc, argv, key, "");
    if (raw.empty()) {
        return default_value;
    }
    std::size_t used = 0;
    const int value = std::stoi(raw, &used);
    if (used != raw.size()) {
        throw std::invalid_argument(key + " expects an integer, got '" + raw + "'");
    }
    return value;
}

void PrintUsage(std::ostream& out) {
    out << "Usage: assetup_upload --file <path> --api-key <key> [options]\n"
           "\n"
           "Options:\n"
           "  --file <path>              file to upload (required)\n"
           "  --api-key <key>            API key (required; or ASSETUP_API_KEY)\n"
           "  --filename <name>          asset name (default: file name)\n"
           "  --type <type>              asset type (default: video)\n"
           "  --base-url <url>           API root (default: https://api.twelvelabs.io/v1.3)\n"
           "  --batch-size <n>           chunks per report batch (default: 10)\n"
           "  --config <path>            JSON file with client defaults\n"
           "  --log-level <level>        trace|debug|information|warning|error\n"
           "  --status-attempts <n>      final status checks before giving up (default: 1)\n"
           "  --status-interval-ms <n>   delay between status checks (default: 2000)\n"
           "  --help                     show this message\n";
}

assetup::core::Config BuildConfig(int argc, char** argv) {
    const auto config_path = GetArgValue(argc, argv, "--config", "");
    auto config = config_path.empty() ? assetup::core::Config{}
                                      : assetup::core::LoadConfig(config_path);

    if (const char* env_key = std::getenv("ASSETUP_API_KEY"); env_key && *env_key) {
        config.api.api_key = env_key;
    }
    config.api.api_key = GetArgValue(argc, argv, "--api-key", config.api.api_key);
    config.api.base_url = GetArgValue(argc, argv, "--base-url", config.api.base_url);
    config.upload.batch_size = GetIntArg(argc, argv, "--batch-size", config.upload.batch_size);
    config.status.max_attempts =
        GetIntArg(argc, argv, "--status-attempts", config.status.max_attempts);
    config.status.interval_ms =
        GetIntArg(argc, argv, "--status-interval-ms", config.status.interval_ms);
    config.observability.log_level =
        GetArgValue(argc, argv, "--log-level", config.observability.log_level);

    assetup::core::ValidateConfig(config);
    if (config.api.api_key.empty()) {
        throw std::invalid_argument("--api-key is required");
    }
    return config;
}

}  // namespace

int main(int argc, char** argv) {
    if (HasFlag(argc, argv, "--help")) {
        PrintUsage(std::cout);
        return 0;
    }

    assetup::core::Config config;
    assetup::upload::UploadRequest request;
    try {
        config = BuildConfig(argc, argv);
        request.file_path = GetArgValue(argc, argv, "--file", "");
        if (request.file_path.empty()) {
            throw std::invalid_argument("--file is required");
        }
        request.filename = GetArgValue(argc, argv, "--filename", "");
        request.asset_type = GetArgValue(argc, argv, "--type", "video");
    } catch (const Poco::Exception& ex) {
        std::cerr << "Error: " << ex.displayText() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n\n";
        PrintUsage(std::cerr);
        return 1;
    }

    assetup::core::InitLogging(config.observability.log_level);
    std::signal(SIGINT, HandleInterrupt);
    std::signal(SIGTERM, HandleInterrupt);

    assetup::core::LogInfo("Starting multipart upload of " + request.file_path.string() +
                           " (batch size " + std::to_string(config.upload.batch_size) + ")");

    const auto started = std::chrono::steady_clock::now();
    assetup::core::Result<assetup::upload::UploadOutcome> outcome(
        assetup::core::MakeError(assetup::core::ErrorCode::kInternal, "upload did not run"));
    try {
        auto http = std::make_shared<assetup::http::PocoHttpClient>(
            std::chrono::seconds(config.api.timeout_seconds));
        InterruptWatcher watcher(http);
        assetup::upload::MultipartUploader uploader(config, http, &g_cancellation);
        outcome = uploader.Upload(request);
    } catch (const Poco::Exception& ex) {
        std::cerr << "Error: " << ex.displayText() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
    assetup::core::LogDebug("Run metrics:\n" + assetup::observability::RenderMetrics());

    if (!outcome.ok()) {
        if (outcome.error().code == assetup::core::ErrorCode::kCancelled ||
            g_cancellation.cancelled()) {
            std::cerr << "Upload cancelled by user\n";
        } else {
            std::cerr << "Error: " << assetup::core::Describe(outcome.error()) << "\n";
        }
        return 1;
    }

    const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started);
    std::ostringstream summary;
    summary << "Upload completed in " << std::fixed << std::setprecision(1) << elapsed.count()
            << " seconds (" << outcome.value().total_chunks << " chunks, "
            << outcome.value().batches_reported << " batches)";
    assetup::core::LogInfo(summary.str());

    std::cout << outcome.value().asset_url << std::endl;
    return 0;
}
