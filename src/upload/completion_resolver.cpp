#include "assetup/upload/completion_resolver.h"

#include <chrono>
#include <thread>
#include <utility>

#include "assetup/core/logger.h"

namespace assetup::upload {

CompletionResolver::CompletionResolver(core::StatusPollConfig policy,
                                       std::shared_ptr<api::AssetApiClient> api,
                                       const core::CancellationToken* cancellation,
                                       Sleeper sleeper)
    : policy_(policy),
      api_(std::move(api)),
      cancellation_(cancellation),
      sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](int milliseconds) {
            std::this_thread::sleep_for(std::chrono::milliseconds(milliseconds));
        };
    }
}

core::Result<std::string> CompletionResolver::Resolve(const api::UploadSession& session) {
    std::string last_status = api::SessionStatusName(session.status);
    const int attempts = policy_.max_attempts > 0 ? policy_.max_attempts : 1;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (cancellation_ && cancellation_->cancelled()) {
            return core::MakeError(core::ErrorCode::kCancelled, "upload cancelled");
        }
        if (attempt > 1 && policy_.interval_ms > 0) {
            sleeper_(policy_.interval_ms);
        }

        core::LogInfo("Checking final status (attempt " + std::to_string(attempt) + "/" +
                      std::to_string(attempts) + ")");
        auto status = api_->GetUploadStatus(session.upload_id, 1, policy_.page_size);
        if (!status.ok()) {
            return status.error();
        }
        last_status = status.value().raw_status;
        core::LogInfo("Final status: " + last_status + ", completed " +
                      std::to_string(status.value().chunks_completed) + "/" +
                      std::to_string(status.value().total_chunks));

        if (status.value().status == api::SessionStatus::kCompleted) {
            return api_->GetAsset(session.asset_id);
        }
        if (status.value().status == api::SessionStatus::kFailed) {
            break;
        }
    }

    return core::MakeError(core::ErrorCode::kUploadIncomplete,
                           "upload not completed, status: " + last_status);
}

}  // namespace assetup::upload
