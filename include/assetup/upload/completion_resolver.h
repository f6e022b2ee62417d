#pragma once

#include <functional>
#include <memory>
#include <string>

#include "assetup/api/asset_api_client.h"
#include "assetup/core/cancellation.h"
#include "assetup/core/config.h"
#include "assetup/core/result.h"

namespace assetup::upload {

/// @brief Fallback completion path: checks session status and resolves the asset URL.
///
/// Polls at most `max_attempts` times, sleeping `interval_ms` between attempts.
/// With the default policy exactly one status check is made. A session that is
/// not `completed` after the last attempt fails with kUploadIncomplete.
class CompletionResolver {
public:
    using Sleeper = std::function<void(int milliseconds)>;

    CompletionResolver(core::StatusPollConfig policy, std::shared_ptr<api::AssetApiClient> api,
                       const core::CancellationToken* cancellation = nullptr,
                       Sleeper sleeper = {});

    core::Result<std::string> Resolve(const api::UploadSession& session);

private:
    core::StatusPollConfig policy_;
    std::shared_ptr<api::AssetApiClient> api_;
    const core::CancellationToken* cancellation_;
    Sleeper sleeper_;
};

}  // namespace assetup::upload
