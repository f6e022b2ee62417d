#pragma once

#include <atomic>

namespace assetup::core {

/// @brief Cooperative cancellation flag shared between a signal handler and the upload flow.
///
/// Cancel() only stores to a lock-free atomic, so it may be called from a signal
/// handler. Work already on the wire is not interrupted; stages check the flag
/// before starting new work.
class CancellationToken {
public:
    void Cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }
    bool cancelled() const noexcept { return cancelled_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> cancelled_{false};
};

}  // namespace assetup::core
