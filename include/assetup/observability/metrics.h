#pragma once

#include <cstdint>
#include <string>

namespace assetup::observability {

/// @brief Render Prometheus-style counters for the current process.
std::string RenderMetrics();
/// @brief Record an outbound HTTP call; status 0 means a transport failure.
void RecordHttpCall(int status_code, long long latency_ms);
void RecordChunkUploaded(std::uint64_t bytes);
void RecordUrlRefill();
void RecordBatchReported(int processed_chunks, int duplicate_chunks);
/// @brief Reset all counters (tests only).
void ResetMetrics();

}  // namespace assetup::observability
