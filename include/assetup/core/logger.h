#pragma once

#include <string>

namespace assetup::core {

void InitLogging(const std::string& level);
void LogInfo(const std::string& message);
void LogWarning(const std::string& message);
void LogError(const std::string& message);
void LogDebug(const std::string& message);
/// @brief Log a structured JSON line for an outbound HTTP call.
///
/// The query string of `target` is dropped: presigned URLs carry credentials there.
void LogHttpCall(const std::string& request_id,
                 const std::string& method,
                 const std::string& target,
                 int status,
                 long long latency_ms);

}  // namespace assetup::core
