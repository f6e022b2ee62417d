#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "assetup/core/result.h"

namespace Poco::Net {
class HTTPClientSession;
}

namespace assetup::http {

/// @brief Outbound request. `url` is absolute; its path and query are sent verbatim.
struct HttpRequest {
    std::string method;
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string content_type;
    std::string body;
};

/// @brief Received response. Header names are stored lower-case.
struct HttpResponse {
    int status{0};
    std::map<std::string, std::string> headers;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
    std::optional<std::string> Header(const std::string& name) const;
};

/// @brief Blocking HTTP transport. Implementations must allow concurrent Send calls.
///
/// Only transport failures (DNS, connect, TLS, timeout) are reported as errors
/// (kTransportError); any HTTP status, including 4xx/5xx, is a successful Send.
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual core::Result<HttpResponse> Send(const HttpRequest& request) = 0;
};

/// @brief HttpClient over Poco::Net, one client session per request.
///
/// Live sessions are registered so AbortInFlight() can close their sockets
/// from another thread; blocked Send calls then fail with kTransportError.
class PocoHttpClient : public HttpClient {
public:
    explicit PocoHttpClient(std::chrono::seconds timeout);

    core::Result<HttpResponse> Send(const HttpRequest& request) override;

    /// @brief Closes every open session and refuses further requests. Thread-safe.
    void AbortInFlight();
    bool aborted() const { return aborted_.load(); }
    std::size_t in_flight() const;

    /// @brief Path, query and nothing else of an absolute URL ("/" when empty).
    static std::string RequestTarget(const std::string& url);

private:
    void Register(Poco::Net::HTTPClientSession* session);
    void Unregister(Poco::Net::HTTPClientSession* session);

    std::chrono::seconds timeout_;
    std::atomic<bool> aborted_{false};
    mutable std::mutex sessions_mutex_;
    std::set<Poco::Net::HTTPClientSession*> sessions_;
};

}  // namespace assetup::http
