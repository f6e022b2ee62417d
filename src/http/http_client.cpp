#include "assetup/http/http_client.h"

#include <cctype>
#include <memory>
#include <mutex>

#include <Poco/Exception.h>
#include <Poco/Net/Context.h>
#include <Poco/Net/HTTPClientSession.h>
#include <Poco/Net/HTTPRequest.h>
#include <Poco/Net/HTTPResponse.h>
#include <Poco/Net/HTTPSClientSession.h>
#include <Poco/Net/RejectCertificateHandler.h>
#include <Poco/Net/SSLManager.h>
#include <Poco/StreamCopier.h>
#include <Poco/Timespan.h>
#include <Poco/URI.h>

#include "assetup/core/logger.h"
#include "assetup/observability/metrics.h"

namespace assetup::http {

namespace {

std::string ToLower(std::string value) {
    for (auto& c : value) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return value;
}

void InitSslOnce() {
    // Initialize Poco SSL once; every HTTPS session shares the default client context.
    static std::once_flag ssl_once;
    std::call_once(ssl_once, []() {
        Poco::Net::initializeSSL();
        Poco::Net::Context::Ptr context =
            new Poco::Net::Context(Poco::Net::Context::CLIENT_USE, "", "", "",
                                   Poco::Net::Context::VERIFY_RELAXED, 9, true);
        Poco::SharedPtr<Poco::Net::InvalidCertificateHandler> handler(
            new Poco::Net::RejectCertificateHandler(false));
        Poco::Net::SSLManager::instance().initializeClient(nullptr, handler, context);
    });
}

std::string FindRequestId(const HttpRequest& request) {
    for (const auto& [name, value] : request.headers) {
        if (ToLower(name) == "x-request-id") {
            return value;
        }
    }
    return "-";
}

}  // namespace

std::optional<std::string> HttpResponse::Header(const std::string& name) const {
    auto it = headers.find(ToLower(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

PocoHttpClient::PocoHttpClient(std::chrono::seconds timeout) : timeout_(timeout) {}

void PocoHttpClient::Register(Poco::Net::HTTPClientSession* session) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.insert(session);
}

void PocoHttpClient::Unregister(Poco::Net::HTTPClientSession* session) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.erase(session);
}

std::size_t PocoHttpClient::in_flight() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

void PocoHttpClient::AbortInFlight() {
    aborted_.store(true);
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    if (!sessions_.empty()) {
        core::LogWarning("Aborting " + std::to_string(sessions_.size()) + " in-flight requests");
    }
    for (auto* session : sessions_) {
        try {
            session->abort();
        } catch (const Poco::Exception& ex) {
            core::LogDebug("Session abort failed: " + ex.displayText());
        }
    }
}

std::string PocoHttpClient::RequestTarget(const std::string& url) {
    // Presigned signatures cover the exact path and query bytes, so the target is
    // cut out of the original string instead of being re-encoded through Poco::URI.
    auto authority = url.find("://");
    authority = authority == std::string::npos ? 0 : authority + 3;
    auto start = url.find_first_of("/?#", authority);
    if (start == std::string::npos) {
        return "/";
    }
    auto target = url.substr(start);
    const auto fragment = target.find('#');
    if (fragment != std::string::npos) {
        target.erase(fragment);
    }
    if (target.empty() || target.front() != '/') {
        target.insert(target.begin(), '/');
    }
    return target;
}

core::Result<HttpResponse> PocoHttpClient::Send(const HttpRequest& request) {
    const auto started = std::chrono::steady_clock::now();
    const auto request_id = FindRequestId(request);
    const auto target = RequestTarget(request.url);
    if (aborted_.load()) {
        return core::MakeError(core::ErrorCode::kTransportError,
                               "client aborted: " + request.method + " " + target);
    }

    try {
        Poco::URI uri(request.url);
        const auto scheme = ToLower(uri.getScheme());
        if (scheme != "http" && scheme != "https") {
            return core::MakeError(core::ErrorCode::kTransportError,
                                   "unsupported url scheme: " + scheme);
        }
        const bool is_https = scheme == "https";
        const std::string host = uri.getHost();
        const int port = uri.getPort() > 0 ? uri.getPort() : (is_https ? 443 : 80);

        std::unique_ptr<Poco::Net::HTTPClientSession> session;
        if (is_https) {
            InitSslOnce();
            session = std::make_unique<Poco::Net::HTTPSClientSession>(
                host, static_cast<Poco::UInt16>(port));
        } else {
            session = std::make_unique<Poco::Net::HTTPClientSession>(
                host, static_cast<Poco::UInt16>(port));
        }
        session->setTimeout(Poco::Timespan(static_cast<long>(timeout_.count()), 0));

        Register(session.get());
        struct Registration {
            PocoHttpClient* client;
            Poco::Net::HTTPClientSession* session;
            ~Registration() { client->Unregister(session); }
        } registration{this, session.get()};
        // An abort that raced the registration above would otherwise be missed.
        if (aborted_.load()) {
            return core::MakeError(core::ErrorCode::kTransportError,
                                   "client aborted: " + request.method + " " + target);
        }

        Poco::Net::HTTPRequest req(request.method, target, Poco::Net::HTTPMessage::HTTP_1_1);
        for (const auto& [name, value] : request.headers) {
            req.set(name, value);
        }
        if (!request.content_type.empty()) {
            req.setContentType(request.content_type);
        }
        if (request.method != Poco::Net::HTTPRequest::HTTP_GET || !request.body.empty()) {
            req.setContentLength(static_cast<std::streamsize>(request.body.size()));
        }

        std::ostream& os = session->sendRequest(req);
        os.write(request.body.data(), static_cast<std::streamsize>(request.body.size()));

        Poco::Net::HTTPResponse res;
        std::istream& rs = session->receiveResponse(res);

        HttpResponse response;
        response.status = static_cast<int>(res.getStatus());
        for (auto it = res.begin(); it != res.end(); ++it) {
            response.headers[ToLower(it->first)] = it->second;
        }
        Poco::StreamCopier::copyToString(rs, response.body);

        const auto latency_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                    std::chrono::steady_clock::now() - started)
                                    .count();
        core::LogHttpCall(request_id, request.method, target, response.status, latency_ms);
        observability::RecordHttpCall(response.status, latency_ms);
        return response;
    } catch (const Poco::Exception& ex) {
        core::LogHttpCall(request_id, request.method, target, 0, 0);
        observability::RecordHttpCall(0, 0);
        return core::MakeError(core::ErrorCode::kTransportError, ex.displayText());
    } catch (const std::exception& ex) {
        core::LogHttpCall(request_id, request.method, target, 0, 0);
        observability::RecordHttpCall(0, 0);
        return core::MakeError(core::ErrorCode::kTransportError, ex.what());
    }
}

}  // namespace assetup::http
