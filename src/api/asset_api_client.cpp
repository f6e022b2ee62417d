#include "assetup/api/asset_api_client.h"

#include <sstream>
#include <utility>

#include <Poco/Exception.h>
#include <Poco/JSON/Array.h>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>
#include <Poco/Net/HTTPRequest.h>
#include <Poco/URI.h>
#include <Poco/UUIDGenerator.h>

#include "assetup/core/logger.h"

namespace assetup::api {

namespace {

std::string TrimTrailingSlashes(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

std::string EncodeSegment(const std::string& value) {
    std::string encoded;
    Poco::URI::encode(value, "/?#%&=+ ", encoded);
    return encoded;
}

std::string Stringify(const Poco::JSON::Object::Ptr& obj) {
    std::stringstream ss;
    obj->stringify(ss);
    return ss.str();
}

Poco::JSON::Object::Ptr ParseObject(const std::string& body) {
    Poco::JSON::Parser parser;
    auto obj = parser.parse(body).extract<Poco::JSON::Object::Ptr>();
    if (!obj) {
        throw Poco::DataFormatException("response is not a JSON object");
    }
    return obj;
}

std::optional<std::string> OptionalString(const Poco::JSON::Object::Ptr& obj,
                                          const std::string& key) {
    if (!obj->has(key) || obj->isNull(key)) {
        return std::nullopt;
    }
    auto value = obj->getValue<std::string>(key);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

int IntOr(const Poco::JSON::Object::Ptr& obj, const std::string& key, int fallback) {
    if (!obj->has(key) || obj->isNull(key)) {
        return fallback;
    }
    return obj->getValue<int>(key);
}

std::vector<PresignedUrlEntry> ParseUrlEntries(const Poco::JSON::Object::Ptr& obj) {
    std::vector<PresignedUrlEntry> entries;
    auto urls = obj->getArray("upload_urls");
    if (!urls) {
        return entries;
    }
    entries.reserve(urls->size());
    for (std::size_t i = 0; i < urls->size(); ++i) {
        auto item = urls->getObject(static_cast<unsigned int>(i));
        if (!item) {
            continue;
        }
        PresignedUrlEntry entry;
        entry.chunk_index = item->getValue<int>("chunk_index");
        entry.url = item->getValue<std::string>("url");
        entries.push_back(std::move(entry));
    }
    return entries;
}

core::Error InvalidResponse(const std::string& operation, const std::string& detail) {
    return core::MakeError(core::ErrorCode::kInvalidResponse,
                           operation + " returned an unexpected body: " + detail);
}

}  // namespace

SessionStatus ParseSessionStatus(const std::string& value) {
    if (value == "pending") {
        return SessionStatus::kPending;
    }
    if (value == "uploading") {
        return SessionStatus::kUploading;
    }
    if (value == "completed") {
        return SessionStatus::kCompleted;
    }
    if (value == "failed") {
        return SessionStatus::kFailed;
    }
    return SessionStatus::kUnknown;
}

const char* SessionStatusName(SessionStatus status) {
    switch (status) {
        case SessionStatus::kPending:
            return "pending";
        case SessionStatus::kUploading:
            return "uploading";
        case SessionStatus::kCompleted:
            return "completed";
        case SessionStatus::kFailed:
            return "failed";
        case SessionStatus::kUnknown:
            break;
    }
    return "unknown";
}

AssetApiClient::AssetApiClient(core::ApiConfig config, std::shared_ptr<http::HttpClient> http)
    : config_(std::move(config)),
      base_url_(TrimTrailingSlashes(config_.base_url)),
      http_(std::move(http)) {}

core::Result<http::HttpResponse> AssetApiClient::Call(const std::string& method,
                                                      const std::string& path,
                                                      const std::string& body,
                                                      core::ErrorCode failure_code,
                                                      const std::string& operation) {
    http::HttpRequest request;
    request.method = method;
    request.url = base_url_ + path;
    request.headers.emplace_back("x-api-key", config_.api_key);
    request.headers.emplace_back("Accept", "application/json");
    request.headers.emplace_back("User-Agent", std::string("assetup/") + ASSETUP_VERSION);
    request.headers.emplace_back("X-Request-Id", Poco::UUIDGenerator().createOne().toString());
    if (!body.empty()) {
        request.content_type = "application/json";
        request.body = body;
    }

    auto sent = http_->Send(request);
    if (!sent.ok()) {
        return core::MakeError(failure_code, operation + " failed: " + sent.error().message);
    }
    auto response = sent.take();
    if (!response.ok()) {
        // Keep the body: the service explains rejections there.
        return core::MakeError(failure_code,
                               operation + " rejected with HTTP " +
                                   std::to_string(response.status) + ": " + response.body,
                               response.status);
    }
    return response;
}

core::Result<CreatedSession> AssetApiClient::CreateSession(const std::string& filename,
                                                           const std::string& asset_type,
                                                           std::uint64_t total_size) {
    Poco::JSON::Object::Ptr payload = new Poco::JSON::Object();
    payload->set("filename", filename);
    payload->set("type", asset_type);
    payload->set("total_size", static_cast<Poco::UInt64>(total_size));

    auto response = Call(Poco::Net::HTTPRequest::HTTP_POST, "/assets/multipart-uploads",
                         Stringify(payload), core::ErrorCode::kSessionCreateError,
                         "create session");
    if (!response.ok()) {
        return response.error();
    }

    try {
        auto obj = ParseObject(response.value().body);
        CreatedSession created;
        created.session.upload_id = obj->getValue<std::string>("upload_id");
        created.session.asset_id = obj->getValue<std::string>("asset_id");
        created.session.total_chunks = obj->getValue<int>("total_chunks");
        const auto chunk_size = obj->getValue<Poco::Int64>("chunk_size");
        if (chunk_size <= 0 || created.session.total_chunks < 0 ||
            created.session.upload_id.empty()) {
            return InvalidResponse("create session", "chunk_size, total_chunks or upload_id");
        }
        created.session.chunk_size = static_cast<std::uint64_t>(chunk_size);
        created.session.status = SessionStatus::kPending;
        created.upload_urls = ParseUrlEntries(obj);
        core::LogInfo("Upload session " + created.session.upload_id + " created for asset " +
                      created.session.asset_id + ": " +
                      std::to_string(created.session.total_chunks) + " chunks of " +
                      std::to_string(created.session.chunk_size) + " bytes, " +
                      std::to_string(created.upload_urls.size()) + " initial urls");
        return created;
    } catch (const Poco::Exception& ex) {
        return InvalidResponse("create session", ex.displayText());
    } catch (const std::exception& ex) {
        return InvalidResponse("create session", ex.what());
    }
}

core::Result<std::vector<PresignedUrlEntry>> AssetApiClient::FetchPresignedUrls(
    const std::string& upload_id, int page, int limit) {
    Poco::JSON::Object::Ptr payload = new Poco::JSON::Object();
    payload->set("page", page);
    payload->set("limit", limit);

    auto response = Call(Poco::Net::HTTPRequest::HTTP_POST,
                         "/assets/multipart-uploads/" + EncodeSegment(upload_id) +
                             "/presigned-urls",
                         Stringify(payload), core::ErrorCode::kUrlRefillError,
                         "fetch presigned urls");
    if (!response.ok()) {
        return response.error();
    }
    try {
        auto entries = ParseUrlEntries(ParseObject(response.value().body));
        core::LogDebug("Fetched " + std::to_string(entries.size()) +
                       " presigned urls (page " + std::to_string(page) + ")");
        return entries;
    } catch (const Poco::Exception& ex) {
        return InvalidResponse("fetch presigned urls", ex.displayText());
    } catch (const std::exception& ex) {
        return InvalidResponse("fetch presigned urls", ex.what());
    }
}

core::Result<CompletionReport> AssetApiClient::ReportChunks(
    const std::string& upload_id, const std::vector<ChunkProof>& proofs) {
    Poco::JSON::Array::Ptr completed = new Poco::JSON::Array();
    for (const auto& proof : proofs) {
        Poco::JSON::Object::Ptr item = new Poco::JSON::Object();
        item->set("chunk_index", proof.chunk_index);
        item->set("proof", proof.proof);
        item->set("proof_type", proof.proof_type);
        item->set("chunk_size", static_cast<Poco::UInt64>(proof.chunk_size_bytes));
        completed->add(item);
    }
    Poco::JSON::Object::Ptr payload = new Poco::JSON::Object();
    payload->set("completed_chunks", completed);

    auto response = Call(Poco::Net::HTTPRequest::HTTP_POST,
                         "/assets/multipart-uploads/" + EncodeSegment(upload_id),
                         Stringify(payload), core::ErrorCode::kReportError, "report chunks");
    if (!response.ok()) {
        return response.error();
    }
    try {
        auto obj = ParseObject(response.value().body);
        CompletionReport report;
        report.processed_chunks = IntOr(obj, "processed_chunks", 0);
        report.duplicate_chunks = IntOr(obj, "duplicate_chunks", 0);
        report.total_completed = IntOr(obj, "total_completed", 0);
        report.url = OptionalString(obj, "url");
        return report;
    } catch (const Poco::Exception& ex) {
        return InvalidResponse("report chunks", ex.displayText());
    } catch (const std::exception& ex) {
        return InvalidResponse("report chunks", ex.what());
    }
}

core::Result<UploadStatus> AssetApiClient::GetUploadStatus(const std::string& upload_id,
                                                           int page, int limit) {
    auto response = Call(Poco::Net::HTTPRequest::HTTP_GET,
                         "/assets/multipart-uploads/" + EncodeSegment(upload_id) +
                             "?page=" + std::to_string(page) + "&limit=" + std::to_string(limit),
                         "", core::ErrorCode::kStatusError, "get upload status");
    if (!response.ok()) {
        return response.error();
    }
    try {
        auto obj = ParseObject(response.value().body);
        UploadStatus status;
        status.raw_status = obj->getValue<std::string>("status");
        status.status = ParseSessionStatus(status.raw_status);
        status.chunks_completed = IntOr(obj, "chunks_completed", 0);
        status.total_chunks = IntOr(obj, "total_chunks", 0);
        return status;
    } catch (const Poco::Exception& ex) {
        return InvalidResponse("get upload status", ex.displayText());
    } catch (const std::exception& ex) {
        return InvalidResponse("get upload status", ex.what());
    }
}

core::Result<std::string> AssetApiClient::GetAsset(const std::string& asset_id) {
    auto response = Call(Poco::Net::HTTPRequest::HTTP_GET, "/assets/" + EncodeSegment(asset_id),
                         "", core::ErrorCode::kAssetError, "get asset");
    if (!response.ok()) {
        return response.error();
    }
    try {
        auto url = OptionalString(ParseObject(response.value().body), "url");
        if (!url) {
            return InvalidResponse("get asset", "url missing");
        }
        return *url;
    } catch (const Poco::Exception& ex) {
        return InvalidResponse("get asset", ex.displayText());
    } catch (const std::exception& ex) {
        return InvalidResponse("get asset", ex.what());
    }
}

}  // namespace assetup::api
