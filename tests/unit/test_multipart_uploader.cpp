#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include <gtest/gtest.h>

#include "assetup/upload/completion_resolver.h"
#include "assetup/upload/file_chunker.h"
#include "assetup/upload/multipart_uploader.h"
#include "support/fake_asset_service.h"
#include "support/temp_files.h"

namespace {

using assetup::core::ErrorCode;
using assetup::test_support::FakeAssetService;
using assetup::test_support::FakeHttpClient;
using assetup::upload::FileChunker;
using assetup::upload::MultipartUploader;
using assetup::upload::UploadRequest;

assetup::core::Config TestConfig() {
    assetup::core::Config config;
    config.api.api_key = "tlk_test";
    return config;
}

std::string Reassemble(const std::map<int, std::string>& stored) {
    std::string out;
    for (const auto& [index, bytes] : stored) {
        out += bytes;
    }
    return out;
}

class MultipartUploaderTest : public ::testing::Test {
protected:
    std::filesystem::path Source(std::size_t size) {
        content_ = assetup::test_support::PatternBytes(size);
        return assetup::test_support::WriteFile(dir_.path() / "clip.mp4", content_);
    }

    assetup::core::Result<assetup::upload::UploadOutcome> Upload(
        FakeAssetService& service, const std::filesystem::path& file,
        assetup::core::Config config = TestConfig(),
        const assetup::core::CancellationToken* cancellation = nullptr) {
        MultipartUploader uploader(std::move(config), std::make_shared<FakeHttpClient>(service),
                                   cancellation);
        UploadRequest request;
        request.file_path = file;
        return uploader.Upload(request);
    }

    assetup::test_support::TempDir dir_;
    std::string content_;
};

}  // namespace

TEST_F(MultipartUploaderTest, SmallFileCompletesFromBatchReport) {
    FakeAssetService service(FakeAssetService::Options{});
    const auto file = Source(10);

    auto outcome = Upload(service, file);
    ASSERT_TRUE(outcome.ok()) << assetup::core::Describe(outcome.error());
    EXPECT_EQ(outcome.value().asset_url, "https://cdn.test/assets/asset-1/video.mp4");
    EXPECT_TRUE(outcome.value().completed_early);
    EXPECT_EQ(outcome.value().upload_id, "upload-abc");
    EXPECT_EQ(outcome.value().asset_id, "asset-1");
    EXPECT_EQ(outcome.value().total_chunks, 3);
    EXPECT_EQ(outcome.value().batches_reported, 1);

    EXPECT_EQ(Reassemble(service.stored_chunks()), content_);
    EXPECT_EQ(service.created_filename(), "clip.mp4");
    EXPECT_EQ(service.created_total_size(), 10u);
    EXPECT_TRUE(service.status_queries().empty());
    EXPECT_EQ(service.asset_calls(), 0);
    for (const auto& key : service.api_keys()) {
        EXPECT_EQ(key, "tlk_test");
    }
    EXPECT_FALSE(std::filesystem::exists(FileChunker::ScratchDirectoryFor(file)));
}

TEST_F(MultipartUploaderTest, LargeFileRefillsUrlsAcrossBatches) {
    FakeAssetService::Options options;
    options.chunk_size = 1;
    FakeAssetService service(options);
    const auto file = Source(25);

    auto outcome = Upload(service, file);
    ASSERT_TRUE(outcome.ok()) << assetup::core::Describe(outcome.error());
    EXPECT_EQ(outcome.value().batches_reported, 3);
    EXPECT_TRUE(outcome.value().completed_early);
    EXPECT_EQ(service.url_pages(), std::vector<int>({2, 3}));
    EXPECT_EQ(service.total_completed(), 25);
    EXPECT_EQ(Reassemble(service.stored_chunks()), content_);
}

TEST_F(MultipartUploaderTest, FallsBackToStatusCheckAndAssetLookup) {
    FakeAssetService::Options options;
    options.report_returns_url = false;
    FakeAssetService service(options);
    const auto file = Source(10);

    auto outcome = Upload(service, file);
    ASSERT_TRUE(outcome.ok()) << assetup::core::Describe(outcome.error());
    EXPECT_FALSE(outcome.value().completed_early);
    EXPECT_EQ(outcome.value().asset_url, "https://cdn.test/assets/asset-1/video.mp4");
    EXPECT_EQ(service.status_queries(), std::vector<std::string>({"page=1&limit=50"}));
    EXPECT_EQ(service.asset_calls(), 1);
}

TEST_F(MultipartUploaderTest, UnfinishedStatusIsUploadIncomplete) {
    FakeAssetService::Options options;
    options.report_returns_url = false;
    options.status_override = "uploading";
    FakeAssetService service(options);
    const auto file = Source(10);

    auto outcome = Upload(service, file);
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error().code, ErrorCode::kUploadIncomplete);
    EXPECT_NE(outcome.error().message.find("uploading"), std::string::npos);
    EXPECT_EQ(service.status_queries().size(), 1u);
    EXPECT_EQ(service.asset_calls(), 0);
    EXPECT_FALSE(std::filesystem::exists(FileChunker::ScratchDirectoryFor(file)));
}

TEST_F(MultipartUploaderTest, EmptyFileResolvesThroughStatus) {
    FakeAssetService::Options options;
    options.report_returns_url = false;
    FakeAssetService service(options);
    const auto file = Source(0);

    auto outcome = Upload(service, file);
    ASSERT_TRUE(outcome.ok()) << assetup::core::Describe(outcome.error());
    EXPECT_EQ(outcome.value().total_chunks, 0);
    EXPECT_EQ(outcome.value().batches_reported, 0);
    EXPECT_EQ(service.put_count(), 0);
    EXPECT_EQ(service.asset_calls(), 1);
}

TEST_F(MultipartUploaderTest, ChunkFailureStillRemovesScratchDirectory) {
    FakeAssetService::Options options;
    options.fail_put_chunk = 2;
    FakeAssetService service(options);
    const auto file = Source(10);

    auto outcome = Upload(service, file);
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error().code, ErrorCode::kChunkUploadError);
    EXPECT_EQ(outcome.error().chunk_index, 2);
    EXPECT_TRUE(service.reports().empty());
    EXPECT_FALSE(std::filesystem::exists(FileChunker::ScratchDirectoryFor(file)));
    EXPECT_TRUE(std::filesystem::exists(file));
}

TEST_F(MultipartUploaderTest, ChunkCountMismatchIsRejected) {
    FakeAssetService::Options options;
    options.total_chunks_override = 5;
    FakeAssetService service(options);
    const auto file = Source(10);

    auto outcome = Upload(service, file);
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error().code, ErrorCode::kInvalidResponse);
    EXPECT_EQ(service.put_count(), 0);
    EXPECT_FALSE(std::filesystem::exists(FileChunker::ScratchDirectoryFor(file)));
}

TEST_F(MultipartUploaderTest, SessionRejectionLeavesNoScratchState) {
    FakeAssetService::Options options;
    options.session_status_code = 401;
    FakeAssetService service(options);
    const auto file = Source(10);

    auto outcome = Upload(service, file);
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error().code, ErrorCode::kSessionCreateError);
    EXPECT_EQ(outcome.error().http_status, 401);
    EXPECT_FALSE(std::filesystem::exists(FileChunker::ScratchDirectoryFor(file)));
}

TEST_F(MultipartUploaderTest, MissingFileFailsBeforeAnyCall) {
    FakeAssetService service(FakeAssetService::Options{});

    auto outcome = Upload(service, dir_.path() / "absent.mp4");
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error().code, ErrorCode::kFileNotFound);
    EXPECT_EQ(service.session_count(), 0);
}

TEST_F(MultipartUploaderTest, ExplicitFilenameOverridesSourceName) {
    FakeAssetService service(FakeAssetService::Options{});
    const auto file = Source(6);

    MultipartUploader uploader(TestConfig(), std::make_shared<FakeHttpClient>(service));
    UploadRequest request;
    request.file_path = file;
    request.filename = "holiday.mp4";
    request.asset_type = "audio";
    ASSERT_TRUE(uploader.Upload(request).ok());
    EXPECT_EQ(service.created_filename(), "holiday.mp4");
}

TEST_F(MultipartUploaderTest, CancelledUploadCleansUp) {
    FakeAssetService service(FakeAssetService::Options{});
    const auto file = Source(10);
    assetup::core::CancellationToken token;
    token.Cancel();

    auto outcome = Upload(service, file, TestConfig(), &token);
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error().code, ErrorCode::kCancelled);
    EXPECT_EQ(service.put_count(), 0);
    EXPECT_FALSE(std::filesystem::exists(FileChunker::ScratchDirectoryFor(file)));
}

TEST_F(MultipartUploaderTest, StaleBlobsFromCrashedRunAreRemoved) {
    FakeAssetService::Options options;
    options.chunk_size = 40;
    FakeAssetService service(options);
    const auto file = Source(100);
    const auto scratch_path = FileChunker::ScratchDirectoryFor(file);
    std::filesystem::create_directories(scratch_path);
    for (int i = 1; i <= 10; ++i) {
        assetup::test_support::WriteFile(scratch_path / FileChunker::ChunkFileName(i), "stale");
    }

    auto outcome = Upload(service, file);
    ASSERT_TRUE(outcome.ok()) << assetup::core::Describe(outcome.error());
    EXPECT_EQ(outcome.value().total_chunks, 3);
    EXPECT_EQ(Reassemble(service.stored_chunks()), content_);
    EXPECT_FALSE(std::filesystem::exists(scratch_path));
}

TEST_F(MultipartUploaderTest, CancelDuringBatchStopsRemainingChunks) {
    FakeAssetService::Options options;
    options.chunk_size = 1;
    FakeAssetService service(options);
    const auto file = Source(10);
    assetup::core::CancellationToken token;
    service.set_put_hook([&token](int index) {
        if (index == 3) {
            token.Cancel();
        }
    });
    auto config = TestConfig();
    config.upload.max_concurrency = 1;

    auto outcome = Upload(service, file, config, &token);
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error().code, ErrorCode::kCancelled);
    EXPECT_EQ(service.put_count(), 3);
    EXPECT_TRUE(service.reports().empty());
    EXPECT_FALSE(std::filesystem::exists(FileChunker::ScratchDirectoryFor(file)));
}

namespace {

/// Forwards to the fake but throws on the batch report, as a failing worker pool would.
class ThrowingReportClient : public assetup::http::HttpClient {
public:
    explicit ThrowingReportClient(FakeAssetService& service) : inner_(service) {}

    assetup::core::Result<assetup::http::HttpResponse> Send(
        const assetup::http::HttpRequest& request) override {
        const auto target = assetup::http::PocoHttpClient::RequestTarget(request.url);
        if (request.method == "POST" && target.size() >= 11 &&
            target.compare(target.size() - 11, 11, "/upload-abc") == 0) {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again),
                                    "thread creation failed");
        }
        return inner_.Send(request);
    }

private:
    FakeHttpClient inner_;
};

}  // namespace

TEST_F(MultipartUploaderTest, UnexpectedExceptionBecomesInternalErrorAndCleansUp) {
    FakeAssetService service(FakeAssetService::Options{});
    const auto file = Source(10);

    MultipartUploader uploader(TestConfig(), std::make_shared<ThrowingReportClient>(service));
    UploadRequest request;
    request.file_path = file;
    auto outcome = uploader.Upload(request);
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error().code, ErrorCode::kInternal);
    EXPECT_NE(outcome.error().message.find("thread creation failed"), std::string::npos);
    EXPECT_EQ(service.put_count(), 3);
    EXPECT_FALSE(std::filesystem::exists(FileChunker::ScratchDirectoryFor(file)));
}

class CompletionResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        session_.upload_id = "upload-abc";
        session_.asset_id = "asset-1";
    }

    std::shared_ptr<assetup::api::AssetApiClient> Api(FakeAssetService& service) {
        assetup::core::ApiConfig api;
        api.api_key = "tlk_test";
        return std::make_shared<assetup::api::AssetApiClient>(
            api, std::make_shared<FakeHttpClient>(service));
    }

    assetup::api::UploadSession session_;
    std::vector<int> sleeps_;
};

TEST_F(CompletionResolverTest, PollsUpToMaxAttemptsWithInterval) {
    FakeAssetService::Options options;
    options.status_override = "uploading";
    FakeAssetService service(options);
    assetup::core::StatusPollConfig policy;
    policy.max_attempts = 3;
    policy.interval_ms = 1500;

    assetup::upload::CompletionResolver resolver(policy, Api(service), nullptr,
                                                 [this](int ms) { sleeps_.push_back(ms); });
    auto url = resolver.Resolve(session_);
    ASSERT_FALSE(url.ok());
    EXPECT_EQ(url.error().code, ErrorCode::kUploadIncomplete);
    EXPECT_EQ(service.status_queries().size(), 3u);
    EXPECT_EQ(sleeps_, std::vector<int>({1500, 1500}));
}

TEST_F(CompletionResolverTest, FailedStatusStopsPolling) {
    FakeAssetService::Options options;
    options.status_override = "failed";
    FakeAssetService service(options);
    assetup::core::StatusPollConfig policy;
    policy.max_attempts = 5;

    assetup::upload::CompletionResolver resolver(policy, Api(service), nullptr,
                                                 [this](int ms) { sleeps_.push_back(ms); });
    auto url = resolver.Resolve(session_);
    ASSERT_FALSE(url.ok());
    EXPECT_EQ(url.error().code, ErrorCode::kUploadIncomplete);
    EXPECT_NE(url.error().message.find("failed"), std::string::npos);
    EXPECT_EQ(service.status_queries().size(), 1u);
    EXPECT_TRUE(sleeps_.empty());
}

TEST_F(CompletionResolverTest, CompletedStatusResolvesAssetUrl) {
    FakeAssetService::Options options;
    options.status_override = "completed";
    options.asset_url = "https://cdn.test/a.mp4";
    FakeAssetService service(options);

    assetup::upload::CompletionResolver resolver(assetup::core::StatusPollConfig{}, Api(service));
    auto url = resolver.Resolve(session_);
    ASSERT_TRUE(url.ok()) << assetup::core::Describe(url.error());
    EXPECT_EQ(url.value(), "https://cdn.test/a.mp4");
}
