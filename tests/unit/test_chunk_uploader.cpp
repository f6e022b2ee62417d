#include <memory>
#include <string>

#include <gtest/gtest.h>

#include "assetup/upload/chunk_uploader.h"
#include "assetup/upload/file_chunker.h"
#include "support/temp_files.h"

namespace {

using assetup::core::ErrorCode;
using assetup::upload::ChunkDescriptor;
using assetup::upload::ChunkUploader;

/// Answers every request with a canned response and remembers the last request.
class CannedHttpClient : public assetup::http::HttpClient {
public:
    assetup::core::Result<assetup::http::HttpResponse> Send(
        const assetup::http::HttpRequest& request) override {
        last_request = request;
        ++calls;
        if (transport_error) {
            return assetup::core::MakeError(ErrorCode::kTransportError, "timed out");
        }
        return response;
    }

    assetup::http::HttpResponse response;
    assetup::http::HttpRequest last_request;
    bool transport_error{false};
    int calls{0};
};

class ChunkUploaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        chunk_.index = 4;
        chunk_.path = assetup::test_support::WriteFile(dir_.path() / "chunk_0004", "chunk-bytes");
        chunk_.size_bytes = 11;
        http_ = std::make_shared<CannedHttpClient>();
        http_->response.status = 200;
    }

    assetup::test_support::TempDir dir_;
    ChunkDescriptor chunk_;
    std::shared_ptr<CannedHttpClient> http_;
};

}  // namespace

TEST_F(ChunkUploaderTest, PutsRawBytesAndStripsEtagQuotes) {
    http_->response.headers["etag"] = "\"9b2cf535f27731c974343645a3985328\"";
    ChunkUploader uploader(http_);

    auto proof = uploader.Upload(chunk_, "https://bucket.s3/obj?partNumber=4&X-Amz-Signature=ab");
    ASSERT_TRUE(proof.ok()) << proof.error().message;
    EXPECT_EQ(proof.value().chunk_index, 4);
    EXPECT_EQ(proof.value().proof, "9b2cf535f27731c974343645a3985328");
    EXPECT_EQ(proof.value().proof_type, "etag");
    EXPECT_EQ(proof.value().chunk_size_bytes, 11u);

    EXPECT_EQ(http_->last_request.method, "PUT");
    EXPECT_EQ(http_->last_request.url, "https://bucket.s3/obj?partNumber=4&X-Amz-Signature=ab");
    EXPECT_EQ(http_->last_request.content_type, "application/octet-stream");
    EXPECT_EQ(http_->last_request.body, "chunk-bytes");
}

TEST_F(ChunkUploaderTest, UnquotedEtagIsKept) {
    http_->response.headers["etag"] = "abc123";
    auto proof = ChunkUploader(http_).Upload(chunk_, "https://bucket.s3/obj");
    ASSERT_TRUE(proof.ok());
    EXPECT_EQ(proof.value().proof, "abc123");
}

TEST_F(ChunkUploaderTest, MissingEtagIsMissingProof) {
    auto proof = ChunkUploader(http_).Upload(chunk_, "https://bucket.s3/obj");
    ASSERT_FALSE(proof.ok());
    EXPECT_EQ(proof.error().code, ErrorCode::kMissingProof);
    EXPECT_EQ(proof.error().chunk_index, 4);
}

TEST_F(ChunkUploaderTest, EmptyQuotedEtagIsMissingProof) {
    http_->response.headers["etag"] = "\"\"";
    auto proof = ChunkUploader(http_).Upload(chunk_, "https://bucket.s3/obj");
    ASSERT_FALSE(proof.ok());
    EXPECT_EQ(proof.error().code, ErrorCode::kMissingProof);
}

TEST_F(ChunkUploaderTest, NonSuccessStatusIsChunkUploadError) {
    http_->response.status = 403;
    http_->response.headers["etag"] = "\"ignored\"";
    auto proof = ChunkUploader(http_).Upload(chunk_, "https://bucket.s3/obj");
    ASSERT_FALSE(proof.ok());
    EXPECT_EQ(proof.error().code, ErrorCode::kChunkUploadError);
    EXPECT_EQ(proof.error().http_status, 403);
    EXPECT_EQ(proof.error().chunk_index, 4);
}

TEST_F(ChunkUploaderTest, TransportFailureIsChunkUploadError) {
    http_->transport_error = true;
    auto proof = ChunkUploader(http_).Upload(chunk_, "https://bucket.s3/obj");
    ASSERT_FALSE(proof.ok());
    EXPECT_EQ(proof.error().code, ErrorCode::kChunkUploadError);
    EXPECT_EQ(proof.error().http_status, 0);
}

TEST_F(ChunkUploaderTest, MissingChunkFileFailsBeforeSending) {
    chunk_.path = dir_.path() / "chunk_0099";
    auto proof = ChunkUploader(http_).Upload(chunk_, "https://bucket.s3/obj");
    ASSERT_FALSE(proof.ok());
    EXPECT_EQ(proof.error().code, ErrorCode::kIoError);
    EXPECT_EQ(http_->calls, 0);
}

TEST(ChunkUploaderStripQuotes, HandlesEdgeCases) {
    EXPECT_EQ(ChunkUploader::StripQuotes("\"a\""), "a");
    EXPECT_EQ(ChunkUploader::StripQuotes("\"\"a\"\""), "a");
    EXPECT_EQ(ChunkUploader::StripQuotes("\""), "");
    EXPECT_EQ(ChunkUploader::StripQuotes("a\"b"), "a\"b");
}
