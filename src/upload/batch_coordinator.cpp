#include "assetup/upload/batch_coordinator.h"

#include <algorithm>
#include <atomic>
#include <set>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include "assetup/core/logger.h"
#include "assetup/observability/metrics.h"

namespace assetup::upload {

namespace {

core::Error CancelledError() {
    return core::MakeError(core::ErrorCode::kCancelled, "upload cancelled");
}

std::string JoinIndices(const std::vector<int>& indices) {
    std::string out;
    for (auto index : indices) {
        if (!out.empty()) {
            out += ", ";
        }
        out += std::to_string(index);
    }
    return out;
}

}  // namespace

BatchCoordinator::BatchCoordinator(core::UploadConfig config,
                                   std::shared_ptr<api::AssetApiClient> api,
                                   ChunkUploader uploader,
                                   const core::CancellationToken* cancellation)
    : config_(config),
      api_(std::move(api)),
      uploader_(std::move(uploader)),
      cancellation_(cancellation) {}

int BatchCoordinator::WorkerCount(std::size_t batch_chunks, int max_concurrency) {
    const auto cap = static_cast<std::size_t>(std::max(max_concurrency, 1));
    return static_cast<int>(std::max<std::size_t>(1, std::min(batch_chunks, cap)));
}

core::Result<BatchRunResult> BatchCoordinator::Run(const api::UploadSession& session,
                                                   const std::vector<ChunkDescriptor>& chunks,
                                                   PresignedUrlCache& cache) {
    BatchRunResult result;
    const auto batch_size = static_cast<std::size_t>(std::max(config_.batch_size, 1));

    for (std::size_t start = 0; start < chunks.size(); start += batch_size) {
        if (Cancelled()) {
            return CancelledError();
        }
        const auto end = std::min(start + batch_size, chunks.size());
        const std::vector<ChunkDescriptor> batch(chunks.begin() + static_cast<std::ptrdiff_t>(start),
                                                 chunks.begin() + static_cast<std::ptrdiff_t>(end));
        core::LogInfo("Processing batch: chunks " + std::to_string(batch.front().index) + "-" +
                      std::to_string(batch.back().index) + " (" + std::to_string(batch.size()) +
                      " chunks)");

        auto urls = EnsureUrls(session.upload_id, batch, cache);
        if (!urls.ok()) {
            return urls.error();
        }

        auto proofs = UploadBatch(batch, cache);
        if (!proofs.ok()) {
            return proofs.error();
        }
        for (const auto& proof : proofs.value()) {
            cache.Consume(proof.chunk_index);
        }
        result.chunks_uploaded += static_cast<int>(proofs.value().size());

        core::LogInfo("Reporting batch of " + std::to_string(proofs.value().size()) + " chunks");
        auto report = api_->ReportChunks(session.upload_id, proofs.value());
        if (!report.ok()) {
            return report.error();
        }
        ++result.batches_reported;
        observability::RecordBatchReported(report.value().processed_chunks,
                                           report.value().duplicate_chunks);
        core::LogInfo("Reported chunks: processed " +
                      std::to_string(report.value().processed_chunks) + ", duplicates " +
                      std::to_string(report.value().duplicate_chunks) + ", total completed " +
                      std::to_string(report.value().total_completed));

        if (report.value().url) {
            core::LogInfo("Upload completed by batch report");
            result.asset_url = report.value().url;
            return result;
        }
        core::LogInfo("Progress: " + std::to_string(end) + "/" + std::to_string(chunks.size()) +
                      " chunks uploaded");
    }
    return result;
}

core::Result<void> BatchCoordinator::EnsureUrls(const std::string& upload_id,
                                                const std::vector<ChunkDescriptor>& batch,
                                                PresignedUrlCache& cache) {
    std::vector<int> missing;
    for (const auto& chunk : batch) {
        if (!cache.Contains(chunk.index)) {
            missing.push_back(chunk.index);
        }
    }
    if (missing.empty()) {
        return core::Ok();
    }
    core::LogInfo("Need URLs for chunks: " + JoinIndices(missing));

    // One request per page: a page usually covers several missing indices.
    std::set<int> requested_pages;
    for (auto index : missing) {
        if (cache.Contains(index)) {
            continue;
        }
        const auto page = PresignedUrlCache::PageFor(index, config_.url_page_size);
        if (!requested_pages.insert(page).second) {
            continue;
        }
        auto fetched = api_->FetchPresignedUrls(upload_id, page, config_.url_page_size);
        if (!fetched.ok()) {
            return fetched.error();
        }
        observability::RecordUrlRefill();
        cache.Merge(fetched.value());
    }

    for (auto index : missing) {
        if (!cache.Contains(index)) {
            return core::MakeError(core::ErrorCode::kPresignedUrlExhausted,
                                   "no presigned URL available after refill", 0, index);
        }
    }
    return core::Ok();
}

core::Result<std::vector<api::ChunkProof>> BatchCoordinator::UploadBatch(
    const std::vector<ChunkDescriptor>& batch, const PresignedUrlCache& cache) {
    const int workers = WorkerCount(batch.size(), config_.max_concurrency);
    // Each task writes only its own slot; the pool join publishes the writes.
    std::vector<std::optional<core::Result<api::ChunkProof>>> slots(batch.size());
    std::atomic<bool> failed{false};

    {
        boost::asio::thread_pool pool(static_cast<std::size_t>(workers));
        for (std::size_t i = 0; i < batch.size(); ++i) {
            auto url = cache.Get(batch[i].index).value_or("");
            boost::asio::post(pool, [this, &batch, &slots, &failed, i, url = std::move(url)]() {
                if (failed.load() || Cancelled()) {
                    return;
                }
                try {
                    auto proof = uploader_.Upload(batch[i], url);
                    if (!proof.ok()) {
                        failed.store(true);
                    }
                    slots[i] = std::move(proof);
                } catch (const std::exception& ex) {
                    failed.store(true);
                    slots[i] = core::Result<api::ChunkProof>(core::MakeError(
                        core::ErrorCode::kChunkUploadError, ex.what(), 0, batch[i].index));
                }
            });
        }
        pool.join();
    }
    // Sockets closed by an interrupt surface as transport failures; report the cause instead.
    if (Cancelled()) {
        return CancelledError();
    }

    std::vector<api::ChunkProof> proofs;
    proofs.reserve(batch.size());
    for (std::size_t i = 0; i < slots.size(); ++i) {
        if (slots[i] && !slots[i]->ok()) {
            core::LogError("Chunk " + std::to_string(batch[i].index) +
                           " failed: " + core::Describe(slots[i]->error()));
            return slots[i]->error();
        }
    }
    for (auto& slot : slots) {
        if (!slot) {
            return CancelledError();
        }
        proofs.push_back(slot->take());
    }
    std::sort(proofs.begin(), proofs.end(),
              [](const api::ChunkProof& a, const api::ChunkProof& b) {
                  return a.chunk_index < b.chunk_index;
              });
    return proofs;
}

}  // namespace assetup::upload
