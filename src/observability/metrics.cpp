#include "assetup/observability/metrics.h"

#include <atomic>

namespace assetup::observability {
namespace {
std::atomic<std::uint64_t> g_http_calls{0};
std::atomic<std::uint64_t> g_http_2xx{0};
std::atomic<std::uint64_t> g_http_4xx{0};
std::atomic<std::uint64_t> g_http_5xx{0};
std::atomic<std::uint64_t> g_transport_failures{0};
std::atomic<std::uint64_t> g_latency_ms_total{0};
std::atomic<std::uint64_t> g_chunks_uploaded{0};
std::atomic<std::uint64_t> g_bytes_uploaded{0};
std::atomic<std::uint64_t> g_url_refills{0};
std::atomic<std::uint64_t> g_batches_reported{0};
std::atomic<std::uint64_t> g_chunks_processed{0};
std::atomic<std::uint64_t> g_chunks_duplicate{0};

std::string Counter(const std::string& name, const std::string& help,
                    const std::atomic<std::uint64_t>& value) {
    return "# HELP " + name + " " + help + "\n# TYPE " + name + " counter\n" + name + " " +
           std::to_string(value.load(std::memory_order_relaxed)) + "\n";
}
}  // namespace

void RecordHttpCall(int status_code, long long latency_ms) {
    g_http_calls.fetch_add(1, std::memory_order_relaxed);
    g_latency_ms_total.fetch_add(static_cast<std::uint64_t>(latency_ms),
                                 std::memory_order_relaxed);
    if (status_code == 0) {
        g_transport_failures.fetch_add(1, std::memory_order_relaxed);
    } else if (status_code >= 200 && status_code < 300) {
        g_http_2xx.fetch_add(1, std::memory_order_relaxed);
    } else if (status_code >= 400 && status_code < 500) {
        g_http_4xx.fetch_add(1, std::memory_order_relaxed);
    } else if (status_code >= 500) {
        g_http_5xx.fetch_add(1, std::memory_order_relaxed);
    }
}

void RecordChunkUploaded(std::uint64_t bytes) {
    g_chunks_uploaded.fetch_add(1, std::memory_order_relaxed);
    g_bytes_uploaded.fetch_add(bytes, std::memory_order_relaxed);
}

void RecordUrlRefill() { g_url_refills.fetch_add(1, std::memory_order_relaxed); }

void RecordBatchReported(int processed_chunks, int duplicate_chunks) {
    g_batches_reported.fetch_add(1, std::memory_order_relaxed);
    if (processed_chunks > 0) {
        g_chunks_processed.fetch_add(static_cast<std::uint64_t>(processed_chunks),
                                     std::memory_order_relaxed);
    }
    if (duplicate_chunks > 0) {
        g_chunks_duplicate.fetch_add(static_cast<std::uint64_t>(duplicate_chunks),
                                     std::memory_order_relaxed);
    }
}

void ResetMetrics() {
    for (auto* counter : {&g_http_calls, &g_http_2xx, &g_http_4xx, &g_http_5xx,
                          &g_transport_failures, &g_latency_ms_total, &g_chunks_uploaded,
                          &g_bytes_uploaded, &g_url_refills, &g_batches_reported,
                          &g_chunks_processed, &g_chunks_duplicate}) {
        counter->store(0, std::memory_order_relaxed);
    }
}

std::string RenderMetrics() {
    return Counter("assetup_http_calls_total", "Outbound HTTP calls", g_http_calls) +
           Counter("assetup_http_calls_2xx", "Outbound calls answered with 2xx", g_http_2xx) +
           Counter("assetup_http_calls_4xx", "Outbound calls answered with 4xx", g_http_4xx) +
           Counter("assetup_http_calls_5xx", "Outbound calls answered with 5xx", g_http_5xx) +
           Counter("assetup_http_transport_failures", "Calls without an HTTP response",
                   g_transport_failures) +
           Counter("assetup_http_latency_ms_sum", "Sum of call latencies in ms",
                   g_latency_ms_total) +
           Counter("assetup_chunks_uploaded_total", "Chunks stored with a proof",
                   g_chunks_uploaded) +
           Counter("assetup_bytes_uploaded_total", "Chunk bytes stored", g_bytes_uploaded) +
           Counter("assetup_url_refills_total", "Presigned URL page requests", g_url_refills) +
           Counter("assetup_batches_reported_total", "Completion reports sent",
                   g_batches_reported) +
           Counter("assetup_chunks_processed_total", "Chunks the service accepted as new",
                   g_chunks_processed) +
           Counter("assetup_chunks_duplicate_total", "Chunks the service already had",
                   g_chunks_duplicate);
}

}  // namespace assetup::observability
