#include "skopje/download/downloader.hpp"
#include "skopje/error.hpp"
#include "skopje/logging.hpp"
#include "skopje/thread_pool.hpp"
#include "skopje/util.hpp"

#include <algorithm>
#include <atomic>
#include <future>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace skopje::download {

namespace {

void ensure_parent_directory(const std::filesystem::path& destination) {
    auto parent = destination.parent_path();
    if (parent.empty()) return;

    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        throw IOError("Failed to create directory: " + ec.message(), parent.string());
    }
}

std::string describe(const Chunk& chunk) {
    return "chunk " + std::to_string(chunk.index) + " (" + std::to_string(chunk.start) + "-" +
           std::to_string(chunk.end) + ")";
}

} // namespace

Downloader::Downloader(http::HttpClient& client, const DownloadConfig& config)
    : client_(client), config_(config) {
    SKOPJE_CHECK_ARGUMENT(config_.chunk_size > 0, "chunk size must be greater than zero");
    SKOPJE_CHECK_ARGUMENT(config_.max_parallel_chunks > 0, "max_parallel_chunks must be greater than zero");
}

DownloadReport Downloader::download_file(const std::string& url, const std::filesystem::path& destination) {
    auto started = std::chrono::steady_clock::now();

    LOG_TRACE("fetching " + url);
    std::optional<uint64_t> file_size = client_.content_length(url);

    ensure_parent_directory(destination);

    if (!file_size || *file_size == 0) {
        LOG_DEBUG("Size of " + url + " unknown, downloading as a single request");
        DownloadReport report = download_whole(url, destination);
        report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        return report;
    }

    const std::vector<Chunk> chunks = plan_chunks(*file_size, config_.chunk_size);
    OutputFile file(destination, *file_size);

    CancellationToken cancel;
    std::mutex failures_mutex;
    std::vector<uint64_t> failed;
    std::string first_error;
    std::atomic<uint64_t> skipped{0};

    const size_t workers = static_cast<size_t>(
        std::min<uint64_t>(config_.max_parallel_chunks, chunks.size()));

    LOG_DEBUG("Downloading " + url + " (" + format_bytes(*file_size) + ") in " +
              std::to_string(chunks.size()) + " chunks on " + std::to_string(workers) + " workers");
    {
        ThreadPool pool(workers);
        std::vector<std::future<void>> tasks;
        tasks.reserve(chunks.size());

        for (const Chunk& chunk : chunks) {
            tasks.push_back(pool.submit([&, chunk]() {
                if (cancel.is_cancelled()) {
                    skipped.fetch_add(1);
                    return;
                }
                try {
                    download_chunk(url, chunk, *file_size, file);
                } catch (const std::exception& e) {
                    cancel.cancel();
                    LOG_ERROR("Error downloading " + describe(chunk) + ": " + e.what());
                    std::lock_guard<std::mutex> lock(failures_mutex);
                    failed.push_back(chunk.index);
                    if (first_error.empty()) {
                        first_error = e.what();
                    }
                }
            }));
        }

        // Completion requires every chunk task to have settled
        for (auto& task : tasks) {
            task.get();
        }
    }

    if (!failed.empty()) {
        std::sort(failed.begin(), failed.end());
        std::string message = std::to_string(failed.size()) + " of " + std::to_string(chunks.size()) +
                              " chunks failed";
        if (skipped.load() > 0) {
            message += ", " + std::to_string(skipped.load()) + " not started";
        }
        message += ": " + first_error;
        throw DownloadError(message, url, std::move(failed));
    }

    file.close();

    DownloadReport report;
    report.file_size = *file_size;
    report.chunk_count = chunks.size();
    report.bytes_written = *file_size;
    report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    LOG_INFO("Downloaded " + url + " to " + destination.string() + " (" + format_bytes(*file_size) +
             ", " + std::to_string(report.chunk_count) + " chunks, " +
             std::to_string(report.elapsed.count()) + " ms)");
    return report;
}

void Downloader::download_chunk(const std::string& url, const Chunk& chunk, uint64_t file_size,
                                OutputFile& file) {
    for (uint32_t attempt = 0;; ++attempt) {
        try {
            http::HttpResponse response = client_.get_range(url, chunk.start, chunk.end);

            if (response.status != 206) {
                throw NetworkError("expected 206 Partial Content for " + describe(chunk) + ", got " +
                                   std::to_string(response.status), url, response.status);
            }
            if (response.body.size() != chunk.length()) {
                throw NetworkError("expected " + std::to_string(chunk.length()) + " bytes for " +
                                   describe(chunk) + ", got " + std::to_string(response.body.size()),
                                   url, response.status);
            }

            file.write_at(chunk.start, response.body);

            LOG_TRACE("Downloaded chunk: (" + format_bytes(chunk.start) + ", " + format_bytes(chunk.end) +
                      ") of " + format_bytes(file_size));
            return;

        } catch (const NetworkError& e) {
            if (attempt >= config_.chunk_retries) {
                throw;
            }
            auto backoff = std::chrono::milliseconds(
                static_cast<uint64_t>(config_.retry_backoff_ms) * (attempt + 1));
            LOG_WARNING("Retrying " + describe(chunk) + " in " + std::to_string(backoff.count()) +
                        " ms: " + e.message());
            std::this_thread::sleep_for(backoff);
        }
    }
}

DownloadReport Downloader::download_whole(const std::string& url, const std::filesystem::path& destination) {
    http::HttpResponse response;
    try {
        response = client_.get(url);
    } catch (const NetworkError& e) {
        throw DownloadError(e.message(), url, {0});
    }

    if (response.status != 200 && response.status != 206) {
        LOG_ERROR("GET " + url + " returned status " + std::to_string(response.status));
        throw DownloadError("unexpected HTTP status " + std::to_string(response.status), url, {0});
    }

    OutputFile file(destination, response.body.size());
    if (!response.body.empty()) {
        file.write_at(0, response.body);
    }
    file.close();

    DownloadReport report;
    report.file_size = response.body.size();
    report.chunk_count = 1;
    report.bytes_written = response.body.size();

    LOG_INFO("Downloaded " + url + " to " + destination.string() + " (" +
             format_bytes(report.bytes_written) + ")");
    return report;
}

} // namespace skopje::download
