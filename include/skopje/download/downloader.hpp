#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

#include "skopje/config.hpp"
#include "skopje/download/chunk_planner.hpp"
#include "skopje/download/output_file.hpp"
#include "skopje/http/http_client.hpp"

namespace skopje::download {

struct DownloadReport {
    uint64_t file_size = 0;
    uint64_t chunk_count = 0;
    uint64_t bytes_written = 0;
    std::chrono::milliseconds elapsed{0};
};

/**
 * Chunked concurrent downloader.
 *
 * The resource size is probed from Content-Length, split into chunks of
 * DownloadConfig::chunk_size bytes, and each chunk is fetched with a Range
 * request on a bounded worker pool (max_parallel_chunks) and written at its
 * own offset into the pre-sized destination file.
 *
 * A chunk succeeds only on 206 Partial Content with exactly the requested
 * number of bytes. After the first failure no further chunks are started;
 * chunks already running are allowed to finish, then DownloadError is thrown
 * naming every failed chunk. The destination is valid only when
 * download_file() returns.
 */
class Downloader {
public:
    Downloader(http::HttpClient& client, const DownloadConfig& config);

    DownloadReport download_file(const std::string& url, const std::filesystem::path& destination);

    const DownloadConfig& config() const { return config_; }

private:
    DownloadReport download_whole(const std::string& url, const std::filesystem::path& destination);
    void download_chunk(const std::string& url, const Chunk& chunk, uint64_t file_size,
                        OutputFile& file);

    http::HttpClient& client_;
    DownloadConfig config_;
};

} // namespace skopje::download
