#include "skopje/etl.hpp"

namespace skopje {

FileDownload::FileDownload(std::string url, std::filesystem::path destination, DownloadConfig config)
    : url_(std::move(url)), destination_(std::move(destination)), config_(std::move(config)) {}

void FileDownload::extract(http::HttpClient& client) {
    download::Downloader downloader(client, config_);
    report_ = downloader.download_file(url_, destination_);
}

} // namespace skopje
