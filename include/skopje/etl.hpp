/**
 * @file etl.hpp
 * @brief Extract/load capability interfaces and the stock adapters
 *
 * A client type can only take part in a pipeline through a type that
 * implements Extractor<Client> or Loadable<Client> for it.
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "skopje/config.hpp"
#include "skopje/db/loader.hpp"
#include "skopje/download/downloader.hpp"
#include "skopje/http/http_client.hpp"
#include "skopje/logging.hpp"

namespace skopje {

template <typename Client>
class Extractor {
public:
    virtual ~Extractor() = default;
    virtual void extract(Client& client) = 0;
};

template <typename Client>
class Loadable {
public:
    virtual ~Loadable() = default;
    virtual void load(Client& client) const = 0;
};

/**
 * Run extract on source_client, then load into sink_client.
 * Errors from either stage propagate unchanged.
 */
template <typename Source, typename Sink>
void run_pipeline(Extractor<Source>& extractor, Source& source_client,
                  const Loadable<Sink>& loadable, Sink& sink_client) {
    using clock = std::chrono::steady_clock;

    auto started = clock::now();
    extractor.extract(source_client);
    auto extracted = clock::now();
    loadable.load(sink_client);
    auto loaded = clock::now();

    auto ms = [](clock::duration d) {
        return std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(d).count());
    };
    LOG_INFO("Pipeline finished: extract " + ms(extracted - started) + " ms, load " +
             ms(loaded - extracted) + " ms");
}

// =============================================================================
// Adapters
// =============================================================================

// Chunked download of one URL into a local file.
class FileDownload : public Extractor<http::HttpClient> {
public:
    FileDownload(std::string url, std::filesystem::path destination, DownloadConfig config);

    void extract(http::HttpClient& client) override;

    const std::filesystem::path& destination() const { return destination_; }
    const download::DownloadReport& report() const { return report_; }

private:
    std::string url_;
    std::filesystem::path destination_;
    DownloadConfig config_;
    download::DownloadReport report_;
};

/**
 * Whole-body GET of one URL; requires 200 OK.
 * HttpFetch<> keeps the body text. Any other T is decoded from the JSON body
 * through HttpClient::fetch_json<T>, so a RecordBatch can be built from value().
 */
template <typename T = std::string>
class HttpFetch : public Extractor<http::HttpClient> {
public:
    explicit HttpFetch(std::string url) : url_(std::move(url)) {}

    void extract(http::HttpClient& client) override {
        if constexpr (std::is_same_v<T, std::string>) {
            value_ = client.fetch(url_);
        } else {
            value_ = client.fetch_json<T>(url_);
        }
    }

    const T& value() const { return value_; }

private:
    std::string url_;
    T value_{};
};

enum class LoadMode { Insert, Copy };

// A batch of records written through PgLoader in one transaction.
template <typename T>
class RecordBatch : public Loadable<db::PgLoader> {
public:
    RecordBatch(std::string statement, std::vector<T> records, LoadMode mode = LoadMode::Insert)
        : statement_(std::move(statement)), records_(std::move(records)), mode_(mode) {}

    void load(db::PgLoader& loader) const override {
        if (mode_ == LoadMode::Copy) {
            loader.copy(statement_, records_);
        } else {
            loader.insert(statement_, records_);
        }
    }

    const std::vector<T>& records() const { return records_; }

private:
    std::string statement_;
    std::vector<T> records_;
    LoadMode mode_;
};

} // namespace skopje
