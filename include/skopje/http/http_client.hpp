#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include <boost/json.hpp>

#include "skopje/config.hpp"
#include "skopje/error.hpp"
#include "skopje/http/url.hpp"
#include "skopje/logging.hpp"

namespace skopje::http {

// Header names are stored lower-case.
using Headers = std::map<std::string, std::string>;

struct HttpResponse {
    unsigned status = 0;
    Headers headers;
    std::string body;

    std::optional<std::string> header(const std::string& name) const;
};

struct HttpRequest {
    std::string url;
    Headers headers;
    bool headers_only = false;  // stop after the response header, body is not read
};

/**
 * Synchronous HTTP/1.1 client on Boost.Beast.
 *
 * One connection per request; TLS through Boost.Asio SSL when the URL is https.
 * Redirects are not followed. Transport failures raise NetworkError.
 * Safe to share between threads: no per-request state is kept on the client.
 */
class HttpClient {
public:
    explicit HttpClient(const DownloadConfig& config = DownloadConfig{});
    virtual ~HttpClient() = default;

    // Send one GET. The status is returned as-is, no status is treated as an error here.
    virtual HttpResponse send(const HttpRequest& request);

    HttpResponse get(const std::string& url, const Headers& headers = {});

    // GET with "Range: bytes=start-(end_exclusive-1)"
    HttpResponse get_range(const std::string& url, uint64_t start, uint64_t end_exclusive);

    // Size of the resource from the Content-Length header of a GET whose body is not read.
    // nullopt when the header is absent or unparsable.
    std::optional<uint64_t> content_length(const std::string& url);

    // GET that requires 200 OK and returns the body text.
    std::string fetch(const std::string& url);

    // fetch() parsed as a JSON document. DecodeError when the body is not JSON.
    boost::json::value fetch_json_value(const std::string& url);

    /**
     * fetch() decoded into T with boost::json::value_to, so T needs a
     * tag_invoke(boost::json::value_to_tag<T>, const boost::json::value&)
     * overload, or to be a container or arithmetic type Boost.JSON handles.
     * A body of the wrong shape raises DecodeError.
     */
    template <typename T>
    T fetch_json(const std::string& url) {
        boost::json::value document = fetch_json_value(url);
        try {
            return boost::json::value_to<T>(document);
        } catch (const std::exception& e) {
            LOG_ERROR("Unexpected JSON shape from " + url + ": " + e.what());
            throw DecodeError(std::string("unexpected JSON shape: ") + e.what(), url);
        }
    }

    std::chrono::seconds timeout() const { return timeout_; }
    const std::string& user_agent() const { return user_agent_; }

private:
    std::chrono::seconds timeout_;
    std::string user_agent_;
};

// Format the value of a Range header for [start, end_exclusive).
std::string range_header(uint64_t start, uint64_t end_exclusive);

// Parse a decimal Content-Length value; nullopt on anything else.
std::optional<uint64_t> parse_content_length(const std::string& value);

} // namespace skopje::http
