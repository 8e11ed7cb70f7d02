#include "skopje/http/http_client.hpp"
#include "skopje/error.hpp"
#include "skopje/logging.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <algorithm>
#include <cctype>
#include <limits>

namespace beast = boost::beast;
namespace bhttp = beast::http;
namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace skopje::http {

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// Run one asynchronous operation to completion on the calling thread.
// Beast stream timeouts only apply to asynchronous operations, so every step
// of a request goes through here.
template<typename Initiate>
beast::error_code run_async(asio::io_context& ioc, Initiate&& initiate) {
    beast::error_code result;
    initiate([&result](beast::error_code ec, auto&&...) { result = ec; });
    ioc.restart();
    ioc.run();
    return result;
}

template<typename Stream>
HttpResponse exchange(asio::io_context& ioc, Stream& stream, const Url& url,
                      const HttpRequest& request, const std::string& user_agent,
                      std::chrono::seconds timeout) {
    bhttp::request<bhttp::empty_body> req{bhttp::verb::get, url.target, 11};
    req.set(bhttp::field::host, url.host_header());
    req.set(bhttp::field::user_agent, user_agent);
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }

    beast::get_lowest_layer(stream).expires_after(timeout);
    beast::error_code ec = run_async(ioc, [&](auto handler) {
        bhttp::async_write(stream, req, std::move(handler));
    });
    if (ec) {
        throw NetworkError("Failed to send request: " + ec.message(), request.url);
    }

    beast::flat_buffer buffer;
    bhttp::response_parser<bhttp::string_body> parser;
    parser.body_limit((std::numeric_limits<std::uint64_t>::max)());

    beast::get_lowest_layer(stream).expires_after(timeout);
    if (request.headers_only) {
        ec = run_async(ioc, [&](auto handler) {
            bhttp::async_read_header(stream, buffer, parser, std::move(handler));
        });
    } else {
        ec = run_async(ioc, [&](auto handler) {
            bhttp::async_read(stream, buffer, parser, std::move(handler));
        });
    }
    if (ec) {
        throw NetworkError("Failed to read response: " + ec.message(), request.url);
    }

    auto& res = parser.get();
    HttpResponse response;
    response.status = res.result_int();
    for (const auto& field : res) {
        response.headers[to_lower(std::string(field.name_string()))] = std::string(field.value());
    }
    if (!request.headers_only) {
        response.body = std::move(res.body());
    }
    return response;
}

} // namespace

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    if (it == headers.end()) return std::nullopt;
    return it->second;
}

std::string range_header(uint64_t start, uint64_t end_exclusive) {
    SKOPJE_CHECK_ARGUMENT(end_exclusive > start, "range must not be empty");
    return "bytes=" + std::to_string(start) + "-" + std::to_string(end_exclusive - 1);
}

std::optional<uint64_t> parse_content_length(const std::string& raw) {
    auto first = raw.find_first_not_of(" \t");
    auto last = raw.find_last_not_of(" \t");
    if (first == std::string::npos) return std::nullopt;
    const std::string value = raw.substr(first, last - first + 1);

    if (value.empty() || value.size() > 20) return std::nullopt;
    if (!std::all_of(value.begin(), value.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    try {
        return static_cast<uint64_t>(std::stoull(value));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

HttpClient::HttpClient(const DownloadConfig& config)
    : timeout_(config.timeout_seconds),
      user_agent_(config.user_agent) {}

HttpResponse HttpClient::send(const HttpRequest& request) {
    Url url = parse_url(request.url);
    LOG_TRACE("GET " + url.to_string());

    try {
        asio::io_context ioc;
        tcp::resolver resolver(ioc);
        auto const results = resolver.resolve(url.host, std::to_string(url.port));

        if (!url.secure()) {
            beast::tcp_stream stream(ioc);
            stream.expires_after(timeout_);
            beast::error_code ec = run_async(ioc, [&](auto handler) {
                stream.async_connect(results, std::move(handler));
            });
            if (ec) {
                throw NetworkError("Failed to connect: " + ec.message(), request.url);
            }

            HttpResponse response = exchange(ioc, stream, url, request, user_agent_, timeout_);

            // not_connected happens when the server already closed its side
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            return response;
        }

        ssl::context ctx{ssl::context::tlsv12_client};
        ctx.set_default_verify_paths();

        beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
        stream.set_verify_mode(ssl::verify_peer);
        stream.set_verify_callback(ssl::host_name_verification(url.host));
        if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
            beast::error_code ec{static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()};
            throw NetworkError("Failed to set SNI host name: " + ec.message(), request.url);
        }

        beast::get_lowest_layer(stream).expires_after(timeout_);
        beast::error_code ec = run_async(ioc, [&](auto handler) {
            beast::get_lowest_layer(stream).async_connect(results, std::move(handler));
        });
        if (ec) {
            throw NetworkError("Failed to connect: " + ec.message(), request.url);
        }

        beast::get_lowest_layer(stream).expires_after(timeout_);
        ec = run_async(ioc, [&](auto handler) {
            stream.async_handshake(ssl::stream_base::client, std::move(handler));
        });
        if (ec) {
            throw NetworkError("TLS handshake failed: " + ec.message(), request.url);
        }

        HttpResponse response = exchange(ioc, stream, url, request, user_agent_, timeout_);

        beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(5));
        ec = run_async(ioc, [&](auto handler) {
            stream.async_shutdown(std::move(handler));
        });
        if (ec && ec != asio::error::eof && ec != ssl::error::stream_truncated) {
            LOG_DEBUG("TLS shutdown for " + request.url + " ended with: " + ec.message());
        }
        return response;

    } catch (const beast::system_error& e) {
        LOG_ERROR("HTTP request failed for " + request.url + ": " + e.what());
        throw NetworkError(std::string("HTTP request failed: ") + e.what(), request.url);
    }
}

HttpResponse HttpClient::get(const std::string& url, const Headers& headers) {
    HttpRequest request;
    request.url = url;
    request.headers = headers;
    return send(request);
}

HttpResponse HttpClient::get_range(const std::string& url, uint64_t start, uint64_t end_exclusive) {
    return get(url, {{"range", range_header(start, end_exclusive)}});
}

std::optional<uint64_t> HttpClient::content_length(const std::string& url) {
    HttpRequest request;
    request.url = url;
    request.headers_only = true;
    HttpResponse response = send(request);

    auto value = response.header("content-length");
    if (!value) {
        LOG_DEBUG("No Content-Length for " + url);
        return std::nullopt;
    }
    auto length = parse_content_length(*value);
    if (!length) {
        LOG_WARNING("Unparsable Content-Length '" + *value + "' for " + url);
    }
    return length;
}

std::string HttpClient::fetch(const std::string& url) {
    HttpResponse response = get(url);
    if (response.status != 200) {
        LOG_ERROR("GET " + url + " returned status " + std::to_string(response.status));
        throw NetworkError("unexpected HTTP status " + std::to_string(response.status), url,
                           response.status);
    }
    return std::move(response.body);
}

boost::json::value HttpClient::fetch_json_value(const std::string& url) {
    std::string body = fetch(url);

    boost::json::error_code ec;
    boost::json::value document = boost::json::parse(body, ec);
    if (ec) {
        LOG_ERROR("Failed to parse JSON from " + url + ": " + ec.message());
        throw DecodeError("invalid JSON: " + ec.message(), url);
    }
    return document;
}

} // namespace skopje::http
