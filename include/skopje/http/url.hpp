#pragma once

#include <cstdint>
#include <string>

namespace skopje::http {

struct Url {
    std::string scheme;   // "http" or "https"
    std::string host;
    uint16_t port = 80;
    std::string target = "/";  // path + query

    bool secure() const { return scheme == "https"; }

    // Value for the Host header (port omitted when it is the scheme default)
    std::string host_header() const;

    std::string to_string() const;
};

// Parse an absolute http(s) URL. Throws InvalidArgumentError when malformed.
Url parse_url(const std::string& text);

} // namespace skopje::http
