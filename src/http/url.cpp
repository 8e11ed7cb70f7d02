#include "skopje/http/url.hpp"
#include "skopje/error.hpp"

#include <algorithm>
#include <cctype>

namespace skopje::http {

namespace {

bool default_port(const Url& url) {
    return (url.secure() && url.port == 443) || (!url.secure() && url.port == 80);
}

} // namespace

std::string Url::host_header() const {
    if (default_port(*this)) return host;
    return host + ":" + std::to_string(port);
}

std::string Url::to_string() const {
    return scheme + "://" + host_header() + target;
}

Url parse_url(const std::string& text) {
    Url url;

    auto scheme_end = text.find("://");
    if (scheme_end == std::string::npos) {
        throw InvalidArgumentError("URL has no scheme", text);
    }
    url.scheme = text.substr(0, scheme_end);
    std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (url.scheme != "http" && url.scheme != "https") {
        throw InvalidArgumentError("unsupported URL scheme '" + url.scheme + "'", text);
    }
    url.port = url.secure() ? 443 : 80;

    size_t authority_start = scheme_end + 3;
    size_t authority_end = text.find_first_of("/?#", authority_start);
    std::string authority = text.substr(authority_start,
        authority_end == std::string::npos ? std::string::npos : authority_end - authority_start);

    // Drop userinfo, credentials are never sent
    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    std::string port_text;
    if (!authority.empty() && authority[0] == '[') {
        // IPv6 literal
        auto close = authority.find(']');
        if (close == std::string::npos) {
            throw InvalidArgumentError("unterminated IPv6 host", text);
        }
        url.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                throw InvalidArgumentError("malformed authority", text);
            }
            port_text = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            url.host = authority.substr(0, colon);
            port_text = authority.substr(colon + 1);
        } else {
            url.host = authority;
        }
    }

    if (url.host.empty()) {
        throw InvalidArgumentError("URL has no host", text);
    }

    if (!port_text.empty()) {
        if (port_text.size() > 5 ||
            !std::all_of(port_text.begin(), port_text.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            throw InvalidArgumentError("invalid port '" + port_text + "'", text);
        }
        unsigned long port = std::stoul(port_text);
        if (port == 0 || port > 65535) {
            throw InvalidArgumentError("port out of range", text);
        }
        url.port = static_cast<uint16_t>(port);
    }

    if (authority_end != std::string::npos) {
        url.target = text.substr(authority_end);
        // Fragments are never sent to the server
        auto hash = url.target.find('#');
        if (hash != std::string::npos) {
            url.target.erase(hash);
        }
        if (url.target.empty() || url.target[0] != '/') {
            url.target.insert(0, "/");
        }
    }

    return url;
}

} // namespace skopje::http
