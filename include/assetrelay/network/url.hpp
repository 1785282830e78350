#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace assetrelay::network {

struct Url {
    std::string scheme;  // "http" or "https"
    std::string host;
    uint16_t port = 0;
    std::string target;  // path plus query, always starting with '/'

    bool is_tls() const { return scheme == "https"; }
    bool has_default_port() const { return port == (is_tls() ? 443 : 80); }

    // "host" or "host:port" for the Host header.
    std::string host_header() const;
    std::string to_string() const;

    static std::optional<Url> parse(const std::string& text);

    // Resolves a Location header value against this URL.
    std::optional<Url> resolve(const std::string& reference) const;
};

} // namespace assetrelay::network
