#include "assetrelay/network/url.hpp"
#include "assetrelay/core/utils.hpp"

namespace assetrelay::network {

using core::utils::StringUtils;

std::string Url::host_header() const {
    if (has_default_port()) {
        return host;
    }
    return host + ":" + std::to_string(port);
}

std::string Url::to_string() const {
    return scheme + "://" + host_header() + target;
}

std::optional<Url> Url::parse(const std::string& text) {
    auto scheme_end = text.find("://");
    if (scheme_end == std::string::npos) {
        return std::nullopt;
    }

    Url url;
    url.scheme = StringUtils::to_lower(text.substr(0, scheme_end));
    if (url.scheme != "http" && url.scheme != "https") {
        return std::nullopt;
    }

    auto authority_start = scheme_end + 3;
    auto authority_end = text.find_first_of("/?#", authority_start);
    std::string authority = text.substr(authority_start, authority_end == std::string::npos
                                                             ? std::string::npos
                                                             : authority_end - authority_start);

    // Drop userinfo
    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    url.port = url.is_tls() ? 443 : 80;
    std::string host = authority;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                return std::nullopt;
            }
            authority = authority.substr(close + 1);
        } else {
            authority.clear();
        }
        if (!authority.empty()) {
            auto port_str = authority.substr(1);
            try {
                auto port = std::stoul(port_str);
                if (port == 0 || port > 65535) {
                    return std::nullopt;
                }
                url.port = static_cast<uint16_t>(port);
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            host = authority.substr(0, colon);
            auto port_str = authority.substr(colon + 1);
            if (!port_str.empty()) {
                try {
                    size_t consumed = 0;
                    auto port = std::stoul(port_str, &consumed);
                    if (consumed != port_str.size() || port == 0 || port > 65535) {
                        return std::nullopt;
                    }
                    url.port = static_cast<uint16_t>(port);
                } catch (const std::exception&) {
                    return std::nullopt;
                }
            }
        }
    }

    if (host.empty()) {
        return std::nullopt;
    }
    url.host = StringUtils::to_lower(host);

    if (authority_end == std::string::npos) {
        url.target = "/";
    } else {
        url.target = text.substr(authority_end);
        auto fragment = url.target.find('#');
        if (fragment != std::string::npos) {
            url.target.erase(fragment);
        }
        if (url.target.empty() || url.target.front() != '/') {
            url.target.insert(url.target.begin(), '/');
        }
    }

    return url;
}

std::optional<Url> Url::resolve(const std::string& reference) const {
    if (reference.empty()) {
        return std::nullopt;
    }
    if (reference.find("://") != std::string::npos) {
        return parse(reference);
    }
    if (StringUtils::starts_with(reference, "//")) {
        return parse(scheme + ":" + reference);
    }

    Url resolved = *this;
    if (reference.front() == '/') {
        resolved.target = reference;
    } else {
        auto path = target.substr(0, target.find('?'));
        auto slash = path.rfind('/');
        resolved.target = path.substr(0, slash + 1) + reference;
    }

    auto fragment = resolved.target.find('#');
    if (fragment != std::string::npos) {
        resolved.target.erase(fragment);
    }
    return resolved;
}

}
