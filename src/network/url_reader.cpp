#include "assetrelay/network/url_reader.hpp"
#include "assetrelay/core/logger.hpp"
#include "assetrelay/core/utils.hpp"

namespace assetrelay::network {

using core::TransferError;
using core::TransferResult;
using core::utils::StringUtils;

namespace {

bool is_redirect(int status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

std::optional<uint64_t> parse_length(const std::string& value) {
    auto trimmed = StringUtils::trim(value);
    if (trimmed.empty() || trimmed.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    try {
        return std::stoull(trimmed);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string field(const http::response_header<>& header, http::field name) {
    auto it = header.find(name);
    if (it == header.end()) {
        return "";
    }
    auto value = it->value();
    return std::string(value.data(), value.size());
}

}

UrlReader::UrlReader(std::string url, HttpOptions options, int max_redirects)
    : url_(std::move(url))
    , options_(std::move(options))
    , max_redirects_(max_redirects)
    , position_(0)
    , accepts_ranges_(false) {}

UrlReader::~UrlReader() = default;

std::optional<uint64_t> UrlReader::parse_content_range_start(const std::string& value) {
    // "bytes 100-199/1000" or "bytes 100-199/*"
    auto trimmed = StringUtils::trim(value);
    if (!StringUtils::starts_with(StringUtils::to_lower(trimmed), "bytes ")) {
        return std::nullopt;
    }
    auto range = trimmed.substr(6);
    auto dash = range.find('-');
    if (dash == std::string::npos) {
        return std::nullopt;
    }
    return parse_length(range.substr(0, dash));
}

std::string UrlReader::get_final_url() const {
    return final_url_ ? final_url_->to_string() : url_;
}

TransferResult UrlReader::open() {
    total_.reset();
    accepts_ranges_ = false;
    return fetch(0);
}

TransferResult UrlReader::seek(uint64_t offset) {
    if (!accepts_ranges_) {
        return ChunkedReader::seek(offset);
    }
    if (total_ && offset > *total_) {
        return TransferResult(TransferError::INVALID_REQUEST, "Seek past the end of " + url_);
    }
    if (connection_ && offset == position_) {
        return TransferResult();
    }
    LOG_DEBUG("Re-fetching {} from offset {}", url_, offset);
    return fetch(offset);
}

TransferResult UrlReader::fetch(uint64_t offset) {
    connection_.reset();

    auto current = final_url_ ? final_url_ : Url::parse(url_);
    if (!current) {
        return TransferResult(TransferError::INVALID_REQUEST, "Invalid URL: " + url_);
    }

    for (int redirects = 0;; ++redirects) {
        auto connection = std::make_unique<HttpConnection>(options_);
        auto result = connection->connect(*current);
        if (!result) {
            return result;
        }

        EmptyRequest req{http::verb::get, current->target, 11};
        req.set(http::field::host, current->host_header());
        req.set(http::field::accept, "*/*");
        if (offset > 0) {
            req.set(http::field::range, "bytes=" + std::to_string(offset) + "-");
        }

        http::response_header<> header;
        result = connection->begin_download(req, header);
        if (!result) {
            return result;
        }

        int status = static_cast<int>(header.result_int());

        if (is_redirect(status)) {
            auto location = field(header, http::field::location);
            if (location.empty()) {
                return TransferResult(TransferError::SOURCE_REJECTED, "Redirect without Location")
                    .with_status(status);
            }
            if (redirects >= max_redirects_) {
                return TransferResult(TransferError::SOURCE_REJECTED, "Too many redirects for " + url_)
                    .with_status(status);
            }
            auto next = current->resolve(location);
            if (!next) {
                return TransferResult(TransferError::SOURCE_REJECTED, "Unsupported redirect to " + location)
                    .with_status(status);
            }
            LOG_DEBUG("{} redirected to {}", current->to_string(), next->to_string());
            current = next;
            continue;
        }

        if (status < 200 || status >= 300) {
            return TransferResult(TransferError::SOURCE_REJECTED,
                                  "HTTP " + std::to_string(status) + " from " + current->to_string())
                .with_status(status);
        }

        auto content_length = parse_length(field(header, http::field::content_length));
        std::optional<uint64_t> total;

        if (offset > 0) {
            if (status != 206) {
                return TransferResult(TransferError::SOURCE_REJECTED,
                                      "Server ignored the range request for " + url_)
                    .with_status(status);
            }
            auto start = parse_content_range_start(field(header, http::field::content_range));
            if (!start || *start != offset) {
                return TransferResult(TransferError::SOURCE_REJECTED,
                                      "Content-Range does not start at " + std::to_string(offset))
                    .with_status(status);
            }
            if (content_length) {
                total = offset + *content_length;
            }
        } else {
            total = content_length;
            auto ranges = StringUtils::to_lower(field(header, http::field::accept_ranges));
            accepts_ranges_ = ranges.find("bytes") != std::string::npos;
        }

        if (total_ && total && *total_ != *total) {
            return TransferResult(TransferError::SOURCE_CHANGED,
                                  url_ + " changed size from " + std::to_string(*total_) + " to " +
                                  std::to_string(*total));
        }
        if (!total_) {
            total_ = total;
        }

        final_url_ = current;
        position_ = offset;
        connection_ = std::move(connection);

        LOG_DEBUG("GET {} -> {} ({})", current->to_string(), status,
                  total_ ? StringUtils::format_bytes(*total_) : std::string("unknown length"));
        return TransferResult();
    }
}

TransferResult UrlReader::next_chunk(size_t max_bytes, std::vector<uint8_t>& out) {
    out.clear();
    if (!connection_) {
        if (total_ && position_ >= *total_) {
            return TransferResult();
        }
        return TransferResult(TransferError::INVALID_STATE, url_ + " is not open");
    }

    auto result = connection_->read_body(max_bytes, out);
    if (!result) {
        connection_.reset();
        return result;
    }

    if (out.empty()) {
        connection_.reset();
        if (total_ && position_ < *total_) {
            return TransferResult(TransferError::SOURCE_TRUNCATED,
                                  url_ + " ended at " + std::to_string(position_) + " of " +
                                  std::to_string(*total_) + " bytes");
        }
        if (!total_) {
            total_ = position_;
        }
        return TransferResult();
    }

    position_ += out.size();
    return TransferResult();
}

}
