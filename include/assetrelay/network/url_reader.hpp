#pragma once

#include "assetrelay/network/http_connection.hpp"
#include "assetrelay/network/url.hpp"
#include "assetrelay/transfer/chunked_reader.hpp"
#include <memory>
#include <optional>
#include <string>

namespace assetrelay::network {

// Streams the body of an HTTP(S) GET. Follows redirects, reports
// Content-Length as the known total, and re-fetches with a Range request
// on seek() when the server advertised "Accept-Ranges: bytes".
class UrlReader : public transfer::ChunkedReader {
public:
    explicit UrlReader(std::string url, HttpOptions options = {}, int max_redirects = 5);
    ~UrlReader() override;

    core::TransferResult open() override;
    core::TransferResult next_chunk(size_t max_bytes, std::vector<uint8_t>& out) override;
    std::optional<uint64_t> total_bytes_known() const override { return total_; }

    bool seekable() const override { return accepts_ranges_; }
    core::TransferResult seek(uint64_t offset) override;

    uint64_t bytes_read() const override { return position_; }
    std::string describe() const override { return url_; }

    // URL after redirects, once opened.
    std::string get_final_url() const;

    static std::optional<uint64_t> parse_content_range_start(const std::string& value);

private:
    std::string url_;
    HttpOptions options_;
    int max_redirects_;

    std::unique_ptr<HttpConnection> connection_;
    std::optional<Url> final_url_;
    std::optional<uint64_t> total_;
    uint64_t position_;
    bool accepts_ranges_;

    core::TransferResult fetch(uint64_t offset);
};

} // namespace assetrelay::network
