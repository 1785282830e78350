#pragma once

#include "assetrelay/core/errors.hpp"
#include "assetrelay/network/url.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace assetrelay::network {

namespace beast = boost::beast;
namespace http = boost::beast::http;

using StringResponse = http::response<http::string_body>;
using EmptyRequest = http::request<http::empty_body>;

struct HttpOptions {
    std::chrono::seconds idle_timeout{60};
    std::string user_agent = "assetrelay/1.0";
    bool verify_peer = true;
};

// One HTTP/1.1 connection (plain or TLS) driven synchronously. Every network
// operation runs under the idle timeout; a stalled peer yields TIMEOUT.
//
// Failures are reported with source-side kinds: SOURCE_UNREACHABLE for
// resolve/connect/transport errors, TIMEOUT, and SOURCE_TRUNCATED when a body
// ends early. Sink callers remap them.
class HttpConnection {
public:
    explicit HttpConnection(HttpOptions options = {});
    ~HttpConnection();

    HttpConnection(const HttpConnection&) = delete;
    HttpConnection& operator=(const HttpConnection&) = delete;

    core::TransferResult connect(const Url& url);
    void close();
    bool is_open() const;

    // Request with a fully buffered body, response read in full.
    core::TransferResult request(http::request<http::string_body>& req, StringResponse& response);

    // Streamed download: send the request, read the header, then pull body
    // bytes. read_body() returns success with an empty `out` at the end.
    core::TransferResult begin_download(EmptyRequest& req, http::response_header<>& header);
    core::TransferResult read_body(size_t max_bytes, std::vector<uint8_t>& out);
    bool body_done() const;

    // Streamed upload: the request must carry Content-Length.
    core::TransferResult begin_upload(EmptyRequest& req);
    core::TransferResult write_body(std::span<const uint8_t> data);
    core::TransferResult read_response(StringResponse& response);

    const HttpOptions& get_options() const { return options_; }
    const std::string& get_host() const { return host_; }

private:
    HttpOptions options_;
    boost::asio::io_context ioc_;
    boost::asio::ssl::context ssl_ctx_;
    std::unique_ptr<beast::tcp_stream> plain_;
    std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> tls_;
    beast::flat_buffer buffer_;
    std::optional<http::response_parser<http::buffer_body>> parser_;
    std::string host_;

    beast::tcp_stream& lowest_layer();

    template <typename Initiate>
    beast::error_code run(Initiate&& initiate);

    template <typename Fn>
    void visit(Fn&& fn);

    core::TransferResult resolve(const Url& url, boost::asio::ip::tcp::resolver::results_type& results);
    core::TransferResult failure(const beast::error_code& ec, const std::string& what) const;
};

} // namespace assetrelay::network
