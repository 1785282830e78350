#include "assetrelay/network/http_connection.hpp"
#include "assetrelay/core/logger.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/write.hpp>
#include <limits>

namespace assetrelay::network {

namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

using core::TransferError;
using core::TransferResult;

HttpConnection::HttpConnection(HttpOptions options)
    : options_(std::move(options))
    , ssl_ctx_(ssl::context::tls_client) {
    beast::error_code ec;
    ssl_ctx_.set_default_verify_paths(ec);
    if (ec) {
        LOG_WARN("Cannot load default CA certificates: {}", ec.message());
    }
}

HttpConnection::~HttpConnection() {
    close();
}

beast::tcp_stream& HttpConnection::lowest_layer() {
    if (tls_) {
        return beast::get_lowest_layer(*tls_);
    }
    return *plain_;
}

template <typename Fn>
void HttpConnection::visit(Fn&& fn) {
    if (tls_) {
        fn(*tls_);
    } else {
        fn(*plain_);
    }
}

template <typename Initiate>
beast::error_code HttpConnection::run(Initiate&& initiate) {
    beast::error_code result = net::error::would_block;
    lowest_layer().expires_after(options_.idle_timeout);
    initiate([&result](beast::error_code ec, auto&&...) { result = ec; });
    ioc_.restart();
    ioc_.run();
    return result;
}

TransferResult HttpConnection::failure(const beast::error_code& ec, const std::string& what) const {
    if (ec == beast::error::timeout) {
        return TransferResult(TransferError::TIMEOUT,
                              what + " timed out after " + std::to_string(options_.idle_timeout.count()) + "s");
    }
    return TransferResult(TransferError::SOURCE_UNREACHABLE, what + ": " + ec.message());
}

TransferResult HttpConnection::resolve(const Url& url, tcp::resolver::results_type& results) {
    struct Pending {
        beast::error_code ec;
        tcp::resolver::results_type results;
        bool done = false;
    };

    // The handler may outlive this call when the lookup times out.
    auto pending = std::make_shared<Pending>();
    auto resolver = std::make_shared<tcp::resolver>(ioc_);
    resolver->async_resolve(url.host, std::to_string(url.port),
                            [pending, resolver](beast::error_code ec, tcp::resolver::results_type found) {
                                pending->ec = ec;
                                pending->results = std::move(found);
                                pending->done = true;
                            });

    ioc_.restart();
    ioc_.run_for(options_.idle_timeout);

    if (!pending->done) {
        resolver->cancel();
        return TransferResult(TransferError::TIMEOUT, "Resolve " + url.host + " timed out after " +
                                                          std::to_string(options_.idle_timeout.count()) + "s");
    }
    if (pending->ec) {
        return TransferResult(TransferError::SOURCE_UNREACHABLE,
                              "Cannot resolve " + url.host + ": " + pending->ec.message());
    }

    results = std::move(pending->results);
    return TransferResult();
}

TransferResult HttpConnection::connect(const Url& url) {
    close();
    host_ = url.host;

    tcp::resolver::results_type results;
    auto resolved = resolve(url, results);
    if (!resolved) {
        return resolved;
    }
    beast::error_code ec;

    if (url.is_tls()) {
        tls_ = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(ioc_, ssl_ctx_);
        if (!SSL_set_tlsext_host_name(tls_->native_handle(), url.host.c_str())) {
            tls_.reset();
            return TransferResult(TransferError::SOURCE_UNREACHABLE, "Cannot set TLS server name for " + url.host);
        }
        if (options_.verify_peer) {
            tls_->set_verify_mode(ssl::verify_peer);
            tls_->set_verify_callback(ssl::host_name_verification(url.host));
        } else {
            tls_->set_verify_mode(ssl::verify_none);
        }
    } else {
        plain_ = std::make_unique<beast::tcp_stream>(ioc_);
    }

    ec = run([&](auto handler) { lowest_layer().async_connect(results, std::move(handler)); });
    if (ec) {
        auto result = failure(ec, "Connect to " + url.host_header());
        close();
        return result;
    }

    if (tls_) {
        ec = run([&](auto handler) { tls_->async_handshake(ssl::stream_base::client, std::move(handler)); });
        if (ec) {
            auto result = failure(ec, "TLS handshake with " + url.host);
            close();
            return result;
        }
    }

    buffer_.clear();
    parser_.reset();
    LOG_DEBUG("Connected to {}", url.host_header());
    return TransferResult();
}

void HttpConnection::close() {
    if (!tls_ && !plain_) {
        return;
    }

    beast::error_code ec;
    auto& socket = lowest_layer().socket();
    if (socket.is_open()) {
        socket.shutdown(tcp::socket::shutdown_both, ec);
        socket.close(ec);
    }

    tls_.reset();
    plain_.reset();
    parser_.reset();
    buffer_.clear();
}

bool HttpConnection::is_open() const {
    if (tls_) {
        return beast::get_lowest_layer(*tls_).socket().is_open();
    }
    return plain_ && plain_->socket().is_open();
}

TransferResult HttpConnection::request(http::request<http::string_body>& req, StringResponse& response) {
    if (!is_open()) {
        return TransferResult(TransferError::INVALID_STATE, "Connection is not open");
    }

    req.set(http::field::user_agent, options_.user_agent);
    req.prepare_payload();

    auto ec = run([&](auto handler) {
        visit([&](auto& stream) { http::async_write(stream, req, std::move(handler)); });
    });
    if (ec) {
        return failure(ec, "Send " + std::string(req.method_string().data(), req.method_string().size()) + " request");
    }

    return read_response(response);
}

TransferResult HttpConnection::begin_download(EmptyRequest& req, http::response_header<>& header) {
    if (!is_open()) {
        return TransferResult(TransferError::INVALID_STATE, "Connection is not open");
    }

    req.set(http::field::user_agent, options_.user_agent);

    auto ec = run([&](auto handler) {
        visit([&](auto& stream) { http::async_write(stream, req, std::move(handler)); });
    });
    if (ec) {
        return failure(ec, "Send GET request");
    }

    parser_.emplace();
    parser_->body_limit(std::numeric_limits<std::uint64_t>::max());

    ec = run([&](auto handler) {
        visit([&](auto& stream) { http::async_read_header(stream, buffer_, *parser_, std::move(handler)); });
    });
    if (ec) {
        parser_.reset();
        return failure(ec, "Read response header");
    }

    header = parser_->get().base();
    return TransferResult();
}

TransferResult HttpConnection::read_body(size_t max_bytes, std::vector<uint8_t>& out) {
    out.clear();
    if (!parser_) {
        return TransferResult(TransferError::INVALID_STATE, "No download in progress");
    }

    while (!parser_->is_done()) {
        out.resize(max_bytes);
        auto& body = parser_->get().body();
        body.data = out.data();
        body.size = max_bytes;

        auto ec = run([&](auto handler) {
            visit([&](auto& stream) { http::async_read(stream, buffer_, *parser_, std::move(handler)); });
        });
        if (ec == http::error::need_buffer) {
            ec = {};
        }

        out.resize(max_bytes - parser_->get().body().size);

        if (ec) {
            out.clear();
            if (ec == http::error::partial_message || ec == http::error::end_of_stream ||
                ec == net::error::eof || ec == net::error::connection_reset) {
                return TransferResult(TransferError::SOURCE_TRUNCATED, "Body ended early: " + ec.message());
            }
            return failure(ec, "Read response body");
        }

        if (!out.empty()) {
            return TransferResult();
        }
    }

    return TransferResult();
}

bool HttpConnection::body_done() const {
    return parser_ && parser_->is_done();
}

TransferResult HttpConnection::begin_upload(EmptyRequest& req) {
    if (!is_open()) {
        return TransferResult(TransferError::INVALID_STATE, "Connection is not open");
    }

    req.set(http::field::user_agent, options_.user_agent);

    http::request_serializer<http::empty_body> serializer{req};
    auto ec = run([&](auto handler) {
        visit([&](auto& stream) { http::async_write_header(stream, serializer, std::move(handler)); });
    });
    if (ec) {
        return failure(ec, "Send upload header");
    }
    return TransferResult();
}

TransferResult HttpConnection::write_body(std::span<const uint8_t> data) {
    if (data.empty()) {
        return TransferResult();
    }

    auto ec = run([&](auto handler) {
        visit([&](auto& stream) {
            net::async_write(stream, net::buffer(data.data(), data.size()), std::move(handler));
        });
    });
    if (ec) {
        return failure(ec, "Write upload body");
    }
    return TransferResult();
}

TransferResult HttpConnection::read_response(StringResponse& response) {
    response = StringResponse{};
    auto ec = run([&](auto handler) {
        visit([&](auto& stream) { http::async_read(stream, buffer_, response, std::move(handler)); });
    });
    if (ec) {
        return failure(ec, "Read response");
    }
    return TransferResult();
}

}
