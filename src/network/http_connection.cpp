#include "clu/network/http_connection.hpp"

#include <spdlog/spdlog.h>

#include <openssl/ssl.h>

namespace clu::network {

HttpConnection::HttpConnection(TransportOptions options)
    : options_(std::move(options))
    , ssl_ctx_(ssl::context::tls_client) {
    if (options_.verify_tls) {
        ssl_ctx_.set_default_verify_paths();
        ssl_ctx_.set_verify_mode(ssl::verify_peer);
    } else {
        ssl_ctx_.set_verify_mode(ssl::verify_none);
    }
}

HttpConnection::~HttpConnection() {
    close();
}

beast::tcp_stream& HttpConnection::lowest_layer() {
    if (secure_) {
        return beast::get_lowest_layer(*secure_);
    }
    return *plain_;
}

template<typename Initiate>
Result<void> HttpConnection::run(Initiate&& initiate, const char* what) {
    if (!is_open()) {
        return Err<void>(ErrorCode::RemoteFailure, std::string(what) + ": connection is not open");
    }

    beast::error_code op_ec;
    bool finished = false;
    lowest_layer().expires_after(options_.timeout);
    initiate([&op_ec, &finished](beast::error_code ec, auto&&...) {
        op_ec = ec;
        finished = true;
    });

    ioc_.restart();
    ioc_.run();

    if (!finished) {
        close();
        return Err<void>(ErrorCode::RemoteFailure, std::string(what) + ": operation did not complete");
    }
    if (op_ec) {
        const bool timed_out = op_ec == beast::error::timeout;
        close();
        return Err<void>(ErrorCode::RemoteFailure,
                         std::string(what) + (timed_out ? ": timed out" : ": " + op_ec.message()));
    }
    return Ok();
}

template<typename Message>
Result<void> HttpConnection::write_message(Message& message, const char* what) {
    return run([this, &message](auto handler) {
        if (secure_) {
            http::async_write(*secure_, message, std::move(handler));
        } else {
            http::async_write(*plain_, message, std::move(handler));
        }
    }, what);
}

Result<void> HttpConnection::connect(const Uri& uri) {
    close();

    beast::error_code ec;
    tcp::resolver resolver(ioc_);
    const auto endpoints = resolver.resolve(uri.host, std::to_string(uri.port), ec);
    if (ec) {
        return Err<void>(ErrorCode::RemoteFailure, "Failed to resolve " + uri.host + ": " + ec.message());
    }

    if (uri.is_secure()) {
        secure_ = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(ioc_, ssl_ctx_);
        if (!SSL_set_tlsext_host_name(secure_->native_handle(), uri.host.c_str())) {
            secure_.reset();
            return Err<void>(ErrorCode::RemoteFailure, "Failed to set SNI hostname " + uri.host);
        }
        if (options_.verify_tls) {
            secure_->set_verify_callback(ssl::host_name_verification(uri.host));
        }
    } else {
        plain_ = std::make_unique<beast::tcp_stream>(ioc_);
    }

    auto connected = run([this, &endpoints](auto handler) {
        lowest_layer().async_connect(endpoints, std::move(handler));
    }, "connect");
    if (connected.is_error()) {
        connected.error().with_context("while connecting to " + uri.authority());
        return connected;
    }

    if (secure_) {
        auto handshake = run([this](auto handler) {
            secure_->async_handshake(ssl::stream_base::client, std::move(handler));
        }, "TLS handshake");
        if (handshake.is_error()) {
            handshake.error().with_context("while connecting to " + uri.authority());
            return handshake;
        }
    }

    spdlog::debug("Connected to {}://{}", uri.scheme, uri.authority());
    return Ok();
}

Result<HttpResponse> HttpConnection::round_trip(const HttpRequest& request, const Uri& uri) {
    http::request<http::string_body> message{to_verb(request.method), uri.target, 11};
    message.set(http::field::host, uri.authority());
    message.set(http::field::user_agent, options_.user_agent);
    for (const auto& [name, value] : request.headers) {
        message.set(name, value);
    }
    message.body() = request.body;
    message.prepare_payload();

    if (auto written = write_message(message, "write request"); written.is_error()) {
        return Err<HttpResponse>(written.error());
    }
    return read_response();
}

Result<void> HttpConnection::write_header(HttpMethod method,
                                          const Uri& uri,
                                          const std::unordered_map<std::string, std::string>& headers,
                                          std::uint64_t content_length) {
    http::request<http::empty_body> message{to_verb(method), uri.target, 11};
    message.set(http::field::host, uri.authority());
    message.set(http::field::user_agent, options_.user_agent);
    message.set(http::field::content_type, "application/octet-stream");
    for (const auto& [name, value] : headers) {
        message.set(name, value);
    }
    message.set(http::field::content_length, std::to_string(content_length));

    http::request_serializer<http::empty_body> serializer{message};
    return run([this, &serializer](auto handler) {
        if (secure_) {
            http::async_write_header(*secure_, serializer, std::move(handler));
        } else {
            http::async_write_header(*plain_, serializer, std::move(handler));
        }
    }, "write upload header");
}

Result<void> HttpConnection::write_body(const std::uint8_t* data, std::size_t size) {
    const auto buffer = asio::buffer(data, size);
    return run([this, &buffer](auto handler) {
        if (secure_) {
            asio::async_write(*secure_, buffer, std::move(handler));
        } else {
            asio::async_write(*plain_, buffer, std::move(handler));
        }
    }, "write upload body");
}

Result<HttpResponse> HttpConnection::read_response() {
    http::response<http::string_body> message;
    auto read = run([this, &message](auto handler) {
        if (secure_) {
            http::async_read(*secure_, buffer_, message, std::move(handler));
        } else {
            http::async_read(*plain_, buffer_, message, std::move(handler));
        }
    }, "read response");
    if (read.is_error()) {
        return Err<HttpResponse>(read.error());
    }

    HttpResponse response;
    response.status_code = static_cast<int>(message.result_int());
    for (const auto& field : message) {
        response.headers[std::string(field.name_string())] = std::string(field.value());
    }
    response.body = std::move(message.body());
    return Ok(std::move(response));
}

void HttpConnection::close() noexcept {
    if (!is_open()) {
        return;
    }
    beast::error_code ec;
    auto& layer = lowest_layer();
    layer.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected) {
        spdlog::debug("Socket shutdown: {}", ec.message());
    }
    layer.close();
    secure_.reset();
    plain_.reset();
    buffer_.clear();
}

http::verb HttpConnection::to_verb(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return http::verb::get;
        case HttpMethod::POST: return http::verb::post;
        case HttpMethod::PUT: return http::verb::put;
        case HttpMethod::DELETE_METHOD: return http::verb::delete_;
        default: return http::verb::unknown;
    }
}

} // namespace clu::network
