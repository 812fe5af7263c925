#pragma once

#include "clu/core/result.hpp"
#include "clu/network/http_types.hpp"
#include "clu/network/uri.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace clu::network {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

struct TransportOptions {
    bool verify_tls = true;
    std::chrono::seconds timeout{60};
    std::string user_agent = "clu/1.0";
};

/**
 * @brief One client connection to an http(s) endpoint
 *
 * Owns its io_context; every operation is started asynchronously and the
 * context is run until the operation finishes or the stream deadline
 * (TransportOptions::timeout) expires. Supports both a full request/response
 * round trip and a streamed request body (header, body chunks, response).
 *
 * Lifecycle:
 * 1. connect() resolves, connects and (for https) performs the TLS handshake
 * 2. round_trip() or write_header()/write_body()/read_response()
 * 3. close() or destruction tears the socket down
 */
class HttpConnection {
public:
    explicit HttpConnection(TransportOptions options);
    ~HttpConnection();

    HttpConnection(const HttpConnection&) = delete;
    HttpConnection& operator=(const HttpConnection&) = delete;

    Result<void> connect(const Uri& uri);

    Result<HttpResponse> round_trip(const HttpRequest& request, const Uri& uri);

    Result<void> write_header(HttpMethod method,
                              const Uri& uri,
                              const std::unordered_map<std::string, std::string>& headers,
                              std::uint64_t content_length);

    Result<void> write_body(const std::uint8_t* data, std::size_t size);

    Result<HttpResponse> read_response();

    void close() noexcept;

    bool is_open() const noexcept { return plain_ != nullptr || secure_ != nullptr; }

private:
    beast::tcp_stream& lowest_layer();

    /**
     * @brief Run one asynchronous operation to completion
     *
     * initiate receives a completion handler and starts the operation on
     * whichever stream is active.
     */
    template<typename Initiate>
    Result<void> run(Initiate&& initiate, const char* what);

    template<typename Message>
    Result<void> write_message(Message& message, const char* what);

    static http::verb to_verb(HttpMethod method);

    TransportOptions options_;
    asio::io_context ioc_;
    ssl::context ssl_ctx_;
    std::unique_ptr<beast::tcp_stream> plain_;
    std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> secure_;
    beast::flat_buffer buffer_;
};

} // namespace clu::network
