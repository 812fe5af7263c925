#pragma once

#include "clu/core/result.hpp"
#include "clu/network/http_connection.hpp"
#include "clu/network/http_types.hpp"

namespace clu::network {

/**
 * @brief Request/response seam between the REST client and the wire
 *
 * A transport reports only transport failures (resolve, connect, TLS,
 * timeout) as errors; any HTTP status, including 4xx/5xx, is a successful
 * response for the caller to interpret.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual Result<HttpResponse> send(const HttpRequest& request) = 0;
};

/**
 * @brief Transport over Boost.Beast, one connection per request
 */
class BeastHttpTransport : public HttpTransport {
public:
    explicit BeastHttpTransport(TransportOptions options);

    Result<HttpResponse> send(const HttpRequest& request) override;

private:
    TransportOptions options_;
};

} // namespace clu::network
