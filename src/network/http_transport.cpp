#include "clu/network/http_transport.hpp"

#include <spdlog/spdlog.h>

namespace clu::network {

BeastHttpTransport::BeastHttpTransport(TransportOptions options)
    : options_(std::move(options)) {
}

Result<HttpResponse> BeastHttpTransport::send(const HttpRequest& request) {
    auto uri = Uri::parse(request.url);
    if (uri.is_error()) {
        return Err<HttpResponse>(uri.error());
    }

    HttpConnection connection(options_);
    if (auto connected = connection.connect(uri.value()); connected.is_error()) {
        return Err<HttpResponse>(connected.error());
    }

    auto response = connection.round_trip(request, uri.value());
    if (response.is_ok()) {
        spdlog::debug("{} {} -> {}", to_string(request.method),
                      uri.value().target, response.value().status_code);
    }
    return response;
}

} // namespace clu::network
