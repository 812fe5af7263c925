#include "clu/network/upload_stream.hpp"

#include <spdlog/spdlog.h>

namespace clu::network {
namespace {

Error as_transfer_failure(Error error) {
    error.code = ErrorCode::TransferFailure;
    return error;
}

} // namespace

HttpUploadStream::HttpUploadStream(TransportOptions options,
                                   HttpMethod method,
                                   std::unordered_map<std::string, std::string> headers)
    : connection_(std::move(options))
    , method_(method)
    , headers_(std::move(headers)) {
}

Result<void> HttpUploadStream::open(const std::string& endpoint, std::uint64_t content_length) {
    auto uri = Uri::parse(endpoint);
    if (uri.is_error()) {
        return Err<void>(as_transfer_failure(uri.error()));
    }
    endpoint_ = endpoint;

    if (auto connected = connection_.connect(uri.value()); connected.is_error()) {
        return Err<void>(as_transfer_failure(connected.error()));
    }
    if (auto header = connection_.write_header(method_, uri.value(), headers_, content_length); header.is_error()) {
        return Err<void>(as_transfer_failure(header.error()));
    }
    spdlog::debug("Upload to {} started ({} bytes)", uri.value().authority(), content_length);
    return Ok();
}

Result<void> HttpUploadStream::write(const std::uint8_t* data, std::size_t size) {
    if (auto written = connection_.write_body(data, size); written.is_error()) {
        return Err<void>(as_transfer_failure(written.error()));
    }
    return Ok();
}

Result<void> HttpUploadStream::finish() {
    auto response = connection_.read_response();
    connection_.close();
    if (response.is_error()) {
        return Err<void>(as_transfer_failure(response.error()));
    }
    if (!response.value().is_success()) {
        return Err<void>(ErrorCode::TransferFailure,
                         "Upload endpoint rejected content with HTTP " +
                         std::to_string(response.value().status_code));
    }
    return Ok();
}

void HttpUploadStream::abort() noexcept {
    connection_.close();
}

} // namespace clu::network
