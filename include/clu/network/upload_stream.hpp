#pragma once

#include "clu/core/result.hpp"
#include "clu/network/http_connection.hpp"
#include "clu/network/http_types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

namespace clu::network {

/**
 * @brief Sink for one binary upload to a server-issued endpoint
 *
 * Call order: open(), write() any number of times, finish(). abort() may be
 * called at any point and must release the underlying connection.
 */
class UploadStream {
public:
    virtual ~UploadStream() = default;

    virtual Result<void> open(const std::string& endpoint, std::uint64_t content_length) = 0;
    virtual Result<void> write(const std::uint8_t* data, std::size_t size) = 0;
    virtual Result<void> finish() = 0;
    virtual void abort() noexcept = 0;
};

using UploadStreamFactory = std::function<std::unique_ptr<UploadStream>()>;

/**
 * @brief UploadStream that submits the file as a single HTTP request body
 */
class HttpUploadStream : public UploadStream {
public:
    HttpUploadStream(TransportOptions options,
                     HttpMethod method,
                     std::unordered_map<std::string, std::string> headers);

    Result<void> open(const std::string& endpoint, std::uint64_t content_length) override;
    Result<void> write(const std::uint8_t* data, std::size_t size) override;
    Result<void> finish() override;
    void abort() noexcept override;

private:
    HttpConnection connection_;
    HttpMethod method_;
    std::unordered_map<std::string, std::string> headers_;
    std::string endpoint_;
};

} // namespace clu::network
