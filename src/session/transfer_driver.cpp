#include "clu/session/transfer_driver.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <vector>

namespace clu::session {
namespace fs = std::filesystem;

TransferTask::TransferTask(std::unique_ptr<network::UploadStream> stream,
                           std::string endpoint,
                           std::ifstream source,
                           std::uint64_t total_bytes,
                           std::size_t chunk_size)
    : stream_(std::move(stream))
    , endpoint_(std::move(endpoint))
    , source_(std::move(source))
    , total_bytes_(total_bytes)
    , chunk_size_(chunk_size)
    , worker_([this]() { run(); }) {
}

TransferTask::~TransferTask() {
    cancel();
    if (worker_.joinable()) {
        worker_.join();
    }
}

std::optional<TransferUpdate> TransferTask::next_update(std::chrono::milliseconds wait) {
    if (final_consumed_) {
        return std::nullopt;
    }
    auto update = updates_.pop_for(wait);
    if (update && update->is_final()) {
        final_consumed_ = true;
    }
    return update;
}

void TransferTask::cancel() {
    cancel_requested_.store(true);
}

void TransferTask::run() {
    Result<void> outcome = Ok();
    try {
        outcome = pump();
    } catch (const std::exception& e) {
        outcome = Err<void>(ErrorCode::TransferFailure, std::string("Upload aborted: ") + e.what());
    }

    source_.close();
    if (outcome.is_error()) {
        stream_->abort();
        resolve({TransferUpdate::Kind::Failed, percent_.load(), 0, outcome.error().to_string()});
        return;
    }
    resolve({TransferUpdate::Kind::Completed, 100, total_bytes_, {}});
}

Result<void> TransferTask::pump() {
    report_progress(0);

    if (auto opened = stream_->open(endpoint_, total_bytes_); opened.is_error()) {
        return opened;
    }

    std::vector<std::uint8_t> buffer(chunk_size_);
    std::uint64_t sent = 0;

    while (sent < total_bytes_) {
        if (cancel_requested_.load()) {
            return Err<void>(ErrorCode::Cancelled, "Upload cancelled after " + std::to_string(sent) + " bytes");
        }

        // Never send more than the Content-Length announced at open, even if the file grew
        const auto wanted = static_cast<std::size_t>(
            std::min<std::uint64_t>(chunk_size_, total_bytes_ - sent));
        source_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(wanted));
        const auto bytes_read = static_cast<std::size_t>(source_.gcount());
        if (bytes_read == 0) {
            return Err<void>(ErrorCode::TransferFailure,
                             "Source file ended after " + std::to_string(sent) + " of " +
                             std::to_string(total_bytes_) + " bytes");
        }

        if (auto written = stream_->write(buffer.data(), bytes_read); written.is_error()) {
            return written;
        }
        sent += bytes_read;
        report_progress(sent);
    }

    if (cancel_requested_.load()) {
        return Err<void>(ErrorCode::Cancelled, "Upload cancelled before it was finalized");
    }
    return stream_->finish();
}

void TransferTask::report_progress(std::uint64_t sent) {
    const int percent = total_bytes_ == 0
        ? (sent == 0 ? 0 : 100)
        : static_cast<int>(std::min<std::uint64_t>(sent, total_bytes_) * 100 / total_bytes_);

    // 0% is always reported once; afterwards only increases
    if (sent != 0 && percent <= percent_.load()) {
        return;
    }
    percent_.store(percent);
    updates_.push({TransferUpdate::Kind::Progress, percent, sent, {}});
}

void TransferTask::resolve(TransferUpdate update) {
    if (finished_.exchange(true)) {
        return;
    }
    spdlog::debug("[Upload] endpoint={} outcome={} percent={}", endpoint_,
                  update.kind == TransferUpdate::Kind::Completed ? "completed" : "failed", update.percent);
    updates_.push(std::move(update));
    updates_.shutdown();
}

// ════════════════════════════════════════════════════════
// FileTransferDriver
// ════════════════════════════════════════════════════════

FileTransferDriver::FileTransferDriver(network::UploadStreamFactory factory, std::size_t chunk_size)
    : factory_(std::move(factory))
    , chunk_size_(chunk_size) {
}

Result<std::unique_ptr<TransferTask>> FileTransferDriver::start(const std::string& endpoint,
                                                                const fs::path& source) const {
    if (chunk_size_ == 0) {
        return Err<std::unique_ptr<TransferTask>>(ErrorCode::InvalidArgument, "chunk_size must be > 0");
    }

    std::ifstream input(source, std::ios::binary);
    if (!input) {
        return Err<std::unique_ptr<TransferTask>>(ErrorCode::TransferFailure,
                                                  "Failed to open source file: " + source.string());
    }

    std::error_code ec;
    const auto file_size = fs::file_size(source, ec);
    if (ec) {
        return Err<std::unique_ptr<TransferTask>>(ErrorCode::TransferFailure,
                                                  "Failed to size source file " + source.string() + ": " + ec.message());
    }

    auto stream = factory_ ? factory_() : nullptr;
    if (!stream) {
        return Err<std::unique_ptr<TransferTask>>(ErrorCode::TransferFailure, "No upload stream available");
    }

    spdlog::debug("[Upload] starting source={} bytes={} endpoint={}", source.string(), file_size, endpoint);
    return Ok(std::make_unique<TransferTask>(std::move(stream), endpoint, std::move(input),
                                             static_cast<std::uint64_t>(file_size), chunk_size_));
}

} // namespace clu::session
