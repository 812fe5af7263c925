#pragma once

#include "clu/core/result.hpp"
#include "clu/events/event_queue.hpp"
#include "clu/network/upload_stream.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace clu::session {

/**
 * @brief One observation handed from the upload task to its owner
 *
 * A task produces any number of Progress updates followed by exactly one
 * Completed or Failed update.
 */
struct TransferUpdate {
    enum class Kind { Progress, Completed, Failed };

    Kind kind = Kind::Progress;
    int percent = 0;
    std::uint64_t bytes_sent = 0;
    std::string reason;

    [[nodiscard]] bool is_final() const noexcept { return kind != Kind::Progress; }
};

/**
 * @brief A running PUSH upload of one local file
 *
 * WHAT: Streams the file in chunks into an UploadStream on a worker thread
 * and reports through a ThreadSafeQueue. The owner polls next_update()
 * with a bounded wait, so it regains control at least once per wait and
 * can renew the session lease in between.
 *
 * GUARANTEES:
 * - The first update is 0%, percent never decreases
 * - Resolves exactly once (Completed or Failed)
 * - The destructor cancels and joins; the stream is aborted and the file
 *   closed on every exit path, including an owner that stops waiting
 *
 * THREAD SAFETY:
 * - cancel(), percent(), finished() may be called from any thread
 * - next_update() is meant for the single owning thread
 */
class TransferTask {
public:
    TransferTask(std::unique_ptr<network::UploadStream> stream,
                 std::string endpoint,
                 std::ifstream source,
                 std::uint64_t total_bytes,
                 std::size_t chunk_size);
    ~TransferTask();

    TransferTask(const TransferTask&) = delete;
    TransferTask& operator=(const TransferTask&) = delete;

    /**
     * @brief Wait up to `wait` for the next update
     *
     * RETURNS: nullopt when nothing arrived in time or the final update was
     * already consumed
     */
    std::optional<TransferUpdate> next_update(std::chrono::milliseconds wait);

    /// Request teardown; the task resolves as Failed unless it already finished.
    void cancel();

    [[nodiscard]] int percent() const noexcept { return percent_.load(); }
    [[nodiscard]] bool finished() const noexcept { return finished_.load(); }
    [[nodiscard]] std::uint64_t total_bytes() const noexcept { return total_bytes_; }

private:
    void run();
    Result<void> pump();
    void report_progress(std::uint64_t sent);
    void resolve(TransferUpdate update);

    std::unique_ptr<network::UploadStream> stream_;
    std::string endpoint_;
    std::ifstream source_;
    std::uint64_t total_bytes_;
    std::size_t chunk_size_;

    std::atomic<bool> cancel_requested_{false};
    std::atomic<bool> finished_{false};
    std::atomic<int> percent_{0};
    bool final_consumed_ = false;
    events::ThreadSafeQueue<TransferUpdate> updates_;

    std::thread worker_;
};

/**
 * @brief Starts PUSH uploads of local files to server-issued endpoints
 */
class FileTransferDriver {
public:
    static constexpr std::size_t kDefaultChunkSize = 256 * 1024;

    explicit FileTransferDriver(network::UploadStreamFactory factory,
                                std::size_t chunk_size = kDefaultChunkSize);

    /**
     * @brief Begin uploading `source` to `endpoint`
     *
     * Errors: InvalidArgument for a zero chunk size, TransferFailure when
     * the file cannot be opened or sized. Network errors are reported
     * through the returned task, not here.
     */
    Result<std::unique_ptr<TransferTask>> start(const std::string& endpoint,
                                                const std::filesystem::path& source) const;

private:
    network::UploadStreamFactory factory_;
    std::size_t chunk_size_;
};

} // namespace clu::session
