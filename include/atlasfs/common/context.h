#ifndef ATLASFS_COMMON_CONTEXT_H
#define ATLASFS_COMMON_CONTEXT_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace atlasfs {

/**
 * Per-operation deadline and cancellation flag.
 *
 * Copies share the cancellation flag, so a context handed to a worker can be
 * cancelled from the thread that created it. The deadline is fixed at
 * construction.
 */
class OperationContext {
   public:
    using Clock = std::chrono::steady_clock;

    OperationContext();
    explicit OperationContext(std::uint64_t timeout_ms);

    void cancel() const;
    bool is_cancelled() const;
    bool is_expired() const;
    bool has_deadline() const { return has_deadline_; }
    Clock::time_point deadline() const { return deadline_; }

    // Milliseconds left before the deadline, zero once expired. Returns
    // fallback_ms when there is no deadline.
    std::uint64_t remaining_ms(std::uint64_t fallback_ms) const;

    // Throws TransferError(CANCELLED) or TransferError(TIMEOUT).
    void check(const std::string &operation) const;

   private:
    bool has_deadline_;
    Clock::time_point deadline_;
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

}  // namespace atlasfs

#endif  // ATLASFS_COMMON_CONTEXT_H
