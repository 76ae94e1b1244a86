#include <atlasfs/common/context.h>
#include <atlasfs/transfer/error.h>

namespace atlasfs {

OperationContext::OperationContext()
    : has_deadline_(false),
      deadline_(Clock::time_point::max()),
      cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

OperationContext::OperationContext(std::uint64_t timeout_ms)
    : has_deadline_(true),
      deadline_(Clock::now() + std::chrono::milliseconds(timeout_ms)),
      cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

void OperationContext::cancel() const { cancelled_->store(true); }

bool OperationContext::is_cancelled() const { return cancelled_->load(); }

bool OperationContext::is_expired() const {
    return has_deadline_ && Clock::now() >= deadline_;
}

std::uint64_t OperationContext::remaining_ms(std::uint64_t fallback_ms) const {
    if (!has_deadline_) {
        return fallback_ms;
    }
    auto now = Clock::now();
    if (now >= deadline_) {
        return 0;
    }
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - now)
            .count());
}

void OperationContext::check(const std::string &operation) const {
    if (is_cancelled()) {
        throw TransferError(TransferError::CANCELLED,
                            operation + " cancelled");
    }
    if (is_expired()) {
        throw TransferError(TransferError::TIMEOUT,
                            operation + " exceeded its deadline");
    }
}

}  // namespace atlasfs
