#include "ConcurrencyLimiter.hpp"
#include <shared/utils/Logger.hpp>
#include <string>

namespace ImageOptimizer::Internal::Batch {

ConcurrencyLimiter::Permit::~Permit() {
    releaseQuietly();
}

void ConcurrencyLimiter::Permit::releaseQuietly() noexcept {
    try {
        reset();
    } catch (const Types::OptimizerError& e) {
        limiter_ = nullptr;
        LOG_ERROR("Permit release failed: ", e.what());
    }
}

ConcurrencyLimiter::ConcurrencyLimiter(int permits) : maxPermits_(permits), available_(permits) {
    if (permits < 1) {
        throw Types::ConfigurationError("Concurrency must be at least 1, got " + std::to_string(permits));
    }
}

void ConcurrencyLimiter::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (available_ > 0 && waiters_.empty()) {
        available_--;
        return;
    }

    const std::uint64_t ticket = nextTicket_++;
    waiters_.push_back(ticket);
    cv_.wait(lock, [this, ticket] { return granted_.count(ticket) > 0; });
    granted_.erase(ticket);
}

bool ConcurrencyLimiter::tryAcquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (available_ > 0 && waiters_.empty()) {
        available_--;
        return true;
    }
    return false;
}

void ConcurrencyLimiter::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!waiters_.empty()) {
            // Permit passes straight to the oldest waiter without touching the count
            granted_.insert(waiters_.front());
            waiters_.pop_front();
        } else {
            if (available_ >= maxPermits_) {
                throw Types::OptimizerError("Concurrency limiter released more permits than it holds");
            }
            available_++;
            return;
        }
    }
    cv_.notify_all();
}

ConcurrencyLimiter::Permit ConcurrencyLimiter::acquirePermit() {
    acquire();
    return Permit(this);
}

int ConcurrencyLimiter::availablePermits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_;
}

int ConcurrencyLimiter::queueLength() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(waiters_.size());
}

}  // namespace ImageOptimizer::Internal::Batch
