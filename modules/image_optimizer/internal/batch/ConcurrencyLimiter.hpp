#pragma once

#include <shared/types/Errors.hpp>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <unordered_set>

namespace ImageOptimizer::Internal::Batch {

// Counting semaphore that hands released permits to waiters in arrival order.
class ConcurrencyLimiter {
  public:
    // Returns its permit to the limiter when destroyed
    class Permit {
      public:
        Permit() = default;
        explicit Permit(ConcurrencyLimiter* limiter) : limiter_(limiter) {}
        // Never throws; an over-release found here is logged
        ~Permit();

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

        Permit(Permit&& other) noexcept : limiter_(other.limiter_) { other.limiter_ = nullptr; }
        Permit& operator=(Permit&& other) noexcept {
            if (this != &other) {
                releaseQuietly();
                limiter_ = other.limiter_;
                other.limiter_ = nullptr;
            }
            return *this;
        }

        bool holds() const { return limiter_ != nullptr; }

        // Throws OptimizerError on over-release
        void reset() {
            if (limiter_) {
                limiter_->release();
                limiter_ = nullptr;
            }
        }

      private:
        ConcurrencyLimiter* limiter_ = nullptr;

        void releaseQuietly() noexcept;
    };

    explicit ConcurrencyLimiter(int permits);

    ConcurrencyLimiter(const ConcurrencyLimiter&) = delete;
    ConcurrencyLimiter& operator=(const ConcurrencyLimiter&) = delete;

    // Blocks until a permit is available and every earlier waiter has been served
    void acquire();

    bool tryAcquire();

    void release();

    Permit acquirePermit();

    int availablePermits() const;
    int queueLength() const;
    int maxPermits() const { return maxPermits_; }

  private:
    const int maxPermits_;
    int available_;
    std::uint64_t nextTicket_ = 0;
    std::deque<std::uint64_t> waiters_;
    std::unordered_set<std::uint64_t> granted_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

}  // namespace ImageOptimizer::Internal::Batch
