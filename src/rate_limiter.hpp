#pragma once

#include <chrono>
#include <mutex>

namespace campfire {

/// Token bucket shared by every request of one client.
/// Holds at most @p burst tokens and credits one token per @p every,
/// accrued fractionally from the elapsed time.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    /// @throws std::invalid_argument if @p every or @p burst is not positive.
    RateLimiter(std::chrono::milliseconds every, int burst, bool verbose = false);

    /// Block until a token is available, then consume it.
    /// Sleeps every/burst between attempts.  No fairness between waiters.
    void acquire();

    // ---- accessors for diagnostics ----
    double totalSleepSeconds() const;
    long   totalAcquired() const;

private:
    const double                    mInterval;   // seconds per token
    const double                    mCapacity;
    const std::chrono::microseconds mPollSleep;
    const bool                      mVerbose;

    mutable std::mutex mMutex;
    double             mTokens;
    Clock::time_point  mLast;

    double mTotalSleep    = 0.0;
    long   mTotalAcquired = 0;
};

} // namespace campfire
