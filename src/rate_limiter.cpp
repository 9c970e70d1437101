#include "rate_limiter.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace campfire {

namespace {

std::chrono::milliseconds checkedInterval(std::chrono::milliseconds every) {
    if (every.count() <= 0) {
        throw std::invalid_argument("Rate limiter interval must be positive");
    }
    return every;
}

int checkedBurst(int burst) {
    if (burst <= 0) {
        throw std::invalid_argument("Burst must be positive");
    }
    return burst;
}

/// every / burst, never below one microsecond.
std::chrono::microseconds pollInterval(std::chrono::milliseconds every, int burst) {
    const auto interval = std::chrono::duration_cast<std::chrono::microseconds>(every) / burst;
    return std::max(interval, std::chrono::microseconds(1));
}

} // namespace

RateLimiter::RateLimiter(std::chrono::milliseconds every, int burst, bool verbose)
    : mInterval(std::chrono::duration<double>(checkedInterval(every)).count())
    , mCapacity(static_cast<double>(checkedBurst(burst)))
    , mPollSleep(pollInterval(every, burst))
    , mVerbose(verbose)
    , mTokens(static_cast<double>(burst))
    , mLast(Clock::now()) {}

void RateLimiter::acquire() {
    for (;;) {
        {
            std::lock_guard<std::mutex> lock(mMutex);
            const auto now     = Clock::now();
            const double elapsed = std::chrono::duration<double>(now - mLast).count();
            mLast   = now;
            mTokens = std::min(mCapacity, mTokens + elapsed / mInterval);

            if (mTokens >= 1.0) {
                mTokens -= 1.0;
                ++mTotalAcquired;
                return;
            }

            mTotalSleep += std::chrono::duration<double>(mPollSleep).count();
            if (mVerbose) {
                std::cerr << "[RateLimiter] Bucket empty (tokens="
                          << mTokens << "), sleeping "
                          << mPollSleep.count() << " us\n";
            }
        }
        std::this_thread::sleep_for(mPollSleep);
    }
}

double RateLimiter::totalSleepSeconds() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mTotalSleep;
}

long RateLimiter::totalAcquired() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mTotalAcquired;
}

} // namespace campfire
