#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace campfire {

/// Rate-limit and retry settings for the GraphQL transport.
/// Invalid values are rejected at construction with std::invalid_argument.
class CampfireConfig {
public:
    static constexpr std::chrono::milliseconds kDefaultEvery{1000};
    static constexpr int kDefaultBurst      = 40;
    static constexpr int kDefaultMaxRetries = 3;

    CampfireConfig();

    /// @param every       One token is credited per @p every.
    /// @param burst       Bucket capacity.
    /// @param maxRetries  Total attempts for retryable failures.
    CampfireConfig(std::chrono::milliseconds every, int burst, int maxRetries);

    std::chrono::milliseconds every() const { return mEvery; }
    int burst()      const { return mBurst; }
    int maxRetries() const { return mMaxRetries; }

private:
    std::chrono::milliseconds mEvery;
    int mBurst;
    int mMaxRetries;
};

/// Explicitly initialized application settings: the transport config plus
/// an optional static bearer token.
struct CampfireSettings {
    CampfireConfig             config;
    std::optional<std::string> token;

    /// Read CAMPFIRE_EVERY_SECONDS, CAMPFIRE_BURST, CAMPFIRE_MAX_RETRIES and
    /// CAMPFIRE_TOKEN.  Unset variables keep their defaults.
    /// @throws std::invalid_argument on non-numeric or out-of-range values.
    static CampfireSettings fromEnvironment();
};

} // namespace campfire
