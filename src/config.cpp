#include "config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace campfire {

namespace {

std::optional<std::string> readEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

int parseIntSetting(const char* name, const std::string& value) {
    std::size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) +
                                    " is not an integer: " + value);
    }
    if (consumed != value.size()) {
        throw std::invalid_argument(std::string(name) +
                                    " is not an integer: " + value);
    }
    return parsed;
}

} // namespace

CampfireConfig::CampfireConfig()
    : CampfireConfig(kDefaultEvery, kDefaultBurst, kDefaultMaxRetries) {}

CampfireConfig::CampfireConfig(std::chrono::milliseconds every,
                               int burst,
                               int maxRetries)
    : mEvery(every)
    , mBurst(burst)
    , mMaxRetries(maxRetries)
{
    if (mEvery.count() <= 0) {
        throw std::invalid_argument("Rate limiter interval must be positive");
    }
    if (mBurst <= 0) {
        throw std::invalid_argument("Burst must be positive");
    }
    if (mMaxRetries <= 0) {
        throw std::invalid_argument("max_retries must be positive");
    }
}

CampfireSettings CampfireSettings::fromEnvironment() {
    auto every      = CampfireConfig::kDefaultEvery;
    int  burst      = CampfireConfig::kDefaultBurst;
    int  maxRetries = CampfireConfig::kDefaultMaxRetries;

    if (auto v = readEnv("CAMPFIRE_EVERY_SECONDS")) {
        every = std::chrono::seconds(parseIntSetting("CAMPFIRE_EVERY_SECONDS", *v));
    }
    if (auto v = readEnv("CAMPFIRE_BURST")) {
        burst = parseIntSetting("CAMPFIRE_BURST", *v);
    }
    if (auto v = readEnv("CAMPFIRE_MAX_RETRIES")) {
        maxRetries = parseIntSetting("CAMPFIRE_MAX_RETRIES", *v);
    }

    return CampfireSettings{CampfireConfig(every, burst, maxRetries),
                            readEnv("CAMPFIRE_TOKEN")};
}

} // namespace campfire
