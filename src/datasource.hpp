#pragma once

#include "config.hpp"
#include "http_client.hpp"
#include "rate_limiter.hpp"
#include "tokens.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace campfire {

/// Final location of an expanded short link.
struct ShortUrlResult {
    std::string finalUrl;
    std::string body;
};

/// Abstract source of Campfire data.  Every fetch returns the GraphQL
/// `data` object of the corresponding operation.
class CampfireDataSource {
public:
    virtual ~CampfireDataSource() = default;

    /// Follow a short URL and return where it ended up.
    virtual ShortUrlResult resolveShortUrl(const std::string& url) = 0;

    virtual nlohmann::json fetchEvent(const std::string& eventId) = 0;

    /// Public (unauthenticated) lookup of map objects by id.
    virtual nlohmann::json fetchPublicEvents(const std::vector<std::string>& ids) = 0;

    virtual nlohmann::json fetchClub(const std::string& clubId) = 0;

    virtual nlohmann::json fetchArchivedMeetups(const std::string& clubId,
                                                int first,
                                                const std::optional<std::string>& after,
                                                int membersFirst) = 0;
};

/// GraphQL-over-HTTP implementation with rate limiting, retries and
/// error classification.
class GraphQLDataSource : public CampfireDataSource {
public:
    struct Endpoints {
        std::string publicUrl  = "https://niantic-social-api.nianticlabs.com/public/graphql";
        std::string privateUrl = "https://niantic-social-api.nianticlabs.com/graphql";
    };

    static constexpr int kUnboundedPageSize = 100000000;
    static constexpr std::chrono::milliseconds kRetryDelay{1000};
    static constexpr std::chrono::milliseconds kGraphqlTimeout{60000};
    static constexpr std::chrono::milliseconds kShortUrlTimeout{30000};

    /// @param transport      HTTP implementation (BeastHttpTransport in production).
    /// @param tokenSupplier  Source of bearer tokens for the private endpoint.
    /// @param retryDelay     Pause between retry attempts.
    GraphQLDataSource(const CampfireConfig& config,
                      std::unique_ptr<HttpTransport> transport,
                      TokenSupplier tokenSupplier,
                      Endpoints endpoints,
                      bool verbose = false,
                      std::chrono::milliseconds retryDelay = kRetryDelay);

    GraphQLDataSource(const CampfireConfig& config,
                      TokenSupplier tokenSupplier,
                      bool verbose = false);

    ShortUrlResult resolveShortUrl(const std::string& url) override;
    nlohmann::json fetchEvent(const std::string& eventId) override;
    nlohmann::json fetchPublicEvents(const std::vector<std::string>& ids) override;
    nlohmann::json fetchClub(const std::string& clubId) override;
    nlohmann::json fetchArchivedMeetups(const std::string& clubId,
                                        int first,
                                        const std::optional<std::string>& after,
                                        int membersFirst) override;

    const RateLimiter& rateLimiter() const { return mRateLimiter; }

private:
    CampfireConfig                 mConfig;
    std::unique_ptr<HttpTransport> mTransport;
    TokenSupplier                  mTokenSupplier;
    Endpoints                      mEndpoints;
    bool                           mVerbose;
    std::chrono::milliseconds      mRetryDelay;
    RateLimiter                    mRateLimiter;

    nlohmann::json privateQuery(const std::string& query,
                                const nlohmann::json& variables);

    nlohmann::json publicQuery(const std::string& query,
                               const nlohmann::json& variables);

    /// Execute with rate limiting, classification and fixed-delay retry.
    nlohmann::json executeWithRetry(const std::string& url,
                                    const std::string& query,
                                    const nlohmann::json& variables,
                                    const std::optional<std::string>& token);

    static bool isRetryableStatus(unsigned int status);
};

} // namespace campfire
