#include "datasource.hpp"
#include "errors.hpp"
#include "mapping.hpp"
#include "queries.hpp"

#include <iostream>
#include <thread>

namespace campfire {

GraphQLDataSource::GraphQLDataSource(const CampfireConfig& config,
                                     std::unique_ptr<HttpTransport> transport,
                                     TokenSupplier tokenSupplier,
                                     Endpoints endpoints,
                                     bool verbose,
                                     std::chrono::milliseconds retryDelay)
    : mConfig(config)
    , mTransport(std::move(transport))
    , mTokenSupplier(std::move(tokenSupplier))
    , mEndpoints(std::move(endpoints))
    , mVerbose(verbose)
    , mRetryDelay(retryDelay)
    , mRateLimiter(config.every(), config.burst(), verbose)
{
    if (!mTransport) {
        throw std::invalid_argument("GraphQLDataSource requires an HTTP transport");
    }
}

GraphQLDataSource::GraphQLDataSource(const CampfireConfig& config,
                                     TokenSupplier tokenSupplier,
                                     bool verbose)
    : GraphQLDataSource(config,
                        std::make_unique<BeastHttpTransport>(verbose),
                        std::move(tokenSupplier),
                        Endpoints{},
                        verbose) {}

// ---------------------------------------------------------------------------
// Operations
// ---------------------------------------------------------------------------

ShortUrlResult GraphQLDataSource::resolveShortUrl(const std::string& url) {
    HttpResponse resp;
    try {
        resp = mTransport->get(url, kShortUrlTimeout);
    } catch (const TransportError& e) {
        throw CampfireError(std::string("Short URL request failed: ") + e.what());
    }

    // Only client and server errors fail; a final 2xx/3xx page is scanned as-is.
    if (resp.httpStatus >= 400) {
        throw CampfireError("Short URL request failed with status " +
                            std::to_string(resp.httpStatus) + ": " + url);
    }

    if (mVerbose) {
        std::cerr << "[GraphQLDataSource] " << url << " -> "
                  << resp.finalUrl << "\n";
    }
    return ShortUrlResult{resp.finalUrl, std::move(resp.body)};
}

nlohmann::json GraphQLDataSource::fetchEvent(const std::string& eventId) {
    return privateQuery(queries::kEventQuery,
                        {{"id", eventId}, {"first", kUnboundedPageSize}});
}

nlohmann::json GraphQLDataSource::fetchPublicEvents(const std::vector<std::string>& ids) {
    return publicQuery(queries::kPublicEventsQuery, {{"ids", ids}});
}

nlohmann::json GraphQLDataSource::fetchClub(const std::string& clubId) {
    return privateQuery(queries::kClubQuery, {{"clubId", clubId}});
}

nlohmann::json GraphQLDataSource::fetchArchivedMeetups(const std::string& clubId,
                                                       int first,
                                                       const std::optional<std::string>& after,
                                                       int membersFirst)
{
    nlohmann::json variables;
    variables["clubId"]       = clubId;
    variables["first"]        = first;
    variables["after"]        = after ? nlohmann::json(*after) : nlohmann::json(nullptr);
    variables["membersFirst"] = membersFirst;
    return privateQuery(queries::kArchivedMeetupsQuery, variables);
}

// ---------------------------------------------------------------------------
// Private: endpoints
// ---------------------------------------------------------------------------

nlohmann::json GraphQLDataSource::privateQuery(const std::string& query,
                                               const nlohmann::json& variables)
{
    std::optional<std::string> token;
    if (mTokenSupplier) {
        token = mTokenSupplier();
    }
    if (!token || token->empty()) {
        throw CampfireError("Campfire token provider did not return a token");
    }
    return executeWithRetry(mEndpoints.privateUrl, query, variables, token);
}

nlohmann::json GraphQLDataSource::publicQuery(const std::string& query,
                                              const nlohmann::json& variables)
{
    return executeWithRetry(mEndpoints.publicUrl, query, variables, std::nullopt);
}

// ---------------------------------------------------------------------------
// Private: retry wrapper
// ---------------------------------------------------------------------------

nlohmann::json GraphQLDataSource::executeWithRetry(const std::string& url,
                                                   const std::string& query,
                                                   const nlohmann::json& variables,
                                                   const std::optional<std::string>& token)
{
    nlohmann::json payload;
    payload["query"]     = query;
    payload["variables"] = variables;
    const std::string body = payload.dump();

    HttpHeaders headers{
        {"Content-Type", "application/json"},
        {"Accept", "application/json"},
    };
    if (token) {
        headers["Authorization"] = "Bearer " + *token;
    }

    const int maxAttempts = mConfig.maxRetries();

    for (int attempt = 0; attempt < maxAttempts; ++attempt) {
        mRateLimiter.acquire();

        HttpResponse resp;
        try {
            resp = mTransport->post(url, body, headers, kGraphqlTimeout);
        } catch (const TransportError& e) {
            // Network / timeout — retryable.
            std::cerr << "[GraphQLDataSource] Request failed: " << e.what()
                      << " - attempt " << (attempt + 1) << "/"
                      << maxAttempts << "\n";

            if (attempt + 1 == maxAttempts) {
                throw RetryError(std::string("Campfire request failed: ") + e.what());
            }
            std::this_thread::sleep_for(mRetryDelay);
            continue;
        }

        if (resp.httpStatus == 429) {
            throw RateLimitError("Too many requests");
        }

        if (isRetryableStatus(resp.httpStatus)) {
            std::cerr << "[GraphQLDataSource] HTTP " << resp.httpStatus
                      << " - attempt " << (attempt + 1) << "/"
                      << maxAttempts << "\n";

            if (attempt + 1 == maxAttempts) {
                throw RetryError("Bad gateway from Campfire");
            }
            std::this_thread::sleep_for(mRetryDelay);
            continue;
        }

        if (resp.httpStatus != 200) {
            throw CampfireError("Campfire request failed with status " +
                                std::to_string(resp.httpStatus) + ": " + resp.body);
        }

        nlohmann::json parsed;
        try {
            parsed = nlohmann::json::parse(resp.body);
        } catch (const nlohmann::json::parse_error& e) {
            throw CampfireError(
                std::string("Failed to parse JSON response: ") + e.what());
        }

        for (const auto& err : parseGraphqlErrors(parsed)) {
            std::cerr << "[GraphQLDataSource] GraphQL error: " << err.message;
            if (!err.path.empty()) {
                std::cerr << " (path:";
                for (const auto& segment : err.path) {
                    std::cerr << " " << segment;
                }
                std::cerr << ")";
            }
            std::cerr << "\n";
        }

        if (!parsed.is_object()) {
            return nlohmann::json::object();
        }
        auto data = parsed.find("data");
        if (data == parsed.end() || !data->is_object()) {
            return nlohmann::json::object();
        }
        return *data;
    }

    throw RetryError("Too many retries");
}

bool GraphQLDataSource::isRetryableStatus(unsigned int status) {
    return status == 502;
}

} // namespace campfire
