#include "client.hpp"
#include "club_lookup.hpp"
#include "deep_link.hpp"
#include "errors.hpp"
#include "mapping.hpp"
#include "pagination.hpp"
#include "url_resolver.hpp"

#include <iostream>
#include <stdexcept>

namespace campfire {

namespace {

/// The object stored under @p key, or nullptr when absent / null / not an object.
const nlohmann::json* objectAt(const nlohmann::json& data, const char* key) {
    if (!data.is_object()) return nullptr;
    auto it = data.find(key);
    if (it == data.end() || !it->is_object()) return nullptr;
    return &*it;
}

} // namespace

CampfireClient::CampfireClient(const CampfireConfig& config,
                               TokenSupplier tokenSupplier,
                               bool verbose)
    : CampfireClient(std::make_unique<GraphQLDataSource>(config,
                                                         std::move(tokenSupplier),
                                                         verbose),
                     verbose) {}

CampfireClient::CampfireClient(std::unique_ptr<CampfireDataSource> dataSource,
                               bool verbose)
    : mDataSource(std::move(dataSource))
    , mVerbose(verbose)
{
    if (!mDataSource) {
        throw std::invalid_argument("CampfireClient requires a data source");
    }
}

// ---------------------------------------------------------------------------
// Events
// ---------------------------------------------------------------------------

std::string CampfireClient::resolveShortUrl(const std::string& url) {
    return MeetupUrlResolver(*mDataSource, mVerbose).resolveShortUrl(url);
}

std::string CampfireClient::resolveEventId(const std::string& meetupUrl) {
    return MeetupUrlResolver(*mDataSource, mVerbose).resolveEventId(meetupUrl);
}

Event CampfireClient::resolveEvent(const std::string& meetupUrl) {
    return getEvent(resolveEventId(meetupUrl));
}

Event CampfireClient::getEvent(const std::string& eventId) {
    const auto data  = mDataSource->fetchEvent(eventId);
    const auto* node = objectAt(data, "event");
    if (node == nullptr) {
        throw EventNotFound(eventId);
    }
    return parseEvent(*node);
}

Events CampfireClient::getEvents(const std::vector<std::string>& mapObjectIds) {
    return parseEvents(mDataSource->fetchPublicEvents(mapObjectIds));
}

std::vector<Event> CampfireClient::getPastMeetups(const std::string& clubId) {
    Paginator paginator(*mDataSource, mVerbose);
    auto events = paginator.fetchPastMeetups(clubId);

    if (mVerbose) {
        const auto stats = paginator.getStats();
        std::cerr << "[CampfireClient] Past meetups for " << clubId << ": "
                  << stats.totalFetched << " events in "
                  << stats.totalRequests << " requests ("
                  << stats.totalSkipped << " non-event nodes skipped)\n";
    }
    return events;
}

// ---------------------------------------------------------------------------
// Clubs
// ---------------------------------------------------------------------------

Club CampfireClient::getClub(const std::string& clubId) {
    const auto data  = mDataSource->fetchClub(clubId);
    const auto* node = objectAt(data, "club");
    if (node == nullptr) {
        throw CampfireError("Club not found: " + clubId);
    }
    return parseClub(*node);
}

std::string CampfireClient::resolveClubId(const std::string& clubUrl) {
    return decodeClubDeepLink(clubUrl);
}

Club CampfireClient::resolveClub(const std::string& clubUrl) {
    return getClub(resolveClubId(clubUrl));
}

Club CampfireClient::lookupClub(const std::string& rawInput, ClubLookupKind fallback) {
    const bool strict = fallback == ClubLookupKind::None;
    const auto ref    = normalizeClubLookup(rawInput, strict, fallback);
    if (ref.url) {
        return resolveClub(*ref.url);
    }
    if (ref.id) {
        return getClub(*ref.id);
    }
    throw ClubLookupError("No club reference provided.");
}

} // namespace campfire
