#include "url_resolver.hpp"
#include "errors.hpp"
#include "mapping.hpp"
#include "util.hpp"

#include <iostream>
#include <regex>

namespace campfire {

namespace {

const std::regex& meetupUrlPattern() {
    static const std::regex kPattern(
        R"(https://(?:niantic-social\.nianticlabs\.com/public/meetup(?:-without-location)?|campfire\.nianticlabs\.com/discover/meetup)/[a-zA-Z0-9-]+)");
    return kPattern;
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

MeetupUrlResolver::MeetupUrlResolver(CampfireDataSource& dataSource, bool verbose)
    : mDataSource(dataSource)
    , mVerbose(verbose) {}

bool MeetupUrlResolver::isCanonicalMeetupUrl(const std::string& url) {
    return startsWith(url, kPublicMeetupPrefix) ||
           startsWith(url, kPublicMeetupWithoutLocationPrefix) ||
           startsWith(url, kDiscoverMeetupPrefix);
}

std::string MeetupUrlResolver::resolveShortUrl(const std::string& url) {
    const auto result = mDataSource.resolveShortUrl(url);
    if (isCanonicalMeetupUrl(result.finalUrl)) {
        return result.finalUrl;
    }

    std::smatch match;
    if (!std::regex_search(result.body, match, meetupUrlPattern())) {
        throw CampfireError("Short URL did not contain a meetup link");
    }

    if (mVerbose) {
        std::cerr << "[UrlResolver] Found meetup link in page body: "
                  << match.str(0) << "\n";
    }
    return match.str(0);
}

std::string MeetupUrlResolver::resolveEventId(const std::string& meetupUrl) {
    std::string url = meetupUrl;
    if (startsWith(url, kMeetupShortPrefix)) {
        url = resolveShortUrl(url);
        if (mVerbose) {
            std::cerr << "[UrlResolver] Expanded " << meetupUrl << " -> " << url << "\n";
        }
    }

    std::string eventId;
    if (startsWith(url, kPublicMeetupWithoutLocationPrefix)) {
        throw UnsupportedMeetup("meetup without location is not supported");
    } else if (startsWith(url, kDiscoverMeetupPrefix)) {
        eventId = lastPathSegment(url.substr(kDiscoverMeetupPrefix.size()));
    } else if (startsWith(url, kPublicMeetupPrefix)) {
        eventId = resolvePublicMapObject(
            lastPathSegment(url.substr(kPublicMeetupPrefix.size())));
    } else {
        throw CampfireError(
            "Invalid meetup URL; expected niantic-social, cmpf.re, or campfire discover link");
    }

    if (eventId.empty()) {
        throw CampfireError("Invalid meetup URL: " + meetupUrl);
    }
    return eventId;
}

std::string MeetupUrlResolver::resolvePublicMapObject(const std::string& mapObjectId) {
    if (mapObjectId.empty()) {
        throw CampfireError("Could not extract event id from URL");
    }

    const Events events = parseEvents(mDataSource.fetchPublicEvents({mapObjectId}));
    if (events.publicMapObjectsById.empty()) {
        throw EventNotFound(mapObjectId);
    }

    for (const auto& item : events.publicMapObjectsById) {
        if (item.mapObjectId == mapObjectId) {
            return item.eventId;
        }
    }

    std::string returned;
    for (const auto& item : events.publicMapObjectsById) {
        if (!returned.empty()) returned += ", ";
        returned += "'" + item.mapObjectId + "'";
    }
    throw CampfireError("Event id mismatch: expected " + mapObjectId +
                        ", got [" + returned + "]");
}

} // namespace campfire
