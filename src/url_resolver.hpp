#pragma once

#include "datasource.hpp"

#include <string>

namespace campfire {

inline const std::string kMeetupShortPrefix =
    "https://cmpf.re/";
inline const std::string kPublicMeetupPrefix =
    "https://niantic-social.nianticlabs.com/public/meetup/";
inline const std::string kPublicMeetupWithoutLocationPrefix =
    "https://niantic-social.nianticlabs.com/public/meetup-without-location/";
inline const std::string kDiscoverMeetupPrefix =
    "https://campfire.nianticlabs.com/discover/meetup/";

/// Maps meetup share links (short, discover, public, public without
/// location) to canonical event ids.
class MeetupUrlResolver {
public:
    explicit MeetupUrlResolver(CampfireDataSource& dataSource, bool verbose = false);

    /// Expand a short link into a canonical meetup URL.
    /// @throws CampfireError if neither the final URL nor the page body
    ///         contains a meetup link.
    std::string resolveShortUrl(const std::string& url);

    /// Resolve any supported meetup link to its event id.
    /// @throws UnsupportedMeetup for links without location,
    ///         EventNotFound when the public lookup is empty,
    ///         CampfireError for anything else that cannot be resolved.
    std::string resolveEventId(const std::string& meetupUrl);

    /// True if @p url starts with one of the three canonical prefixes.
    static bool isCanonicalMeetupUrl(const std::string& url);

private:
    CampfireDataSource& mDataSource;
    bool                mVerbose;

    std::string resolvePublicMapObject(const std::string& mapObjectId);
};

} // namespace campfire
