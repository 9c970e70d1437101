#pragma once

#include "club_lookup.hpp"
#include "config.hpp"
#include "datasource.hpp"
#include "models.hpp"
#include "tokens.hpp"

#include <memory>
#include <string>
#include <vector>

namespace campfire {

/// High-level Campfire client: link resolution plus typed event / club
/// lookups.  Errors from the underlying components propagate unchanged.
/// Safe to call from several threads when the data source is.
class CampfireClient {
public:
    /// Build the HTTP-backed data source from explicit settings.
    CampfireClient(const CampfireConfig& config,
                   TokenSupplier tokenSupplier,
                   bool verbose = false);

    /// Use any data source (e.g. InMemoryDataSource in tests).
    explicit CampfireClient(std::unique_ptr<CampfireDataSource> dataSource,
                            bool verbose = false);

    /// Expand a cmpf.re short link into a canonical meetup URL.
    std::string resolveShortUrl(const std::string& url);

    std::string resolveEventId(const std::string& meetupUrl);
    Event       resolveEvent(const std::string& meetupUrl);

    /// @throws EventNotFound if the backend returns no event.
    Event  getEvent(const std::string& eventId);
    Events getEvents(const std::vector<std::string>& mapObjectIds);

    /// @throws CampfireError if the backend returns no club.
    Club getClub(const std::string& clubId);

    std::string resolveClubId(const std::string& clubUrl);
    Club        resolveClub(const std::string& clubUrl);

    /// Resolve free text holding a club share link or a club id.
    /// Without a @p fallback the text must contain a recognizable reference;
    /// otherwise unrecognized text is used as a club URL or id.
    /// @throws ClubLookupError if no reference can be formed or the text
    ///         holds several.
    Club lookupClub(const std::string& rawInput,
                    ClubLookupKind fallback = ClubLookupKind::None);

    /// Every archived meetup of @p clubId, in server order.
    std::vector<Event> getPastMeetups(const std::string& clubId);

    CampfireDataSource& dataSource() { return *mDataSource; }

private:
    std::unique_ptr<CampfireDataSource> mDataSource;
    bool                                mVerbose;
};

} // namespace campfire
