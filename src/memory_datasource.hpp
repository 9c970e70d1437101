#pragma once

#include "datasource.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace campfire {

/// CampfireDataSource that serves canned `data` objects from memory and
/// records every call.  Requests without a canned answer throw CampfireError.
/// Not thread-safe.
class InMemoryDataSource : public CampfireDataSource {
public:
    struct ArchivedCall {
        std::string                clubId;
        int                        first = 0;
        std::optional<std::string> after;
        int                        membersFirst = 0;
    };

    void addShortUrl(const std::string& url, ShortUrlResult result);
    void addEvent(const std::string& eventId, nlohmann::json data);
    /// Answer for any public lookup; @p data is the full `data` object.
    void setPublicEvents(nlohmann::json data);
    void addClub(const std::string& clubId, nlohmann::json data);
    /// Page returned when `after` equals @p after (nullopt = first page).
    void addArchivedPage(const std::optional<std::string>& after, nlohmann::json data);

    ShortUrlResult resolveShortUrl(const std::string& url) override;
    nlohmann::json fetchEvent(const std::string& eventId) override;
    nlohmann::json fetchPublicEvents(const std::vector<std::string>& ids) override;
    nlohmann::json fetchClub(const std::string& clubId) override;
    nlohmann::json fetchArchivedMeetups(const std::string& clubId,
                                        int first,
                                        const std::optional<std::string>& after,
                                        int membersFirst) override;

    // ---- call log ----
    int totalCalls() const { return mTotalCalls; }
    const std::vector<std::string>&              shortUrlCalls()     const { return mShortUrlCalls; }
    const std::vector<std::string>&              eventCalls()        const { return mEventCalls; }
    const std::vector<std::vector<std::string>>& publicEventsCalls() const { return mPublicEventsCalls; }
    const std::vector<std::string>&              clubCalls()         const { return mClubCalls; }
    const std::vector<ArchivedCall>&             archivedCalls()     const { return mArchivedCalls; }

private:
    std::map<std::string, ShortUrlResult>     mShortUrls;
    std::map<std::string, nlohmann::json>     mEvents;
    std::optional<nlohmann::json>             mPublicEvents;
    std::map<std::string, nlohmann::json>     mClubs;
    std::map<std::optional<std::string>, nlohmann::json> mArchivedPages;

    int                                   mTotalCalls = 0;
    std::vector<std::string>              mShortUrlCalls;
    std::vector<std::string>              mEventCalls;
    std::vector<std::vector<std::string>> mPublicEventsCalls;
    std::vector<std::string>              mClubCalls;
    std::vector<ArchivedCall>             mArchivedCalls;
};

} // namespace campfire
