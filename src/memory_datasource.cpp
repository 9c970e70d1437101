#include "memory_datasource.hpp"
#include "errors.hpp"

namespace campfire {

void InMemoryDataSource::addShortUrl(const std::string& url, ShortUrlResult result) {
    mShortUrls[url] = std::move(result);
}

void InMemoryDataSource::addEvent(const std::string& eventId, nlohmann::json data) {
    mEvents[eventId] = std::move(data);
}

void InMemoryDataSource::setPublicEvents(nlohmann::json data) {
    mPublicEvents = std::move(data);
}

void InMemoryDataSource::addClub(const std::string& clubId, nlohmann::json data) {
    mClubs[clubId] = std::move(data);
}

void InMemoryDataSource::addArchivedPage(const std::optional<std::string>& after,
                                         nlohmann::json data) {
    mArchivedPages[after] = std::move(data);
}

ShortUrlResult InMemoryDataSource::resolveShortUrl(const std::string& url) {
    ++mTotalCalls;
    mShortUrlCalls.push_back(url);
    auto it = mShortUrls.find(url);
    if (it == mShortUrls.end()) {
        throw CampfireError("No canned short URL for " + url);
    }
    return it->second;
}

nlohmann::json InMemoryDataSource::fetchEvent(const std::string& eventId) {
    ++mTotalCalls;
    mEventCalls.push_back(eventId);
    auto it = mEvents.find(eventId);
    if (it == mEvents.end()) {
        throw CampfireError("No canned event for " + eventId);
    }
    return it->second;
}

nlohmann::json InMemoryDataSource::fetchPublicEvents(const std::vector<std::string>& ids) {
    ++mTotalCalls;
    mPublicEventsCalls.push_back(ids);
    if (!mPublicEvents) {
        throw CampfireError("No canned public events");
    }
    return *mPublicEvents;
}

nlohmann::json InMemoryDataSource::fetchClub(const std::string& clubId) {
    ++mTotalCalls;
    mClubCalls.push_back(clubId);
    auto it = mClubs.find(clubId);
    if (it == mClubs.end()) {
        throw CampfireError("No canned club for " + clubId);
    }
    return it->second;
}

nlohmann::json InMemoryDataSource::fetchArchivedMeetups(const std::string& clubId,
                                                        int first,
                                                        const std::optional<std::string>& after,
                                                        int membersFirst) {
    ++mTotalCalls;
    mArchivedCalls.push_back(ArchivedCall{clubId, first, after, membersFirst});
    auto it = mArchivedPages.find(after);
    if (it == mArchivedPages.end()) {
        throw CampfireError("No canned archived page for cursor " +
                            after.value_or("<null>"));
    }
    return it->second;
}

} // namespace campfire
