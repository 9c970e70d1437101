#pragma once

#include "datasource.hpp"
#include "models.hpp"

#include <string>
#include <vector>

namespace campfire {

/// Walks a club's archived-meetups feed with a forward-only cursor.
class Paginator {
public:
    struct Stats {
        int totalFetched  = 0;
        int totalRequests = 0;
        int totalSkipped  = 0;   // non-Event nodes dropped
    };

    static constexpr int kPageSize     = 50;
    static constexpr int kMembersFirst = 100000000;

    explicit Paginator(CampfireDataSource& dataSource, bool verbose = false);

    /// Fetch every archived meetup of @p clubId in server order.
    /// Stops when the server reports no next page; there is no page limit.
    /// @throws CampfireError on a malformed page (including hasNextPage
    ///         without an endCursor); data-source errors propagate.
    std::vector<Event> fetchPastMeetups(const std::string& clubId);

    Stats getStats() const { return mStats; }

private:
    CampfireDataSource& mDataSource;
    bool                mVerbose;
    Stats               mStats{};
};

} // namespace campfire
