#include "pagination.hpp"
#include "errors.hpp"
#include "mapping.hpp"

#include <iostream>
#include <iterator>
#include <optional>

namespace campfire {

Paginator::Paginator(CampfireDataSource& dataSource, bool verbose)
    : mDataSource(dataSource)
    , mVerbose(verbose) {}

std::vector<Event> Paginator::fetchPastMeetups(const std::string& clubId)
{
    std::vector<Event> allEvents;
    std::optional<std::string> cursor;

    for (;;) {
        if (mVerbose) {
            std::cerr << "[Paginator] Fetching page: first=" << kPageSize;
            if (cursor) std::cerr << ", after=" << *cursor;
            std::cerr << "\n";
        }

        const auto data = mDataSource.fetchArchivedMeetups(
            clubId, kPageSize, cursor, kMembersFirst);
        ++mStats.totalRequests;

        auto page = parseArchivedMeetupsPage(data);
        mStats.totalSkipped += page.skippedNodes;

        allEvents.insert(allEvents.end(),
                         std::make_move_iterator(page.events.begin()),
                         std::make_move_iterator(page.events.end()));

        if (mVerbose) {
            std::cerr << "[Paginator] Got " << page.events.size()
                      << " events (total so far: "
                      << allEvents.size() << ")\n";
        }

        if (!page.pageInfo.hasNextPage) {
            if (mVerbose) {
                std::cerr << "[Paginator] No more pages.\n";
            }
            break;
        }

        if (!page.pageInfo.endCursor) {
            throw CampfireError("Archived feed reports a next page without an end cursor");
        }
        cursor = page.pageInfo.endCursor;
    }

    mStats.totalFetched = static_cast<int>(allEvents.size());
    return allEvents;
}

} // namespace campfire
