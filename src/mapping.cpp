#include "mapping.hpp"
#include "errors.hpp"

#include <cmath>
#include <cstdint>
#include <limits>

namespace campfire {

using json = nlohmann::json;

namespace {

const json& emptyObject() {
    static const json kEmpty = json::object();
    return kEmpty;
}

/// The value stored under @p key, or nullptr when absent or null.
const json* field(const json& node, const char* key) {
    if (!node.is_object()) return nullptr;
    auto it = node.find(key);
    if (it == node.end() || it->is_null()) return nullptr;
    return &*it;
}

const json& objectOr(const json& node, const char* key) {
    const json* v = field(node, key);
    return (v && v->is_object()) ? *v : emptyObject();
}

std::string stringOr(const json& node, const char* key, const std::string& fallback = "") {
    const json* v = field(node, key);
    return (v && v->is_string()) ? v->get<std::string>() : fallback;
}

std::optional<std::string> optString(const json& node, const char* key) {
    const json* v = field(node, key);
    if (v && v->is_string()) return v->get<std::string>();
    return std::nullopt;
}

std::optional<int> optInt(const json& node, const char* key) {
    const json* v = field(node, key);
    if (!v || !v->is_number()) return std::nullopt;
    if (v->is_number_float()) {
        double d = v->get<double>();
        if (!std::isfinite(d) ||
            d < static_cast<double>(std::numeric_limits<int>::min()) ||
            d > static_cast<double>(std::numeric_limits<int>::max())) {
            return std::nullopt;
        }
        return static_cast<int>(d);
    }
    if (v->is_number_unsigned()) {
        auto u = v->get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) return std::nullopt;
        return static_cast<int>(u);
    }
    auto i = v->get<std::int64_t>();
    if (i < std::numeric_limits<int>::min() || i > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    return static_cast<int>(i);
}

int intOr(const json& node, const char* key, int fallback = 0) {
    return optInt(node, key).value_or(fallback);
}

std::optional<double> optDouble(const json& node, const char* key) {
    const json* v = field(node, key);
    if (v && v->is_number()) return v->get<double>();
    return std::nullopt;
}

bool flag(const json& node, const char* key) {
    const json* v = field(node, key);
    if (!v) return false;
    if (v->is_boolean()) return v->get<bool>();
    if (v->is_number()) return v->get<double>() != 0.0;
    return false;
}

std::vector<std::string> stringList(const json& node, const char* key) {
    std::vector<std::string> out;
    const json* v = field(node, key);
    if (v && v->is_array()) {
        for (const auto& item : *v) {
            if (item.is_string()) out.push_back(item.get<std::string>());
        }
    }
    return out;
}

/// Iterate the array under @p key, skipping it entirely when absent.
template <typename Fn>
void forEachIn(const json& node, const char* key, Fn&& fn) {
    const json* v = field(node, key);
    if (v && v->is_array()) {
        for (const auto& item : *v) fn(item);
    }
}

json rawOf(const json& node) {
    return node.is_object() ? node : json::object();
}

} // namespace

// ---------------------------------------------------------------------------
// Small records
// ---------------------------------------------------------------------------

PageInfo parsePageInfo(const json& node) {
    PageInfo info;
    info.hasNextPage = flag(node, "hasNextPage");
    info.startCursor = optString(node, "startCursor");
    info.endCursor   = optString(node, "endCursor");
    return info;
}

Badge parseBadge(const json& node) {
    return Badge{optString(node, "alias"), optString(node, "badgeType")};
}

ClubRole parseClubRole(const json& node) {
    return ClubRole{stringOr(node, "id"), stringOr(node, "name")};
}

CampfireLiveEvent parseCampfireLiveEvent(const json& node) {
    CampfireLiveEvent live;
    live.id                   = stringOr(node, "id");
    live.checkInRadiusMeters  = optInt(node, "checkInRadiusMeters");
    live.eventName            = optString(node, "eventName");
    live.modalHeadingImageUrl = optString(node, "modalHeadingImageUrl");
    return live;
}

EventLocation parseEventLocation(const json& node) {
    return EventLocation{optDouble(node, "latitude"), optDouble(node, "longitude")};
}

RsvpStatus parseRsvpStatus(const json& node) {
    return RsvpStatus{stringOr(node, "userId"), stringOr(node, "rsvpStatus")};
}

// ---------------------------------------------------------------------------
// Member / Club
// ---------------------------------------------------------------------------

Member parseMember(const json& node) {
    Member m;
    m.id          = stringOr(node, "id");
    m.username    = stringOr(node, "username");
    m.displayName = stringOr(node, "displayName");
    m.avatarUrl   = stringOr(node, "avatarUrl");
    forEachIn(node, "badges", [&](const json& b) {
        m.badges.push_back(parseBadge(b));
    });
    forEachIn(node, "clubRoles", [&](const json& r) {
        m.clubRoles.push_back(parseClubRole(r));
    });
    m.clubRank = optInt(node, "clubRank");
    m.raw      = rawOf(node);
    return m;
}

Club parseClub(const json& node) {
    Club c;
    c.id                           = stringOr(node, "id");
    c.name                         = stringOr(node, "name");
    c.game                         = optString(node, "game");
    c.visibility                   = optString(node, "visibility");
    c.amIMember                    = flag(node, "amIMember");
    c.avatarUrl                    = stringOr(node, "avatarUrl");
    c.badgeGrants                  = stringList(node, "badgeGrants");
    c.createdByCommunityAmbassador = flag(node, "createdByCommunityAmbassador");
    c.creator                      = parseMember(objectOr(node, "creator"));
    c.raw                          = rawOf(node);
    return c;
}

Pagination<Member> parseMemberConnection(const json& node) {
    Pagination<Member> page;
    page.totalCount = intOr(node, "totalCount");
    forEachIn(node, "edges", [&](const json& edge) {
        page.edges.push_back(Edge<Member>{parseMember(objectOr(edge, "node")),
                                          optString(edge, "cursor")});
    });
    page.pageInfo = parsePageInfo(objectOr(node, "pageInfo"));
    return page;
}

// ---------------------------------------------------------------------------
// Event
// ---------------------------------------------------------------------------

Event parseEvent(const json& node) {
    Event e;
    e.id                           = stringOr(node, "id");
    e.name                         = stringOr(node, "name");
    e.visibility                   = optString(node, "visibility");
    e.address                      = stringOr(node, "address");
    e.location                     = optString(node, "location");
    e.coverPhotoUrl                = stringOr(node, "coverPhotoUrl");
    e.mapPreviewUrl                = optString(node, "mapPreviewUrl");
    e.details                      = stringOr(node, "details");
    e.eventTime                    = stringOr(node, "eventTime");
    e.eventEndTime                 = stringOr(node, "eventEndTime");
    e.rsvpStatus                   = optString(node, "rsvpStatus");
    e.createdByCommunityAmbassador = flag(node, "createdByCommunityAmbassador");
    e.badgeGrants                  = stringList(node, "badgeGrants");
    e.topicId                      = optString(node, "topicId");
    e.discordInterested            = intOr(node, "discordInterested");
    e.game                         = optString(node, "game");
    e.creator                      = parseMember(objectOr(node, "creator"));
    e.clubId                       = stringOr(node, "clubId");
    e.club                         = parseClub(objectOr(node, "club"));
    e.members                      = parseMemberConnection(objectOr(node, "members"));
    e.checkedInMembersCount        = optInt(node, "checkedInMembersCount");
    forEachIn(node, "rsvpStatuses", [&](const json& r) {
        e.rsvpStatuses.push_back(parseRsvpStatus(r));
    });
    e.isPasscodeRewardEligible     = flag(node, "isPasscodeRewardEligible");
    e.passcode                     = optString(node, "passcode");
    e.campfireLiveEventId          = optString(node, "campfireLiveEventId");
    e.campfireLiveEvent            = parseCampfireLiveEvent(objectOr(node, "campfireLiveEvent"));
    e.commentsPermissions          = optString(node, "commentsPermissions");
    e.commentCount                 = intOr(node, "commentCount");
    e.isSubscribed                 = flag(node, "isSubscribed");
    e.raw                          = rawOf(node);
    return e;
}

// ---------------------------------------------------------------------------
// Public events
// ---------------------------------------------------------------------------

PublicEvent parsePublicEvent(const json& node) {
    const json& event = objectOr(node, "event");

    PublicEvent p;
    p.mapObjectId              = stringOr(node, "id");
    p.eventId                  = stringOr(event, "id");
    p.name                     = stringOr(event, "name");
    p.details                  = stringOr(event, "details");
    p.clubName                 = stringOr(event, "clubName");
    p.clubId                   = stringOr(event, "clubId");
    p.clubAvatarUrl            = stringOr(event, "clubAvatarUrl");
    p.isPasscodeRewardEligible = flag(event, "isPasscodeRewardEligible");
    p.eventTime                = stringOr(event, "eventTime");
    p.eventEndTime             = stringOr(event, "eventEndTime");
    p.address                  = stringOr(event, "address");
    p.mapObjectLocation        = parseEventLocation(objectOr(event, "mapObjectLocation"));
    return p;
}

Events parseEvents(const json& data) {
    Events events;
    forEachIn(data, "publicMapObjectsById", [&](const json& item) {
        events.publicMapObjectsById.push_back(parsePublicEvent(item));
    });
    return events;
}

// ---------------------------------------------------------------------------
// Archived feed
// ---------------------------------------------------------------------------

ArchivedMeetupsPage parseArchivedMeetupsPage(const json& data) {
    const json* club = field(data, "club");
    if (!club || !club->is_object()) {
        throw CampfireError("Response missing 'club' field");
    }
    const json* feed = field(*club, "archivedFeed");
    if (!feed || !feed->is_object()) {
        throw CampfireError("Response missing 'club.archivedFeed' field");
    }

    ArchivedMeetupsPage page;
    forEachIn(*feed, "edges", [&](const json& edge) {
        const json& node = objectOr(edge, "node");
        if (stringOr(node, "__typename") == "Event") {
            page.events.push_back(parseEvent(node));
        } else {
            ++page.skippedNodes;
        }
    });
    page.pageInfo = parsePageInfo(objectOr(*feed, "pageInfo"));
    return page;
}

// ---------------------------------------------------------------------------
// Errors / helpers
// ---------------------------------------------------------------------------

std::vector<GraphQLError> parseGraphqlErrors(const json& responseBody) {
    std::vector<GraphQLError> errors;

    forEachIn(responseBody, "errors", [&](const json& err) {
        GraphQLError e;
        e.message = stringOr(err, "message", "Unknown GraphQL error");
        forEachIn(err, "path", [&](const json& segment) {
            if (segment.is_string()) {
                e.path.push_back(segment.get<std::string>());
            } else if (segment.is_number_integer()) {
                e.path.push_back(std::to_string(segment.get<std::int64_t>()));
            }
        });
        errors.push_back(std::move(e));
    });
    return errors;
}

std::optional<Member> findMember(const std::string& memberId, const Event& event) {
    for (const auto& edge : event.members.edges) {
        if (edge.node.id == memberId) {
            return edge.node;
        }
    }
    return std::nullopt;
}

} // namespace campfire
