#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace campfire {

/// One entry of a GraphQL "errors" array.  Informational only.
struct GraphQLError {
    std::string              message;
    std::vector<std::string> path;
};

struct PageInfo {
    bool                       hasNextPage = false;
    std::optional<std::string> startCursor;
    std::optional<std::string> endCursor;
};

template <typename T>
struct Edge {
    T                          node;
    std::optional<std::string> cursor;
};

/// Relay-style connection.  Edges keep server order.
template <typename T>
struct Pagination {
    int                  totalCount = 0;
    std::vector<Edge<T>> edges;
    PageInfo             pageInfo;
};

struct Badge {
    std::optional<std::string> alias;
    std::optional<std::string> badgeType;
};

struct ClubRole {
    std::string id;
    std::string name;
};

struct Member {
    std::string           id;
    std::string           username;
    std::string           displayName;
    std::string           avatarUrl;
    std::vector<Badge>    badges;
    std::vector<ClubRole> clubRoles;
    std::optional<int>    clubRank;
    nlohmann::json        raw = nlohmann::json::object();
};

struct Club {
    std::string                id;
    std::string                name;
    std::optional<std::string> game;
    std::optional<std::string> visibility;
    bool                       amIMember = false;
    std::string                avatarUrl;
    std::vector<std::string>   badgeGrants;
    bool                       createdByCommunityAmbassador = false;
    Member                     creator;
    nlohmann::json             raw = nlohmann::json::object();
};

struct CampfireLiveEvent {
    std::string                id;
    std::optional<int>         checkInRadiusMeters;
    std::optional<std::string> eventName;
    std::optional<std::string> modalHeadingImageUrl;
};

struct EventLocation {
    std::optional<double> latitude;
    std::optional<double> longitude;
};

struct RsvpStatus {
    std::string userId;
    std::string rsvpStatus;
};

/// Full (authenticated) view of a meetup.
struct Event {
    std::string                id;
    std::string                name;
    std::optional<std::string> visibility;
    std::string                address;
    std::optional<std::string> location;
    std::string                coverPhotoUrl;
    std::optional<std::string> mapPreviewUrl;
    std::string                details;
    std::string                eventTime;      // ISO-8601, not parsed
    std::string                eventEndTime;   // ISO-8601, not parsed
    std::optional<std::string> rsvpStatus;
    bool                       createdByCommunityAmbassador = false;
    std::vector<std::string>   badgeGrants;
    std::optional<std::string> topicId;
    int                        discordInterested = 0;
    std::optional<std::string> game;
    Member                     creator;
    std::string                clubId;
    Club                       club;
    Pagination<Member>         members;
    std::optional<int>         checkedInMembersCount;
    std::vector<RsvpStatus>    rsvpStatuses;
    bool                       isPasscodeRewardEligible = false;
    std::optional<std::string> passcode;
    std::optional<std::string> campfireLiveEventId;
    CampfireLiveEvent          campfireLiveEvent;
    std::optional<std::string> commentsPermissions;
    int                        commentCount = 0;
    bool                       isSubscribed = false;
    nlohmann::json             raw = nlohmann::json::object();
};

/// Lightweight, unauthenticated view of a meetup keyed by map-object id.
struct PublicEvent {
    std::string   mapObjectId;
    std::string   eventId;
    std::string   name;
    std::string   details;
    std::string   clubName;
    std::string   clubId;
    std::string   clubAvatarUrl;
    bool          isPasscodeRewardEligible = false;
    std::string   eventTime;
    std::string   eventEndTime;
    std::string   address;
    EventLocation mapObjectLocation;
};

/// Result of a public-events lookup, in response order.
struct Events {
    std::vector<PublicEvent> publicMapObjectsById;
};

/// One page of a club's archived feed, non-event nodes already dropped.
struct ArchivedMeetupsPage {
    std::vector<Event> events;
    int                skippedNodes = 0;
    PageInfo           pageInfo;
};

} // namespace campfire
