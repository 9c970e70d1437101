#pragma once

#include <string>

namespace campfire {
namespace queries {

/// Selection set shared by every member object.
inline const std::string kMemberFields =
    "id username displayName avatarUrl clubRank "
    "badges { alias badgeType } clubRoles { id name }";

/// Full event with its member list.
/// Variables: $id (ID!), $first (Int!).
inline const std::string kEventQuery = std::string(R"(
query Event($id: ID!, $first: Int!) {
  event(id: $id) {
    id name visibility address location coverPhotoUrl mapPreviewUrl details
    eventTime eventEndTime rsvpStatus createdByCommunityAmbassador badgeGrants
    topicId discordInterested game clubId checkedInMembersCount
    isPasscodeRewardEligible passcode campfireLiveEventId commentsPermissions
    commentCount isSubscribed
    creator { )") + kMemberFields + R"( }
    club {
      id name game visibility amIMember avatarUrl badgeGrants
      createdByCommunityAmbassador
      creator { )" + kMemberFields + R"( }
    }
    members(first: $first) {
      totalCount
      edges { cursor node { )" + kMemberFields + R"( } }
      pageInfo { hasNextPage startCursor endCursor }
    }
    rsvpStatuses { userId rsvpStatus }
    campfireLiveEvent { id checkInRadiusMeters eventName modalHeadingImageUrl }
  }
}
)";

/// Unauthenticated lookup by map-object id.
/// Variables: $ids ([String!]!).
inline const std::string kPublicEventsQuery = R"(
query PublicMapObjectsById($ids: [String!]!) {
  publicMapObjectsById(ids: $ids) {
    id
    event {
      id name details clubName clubId clubAvatarUrl isPasscodeRewardEligible
      eventTime eventEndTime address
      mapObjectLocation { latitude longitude }
    }
  }
}
)";

/// Archived meetups of a club with cursor-based pagination.
/// Variables: $clubId (ID!), $first (Int!), $after (String, nullable),
/// $membersFirst (Int!).
inline const std::string kArchivedMeetupsQuery = std::string(R"(
query ArchivedMeetups($clubId: ID!, $first: Int!, $after: String, $membersFirst: Int!) {
  club(id: $clubId) {
    id
    archivedFeed(first: $first, after: $after) {
      edges {
        cursor
        node {
          __typename
          ... on Event {
            id name visibility address location coverPhotoUrl details
            eventTime eventEndTime createdByCommunityAmbassador badgeGrants
            discordInterested clubId checkedInMembersCount
            isPasscodeRewardEligible campfireLiveEventId commentCount
            creator { )") + kMemberFields + R"( }
            members(first: $membersFirst) {
              totalCount
              edges { cursor node { )" + kMemberFields + R"( } }
              pageInfo { hasNextPage startCursor endCursor }
            }
            rsvpStatuses { userId rsvpStatus }
            campfireLiveEvent { id checkInRadiusMeters eventName modalHeadingImageUrl }
          }
        }
      }
      pageInfo { hasNextPage startCursor endCursor }
    }
  }
}
)";

/// Club details.
/// Variables: $clubId (ID!).
inline const std::string kClubQuery = std::string(R"(
query Club($clubId: ID!) {
  club(id: $clubId) {
    id name game visibility amIMember avatarUrl badgeGrants
    createdByCommunityAmbassador
    creator { )") + kMemberFields + R"( }
  }
}
)";

} // namespace queries
} // namespace campfire
