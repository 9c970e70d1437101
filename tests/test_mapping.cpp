/// @file test_mapping.cpp
/// Unit tests for mapping.hpp — JSON-to-record parsing and error extraction.

#include "errors.hpp"
#include "mapping.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace campfire;
using json = nlohmann::json;

// ============================================================================
// parseMember
// ============================================================================

TEST(ParseMember, FullNode) {
    json node = {
        {"id", "m-1"},
        {"username", "trainer"},
        {"displayName", "Trainer One"},
        {"avatarUrl", "https://img/a.png"},
        {"badges", json::array({{{"alias", "ambassador"}, {"badgeType", "CA"}}})},
        {"clubRoles", json::array({{{"id", "r-1"}, {"name", "Admin"}}})},
        {"clubRank", 3}
    };

    auto m = parseMember(node);
    EXPECT_EQ(m.id, "m-1");
    EXPECT_EQ(m.username, "trainer");
    EXPECT_EQ(m.displayName, "Trainer One");
    EXPECT_EQ(m.avatarUrl, "https://img/a.png");
    ASSERT_EQ(m.badges.size(), 1u);
    EXPECT_EQ(m.badges[0].alias.value_or(""), "ambassador");
    EXPECT_EQ(m.badges[0].badgeType.value_or(""), "CA");
    ASSERT_EQ(m.clubRoles.size(), 1u);
    EXPECT_EQ(m.clubRoles[0].name, "Admin");
    ASSERT_TRUE(m.clubRank.has_value());
    EXPECT_EQ(*m.clubRank, 3);
}

TEST(ParseMember, NullBadgesAndRolesBecomeEmpty) {
    json node = {
        {"id", "123"},
        {"username", "trainer"},
        {"displayName", "Trainer"},
        {"badges", nullptr},
        {"clubRoles", nullptr}
    };

    auto m = parseMember(node);
    EXPECT_TRUE(m.badges.empty());
    EXPECT_TRUE(m.clubRoles.empty());
    EXPECT_EQ(m.avatarUrl, "");
    EXPECT_FALSE(m.clubRank.has_value());
}

TEST(ParseMember, NullScalarsAndWrongTypesFallBackToDefaults) {
    json node = {
        {"id", nullptr},
        {"username", 42},
        {"clubRank", "high"},
        {"badges", "not-a-list"}
    };

    auto m = parseMember(node);
    EXPECT_EQ(m.id, "");
    EXPECT_EQ(m.username, "");
    EXPECT_FALSE(m.clubRank.has_value());
    EXPECT_TRUE(m.badges.empty());
}

TEST(ParseMember, RawPayloadKeepsUnmodeledFields) {
    json node = {{"id", "m-2"}, {"pronouns", "they/them"}};

    auto m = parseMember(node);
    EXPECT_EQ(m.raw, node);
    EXPECT_EQ(m.raw["pronouns"], "they/them");
}

TEST(ParseMember, NonObjectInputYieldsDefaultRecord) {
    auto m = parseMember(json(nullptr));
    EXPECT_EQ(m.id, "");
    EXPECT_TRUE(m.raw.is_object());
    EXPECT_TRUE(m.raw.empty());
}

// ============================================================================
// parseClub
// ============================================================================

TEST(ParseClub, FullNode) {
    json node = {
        {"id", "club-1"},
        {"name", "Night Owls"},
        {"game", "POKEMON_GO"},
        {"visibility", "PUBLIC"},
        {"amIMember", true},
        {"avatarUrl", "https://img/c.png"},
        {"badgeGrants", json::array({"CA", "VERIFIED"})},
        {"createdByCommunityAmbassador", true},
        {"creator", {{"id", "m-9"}, {"username", "owner"}}}
    };

    auto c = parseClub(node);
    EXPECT_EQ(c.id, "club-1");
    EXPECT_EQ(c.name, "Night Owls");
    EXPECT_EQ(c.game.value_or(""), "POKEMON_GO");
    EXPECT_EQ(c.visibility.value_or(""), "PUBLIC");
    EXPECT_TRUE(c.amIMember);
    EXPECT_EQ(c.badgeGrants, (std::vector<std::string>{"CA", "VERIFIED"}));
    EXPECT_TRUE(c.createdByCommunityAmbassador);
    EXPECT_EQ(c.creator.id, "m-9");
    EXPECT_EQ(c.creator.username, "owner");
}

TEST(ParseClub, MissingCreatorIsDefaultMember) {
    auto c = parseClub({{"id", "club-2"}, {"creator", nullptr}});
    EXPECT_EQ(c.id, "club-2");
    EXPECT_EQ(c.creator.id, "");
    EXPECT_FALSE(c.game.has_value());
    EXPECT_FALSE(c.amIMember);
    EXPECT_TRUE(c.badgeGrants.empty());
}

// ============================================================================
// parseEvent
// ============================================================================

TEST(ParseEvent, FullNode) {
    json node = {
        {"id", "camp-1"},
        {"name", "Community Day"},
        {"visibility", "PUBLIC"},
        {"address", "Main Square"},
        {"coverPhotoUrl", "https://img/e.png"},
        {"details", "Bring friends"},
        {"eventTime", "2024-06-15T12:00:00Z"},
        {"eventEndTime", "2024-06-15T15:00:00Z"},
        {"badgeGrants", json::array({"CA"})},
        {"discordInterested", 12},
        {"clubId", "club-1"},
        {"club", {{"id", "club-1"}, {"name", "Night Owls"}}},
        {"members", {
            {"totalCount", 2},
            {"edges", json::array({
                {{"cursor", "m-c1"}, {"node", {{"id", "m-1"}, {"username", "a"}}}},
                {{"cursor", "m-c2"}, {"node", {{"id", "m-2"}, {"username", "b"}}}}
            })},
            {"pageInfo", {{"hasNextPage", false}, {"endCursor", "m-c2"}}}
        }},
        {"checkedInMembersCount", 1},
        {"rsvpStatuses", json::array({{{"userId", "m-1"}, {"rsvpStatus", "ACCEPTED"}}})},
        {"isPasscodeRewardEligible", true},
        {"passcode", "1234"},
        {"campfireLiveEventId", "live-1"},
        {"campfireLiveEvent", {{"id", "live-1"}, {"checkInRadiusMeters", 250}, {"eventName", "CD"}}},
        {"commentCount", 7},
        {"isSubscribed", true}
    };

    auto e = parseEvent(node);
    EXPECT_EQ(e.id, "camp-1");
    EXPECT_EQ(e.name, "Community Day");
    EXPECT_EQ(e.visibility.value_or(""), "PUBLIC");
    EXPECT_EQ(e.eventTime, "2024-06-15T12:00:00Z");
    EXPECT_EQ(e.discordInterested, 12);
    EXPECT_EQ(e.club.name, "Night Owls");
    EXPECT_EQ(e.members.totalCount, 2);
    ASSERT_EQ(e.members.edges.size(), 2u);
    EXPECT_EQ(e.members.edges[0].node.id, "m-1");
    EXPECT_EQ(e.members.edges[1].cursor.value_or(""), "m-c2");
    EXPECT_FALSE(e.members.pageInfo.hasNextPage);
    EXPECT_EQ(e.members.pageInfo.endCursor.value_or(""), "m-c2");
    EXPECT_EQ(e.checkedInMembersCount.value_or(-1), 1);
    ASSERT_EQ(e.rsvpStatuses.size(), 1u);
    EXPECT_EQ(e.rsvpStatuses[0].rsvpStatus, "ACCEPTED");
    EXPECT_TRUE(e.isPasscodeRewardEligible);
    EXPECT_EQ(e.passcode.value_or(""), "1234");
    EXPECT_EQ(e.campfireLiveEvent.checkInRadiusMeters.value_or(0), 250);
    EXPECT_EQ(e.commentCount, 7);
    EXPECT_TRUE(e.isSubscribed);
}

TEST(ParseEvent, EmptyNodeYieldsZeroValues) {
    auto e = parseEvent(json::object());
    EXPECT_EQ(e.id, "");
    EXPECT_EQ(e.discordInterested, 0);
    EXPECT_EQ(e.commentCount, 0);
    EXPECT_EQ(e.members.totalCount, 0);
    EXPECT_TRUE(e.members.edges.empty());
    EXPECT_FALSE(e.members.pageInfo.hasNextPage);
    EXPECT_TRUE(e.rsvpStatuses.empty());
    EXPECT_EQ(e.campfireLiveEvent.id, "");
    EXPECT_FALSE(e.campfireLiveEvent.checkInRadiusMeters.has_value());
    EXPECT_FALSE(e.passcode.has_value());
    EXPECT_EQ(e.club.id, "");
}

TEST(ParseEvent, NullLiveEventIsZeroRecord) {
    auto e = parseEvent({{"id", "camp-2"}, {"campfireLiveEvent", nullptr},
                         {"members", nullptr}, {"rsvpStatuses", nullptr}});
    EXPECT_EQ(e.id, "camp-2");
    EXPECT_EQ(e.campfireLiveEvent.id, "");
    EXPECT_TRUE(e.members.edges.empty());
    EXPECT_TRUE(e.rsvpStatuses.empty());
}

TEST(FindMember, LooksUpByIdInMemberEdges) {
    auto e = parseEvent({{"members", {{"edges", json::array({
        {{"node", {{"id", "m-1"}, {"username", "a"}}}},
        {{"node", {{"id", "m-2"}, {"username", "b"}}}}
    })}}}});

    auto found = findMember("m-2", e);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->username, "b");
    EXPECT_FALSE(findMember("m-3", e).has_value());
}

// ============================================================================
// parseEvents / parsePublicEvent
// ============================================================================

TEST(ParseEvents, KeepsResponseOrderAndDuplicates) {
    json data = {{"publicMapObjectsById", json::array({
        {{"id", "map-b"}, {"event", {{"id", "camp-b"}, {"name", "B"}}}},
        {{"id", "map-a"}, {"event", {{"id", "camp-a"}}}},
        {{"id", "map-b"}, {"event", {{"id", "camp-b"}}}}
    })}};

    auto events = parseEvents(data);
    ASSERT_EQ(events.publicMapObjectsById.size(), 3u);
    EXPECT_EQ(events.publicMapObjectsById[0].mapObjectId, "map-b");
    EXPECT_EQ(events.publicMapObjectsById[0].eventId, "camp-b");
    EXPECT_EQ(events.publicMapObjectsById[0].name, "B");
    EXPECT_EQ(events.publicMapObjectsById[1].mapObjectId, "map-a");
    EXPECT_EQ(events.publicMapObjectsById[2].mapObjectId, "map-b");
}

TEST(ParseEvents, MissingListIsEmpty) {
    EXPECT_TRUE(parseEvents(json::object()).publicMapObjectsById.empty());
    EXPECT_TRUE(parseEvents({{"publicMapObjectsById", nullptr}}).publicMapObjectsById.empty());
}

TEST(ParsePublicEvent, LocationIsOptionalPerAxis) {
    auto p = parsePublicEvent({{"id", "map-1"}, {"event", {
        {"id", "camp-1"},
        {"clubName", "Night Owls"},
        {"isPasscodeRewardEligible", true},
        {"mapObjectLocation", {{"latitude", 52.5}, {"longitude", nullptr}}}
    }}});

    EXPECT_EQ(p.mapObjectId, "map-1");
    EXPECT_EQ(p.eventId, "camp-1");
    EXPECT_EQ(p.clubName, "Night Owls");
    EXPECT_TRUE(p.isPasscodeRewardEligible);
    ASSERT_TRUE(p.mapObjectLocation.latitude.has_value());
    EXPECT_DOUBLE_EQ(*p.mapObjectLocation.latitude, 52.5);
    EXPECT_FALSE(p.mapObjectLocation.longitude.has_value());
}

TEST(ParsePublicEvent, MissingEventObject) {
    auto p = parsePublicEvent({{"id", "map-1"}});
    EXPECT_EQ(p.mapObjectId, "map-1");
    EXPECT_EQ(p.eventId, "");
    EXPECT_FALSE(p.mapObjectLocation.latitude.has_value());
}

// ============================================================================
// parseArchivedMeetupsPage
// ============================================================================

TEST(ParseArchivedMeetupsPage, KeepsOnlyEventNodes) {
    json data = {{"club", {{"archivedFeed", {
        {"edges", json::array({
            {{"cursor", "c1"}, {"node", {{"__typename", "Event"}, {"id", "camp-1"}}}},
            {{"cursor", "c2"}, {"node", {{"__typename", "Post"}, {"id", "post-1"}}}},
            {{"cursor", "c3"}, {"node", {{"__typename", "Event"}, {"id", "camp-2"}}}},
            {{"cursor", "c4"}, {"node", nullptr}}
        })},
        {"pageInfo", {{"hasNextPage", true}, {"endCursor", "c4"}}}
    }}}}};

    auto page = parseArchivedMeetupsPage(data);
    ASSERT_EQ(page.events.size(), 2u);
    EXPECT_EQ(page.events[0].id, "camp-1");
    EXPECT_EQ(page.events[1].id, "camp-2");
    EXPECT_EQ(page.skippedNodes, 2);
    EXPECT_TRUE(page.pageInfo.hasNextPage);
    EXPECT_EQ(page.pageInfo.endCursor.value_or(""), "c4");
}

TEST(ParseArchivedMeetupsPage, MissingClubThrows) {
    EXPECT_THROW(parseArchivedMeetupsPage(json::object()), CampfireError);
    EXPECT_THROW(parseArchivedMeetupsPage({{"club", nullptr}}), CampfireError);
    EXPECT_THROW(parseArchivedMeetupsPage({{"club", {{"id", "x"}}}}), CampfireError);
}

// ============================================================================
// parseGraphqlErrors
// ============================================================================

TEST(ParseGraphqlErrors, NoErrorsField) {
    EXPECT_TRUE(parseGraphqlErrors({{"data", json::object()}}).empty());
}

TEST(ParseGraphqlErrors, MessageAndMixedPath) {
    json response = {
        {"errors", json::array({
            {{"message", "Not authorized"}, {"path", json::array({"event", "members", 3})}}
        })}
    };

    auto errors = parseGraphqlErrors(response);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].message, "Not authorized");
    EXPECT_EQ(errors[0].path, (std::vector<std::string>{"event", "members", "3"}));
}

TEST(ParseGraphqlErrors, MissingMessageUsesDefault) {
    auto errors = parseGraphqlErrors({{"errors", json::array({{{"locations", json::array()}}})}});
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].message, "Unknown GraphQL error");
    EXPECT_TRUE(errors[0].path.empty());
}

TEST(ParseGraphqlErrors, ErrorsFieldNotAnArrayIsIgnored) {
    EXPECT_TRUE(parseGraphqlErrors({{"errors", "some string"}}).empty());
}
