/// @file test_client.cpp
/// Unit tests for client.hpp — the CampfireClient facade over an in-memory
/// data source.

#include "client.hpp"
#include "club_lookup.hpp"
#include "errors.hpp"
#include "memory_datasource.hpp"
#include "url_resolver.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <memory>
#include <stdexcept>
#include <string>

using namespace campfire;
using json = nlohmann::json;

namespace {

// base64("r=clubs&c=b6")
const std::string kClubShareLink =
    "https://campfire.onelink.me/eBr8?deep_link_sub1=cj1jbHVicyZjPWI2&foo=bar";

json clubData(const std::string& id, const std::string& name) {
    return {{"club", {{"id", id},
                      {"name", name},
                      {"amIMember", true},
                      {"creator", {{"id", "u-1"}, {"username", "founder"}}}}}};
}

json eventData(const std::string& id) {
    return {{"event", {{"id", id},
                       {"name", "Community Day"},
                       {"clubId", "b6"},
                       {"members", {{"totalCount", 1},
                                    {"edges", json::array({
                                        {{"node", {{"id", "u-9"}, {"username", "trainer"}}}}
                                    })}}}}}};
}

} // namespace

class CampfireClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto ds = std::make_unique<InMemoryDataSource>();
        source  = ds.get();
        client  = std::make_unique<CampfireClient>(std::move(ds));
    }

    InMemoryDataSource*             source = nullptr;
    std::unique_ptr<CampfireClient> client;
};

TEST(CampfireClient, RejectsNullDataSource) {
    std::unique_ptr<CampfireDataSource> none;
    EXPECT_THROW(CampfireClient client(std::move(none)), std::invalid_argument);
}

// ============================================================================
// Events
// ============================================================================

TEST_F(CampfireClientTest, GetEventParsesTypedEvent) {
    source->addEvent("camp-1", eventData("camp-1"));

    Event event = client->getEvent("camp-1");
    EXPECT_EQ(event.id, "camp-1");
    EXPECT_EQ(event.name, "Community Day");
    ASSERT_EQ(event.members.edges.size(), 1u);
    EXPECT_EQ(event.members.edges[0].node.username, "trainer");
}

TEST_F(CampfireClientTest, GetEventWithNullEventIsNotFound) {
    source->addEvent("camp-x", json{{"event", nullptr}});

    try {
        client->getEvent("camp-x");
        FAIL() << "expected EventNotFound";
    } catch (const EventNotFound& e) {
        EXPECT_EQ(e.id(), "camp-x");
        EXPECT_STREQ(e.what(), "Event not found: camp-x");
    }
}

TEST_F(CampfireClientTest, GetEventWithMissingEventIsNotFound) {
    source->addEvent("camp-y", json::object());
    EXPECT_THROW(client->getEvent("camp-y"), EventNotFound);
}

TEST_F(CampfireClientTest, ResolveEventFollowsDiscoverLink) {
    source->addEvent("camp-1", eventData("camp-1"));

    Event event = client->resolveEvent(kDiscoverMeetupPrefix + "camp-1");
    EXPECT_EQ(event.id, "camp-1");
    ASSERT_EQ(source->eventCalls().size(), 1u);
    EXPECT_EQ(source->eventCalls()[0], "camp-1");
}

TEST_F(CampfireClientTest, ResolveEventFollowsShortAndPublicLinks) {
    source->addShortUrl("https://cmpf.re/abc",
                        {kPublicMeetupPrefix + "map-7", "<html/>"});
    source->setPublicEvents({{"publicMapObjectsById",
                              json::array({{{"id", "map-7"}, {"event", {{"id", "camp-1"}}}}})}});
    source->addEvent("camp-1", eventData("camp-1"));

    EXPECT_EQ(client->resolveShortUrl("https://cmpf.re/abc"), kPublicMeetupPrefix + "map-7");
    EXPECT_EQ(client->resolveEvent("https://cmpf.re/abc").id, "camp-1");
}

TEST_F(CampfireClientTest, ResolveEventPropagatesUnsupported) {
    EXPECT_THROW(client->resolveEvent(kPublicMeetupWithoutLocationPrefix + "abc"),
                 UnsupportedMeetup);
    EXPECT_EQ(source->totalCalls(), 0);
}

TEST_F(CampfireClientTest, GetEventsReturnsPublicSummaries) {
    source->setPublicEvents({{"publicMapObjectsById", json::array({
        {{"id", "map-1"}, {"event", {{"id", "camp-1"}, {"clubName", "Pokemon Go Berlin"}}}},
        {{"id", "map-2"}, {"event", {{"id", "camp-2"}}}}
    })}});

    Events events = client->getEvents({"map-1", "map-2"});
    ASSERT_EQ(events.publicMapObjectsById.size(), 2u);
    EXPECT_EQ(events.publicMapObjectsById[0].clubName, "Pokemon Go Berlin");
    EXPECT_EQ(events.publicMapObjectsById[1].eventId, "camp-2");
    EXPECT_EQ(source->publicEventsCalls()[0], (std::vector<std::string>{"map-1", "map-2"}));
}

// ============================================================================
// Clubs
// ============================================================================

TEST_F(CampfireClientTest, GetClubParsesTypedClub) {
    source->addClub("b6", clubData("b6", "Raid Squad"));

    Club club = client->getClub("b6");
    EXPECT_EQ(club.name, "Raid Squad");
    EXPECT_TRUE(club.amIMember);
    EXPECT_EQ(club.creator.username, "founder");
}

TEST_F(CampfireClientTest, GetClubWithMissingClubFails) {
    source->addClub("gone", json{{"club", nullptr}});

    try {
        client->getClub("gone");
        FAIL() << "expected CampfireError";
    } catch (const CampfireError& e) {
        EXPECT_STREQ(e.what(), "Club not found: gone");
    }
}

TEST_F(CampfireClientTest, ResolveClubDecodesShareLinkLocally) {
    source->addClub("b6", clubData("b6", "Raid Squad"));

    EXPECT_EQ(client->resolveClubId(kClubShareLink), "b6");
    EXPECT_EQ(source->totalCalls(), 0);

    EXPECT_EQ(client->resolveClub(kClubShareLink).id, "b6");
    EXPECT_EQ(source->clubCalls(), (std::vector<std::string>{"b6"}));
}

TEST_F(CampfireClientTest, LookupClubFromFreeText) {
    source->addClub("b6", clubData("b6", "Raid Squad"));
    source->addClub("b632fc8e-0b41-49de-ade2-21b0cd81db69",
                    clubData("b632fc8e-0b41-49de-ade2-21b0cd81db69", "By Id"));

    EXPECT_EQ(client->lookupClub("join us: " + kClubShareLink + " !").name, "Raid Squad");
    EXPECT_EQ(client->lookupClub("  b632fc8e-0b41-49de-ade2-21b0cd81db69 ").name, "By Id");
}

TEST_F(CampfireClientTest, LookupClubRejectsAmbiguousOrEmptyInput) {
    EXPECT_THROW(client->lookupClub("   "), ClubLookupError);
    EXPECT_THROW(client->lookupClub("no reference here"), ClubLookupError);
    EXPECT_THROW(client->lookupClub(kClubShareLink + " b632fc8e-0b41-49de-ade2-21b0cd81db69"),
                 ClubLookupError);
    EXPECT_EQ(source->totalCalls(), 0);
}

TEST_F(CampfireClientTest, LookupClubFallsBackToRawId) {
    source->addClub("b6", clubData("b6", "Raid Squad"));

    EXPECT_THROW(client->lookupClub("b6"), ClubLookupError);
    EXPECT_EQ(client->lookupClub(" b6 ", ClubLookupKind::Id).name, "Raid Squad");
    EXPECT_EQ(source->clubCalls(), (std::vector<std::string>{"b6"}));
}

TEST_F(CampfireClientTest, LookupClubFallsBackToRawUrl) {
    source->addClub("b6", clubData("b6", "Raid Squad"));

    // Not a campfire.onelink.me link, but still carries the payload.
    const std::string mirror = "https://share.example/club?deep_link_sub1=cj1jbHVicyZjPWI2";
    EXPECT_EQ(client->lookupClub(mirror, ClubLookupKind::Url).id, "b6");
}

TEST_F(CampfireClientTest, LookupClubWithFallbackStillRejectsBlankInput) {
    EXPECT_THROW(client->lookupClub("  ", ClubLookupKind::Id), ClubLookupError);
    EXPECT_EQ(source->totalCalls(), 0);
}

// ============================================================================
// Past meetups
// ============================================================================

TEST_F(CampfireClientTest, GetPastMeetupsWalksFeed) {
    auto page = [](const char* id, bool next, const char* cursor) {
        json info = {{"hasNextPage", next}};
        if (cursor) info["endCursor"] = cursor;
        return json{{"club", {{"archivedFeed", {
            {"edges", json::array({{{"node", {{"__typename", "Event"}, {"id", id}}}}})},
            {"pageInfo", info}}}}}};
    };
    source->addArchivedPage(std::nullopt, page("e1", true, "c1"));
    source->addArchivedPage(std::string("c1"), page("e2", false, nullptr));

    auto events = client->getPastMeetups("b6");
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].id, "e1");
    EXPECT_EQ(events[1].id, "e2");
}

TEST_F(CampfireClientTest, DataSourceAccessorExposesInjectedSource) {
    EXPECT_EQ(&client->dataSource(), source);
}
