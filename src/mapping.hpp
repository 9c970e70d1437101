#pragma once

#include "models.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace campfire {

// All parse functions accept any JSON value.  Missing keys, explicit nulls
// and values of the wrong type fall back to the record's defaults; a
// non-object input yields a default record.

PageInfo          parsePageInfo(const nlohmann::json& node);
Badge             parseBadge(const nlohmann::json& node);
ClubRole          parseClubRole(const nlohmann::json& node);
Member            parseMember(const nlohmann::json& node);
Club              parseClub(const nlohmann::json& node);
CampfireLiveEvent parseCampfireLiveEvent(const nlohmann::json& node);
EventLocation     parseEventLocation(const nlohmann::json& node);
RsvpStatus        parseRsvpStatus(const nlohmann::json& node);

/// Parse a members connection ({totalCount, edges, pageInfo}).
Pagination<Member> parseMemberConnection(const nlohmann::json& node);

/// Map a single event JSON node into an Event.
Event parseEvent(const nlohmann::json& node);

/// Map one element of publicMapObjectsById.
PublicEvent parsePublicEvent(const nlohmann::json& node);

/// Parse the `data` object of a public_events response.
Events parseEvents(const nlohmann::json& data);

/// Parse the `data` object of an archived_meetups response, keeping only
/// nodes whose __typename is "Event".
/// @throws CampfireError if `club` or `club.archivedFeed` is missing.
ArchivedMeetupsPage parseArchivedMeetupsPage(const nlohmann::json& data);

/// Return the entries of the response's "errors" array (may be empty).
std::vector<GraphQLError> parseGraphqlErrors(const nlohmann::json& responseBody);

/// Look up a member of @p event by id.
std::optional<Member> findMember(const std::string& memberId, const Event& event);

} // namespace campfire
