#pragma once

#include "util.hpp"

#include <string>

namespace campfire {

/// Query parameter of club share links holding the base64 payload.
inline const std::string kDeepLinkParam = "deep_link_sub1";

/// Decode the `deep_link_sub1` payload of @p clubUrl into a query map.
/// @throws CampfireError if the URL is malformed, the parameter is missing,
///         or the payload is not base64 of UTF-8 text.
QueryMap decodeDeepLinkPayload(const std::string& clubUrl);

/// Extract the club id from a club share link.
/// The payload must carry r=clubs and a non-empty c=<club id>.
/// @throws CampfireError with a distinct message for each failure.
std::string decodeClubDeepLink(const std::string& clubUrl);

} // namespace campfire
