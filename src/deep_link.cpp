#include "deep_link.hpp"
#include "errors.hpp"

#include <stdexcept>

namespace campfire {

namespace {

/// First non-blank value of @p key; blank values are dropped.
const std::string* firstValue(const QueryMap& values, const std::string& key) {
    auto it = values.find(key);
    if (it == values.end()) {
        return nullptr;
    }
    for (const auto& value : it->second) {
        if (!value.empty()) {
            return &value;
        }
    }
    return nullptr;
}

} // namespace

QueryMap decodeDeepLinkPayload(const std::string& clubUrl) {
    try {
        parseUrl(clubUrl);
    } catch (const std::invalid_argument& e) {
        throw CampfireError(std::string("Malformed club URL: ") + e.what());
    }

    const auto outer   = parseQueryString(queryOf(clubUrl));
    const auto* encoded = firstValue(outer, kDeepLinkParam);
    if (encoded == nullptr) {
        throw CampfireError("No deep_link_sub1 parameter present");
    }

    // Query decoding turned any unescaped '+' of the base64 text into ' '.
    std::string payload = *encoded;
    for (auto& c : payload) {
        if (c == ' ') c = '+';
    }

    std::string decoded;
    try {
        decoded = base64Decode(payload);
    } catch (const std::invalid_argument& e) {
        throw CampfireError(std::string("Failed to decode deep-link payload: ") + e.what());
    }
    if (!isValidUtf8(decoded)) {
        throw CampfireError("Failed to decode deep-link payload: not valid UTF-8");
    }

    return parseQueryString(decoded);
}

std::string decodeClubDeepLink(const std::string& clubUrl) {
    const auto values = decodeDeepLinkPayload(clubUrl);

    const auto* route = firstValue(values, "r");
    if (route == nullptr || *route != "clubs") {
        throw CampfireError("Decoded link is not a club deep-link");
    }

    const auto* clubId = firstValue(values, "c");
    if (clubId == nullptr) {
        throw CampfireError("Club id missing from deep-link payload");
    }
    return *clubId;
}

} // namespace campfire
