#include "club_lookup.hpp"

#include <algorithm>
#include <regex>
#include <sstream>

namespace campfire {

namespace {

const std::regex& clubUrlPattern() {
    static const std::regex kPattern(
        R"(https://campfire\.onelink\.me/[a-zA-Z0-9]+(?:\?[^ \t\r\n]*)?)");
    return kPattern;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

} // namespace

ClubReference extractClubReference(const std::string& raw) {
    ClubReference ref;

    std::istringstream tokens(trim(raw));
    std::string token;
    while (tokens >> token) {
        std::smatch match;
        if (std::regex_search(token, match, clubUrlPattern())) {
            if (!ref.empty()) {
                throw ClubLookupError("Multiple club URLs or IDs found.");
            }
            ref.url = match.str(0);
            continue;
        }

        if (std::count(token.begin(), token.end(), '-') == 4) {
            if (!ref.empty()) {
                throw ClubLookupError("Multiple club URLs or IDs found.");
            }
            ref.id = token;
        }
    }
    return ref;
}

ClubReference normalizeClubLookup(const std::string& raw,
                                  bool strict,
                                  ClubLookupKind fallback) {
    const std::string text = trim(raw);
    if (text.empty()) {
        if (strict) {
            throw ClubLookupError("No club reference provided.");
        }
        return {};
    }

    auto ref = extractClubReference(text);
    if (!ref.empty()) {
        return ref;
    }

    if (strict) {
        throw ClubLookupError("No club URL or ID found in the provided input.");
    }

    switch (fallback) {
    case ClubLookupKind::Url: return ClubReference{text, std::nullopt};
    case ClubLookupKind::Id:  return ClubReference{std::nullopt, text};
    case ClubLookupKind::None: break;
    }
    return {};
}

} // namespace campfire
