#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace campfire {

/// Input text that cannot be turned into exactly one club reference.
class ClubLookupError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// A club share link or a raw club id; at most one is set.
struct ClubReference {
    std::optional<std::string> url;
    std::optional<std::string> id;

    bool empty() const { return !url && !id; }
};

/// How to interpret input that contains no recognizable reference.
enum class ClubLookupKind { None, Url, Id };

/// Scan whitespace-separated text for a campfire.onelink.me share link or
/// a UUID-shaped club id (a token with exactly four '-').
/// @throws ClubLookupError when more than one candidate is present.
ClubReference extractClubReference(const std::string& raw);

/// Normalize user input into a club reference.
/// With @p strict, input without a recognizable reference is an error;
/// otherwise the raw text is used as a URL or id according to @p fallback.
ClubReference normalizeClubLookup(const std::string& raw,
                                  bool strict = false,
                                  ClubLookupKind fallback = ClubLookupKind::None);

} // namespace campfire
