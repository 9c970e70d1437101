#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace campfire {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // "80", "443", "4000", etc.
    std::string target;   // path plus query (e.g. "/graphql?x=1")
};

/// Multi-valued query-string mapping, values in order of appearance.
using QueryMap = std::map<std::string, std::vector<std::string>>;

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// Return the raw query component of @p url (without '?' or fragment),
/// or an empty string when there is none.
std::string queryOf(const std::string& url);

/// Parse "a=1&b=2&a=3" into a QueryMap.  '+' decodes to a space and %XX
/// escapes are decoded.  Keys without '=' map to an empty value.
QueryMap parseQueryString(std::string_view query);

/// Decode %XX escapes.  Malformed escapes are kept verbatim.
std::string percentDecode(std::string_view text, bool plusAsSpace = true);

/// Path segment after the final '/', ignoring any query or fragment and
/// trailing slashes ("a/b/" -> "b").
std::string lastPathSegment(const std::string& url);

/// Resolve a redirect Location header against the URL that produced it.
std::string resolveRedirect(const std::string& currentUrl,
                            const std::string& location);

/// Decode standard or URL-safe base64.  Missing '=' padding is accepted.
/// Throws std::invalid_argument on characters outside the alphabet or an
/// impossible length.
std::string base64Decode(std::string_view encoded);

/// True when @p bytes is well-formed UTF-8 (no overlongs, no surrogates).
bool isValidUtf8(std::string_view bytes);

} // namespace campfire
