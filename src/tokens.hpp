#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace campfire {

/// Yields the current bearer credential, or nothing.
/// Called once per private-endpoint request.
using TokenSupplier = std::function<std::optional<std::string>()>;

/// A named supplier, used for logging which source produced credentials.
using TokenSource = std::pair<std::string, TokenSupplier>;

/// Always returns @p token (an empty token counts as none).
TokenSupplier staticTokenSupplier(std::string token);

/// Reads @p variable at call time.
TokenSupplier environmentTokenSupplier(std::string variable = "CAMPFIRE_TOKEN");

/// Tries each source in order and returns the first non-empty token.
/// Logs the label of every source tried, never the token itself.
TokenSupplier chainedTokenSupplier(std::vector<TokenSource> sources,
                                   bool verbose = false);

} // namespace campfire
