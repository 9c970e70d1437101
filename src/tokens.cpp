#include "tokens.hpp"

#include <cstdlib>
#include <iostream>

namespace campfire {

TokenSupplier staticTokenSupplier(std::string token) {
    return [token = std::move(token)]() -> std::optional<std::string> {
        if (token.empty()) return std::nullopt;
        return token;
    };
}

TokenSupplier environmentTokenSupplier(std::string variable) {
    return [variable = std::move(variable)]() -> std::optional<std::string> {
        const char* value = std::getenv(variable.c_str());
        if (value == nullptr || *value == '\0') return std::nullopt;
        return std::string(value);
    };
}

TokenSupplier chainedTokenSupplier(std::vector<TokenSource> sources, bool verbose) {
    return [sources = std::move(sources), verbose]() -> std::optional<std::string> {
        for (const auto& [label, supplier] : sources) {
            std::optional<std::string> token;
            if (supplier) {
                token = supplier();
            }
            const bool found = token.has_value() && !token->empty();
            if (verbose) {
                std::cerr << "[Tokens] Token provider " << label
                          << (found ? " supplied credentials\n"
                                    : " produced no credentials\n");
            }
            if (found) {
                return token;
            }
        }
        std::cerr << "[Tokens] Warning: token sources exhausted with no token.\n";
        return std::nullopt;
    };
}

} // namespace campfire
