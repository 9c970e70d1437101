#include "util.hpp"

#include <boost/beast/core/detail/base64.hpp>

#include <stdexcept>

namespace campfire {

namespace base64 = boost::beast::detail::base64;

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;

    // --- scheme ---
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }
    parts.scheme = url.substr(0, schemeEnd);

    // --- authority (host[:port]) ---
    auto hostStart = schemeEnd + 3;
    auto pathStart = url.find_first_of("/?#", hostStart);

    std::string authority;
    if (pathStart == std::string::npos) {
        authority    = url.substr(hostStart);
        parts.target = "/";
    } else {
        authority    = url.substr(hostStart, pathStart - hostStart);
        parts.target = url.substr(pathStart);
        if (parts.target.front() != '/') {
            parts.target.insert(parts.target.begin(), '/');
        }
    }

    // The fragment never goes on the wire.
    auto hash = parts.target.find('#');
    if (hash != std::string::npos) {
        parts.target.erase(hash);
    }

    // --- host / port ---
    auto colon = authority.find(':');
    if (colon == std::string::npos) {
        parts.host = authority;
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        parts.host = authority.substr(0, colon);
        parts.port = authority.substr(colon + 1);
    }

    if (parts.host.empty()) {
        throw std::invalid_argument("Invalid URL (empty host): " + url);
    }
    return parts;
}

std::string queryOf(const std::string& url) {
    auto q = url.find('?');
    if (q == std::string::npos) {
        return "";
    }
    auto hash = url.find('#', q);
    return url.substr(q + 1, hash == std::string::npos ? std::string::npos
                                                       : hash - q - 1);
}

std::string percentDecode(std::string_view text, bool plusAsSpace) {
    auto hexValue = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '+' && plusAsSpace) {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < text.size() &&
                   hexValue(text[i + 1]) >= 0 && hexValue(text[i + 2]) >= 0) {
            out.push_back(static_cast<char>(hexValue(text[i + 1]) * 16 +
                                            hexValue(text[i + 2])));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

QueryMap parseQueryString(std::string_view query) {
    QueryMap result;

    std::size_t pos = 0;
    while (pos <= query.size()) {
        auto amp = query.find_first_of("&;", pos);
        auto pair = query.substr(pos, amp == std::string_view::npos
                                          ? std::string_view::npos
                                          : amp - pos);
        if (!pair.empty()) {
            auto eq = pair.find('=');
            if (eq == std::string_view::npos) {
                result[percentDecode(pair)].emplace_back();
            } else {
                result[percentDecode(pair.substr(0, eq))].push_back(
                    percentDecode(pair.substr(eq + 1)));
            }
        }
        if (amp == std::string_view::npos) {
            break;
        }
        pos = amp + 1;
    }
    return result;
}

std::string lastPathSegment(const std::string& url) {
    auto end = url.find_first_of("?#");
    std::string path = url.substr(0, end);
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    auto slash = path.rfind('/');
    if (slash == std::string::npos) {
        return path;
    }
    return path.substr(slash + 1);
}

std::string resolveRedirect(const std::string& currentUrl,
                            const std::string& location) {
    if (location.rfind("http://", 0) == 0 || location.rfind("https://", 0) == 0) {
        return location;
    }

    auto parts = parseUrl(currentUrl);
    std::string origin = parts.scheme + "://" + parts.host;
    bool defaultPort = (parts.scheme == "https" && parts.port == "443") ||
                       (parts.scheme == "http" && parts.port == "80");
    if (!defaultPort) {
        origin += ":" + parts.port;
    }

    if (location.rfind("//", 0) == 0) {
        return parts.scheme + ":" + location;
    }
    if (!location.empty() && location.front() == '/') {
        return origin + location;
    }

    std::string path = parts.target.substr(0, parts.target.find('?'));
    auto dirEnd = path.rfind('/');
    std::string dir = (dirEnd == std::string::npos) ? "/" : path.substr(0, dirEnd + 1);
    return origin + dir + location;
}

std::string base64Decode(std::string_view encoded) {
    std::string input(encoded);
    for (auto& c : input) {
        if (c == '-') c = '+';
        else if (c == '_') c = '/';
    }

    std::size_t padding = 0;
    while (!input.empty() && input.back() == '=' && padding < 2) {
        input.pop_back();
        ++padding;
    }
    if (input.size() % 4 == 1) {
        throw std::invalid_argument("Invalid base64 length");
    }

    std::string out(base64::decoded_size(input.size() + 3), '\0');
    auto const [written, read] = base64::decode(&out[0], input.data(), input.size());
    if (read != input.size()) {
        throw std::invalid_argument("Invalid base64 character at offset " +
                                    std::to_string(read));
    }
    out.resize(written);
    return out;
}

bool isValidUtf8(std::string_view bytes) {
    std::size_t i = 0;
    while (i < bytes.size()) {
        auto c = static_cast<unsigned char>(bytes[i]);
        std::size_t len = 0;
        unsigned int cp = 0;

        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2; cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3; cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4; cp = c & 0x07;
        } else {
            return false;
        }

        if (i + len > bytes.size()) return false;
        for (std::size_t k = 1; k < len; ++k) {
            auto cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        // overlong, surrogate, or out of range
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
            (len == 4 && cp < 0x10000) || cp > 0x10FFFF ||
            (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += len;
    }
    return true;
}

} // namespace campfire
