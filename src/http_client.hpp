#pragma once

#include <chrono>
#include <map>
#include <string>

namespace campfire {

struct HttpResponse {
    unsigned int httpStatus = 0;
    std::string  body;
    std::string  finalUrl;   // URL that produced this response (after redirects)
};

using HttpHeaders = std::map<std::string, std::string>;

/// Minimal HTTP capability used by the GraphQL data source.
/// Implementations throw TransportError on network / timeout failures and
/// return every HTTP status (including errors) as a response.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const HttpHeaders& headers,
                              std::chrono::milliseconds timeout) = 0;

    /// GET @p url, following redirects.
    virtual HttpResponse get(const std::string& url,
                             std::chrono::milliseconds timeout) = 0;
};

/// HttpTransport built on Boost.Beast.  Every call opens a fresh connection,
/// so one instance may be used from several threads.
class BeastHttpTransport : public HttpTransport {
public:
    static constexpr int kMaxRedirects = 10;

    explicit BeastHttpTransport(bool verbose = false) : mVerbose(verbose) {}

    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const HttpHeaders& headers,
                      std::chrono::milliseconds timeout) override;

    HttpResponse get(const std::string& url,
                     std::chrono::milliseconds timeout) override;

    /// Response headers of interest for redirect handling.
    struct RawResponse {
        unsigned int httpStatus = 0;
        std::string  body;
        std::string  location;
    };

private:
    bool mVerbose;

    RawResponse request(const std::string& method,
                        const std::string& url,
                        const std::string& body,
                        const HttpHeaders& headers,
                        std::chrono::milliseconds timeout);
};

} // namespace campfire
