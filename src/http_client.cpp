#include "http_client.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>

#ifdef CAMPFIRE_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#endif

#include <cstdint>
#include <iostream>
#include <stdexcept>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace campfire {

namespace {

constexpr std::uint64_t kMaxBodyBytes = 64ull * 1024 * 1024;
constexpr const char*   kUserAgent    = "campfire-client/1.0";

bool isRedirect(unsigned int status) {
    return status == 301 || status == 302 || status == 303 ||
           status == 307 || status == 308;
}

http::request<http::string_body>
buildRequest(http::verb verb,
             const UrlParts& parts,
             const std::string& body,
             const HttpHeaders& headers)
{
    http::request<http::string_body> req{verb, parts.target, 11};
    req.set(http::field::host, parts.host);
    req.set(http::field::user_agent, kUserAgent);
    req.set(http::field::connection, "close");
    for (const auto& [name, value] : headers) {
        req.set(name, value);
    }
    if (verb == http::verb::post) {
        req.body() = body;
        req.prepare_payload();
    }
    return req;
}

/// Write @p req and read one response from an already-connected stream.
template <class Stream, class Lowest>
BeastHttpTransport::RawResponse
exchange(Stream& stream,
         Lowest& lowest,
         const http::request<http::string_body>& req,
         std::chrono::milliseconds timeout)
{
    lowest.expires_after(timeout);
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(kMaxBodyBytes);
    lowest.expires_after(timeout);
    http::read(stream, buffer, parser);

    auto res = parser.release();
    BeastHttpTransport::RawResponse raw;
    raw.httpStatus = res.result_int();
    raw.body       = std::move(res.body());
    auto loc = res.find(http::field::location);
    if (loc != res.end()) {
        raw.location.assign(loc->value().data(), loc->value().size());
    }
    return raw;
}

} // namespace

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

HttpResponse BeastHttpTransport::post(const std::string& url,
                                      const std::string& body,
                                      const HttpHeaders& headers,
                                      std::chrono::milliseconds timeout)
{
    if (mVerbose) {
        std::cerr << "[HttpTransport] POST " << url << "\n";
        if (body.size() <= 300) {
            std::cerr << "[HttpTransport] Body: " << body << "\n";
        } else {
            std::cerr << "[HttpTransport] Body: " << body.substr(0, 300)
                      << " ...(truncated)\n";
        }
    }

    auto raw = request("POST", url, body, headers, timeout);

    HttpResponse response;
    response.httpStatus = raw.httpStatus;
    response.body       = std::move(raw.body);
    response.finalUrl   = url;
    return response;
}

HttpResponse BeastHttpTransport::get(const std::string& url,
                                     std::chrono::milliseconds timeout)
{
    std::string current = url;

    for (int hop = 0; hop <= kMaxRedirects; ++hop) {
        if (mVerbose) {
            std::cerr << "[HttpTransport] GET " << current << "\n";
        }

        auto raw = request("GET", current, "", {}, timeout);

        if (isRedirect(raw.httpStatus) && !raw.location.empty()) {
            current = resolveRedirect(current, raw.location);
            continue;
        }

        HttpResponse response;
        response.httpStatus = raw.httpStatus;
        response.body       = std::move(raw.body);
        response.finalUrl   = current;
        return response;
    }

    throw TransportError("Too many redirects starting from " + url);
}

// ---------------------------------------------------------------------------
// Single request over plain HTTP or HTTPS
// ---------------------------------------------------------------------------

BeastHttpTransport::RawResponse
BeastHttpTransport::request(const std::string& method,
                            const std::string& url,
                            const std::string& body,
                            const HttpHeaders& headers,
                            std::chrono::milliseconds timeout)
{
    UrlParts parts;
    try {
        parts = parseUrl(url);
    } catch (const std::invalid_argument& e) {
        throw CampfireError(e.what());
    }

    const auto verb = http::string_to_verb(method);
    const auto req  = buildRequest(verb, parts, body, headers);

    try {
        net::io_context ioc;
        tcp::resolver   resolver(ioc);

        if (parts.scheme == "http") {
            beast::tcp_stream stream(ioc);

            auto const results = resolver.resolve(parts.host, parts.port);
            stream.expires_after(timeout);
            stream.connect(results);

            auto raw = exchange(stream, stream, req, timeout);

            if (mVerbose) {
                std::cerr << "[HttpTransport] HTTP " << raw.httpStatus << "\n";
            }

            // Graceful shutdown (non-critical errors are swallowed).
            beast::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            return raw;
        }

        if (parts.scheme == "https") {
#ifdef CAMPFIRE_HAS_SSL
            namespace ssl = net::ssl;

            ssl::context ctx(ssl::context::tlsv12_client);
            ctx.set_default_verify_paths();
            ctx.set_verify_mode(ssl::verify_peer);

            beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

            // SNI hostname.
            if (!SSL_set_tlsext_host_name(stream.native_handle(), parts.host.c_str())) {
                throw TransportError("Failed to set SNI hostname");
            }

            auto const results = resolver.resolve(parts.host, parts.port);
            beast::get_lowest_layer(stream).expires_after(timeout);
            beast::get_lowest_layer(stream).connect(results);
            stream.handshake(ssl::stream_base::client);

            auto raw = exchange(stream, beast::get_lowest_layer(stream), req, timeout);

            if (mVerbose) {
                std::cerr << "[HttpTransport] HTTPS " << raw.httpStatus << "\n";
            }

            beast::error_code ec;
            stream.shutdown(ec);
            return raw;
#else
            throw CampfireError("HTTPS not supported: built without OpenSSL");
#endif
        }
    } catch (const boost::system::system_error& e) {
        throw TransportError(method + " " + url + " failed: " + e.what());
    }

    throw CampfireError("Unsupported URL scheme: " + parts.scheme);
}

} // namespace campfire
