#pragma once
// ═══════════════════════════════════════════════════════════════════
//  s2dm/fetch.h — Minimal HTTP GET client for remote schema sources
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto resp = fetch::get("http://example.org/schema.graphql");
//    if (resp.ok()) parse(resp.body);
//
//  Plain HTTP/1.1 over Boost.Beast. Transport failures are reported
//  through status 0 and statusText rather than thrown.
// ═══════════════════════════════════════════════════════════════════

#include <chrono>
#include <string>

// Boost.Beast for HTTP client
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>

namespace s2dm::fetch {

namespace beast = boost::beast;
namespace http_ns = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

// ── HTTP Response ──
struct FetchResponse {
    int status = 0;
    std::string statusText;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

// ── Request options ──
struct RequestOptions {
    std::string url;
    int timeoutMs = 30000;
};

namespace detail {

struct ParsedUrl {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
};

inline ParsedUrl parseUrl(const std::string& url) {
    ParsedUrl parsed;
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        parsed.scheme = "http";
        schemeEnd = 0;
    } else {
        parsed.scheme = url.substr(0, schemeEnd);
        schemeEnd += 3;
    }

    auto pathStart = url.find('/', schemeEnd);
    std::string hostPort;
    if (pathStart == std::string::npos) {
        hostPort = url.substr(schemeEnd);
        parsed.path = "/";
    } else {
        hostPort = url.substr(schemeEnd, pathStart - schemeEnd);
        parsed.path = url.substr(pathStart);
    }

    auto colonPos = hostPort.find(':');
    if (colonPos != std::string::npos) {
        parsed.host = hostPort.substr(0, colonPos);
        parsed.port = hostPort.substr(colonPos + 1);
    } else {
        parsed.host = hostPort;
        parsed.port = (parsed.scheme == "https") ? "443" : "80";
    }

    return parsed;
}

} // namespace detail

// ── GET a resource ──
inline FetchResponse get(const RequestOptions& opts) {
    FetchResponse response;
    auto parsed = detail::parseUrl(opts.url);
    if (parsed.scheme != "http") {
        response.statusText = "unsupported URL scheme '" + parsed.scheme + "'";
        return response;
    }

    try {
        asio::io_context ioc;
        tcp::resolver resolver(ioc);
        beast::tcp_stream stream(ioc);
        stream.expires_after(std::chrono::milliseconds(opts.timeoutMs));

        auto const results = resolver.resolve(parsed.host, parsed.port);
        stream.connect(results);

        http_ns::request<http_ns::string_body> req{http_ns::verb::get, parsed.path, 11};
        req.set(http_ns::field::host, parsed.host);
        req.set(http_ns::field::user_agent, "s2dm-rdf/1.0");

        http_ns::write(stream, req);

        beast::flat_buffer buffer;
        http_ns::response<http_ns::string_body> res;
        http_ns::read(stream, buffer, res);

        response.status = static_cast<int>(res.result_int());
        response.statusText = std::string(res.reason());
        response.body = res.body();

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    } catch (const std::exception& e) {
        response.status = 0;
        response.statusText = e.what();
    }

    return response;
}

inline FetchResponse get(const std::string& url) {
    return get(RequestOptions{.url = url});
}

} // namespace s2dm::fetch
