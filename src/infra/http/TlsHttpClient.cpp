#include "infra/http/TlsHttpClient.hpp"

#include <chrono>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/rfc2818_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>

namespace infra::http {
namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

constexpr int kMaxRedirects = 5;
constexpr const char* kUserAgent = "measurement-harvester/0.1";

std::runtime_error makeError(const std::string& host, const std::string& target, const std::string& message) {
    std::ostringstream oss;
    oss << "HTTPS GET request to https://" << host << target << " failed: " << message;
    return std::runtime_error(oss.str());
}

struct ParsedLocation {
    std::string host;
    std::string target;
};

ParsedLocation parseRedirectLocation(const std::string& location, const std::string& currentHost) {
    if (location.empty()) {
        throw std::runtime_error("Redirect response missing Location header");
    }

    ParsedLocation result{};

    if (location.rfind("https://", 0) == 0) {
        const std::string withoutScheme = location.substr(std::string{"https://"}.size());
        const auto slashPos = withoutScheme.find('/');
        std::string hostPart = slashPos == std::string::npos ? withoutScheme : withoutScheme.substr(0, slashPos);
        if (hostPart.empty()) {
            throw std::runtime_error("Redirect URL missing host");
        }
        const auto colonPos = hostPart.find(':');
        if (colonPos != std::string::npos) {
            const std::string portPart = hostPart.substr(colonPos + 1);
            if (portPart != "443") {
                throw std::runtime_error("Redirect to unsupported HTTPS port: " + portPart);
            }
            hostPart = hostPart.substr(0, colonPos);
        }
        result.host = hostPart;
        result.target = slashPos == std::string::npos ? std::string{"/"} : withoutScheme.substr(slashPos);
    } else if (location.rfind("http://", 0) == 0) {
        throw std::runtime_error("Insecure redirect to HTTP is not supported");
    } else {
        result.host = currentHost;
        result.target = location.front() == '/' ? location : "/" + location;
    }

    return result;
}

// "host" or "host:port"; the port defaults to 443.
std::pair<std::string, std::string> splitHostPort(const std::string& host) {
    const auto colonPos = host.rfind(':');
    if (colonPos == std::string::npos || colonPos + 1 == host.size()) {
        return {host, "443"};
    }
    return {host.substr(0, colonPos), host.substr(colonPos + 1)};
}

void configureTls(ssl::context& sslContext, const TlsOptions& tls) {
    if (!tls.verifyPeer) {
        sslContext.set_verify_mode(ssl::verify_none);
        return;
    }
    if (tls.caFile.empty()) {
        sslContext.set_default_verify_paths();
    } else {
        sslContext.load_verify_file(tls.caFile);
    }
    sslContext.set_verify_mode(ssl::verify_peer);
}

http::response<http::string_body> performRequest(const std::string& host,
                                                  const std::string& target,
                                                  const RequestOptions& options) {
    const int timeoutSec = options.timeoutSec;
    if (timeoutSec <= 0) {
        throw makeError(host, target, "timeout must be positive");
    }

    net::io_context ioc;
    ssl::context sslContext(ssl::context::tls_client);
    try {
        configureTls(sslContext, options.tls);
    } catch (const std::exception& ex) {
        throw makeError(host, target, std::string{"TLS trust store error: "} + ex.what());
    }

    const auto [hostname, port] = splitHostPort(host);
    ssl::stream<beast::tcp_stream> stream(ioc, sslContext);
    if (options.tls.verifyPeer) {
        stream.set_verify_callback(ssl::rfc2818_verification(hostname));
    }

    if (!SSL_set_tlsext_host_name(stream.native_handle(), hostname.c_str())) {
        const unsigned long err = ::ERR_get_error();
        const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
        std::ostringstream oss;
        oss << "Failed to set SNI hostname to '" << hostname << "'";
        if (reason != nullptr) {
            oss << ": " << reason;
        }
        throw makeError(host, target, oss.str());
    }

    auto resolver = net::ip::tcp::resolver(ioc);
    beast::error_code ec;
    auto const results = resolver.resolve(hostname, port, ec);
    if (ec) {
        throw makeError(host, target, "DNS resolution error: " + ec.message());
    }

    auto& lowestLayer = beast::get_lowest_layer(stream);
    lowestLayer.expires_after(std::chrono::seconds(timeoutSec));
    lowestLayer.connect(results, ec);
    if (ec) {
        throw makeError(host, target, "Connection error: " + ec.message());
    }

    lowestLayer.expires_after(std::chrono::seconds(timeoutSec));
    stream.handshake(ssl::stream_base::client, ec);
    if (ec) {
        throw makeError(host, target, "TLS handshake error: " + ec.message());
    }

    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::user_agent, kUserAgent);
    req.set(http::field::accept, "*/*");
    req.set(http::field::connection, "close");
    for (const auto& [name, value] : options.headers) {
        req.set(name, value);
    }

    lowestLayer.expires_after(std::chrono::seconds(timeoutSec));
    http::write(stream, req, ec);
    if (ec) {
        throw makeError(host, target, "Write error: " + ec.message());
    }

    // Archive segments routinely exceed the parser's 8 MB default.
    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(options.bodyLimit);
    lowestLayer.expires_after(std::chrono::seconds(timeoutSec));
    http::read(stream, buffer, parser, ec);
    if (ec) {
        throw makeError(host, target, "Read error: " + ec.message());
    }

    stream.shutdown(ec);
    if (ec == net::error::eof) {
        ec = {};
    }
    if (ec == ssl::error::stream_truncated) {
        // Allow truncated TLS shutdown which may occur with some servers.
        ec = {};
    }
    if (ec) {
        throw makeError(host, target, "TLS shutdown error: " + ec.message());
    }

    return parser.release();
}

}  // namespace

HttpResponse https_get_response(const std::string& host, const std::string& target, const RequestOptions& options) {
    if (host.empty()) {
        throw std::runtime_error("HTTPS GET requires a non-empty host");
    }

    std::string currentHost = host;
    std::string currentTarget = target.empty() ? std::string{"/"} : target;
    if (currentTarget.front() != '/') {
        currentTarget.insert(currentTarget.begin(), '/');
    }

    for (int redirectCount = 0; redirectCount <= kMaxRedirects; ++redirectCount) {
        auto response = performRequest(currentHost, currentTarget, options);
        const auto status = static_cast<unsigned>(response.result_int());
        if (status == 301U || status == 302U || status == 307U) {
            try {
                const auto locationHeader = response.base()[http::field::location];
                const auto parsed = parseRedirectLocation(std::string(locationHeader), currentHost);
                currentHost = parsed.host;
                currentTarget = parsed.target;
                continue;
            } catch (const std::exception& redirectError) {
                throw makeError(currentHost, currentTarget, redirectError.what());
            }
        }

        HttpResponse result{};
        result.status = status;
        result.body = std::move(response.body());
        result.final_host = currentHost;
        result.final_target = currentTarget;
        if (auto it = response.base().find(http::field::content_range); it != response.base().end()) {
            result.content_range_header = std::string{it->value()};
        }
        return result;
    }

    throw makeError(currentHost, currentTarget, "Too many redirects");
}

}  // namespace infra::http
