// =============================================================================
// cidc-upload - HTTP Transport Implementation
// =============================================================================

#include "cidc/api/http_transport.h"

#include <algorithm>
#include <cctype>
#include <future>
#include <string>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <fmt/format.h>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include "cidc/common/logger.h"

namespace cidc::api {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

constexpr const char* kUserAgent = "cidc-upload/0.1";

std::string toLower(std::string_view str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

http::verb toVerb(HttpMethod method) {
    switch (method) {
        case HttpMethod::kGet:
            return http::verb::get;
        case HttpMethod::kPost:
            return http::verb::post;
        case HttpMethod::kPatch:
            return http::verb::patch;
    }
    return http::verb::get;
}

HttpResponse fromBeast(http::response<http::string_body>& res) {
    HttpResponse response;
    response.status = res.result_int();
    for (const auto& field : res) {
        auto name = field.name_string();
        auto value = field.value();
        response.headers[toLower(std::string_view(name.data(), name.size()))] =
            std::string(value.data(), value.size());
    }
    response.body = std::move(res.body());
    return response;
}

/// Drive the io_context until the pending operation completes; rethrows its error.
template <typename T>
T await(net::io_context& ioc, std::future<T> pending) {
    ioc.restart();
    ioc.run();
    return pending.get();
}

template <typename Stream>
http::response<http::string_body> exchange(net::io_context& ioc, Stream& stream,
                                           beast::tcp_stream& timer,
                                           std::chrono::seconds timeout,
                                           http::request<http::string_body>& req) {
    timer.expires_after(timeout);
    await(ioc, http::async_write(stream, req, net::use_future));

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    timer.expires_after(timeout);
    await(ioc, http::async_read(stream, buffer, res, net::use_future));
    return res;
}

}  // namespace

// =============================================================================
// HttpResponse
// =============================================================================

std::optional<std::string> HttpResponse::header(std::string_view name) const {
    auto it = headers.find(toLower(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

// =============================================================================
// Endpoint
// =============================================================================

Result<Endpoint> Endpoint::parse(std::string_view url) {
    Endpoint endpoint;

    const auto schemeEnd = url.find("://");
    if (schemeEnd == std::string_view::npos) {
        return makeError<Endpoint>(ErrorCode::kInvalidArgument,
                                   fmt::format("API URL '{}' has no scheme", url));
    }
    endpoint.scheme = toLower(url.substr(0, schemeEnd));
    if (endpoint.scheme != "http" && endpoint.scheme != "https") {
        return makeError<Endpoint>(
            ErrorCode::kInvalidArgument,
            fmt::format("API URL scheme '{}' is not http or https", endpoint.scheme));
    }

    std::string_view rest = url.substr(schemeEnd + 3);
    const auto pathStart = rest.find('/');
    std::string_view authority = rest.substr(0, pathStart);
    if (pathStart != std::string_view::npos) {
        endpoint.basePath = std::string(rest.substr(pathStart));
        while (!endpoint.basePath.empty() && endpoint.basePath.back() == '/') {
            endpoint.basePath.pop_back();
        }
    }

    const auto colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
        endpoint.host = std::string(authority.substr(0, colon));
        endpoint.port = std::string(authority.substr(colon + 1));
        if (endpoint.port.empty() ||
            !std::all_of(endpoint.port.begin(), endpoint.port.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return makeError<Endpoint>(ErrorCode::kInvalidArgument,
                                       fmt::format("API URL '{}' has an invalid port", url));
        }
    } else {
        endpoint.host = std::string(authority);
        endpoint.port = endpoint.isTls() ? "443" : "80";
    }

    if (endpoint.host.empty()) {
        return makeError<Endpoint>(ErrorCode::kInvalidArgument,
                                   fmt::format("API URL '{}' has no host", url));
    }
    return endpoint;
}

// =============================================================================
// TLS
// =============================================================================

VoidResult configureTlsClient(ssl_st* ssl, const std::string& host) {
    if (SSL_set_tlsext_host_name(ssl, host.c_str()) != 1) {
        return makeVoidError(ErrorCode::kTransportError,
                             fmt::format("Cannot set TLS server name '{}': {}", host,
                                         ::ERR_error_string(::ERR_get_error(), nullptr)));
    }
    if (SSL_set1_host(ssl, host.c_str()) != 1) {
        return makeVoidError(ErrorCode::kTransportError,
                             fmt::format("Cannot pin TLS verification to host '{}': {}", host,
                                         ::ERR_error_string(::ERR_get_error(), nullptr)));
    }
    SSL_set_verify(ssl, SSL_VERIFY_PEER, nullptr);
    return makeVoidSuccess();
}

// =============================================================================
// BeastTransport
// =============================================================================

BeastTransport::BeastTransport(Endpoint endpoint, std::chrono::seconds timeout)
    : endpoint_(std::move(endpoint)), timeout_(timeout) {}

Result<HttpResponse> BeastTransport::send(const HttpRequest& request) {
    const std::string target = endpoint_.basePath + request.target;

    http::request<http::string_body> req{toVerb(request.method), target, 11};
    req.set(http::field::host, endpoint_.host);
    req.set(http::field::user_agent, kUserAgent);
    req.set(http::field::accept, "application/json");
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    if (!request.body.empty()) {
        req.set(http::field::content_type, "application/json");
        req.body() = request.body;
    }
    req.prepare_payload();

    CIDC_LOG_DEBUG("{} {}://{}:{}{}", httpMethodToString(request.method), endpoint_.scheme,
                   endpoint_.host, endpoint_.port, target);

    try {
        net::io_context ioc;
        tcp::resolver resolver(ioc);
        const auto results = resolver.resolve(endpoint_.host, endpoint_.port);

        http::response<http::string_body> res;
        if (endpoint_.isTls()) {
            ssl::context ctx(ssl::context::tls_client);
            ctx.set_default_verify_paths();
            ctx.set_verify_mode(ssl::verify_peer);

            beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
            if (auto configured = configureTlsClient(stream.native_handle(), endpoint_.host);
                !configured) {
                return std::unexpected(configured.error());
            }
            auto& lowest = beast::get_lowest_layer(stream);
            lowest.expires_after(timeout_);
            await(ioc, lowest.async_connect(results, net::use_future));
            lowest.expires_after(timeout_);
            await(ioc, stream.async_handshake(ssl::stream_base::client, net::use_future));
            res = exchange(ioc, stream, lowest, timeout_, req);

            beast::error_code ec;
            lowest.expires_never();
            stream.shutdown(ec);
            // Servers commonly close without a TLS close_notify
            if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
                CIDC_LOG_DEBUG("TLS shutdown: {}", ec.message());
            }
        } else {
            beast::tcp_stream stream(ioc);
            stream.expires_after(timeout_);
            await(ioc, stream.async_connect(results, net::use_future));
            res = exchange(ioc, stream, stream, timeout_, req);

            beast::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            if (ec && ec != beast::errc::not_connected) {
                CIDC_LOG_DEBUG("Socket shutdown: {}", ec.message());
            }
        }

        return fromBeast(res);
    } catch (const beast::system_error& e) {
        return makeError<HttpResponse>(
            ErrorCode::kTransportError,
            fmt::format("{} {} failed: {}", httpMethodToString(request.method), target,
                        e.code().message()));
    }
}

}  // namespace cidc::api
