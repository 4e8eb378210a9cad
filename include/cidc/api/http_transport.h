// =============================================================================
// cidc-upload - HTTP Transport
// =============================================================================
// Blocking HTTP/1.1 request/response seam between the ingestion API client
// and the network.
//
// This module provides:
// - HttpRequest / HttpResponse: plain value types
// - HttpTransport: abstract interface (replaced by fakes in tests)
// - Endpoint: base URL split into scheme, host, port and path prefix
// - BeastTransport: Boost.Beast implementation over TCP or TLS
//
// Usage:
//   auto endpoint = Endpoint::parse("https://api.example.org/v1");
//   BeastTransport transport(*endpoint);
//   auto response = transport.send({HttpMethod::kGet, "/status", {}, {}});
// =============================================================================

#ifndef CIDC_API_HTTP_TRANSPORT_H
#define CIDC_API_HTTP_TRANSPORT_H

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "cidc/common/error.h"

struct ssl_st;

namespace cidc::api {

enum class HttpMethod : std::uint8_t { kGet, kPost, kPatch };

[[nodiscard]] constexpr std::string_view httpMethodToString(HttpMethod method) noexcept {
    switch (method) {
        case HttpMethod::kGet:
            return "GET";
        case HttpMethod::kPost:
            return "POST";
        case HttpMethod::kPatch:
            return "PATCH";
    }
    return "GET";
}

struct HttpRequest {
    HttpMethod method = HttpMethod::kGet;

    /// @brief Path relative to the endpoint's base path, e.g. "/ingestion".
    std::string target;

    std::map<std::string, std::string> headers;

    /// @brief JSON body; empty for none.
    std::string body;
};

struct HttpResponse {
    unsigned status = 0;

    /// @brief Response headers keyed by lower-cased name.
    std::map<std::string, std::string> headers;

    std::string body;

    /// @brief Case-insensitive header lookup.
    [[nodiscard]] std::optional<std::string> header(std::string_view name) const;
};

/// @brief Abstract blocking HTTP transport.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /// @brief Send a request and wait for the full response.
    /// @return The response for any HTTP status; kTransportError only when no
    ///         response was received.
    [[nodiscard]] virtual Result<HttpResponse> send(const HttpRequest& request) = 0;
};

/// @brief Parsed base URL of the ingestion API.
struct Endpoint {
    std::string scheme;
    std::string host;
    std::string port;

    /// @brief Path prefix without trailing slash ("" or "/v1").
    std::string basePath;

    [[nodiscard]] bool isTls() const noexcept { return scheme == "https"; }

    /// @brief Parse "http[s]://host[:port][/prefix]".
    [[nodiscard]] static Result<Endpoint> parse(std::string_view url);
};

/// @brief Default limit for each connect, handshake, write and read step.
inline constexpr std::chrono::seconds kDefaultHttpTimeout{30};

/// @brief Prepare an OpenSSL client handle for @p host.
///
/// Sets the SNI name, requires a verified peer certificate and pins
/// certificate verification to @p host, so a certificate issued for another
/// name fails the handshake.
/// @return kTransportError if OpenSSL rejects any setting
[[nodiscard]] VoidResult configureTlsClient(ssl_st* ssl, const std::string& host);

/// @brief Boost.Beast transport; one connection per request.
class BeastTransport : public HttpTransport {
public:
    explicit BeastTransport(Endpoint endpoint,
                            std::chrono::seconds timeout = kDefaultHttpTimeout);

    [[nodiscard]] Result<HttpResponse> send(const HttpRequest& request) override;

    [[nodiscard]] const Endpoint& endpoint() const noexcept { return endpoint_; }

private:
    Endpoint endpoint_;
    std::chrono::seconds timeout_;
};

}  // namespace cidc::api

#endif  // CIDC_API_HTTP_TRANSPORT_H
