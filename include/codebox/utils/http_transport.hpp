/**
 * @file http_transport.hpp
 * @brief HTTP transport abstraction shared by the container and cluster clients
 *
 * Both execution backends drive their runtime through a REST API: the Docker
 * Engine API over a local unix socket and the Kubernetes API over HTTPS.
 * `HttpTransport` is the seam between those clients and the wire; the
 * production implementation is `CurlTransport` (libcurl), tests substitute a
 * scripted fake.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace codebox {
namespace utils {

/**
 * @class TransportError
 * @brief Connection-level failure (socket missing, TLS failure, timeout)
 *
 * HTTP error statuses are not transport errors; they are returned in
 * HttpResponse::status for the caller to interpret.
 */
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @struct HttpRequest
 * @brief One HTTP request relative to the transport's base URL
 */
struct HttpRequest {
    std::string method{"GET"};                          ///< HTTP method
    std::string path;                                   ///< Path and query string
    std::string body;                                   ///< Request body (may be empty)
    std::string content_type{"application/json"};       ///< Body content type
    std::chrono::milliseconds timeout{30000};           ///< Whole-request timeout
};

/**
 * @struct HttpResponse
 * @brief Status and body of a completed request
 */
struct HttpResponse {
    long status{0};              ///< HTTP status code
    std::string body;            ///< Response body (possibly capped)
    bool truncated{false};       ///< Body exceeded the transport's size cap

    bool Ok() const { return status >= 200 && status < 300; }
};

/**
 * @class HttpTransport
 * @brief Abstract request/response channel
 *
 * **Thread Safety**: Implementations must be safe for concurrent Send()
 * calls from independent sandbox invocations.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @brief Perform a request
     * @param request Request description
     * @return Response with status and body
     * @throws TransportError if no HTTP exchange could be completed
     */
    virtual HttpResponse Send(const HttpRequest& request) = 0;

    /**
     * @brief Human-readable endpoint description for error messages
     */
    virtual std::string Endpoint() const = 0;
};

/**
 * @struct CurlTransportConfig
 * @brief Connection parameters for CurlTransport
 */
struct CurlTransportConfig {
    std::string base_url{"http://localhost"};   ///< Scheme, host and port
    std::string unix_socket_path;               ///< Connect through this unix socket if set
    std::string bearer_token;                   ///< Sent as "Authorization: Bearer ..."
    std::string ca_file;                        ///< CA bundle for TLS verification
    std::string client_cert_file;               ///< Client certificate (mTLS)
    std::string client_key_file;                ///< Client private key (mTLS)
    bool verify_tls{true};                      ///< Verify peer and host name
    std::size_t max_response_bytes{8 * 1024 * 1024};   ///< Response body cap
    std::chrono::milliseconds connect_timeout{5000};   ///< Connect timeout
};

/**
 * @class CurlTransport
 * @brief libcurl implementation of HttpTransport
 *
 * Creates one easy handle per request, so a single instance can be shared
 * by concurrent invocations. Bodies larger than `max_response_bytes` are cut
 * at the cap and flagged as truncated instead of failing.
 */
class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(CurlTransportConfig config);

    HttpResponse Send(const HttpRequest& request) override;
    std::string Endpoint() const override;

private:
    CurlTransportConfig config_;
};

/**
 * @brief Percent-encode a string for use in a URL path segment or query value
 *
 * Everything but RFC 3986 unreserved characters is escaped, '/' and ':'
 * included, so an image reference stays a single segment.
 * @throws TransportError if libcurl cannot encode it
 */
std::string UrlEncode(const std::string& value);

} // namespace utils
} // namespace codebox
