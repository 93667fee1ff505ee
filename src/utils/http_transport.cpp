/**
 * @file http_transport.cpp
 * @brief libcurl-backed HTTP transport
 *
 * @date 2025
 */

#include "codebox/utils/http_transport.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <climits>
#include <memory>
#include <mutex>
#include <utility>

namespace codebox {
namespace utils {

namespace {

std::once_flag g_curl_global_init;

struct ResponseBuffer {
    std::string data;
    std::size_t limit{0};
    bool truncated{false};
};

// Appends to the buffer until the cap; returning short aborts the transfer
size_t WriteToBuffer(char* contents, size_t size, size_t num_bytes, void* userp) {
    size_t real_size = size * num_bytes;
    auto* buffer = static_cast<ResponseBuffer*>(userp);

    const std::size_t room = buffer->limit - buffer->data.size();
    if (real_size > room) {
        buffer->data.append(contents, room);
        buffer->truncated = true;
        return 0;
    }

    buffer->data.append(contents, real_size);
    return real_size;
}

struct CurlHandleDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct CurlListDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using CurlHandle = std::unique_ptr<CURL, CurlHandleDeleter>;
using CurlList = std::unique_ptr<curl_slist, CurlListDeleter>;

void AppendHeader(CurlList& list, const std::string& header) {
    curl_slist* extended = curl_slist_append(list.get(), header.c_str());
    if (extended == nullptr) {
        throw TransportError("curl_slist_append failed");
    }
    list.release();
    list.reset(extended);
}

} // anonymous namespace

CurlTransport::CurlTransport(CurlTransportConfig config)
    : config_(std::move(config)) {
    std::call_once(g_curl_global_init, [] {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

std::string CurlTransport::Endpoint() const {
    if (!config_.unix_socket_path.empty()) {
        return "unix://" + config_.unix_socket_path;
    }
    return config_.base_url;
}

HttpResponse CurlTransport::Send(const HttpRequest& request) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw TransportError("curl_easy_init failed: Invalid curl handle");
    }

    const std::string url = config_.base_url + request.path;
    CURL* handle = curl.get();

    curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_USERAGENT, "codebox/1.0");
    curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(config_.connect_timeout.count()));

    if (!config_.unix_socket_path.empty()) {
        curl_easy_setopt(handle, CURLOPT_UNIX_SOCKET_PATH, config_.unix_socket_path.c_str());
    }

    // TLS
    if (!config_.ca_file.empty()) {
        curl_easy_setopt(handle, CURLOPT_CAINFO, config_.ca_file.c_str());
    }
    if (!config_.client_cert_file.empty()) {
        curl_easy_setopt(handle, CURLOPT_SSLCERT, config_.client_cert_file.c_str());
    }
    if (!config_.client_key_file.empty()) {
        curl_easy_setopt(handle, CURLOPT_SSLKEY, config_.client_key_file.c_str());
    }
    if (!config_.verify_tls) {
        curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, 0L);
    }

    // Method and body. POST always gets explicit fields so curl never reads stdin.
    if (request.method == "GET") {
        curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
    } else if (request.method == "POST") {
        curl_easy_setopt(handle, CURLOPT_POST, 1L);
        curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else {
        curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        if (!request.body.empty()) {
            curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE,
                             static_cast<long>(request.body.size()));
        }
    }

    CurlList headers;
    AppendHeader(headers, "Expect:");
    AppendHeader(headers, "Accept: application/json");
    if (!request.body.empty()) {
        AppendHeader(headers, "Content-Type: " + request.content_type);
    }
    if (!config_.bearer_token.empty()) {
        AppendHeader(headers, "Authorization: Bearer " + config_.bearer_token);
    }
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get());

    ResponseBuffer buffer;
    buffer.limit = config_.max_response_bytes;
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, WriteToBuffer);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &buffer);

    spdlog::debug("HTTP {} {}{}", request.method, Endpoint(), request.path);

    CURLcode code = curl_easy_perform(handle);
    if (code != CURLE_OK && !(code == CURLE_WRITE_ERROR && buffer.truncated)) {
        throw TransportError(request.method + " " + request.path + " via " + Endpoint() +
                             " failed: " + curl_easy_strerror(code));
    }

    HttpResponse response;
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status);
    response.body = std::move(buffer.data);
    response.truncated = buffer.truncated;

    if (response.truncated) {
        spdlog::warn("Response body for {} capped at {} bytes",
                     request.path, config_.max_response_bytes);
    }
    spdlog::debug("HTTP {} {} -> {} ({} bytes)", request.method, request.path,
                  response.status, response.body.size());
    return response;
}

std::string UrlEncode(const std::string& value) {
    if (value.size() > static_cast<std::size_t>(INT_MAX)) {
        throw TransportError("URL component too long to encode");
    }
    std::unique_ptr<char, decltype(&curl_free)> encoded(
        curl_easy_escape(nullptr, value.data(), static_cast<int>(value.size())), &curl_free);
    if (!encoded) {
        throw TransportError("curl_easy_escape failed");
    }
    return std::string(encoded.get());
}

} // namespace utils
} // namespace codebox
