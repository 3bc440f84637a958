/**
 * @file http_client.hpp
 * @brief Blocking JSON-over-HTTP client on libcurl.
 * @author Dimitris Kafetzis
 *
 * One easy handle per request. Connect and total timeouts come from the
 * twin configuration; credentials go out as HTTP basic auth.
 */

#pragma once

#include "core/result.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace edge_twin {

struct HttpResponse {
    int status = 0;
    std::string body;

    [[nodiscard]] bool ok() const noexcept { return status >= 200 && status < 300; }
};

/**
 * @brief Synchronous HTTP client bound to one base URL.
 */
class HttpClient {
public:
    static constexpr size_t MAX_RESPONSE_SIZE = 16 * 1024 * 1024;  // 16 MB

    /**
     * @brief Validate `base_url` (http or https, non-empty host) and bind to it.
     *
     * A trailing slash is dropped so request paths always start with '/'.
     */
    static Result<HttpClient> create(std::string_view base_url,
                                     uint32_t connect_timeout_ms = 2000,
                                     uint32_t request_timeout_ms = 5000);

    void set_basic_auth(std::string_view username, std::string_view password);

    /**
     * @brief Perform one request and wait for the complete response.
     *
     * `path` is appended to the base URL and must already be escaped. Any
     * HTTP status is a successful Result; transport failures are errors.
     */
    Result<HttpResponse> request(std::string_view method,
                                 std::string_view path,
                                 std::string_view body = {},
                                 std::string_view content_type = "application/json");

    Result<HttpResponse> get(std::string_view path) { return request("GET", path); }
    Result<HttpResponse> put(std::string_view path, std::string_view body) {
        return request("PUT", path, body);
    }
    Result<HttpResponse> del(std::string_view path) { return request("DELETE", path); }

    /// URL-escape a query value (curl_easy_escape).
    [[nodiscard]] static std::string escape(std::string_view value);

    [[nodiscard]] const std::string& base_url() const noexcept { return base_url_; }

private:
    HttpClient(std::string base_url, uint32_t connect_timeout_ms, uint32_t request_timeout_ms);

    std::string base_url_;
    uint32_t connect_timeout_ms_;
    uint32_t request_timeout_ms_;
    std::string credentials_;   ///< "user:password", empty for no auth
};

}  // namespace edge_twin
