/**
 * @file http_client.cpp
 * @brief HttpClient implementation over the libcurl easy interface.
 * @author Dimitris Kafetzis
 */

#include "network/http_client.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace edge_twin {

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlHeaders = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;
using CurlUrl = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

void ensure_curl_global() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct BodySink {
    std::string* out;
    size_t limit;
    bool overflow = false;
};

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* sink = static_cast<BodySink*>(userdata);
    const size_t total = size * nmemb;
    if (sink->out->size() + total > sink->limit) {
        sink->overflow = true;
        return 0;  // aborts the transfer with CURLE_WRITE_ERROR
    }
    sink->out->append(ptr, total);
    return total;
}

/// Read one URL component; empty when absent.
std::string url_part(CURLU* url, CURLUPart part) {
    char* value = nullptr;
    if (curl_url_get(url, part, &value, 0) != CURLUE_OK || value == nullptr) return {};
    std::string out{value};
    curl_free(value);
    return out;
}

ErrorCode classify(CURLcode rc) noexcept {
    switch (rc) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
            return ErrorCode::Unavailable;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return ErrorCode::InvalidArgument;
        default:
            return ErrorCode::Io;
    }
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

HttpClient::HttpClient(std::string base_url,
                       uint32_t connect_timeout_ms,
                       uint32_t request_timeout_ms)
    : base_url_(std::move(base_url))
    , connect_timeout_ms_(connect_timeout_ms)
    , request_timeout_ms_(request_timeout_ms) {}

Result<HttpClient> HttpClient::create(std::string_view base_url,
                                      uint32_t connect_timeout_ms,
                                      uint32_t request_timeout_ms) {
    ensure_curl_global();

    std::string url{base_url};
    CurlUrl parsed{curl_url(), curl_url_cleanup};
    if (!parsed) return Error{"Out of memory parsing URL", ErrorCode::Io};
    if (curl_url_set(parsed.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) {
        return Error{"Malformed URL: " + url, ErrorCode::InvalidArgument};
    }

    auto scheme = url_part(parsed.get(), CURLUPART_SCHEME);
    if (scheme != "http" && scheme != "https") {
        return Error{"Unsupported URL scheme: " + url, ErrorCode::InvalidArgument};
    }
    if (url_part(parsed.get(), CURLUPART_HOST).empty()) {
        return Error{"URL has no host: " + url, ErrorCode::InvalidArgument};
    }

    while (!url.empty() && url.back() == '/') url.pop_back();
    return HttpClient{std::move(url), connect_timeout_ms, request_timeout_ms};
}

void HttpClient::set_basic_auth(std::string_view username, std::string_view password) {
    credentials_ = std::string{username} + ":" + std::string{password};
}

std::string HttpClient::escape(std::string_view value) {
    ensure_curl_global();
    char* escaped = curl_easy_escape(nullptr, value.data(), static_cast<int>(value.size()));
    if (escaped == nullptr) return {};
    std::string out{escaped};
    curl_free(escaped);
    return out;
}

// ─────────────────────────────────────────────
// Request
// ─────────────────────────────────────────────

Result<HttpResponse> HttpClient::request(std::string_view method,
                                         std::string_view path,
                                         std::string_view body,
                                         std::string_view content_type) {
    CurlHandle curl{curl_easy_init(), curl_easy_cleanup};
    if (!curl) return Error{"curl_easy_init failed", ErrorCode::Io};

    const std::string url = base_url_ + std::string{path};
    const std::string verb{method};
    HttpResponse response;
    BodySink sink{&response.body, MAX_RESPONSE_SIZE};
    char error_buffer[CURL_ERROR_SIZE] = {};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_timeout_ms_));
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(request_timeout_ms_));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);

    if (!credentials_.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPAUTH, static_cast<long>(CURLAUTH_BASIC));
        curl_easy_setopt(curl.get(), CURLOPT_USERPWD, credentials_.c_str());
    }

    curl_slist* raw_headers = curl_slist_append(nullptr, "Accept: application/json");
    // No 100-continue round trip for small JSON bodies
    raw_headers = curl_slist_append(raw_headers, "Expect:");

    std::string content_type_header;
    if (verb == "GET") {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    } else {
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, verb.c_str());
        if (!body.empty() || verb == "PUT" || verb == "POST") {
            content_type_header = "Content-Type: " + std::string{content_type};
            raw_headers = curl_slist_append(raw_headers, content_type_header.c_str());
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.data());
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(body.size()));
        }
    }
    CurlHeaders headers{raw_headers, curl_slist_free_all};
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());

    CURLcode rc = curl_easy_perform(curl.get());
    if (sink.overflow) {
        return Error{"Response from " + url + " too large", ErrorCode::Protocol};
    }
    if (rc != CURLE_OK) {
        std::string detail = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(rc);
        return Error{verb + " " + url + " failed: " + detail, classify(rc)};
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<int>(status);
    return response;
}

}  // namespace edge_twin
