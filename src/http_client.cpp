/**
 * @file http_client.cpp
 * @brief libcurl implementation of the remote image fetcher
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "http_client.hpp"
#include "beacon_logger.hpp"
#include "beacon_string_utils.hpp"

#include <curl/curl.h>

#include <memory>
#include <string_view>
#include <utility>

namespace mailbeacon {

namespace {

/// State shared with the libcurl callbacks of one transfer
struct Transfer {
    FetchResponse* response;
    std::size_t max_body;
    bool body_too_large = false;
};

bool curlReady() {
    static const CURLcode init = curl_global_init(CURL_GLOBAL_DEFAULT);
    return init == CURLE_OK;
}

std::size_t onBody(char* data, std::size_t size, std::size_t count, void* userdata) {
    auto* transfer = static_cast<Transfer*>(userdata);
    const std::size_t n = size * count;
    if (transfer->response->body.size() + n > transfer->max_body) {
        transfer->body_too_large = true;
        return 0;
    }
    transfer->response->body.append(data, n);
    return n;
}

std::size_t onHeader(char* data, std::size_t size, std::size_t count, void* userdata) {
    auto* transfer = static_cast<Transfer*>(userdata);
    const std::size_t n = size * count;
    std::string_view line(data, n);

    // Every redirect hop starts over with its own status line
    if (string_utils::startsWith(line, "HTTP/")) {
        transfer->response->headers.clear();
        return n;
    }
    auto colon = line.find(':');
    if (colon != std::string_view::npos && colon > 0) {
        transfer->response->headers[string_utils::toLower(string_utils::trim(line.substr(0, colon)))] =
            string_utils::trim(line.substr(colon + 1));
    }
    return n;
}

ErrorCode classify(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return ErrorCode::TIMEOUT;
        case CURLE_URL_MALFORMAT:
            return ErrorCode::INVALID_ARGUMENT;
        case CURLE_UNSUPPORTED_PROTOCOL:   // also reported for a reply with no HTTP status line
        case CURLE_WEIRD_SERVER_REPLY:
        case CURLE_TOO_MANY_REDIRECTS:
        case CURLE_PARTIAL_FILE:
        case CURLE_BAD_CONTENT_ENCODING:
        case CURLE_FILESIZE_EXCEEDED:
        case CURLE_WRITE_ERROR:
            return ErrorCode::PROTOCOL_ERROR;
        default:
            return ErrorCode::NETWORK_ERROR;
    }
}

} // namespace

HttpClient::HttpClient() : HttpClient(Options{}) {}

HttpClient::HttpClient(Options options) : options_(std::move(options)) {}

Result<FetchResponse> HttpClient::fetch(const std::string& url, std::chrono::milliseconds timeout) {
    if (!string_utils::startsWithIgnoreCase(url, "http://") &&
        !string_utils::startsWithIgnoreCase(url, "https://")) {
        return Err<FetchResponse>(ErrorCode::INVALID_ARGUMENT, "Not an http or https URL: " + url);
    }
    // CURLOPT_TIMEOUT_MS treats 0 as no limit
    if (timeout.count() <= 0) {
        return Err<FetchResponse>(ErrorCode::TIMEOUT, "No time left to fetch " + url);
    }
    if (!curlReady()) {
        return Err<FetchResponse>(ErrorCode::NETWORK_ERROR, "curl_global_init failed");
    }

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        return Err<FetchResponse>(ErrorCode::NETWORK_ERROR, "curl_easy_init failed");
    }

    FetchResponse response;
    Transfer transfer{&response, options_.max_body_bytes};
    char errbuf[CURL_ERROR_SIZE] = {};

    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(h, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_MAXREDIRS, static_cast<long>(options_.max_redirects));
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(h, CURLOPT_MAXFILESIZE_LARGE, static_cast<curl_off_t>(options_.max_body_bytes));
    curl_easy_setopt(h, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(h, CURLOPT_SSLVERSION, static_cast<long>(CURL_SSLVERSION_TLSv1_2));
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, options_.verify_tls ? 1L : 0L);
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, options_.verify_tls ? 2L : 0L);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, onBody);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &transfer);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, onHeader);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &transfer);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);

    CURLcode rc = curl_easy_perform(h);
    if (transfer.body_too_large) {
        return Err<FetchResponse>(ErrorCode::PROTOCOL_ERROR,
                                  "Response body exceeds " + std::to_string(options_.max_body_bytes) + " bytes");
    }
    if (rc != CURLE_OK) {
        std::string detail = errbuf[0] != '\0' ? errbuf : curl_easy_strerror(rc);
        return Err<FetchResponse>(classify(rc), "GET " + url + ": " + detail);
    }

    long status = 0;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<int>(status);

    char* effective = nullptr;
    curl_easy_getinfo(h, CURLINFO_EFFECTIVE_URL, &effective);
    response.final_url = effective ? effective : url;

    char* contentType = nullptr;
    curl_easy_getinfo(h, CURLINFO_CONTENT_TYPE, &contentType);
    if (contentType) response.headers["content-type"] = contentType;

    LOG_DEBUG("HttpClient", "GET " + response.final_url + " -> " + std::to_string(response.status));
    return Ok(std::move(response));
}

} // namespace mailbeacon
