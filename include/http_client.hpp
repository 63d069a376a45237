/**
 * @file http_client.hpp
 * @brief Outbound HTTP/HTTPS GET used to proxy remote images
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * Provides:
 * - RemoteFetcher interface consumed by the image resolver
 * - HttpClient: libcurl easy-handle GET whose timeout covers name
 *   resolution, connect, TLS, redirects and the body transfer
 */
#ifndef MAILBEACON_HTTP_CLIENT_HPP
#define MAILBEACON_HTTP_CLIENT_HPP

#include "result.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace mailbeacon {

/**
 * @struct FetchResponse
 * @brief Final response after redirects
 */
struct FetchResponse {
    int status = 0;
    std::map<std::string, std::string> headers;   ///< lower-cased names
    std::string body;
    std::string final_url;

    [[nodiscard]] std::optional<std::string> header(const std::string& lowerName) const {
        auto it = headers.find(lowerName);
        if (it == headers.end()) return std::nullopt;
        return it->second;
    }
};

/**
 * @class RemoteFetcher
 * @brief Source of remote resources
 *
 * Implementations report every failure (DNS, connect, TLS, timeout,
 * malformed response) as an error result and never throw.
 */
class RemoteFetcher {
public:
    virtual ~RemoteFetcher() = default;

    [[nodiscard]] virtual Result<FetchResponse> fetch(const std::string& url,
                                                      std::chrono::milliseconds timeout) = 0;
};

/**
 * @class HttpClient
 * @brief Blocking GET client with a whole-request deadline
 *
 * Each fetch uses its own easy handle, so concurrent fetches from
 * connection threads share nothing but the process-wide curl init.
 */
class HttpClient : public RemoteFetcher {
public:
    struct Options {
        int max_redirects = 5;
        std::size_t max_body_bytes = 20 * 1024 * 1024;
        bool verify_tls = true;
        std::string user_agent = "MailBeacon/1.0";
    };

    HttpClient();
    explicit HttpClient(Options options);

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /**
     * @brief GET the URL, following redirects
     * @param url Absolute http or https URL
     * @param timeout Deadline for the whole exchange including redirects
     * @return Final response of any status, or TIMEOUT / NETWORK_ERROR /
     *         PROTOCOL_ERROR (malformed reply, too many redirects, oversized
     *         body) / INVALID_ARGUMENT (not http or https)
     */
    [[nodiscard]] Result<FetchResponse> fetch(const std::string& url,
                                              std::chrono::milliseconds timeout) override;

    [[nodiscard]] const Options& options() const noexcept { return options_; }

private:
    Options options_;
};

} // namespace mailbeacon
#endif
