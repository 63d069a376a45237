/**
 * @file rest_api.hpp
 * @brief Minimal threaded HTTP/1.1 server with a regex route table
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef MAILBEACON_REST_API_HPP
#define MAILBEACON_REST_API_HPP

#include "net_platform.hpp"
#include "beacon_json.hpp"
#include "beacon_logger.hpp"
#include "beacon_string_utils.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace mailbeacon {

enum class HttpMethod { GET, POST, OPTIONS, UNKNOWN };
enum class HttpStatus {
    OK = 200, NO_CONTENT = 204, FOUND = 302, BAD_REQUEST = 400, NOT_FOUND = 404,
    METHOD_NOT_ALLOWED = 405, PAYLOAD_TOO_LARGE = 413, INTERNAL_ERROR = 500, SERVICE_UNAVAILABLE = 503
};

inline std::string methodToString(HttpMethod m) {
    switch (m) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::OPTIONS: return "OPTIONS";
        default: return "UNKNOWN";
    }
}

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string path, query, body, client_ip;
    std::map<std::string, std::string> headers;   ///< lower-cased names
    std::map<std::string, std::string> params;    ///< percent-decoded query parameters

    [[nodiscard]] std::optional<std::string> param(const std::string& name) const {
        auto it = params.find(name);
        if (it == params.end()) return std::nullopt;
        return it->second;
    }

    [[nodiscard]] std::optional<std::string> header(const std::string& lowerName) const {
        auto it = headers.find(lowerName);
        if (it == headers.end()) return std::nullopt;
        return it->second;
    }
};

struct HttpResponse {
    HttpStatus status = HttpStatus::OK;
    std::map<std::string, std::string> headers;
    std::string body, content_type = "application/json";
    void setJSON(const std::string& j) { content_type = "application/json"; body = j; }
    void setText(const std::string& t) { content_type = "text/plain"; body = t; }
    void setBinary(std::string bytes, std::string type) { content_type = std::move(type); body = std::move(bytes); }

    [[nodiscard]] static HttpResponse error(HttpStatus s, const std::string& message) {
        HttpResponse r;
        r.status = s;
        r.setJSON(json::object().add("error", message).build().dump());
        return r;
    }

    /// Control bytes, spaces and non-ASCII in location are percent-encoded
    [[nodiscard]] static HttpResponse redirect(const std::string& location) {
        HttpResponse r;
        r.status = HttpStatus::FOUND;
        r.content_type.clear();
        r.headers["Location"] = string_utils::urlEncode(location, kLocationKeep);
        return r;
    }

    /// True when no header name or value could end the header line early
    [[nodiscard]] bool headersAreSafe() const {
        auto clean = [](const std::string& v) { return v.find_first_of("\r\n") == std::string::npos; };
        if (!clean(content_type)) return false;
        for (const auto& [name, value] : headers) {
            if (!clean(name) || !clean(value)) return false;
        }
        return true;
    }

    /// URL delimiters left intact in a redirect target
    static constexpr std::string_view kLocationKeep = ":/%#?=@[]!$&'()*+,;";
};

/**
 * @brief Decode a query string; '+' is a space and later keys win
 */
inline std::map<std::string, std::string> parseQueryString(const std::string& query) {
    std::map<std::string, std::string> params;
    for (const auto& pair : string_utils::split(query, '&')) {
        if (pair.empty()) continue;
        auto eq = pair.find('=');
        std::string key = string_utils::urlDecode(std::string_view(pair).substr(0, eq));
        std::string value = eq == std::string::npos
            ? std::string() : string_utils::urlDecode(std::string_view(pair).substr(eq + 1));
        params[key] = value;
    }
    return params;
}

using RouteHandler = std::function<HttpResponse(const HttpRequest&)>;
struct Route { HttpMethod method; std::string pattern; std::regex regex; RouteHandler handler; std::string description; };

/**
 * @class RESTServer
 * @brief One thread per connection; handlers run outside the route lock
 *
 * Every response carries Access-Control-Allow-Origin: *. OPTIONS requests
 * are answered as CORS preflight. Unknown paths yield 404 JSON and handler
 * exceptions 500 JSON.
 */
class RESTServer {
public:
    static constexpr std::size_t kMaxHeaderBytes = 64 * 1024;
    static constexpr std::size_t kMaxBodyBytes = 1024 * 1024;
    static constexpr std::chrono::seconds kClientTimeout{30};

    explicit RESTServer(uint16_t port = 8000, std::string bindAddress = "0.0.0.0", int backlog = 64)
        : port_(port), bind_address_(std::move(bindAddress)), backlog_(backlog) {}
    ~RESTServer() { stop(); }

    RESTServer(const RESTServer&) = delete;
    RESTServer& operator=(const RESTServer&) = delete;

    void get(const std::string& path, RouteHandler h, const std::string& d = "") { addRoute(HttpMethod::GET, path, std::move(h), d); }

    /**
     * @brief Bind, listen and start accepting
     *
     * Port 0 picks an ephemeral port; getPort() reports the bound one.
     */
    bool start() {
        if (running_) return true;
        if (!net::initialize()) {
            LOG_ERROR("RESTServer", "Socket layer initialization failed");
            return false;
        }
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port_);
        std::string host = bind_address_ == "localhost" ? "127.0.0.1" : bind_address_;
        if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
            LOG_ERROR("RESTServer", "Invalid bind address: " + bind_address_);
            return false;
        }

        server_socket_ = socket(AF_INET, SOCK_STREAM, 0);
        if (server_socket_ == INVALID_SOCK) {
            LOG_ERROR("RESTServer", "socket() failed");
            return false;
        }
        int opt = 1;
        setsockopt(server_socket_, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&opt), sizeof(opt));
        if (bind(server_socket_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            LOG_ERROR("RESTServer", "bind() failed on " + bind_address_ + ":" + std::to_string(port_));
            net::closeSocket(server_socket_);
            server_socket_ = INVALID_SOCK;
            return false;
        }
        if (listen(server_socket_, backlog_) < 0) {
            LOG_ERROR("RESTServer", "listen() failed");
            net::closeSocket(server_socket_);
            server_socket_ = INVALID_SOCK;
            return false;
        }

        sockaddr_in bound{};
        socklen_t len = sizeof(bound);
        if (getsockname(server_socket_, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
            port_ = ntohs(bound.sin_port);
        }

        running_ = true;
        server_thread_ = std::thread(&RESTServer::acceptLoop, this);
        LOG_INFO("RESTServer", "Listening on " + bind_address_ + ":" + std::to_string(port_));
        return true;
    }

    /// Stop accepting and wait for in-flight connections to finish
    void stop() {
        if (!running_.exchange(false)) return;
        if (server_thread_.joinable()) server_thread_.join();
        net::closeSocket(server_socket_);
        server_socket_ = INVALID_SOCK;

        std::unique_lock<std::mutex> lock(conn_mutex_);
        conn_cv_.wait(lock, [this] { return active_connections_ == 0; });
        LOG_INFO("RESTServer", "Stopped");
    }

    bool isRunning() const { return running_; }
    uint16_t getPort() const { return port_; }
    std::vector<Route> getRoutes() const { std::lock_guard<std::mutex> lock(routes_mutex_); return routes_; }

private:
    void addRoute(HttpMethod m, const std::string& p, RouteHandler h, const std::string& d) {
        std::lock_guard<std::mutex> lock(routes_mutex_);
        Route r; r.method = m; r.pattern = p; r.handler = std::move(h); r.description = d;
        r.regex = std::regex("^" + std::regex_replace(p, std::regex(":[a-zA-Z_]+"), "([^/]+)") + "$");
        routes_.push_back(std::move(r));
    }

    void acceptLoop() {
        while (running_) {
            int ready = net::waitFor(server_socket_, false, std::chrono::milliseconds(200));
            if (ready <= 0) continue;

            sockaddr_storage client_addr{};
            socklen_t client_len = sizeof(client_addr);
            socket_t client_socket = accept(server_socket_, reinterpret_cast<sockaddr*>(&client_addr), &client_len);
            if (client_socket == INVALID_SOCK) continue;

            {
                std::lock_guard<std::mutex> lock(conn_mutex_);
                ++active_connections_;
            }
            std::string client_ip = net::addressToString(reinterpret_cast<const sockaddr*>(&client_addr));
            std::thread([this, client_socket, client_ip]() {
                handleClient(client_socket, client_ip);
                std::lock_guard<std::mutex> lock(conn_mutex_);
                --active_connections_;
                conn_cv_.notify_all();
            }).detach();
        }
    }

    void handleClient(socket_t client_socket, const std::string& client_ip) {
        net::setIoTimeout(client_socket, kClientTimeout);
        HttpResponse resp;
        auto req = readRequest(client_socket, resp);
        if (req) {
            req->client_ip = client_ip;
            resp = handleRequest(*req);
            LOG_DEBUG("RESTServer", methodToString(req->method) + " " + req->path + " -> " +
                      std::to_string(static_cast<int>(resp.status)));
        }
        if (!req && resp.status == HttpStatus::OK) {
            // Peer went away before sending a request
            net::closeSocket(client_socket);
            return;
        }
        if (!resp.headersAreSafe()) {
            LOG_ERROR("RESTServer", "Dropped response with CR or LF in a header for " + client_ip);
            resp = HttpResponse::error(HttpStatus::INTERNAL_ERROR, "Invalid response header");
        }
        resp.headers["Access-Control-Allow-Origin"] = "*";
        std::string respStr = buildResponse(resp);
        std::size_t sent = 0;
        while (sent < respStr.size()) {
            auto n = send(client_socket, respStr.data() + sent, static_cast<int>(respStr.size() - sent), net::kSendFlags);
            if (n <= 0) {
                if (n < 0 && net::isInterrupted(net::lastError())) continue;
                LOG_DEBUG("RESTServer", "Client " + client_ip + " closed before response was sent");
                break;
            }
            sent += static_cast<std::size_t>(n);
        }
        net::closeSocket(client_socket);
    }

    /**
     * @brief Read header block and body
     * @param failure Set to an error response when the request is rejected
     * @return Parsed request, or nullopt (failure left at OK when the peer
     *         closed without sending anything)
     */
    std::optional<HttpRequest> readRequest(socket_t client_socket, HttpResponse& failure) {
        std::string data;
        char buffer[8192];
        std::size_t headerEnd = std::string::npos;
        while ((headerEnd = data.find("\r\n\r\n")) == std::string::npos) {
            if (data.size() > kMaxHeaderBytes) {
                failure = HttpResponse::error(HttpStatus::PAYLOAD_TOO_LARGE, "Request header too large");
                return std::nullopt;
            }
            auto bytes = recv(client_socket, buffer, static_cast<int>(sizeof(buffer)), 0);
            if (bytes < 0 && net::isInterrupted(net::lastError())) continue;
            if (bytes <= 0) {
                if (!data.empty()) failure = HttpResponse::error(HttpStatus::BAD_REQUEST, "Incomplete request");
                return std::nullopt;
            }
            data.append(buffer, static_cast<std::size_t>(bytes));
        }

        HttpRequest req = parseRequest(data.substr(0, headerEnd));
        if (req.method == HttpMethod::UNKNOWN || req.path.empty()) {
            failure = HttpResponse::error(HttpStatus::BAD_REQUEST, "Malformed request line");
            return std::nullopt;
        }

        std::size_t contentLength = 0;
        if (auto cl = req.header("content-length")) {
            auto parsed = string_utils::toInt<std::size_t>(*cl);
            if (!parsed) {
                failure = HttpResponse::error(HttpStatus::BAD_REQUEST, "Invalid Content-Length");
                return std::nullopt;
            }
            contentLength = *parsed;
        }
        if (contentLength > kMaxBodyBytes) {
            failure = HttpResponse::error(HttpStatus::PAYLOAD_TOO_LARGE, "Request body too large");
            return std::nullopt;
        }
        req.body = data.substr(headerEnd + 4);
        while (req.body.size() < contentLength) {
            auto bytes = recv(client_socket, buffer, static_cast<int>(sizeof(buffer)), 0);
            if (bytes < 0 && net::isInterrupted(net::lastError())) continue;
            if (bytes <= 0) {
                failure = HttpResponse::error(HttpStatus::BAD_REQUEST, "Incomplete request body");
                return std::nullopt;
            }
            req.body.append(buffer, static_cast<std::size_t>(bytes));
        }
        req.body.resize(contentLength);
        return req;
    }

    HttpRequest parseRequest(const std::string& head) {
        HttpRequest req;
        std::istringstream s(head);
        std::string requestLine;
        std::getline(s, requestLine);
        if (!requestLine.empty() && requestLine.back() == '\r') requestLine.pop_back();

        std::istringstream rl(requestLine);
        std::string method, target, ver; rl >> method >> target >> ver;
        if (method == "GET") req.method = HttpMethod::GET;
        else if (method == "POST") req.method = HttpMethod::POST;
        else if (method == "OPTIONS") req.method = HttpMethod::OPTIONS;
        else req.method = HttpMethod::UNKNOWN;

        size_t qp = target.find('?');
        if (qp != std::string::npos) { req.query = target.substr(qp + 1); req.path = target.substr(0, qp); }
        else req.path = target;
        req.params = parseQueryString(req.query);

        std::string line;
        while (std::getline(s, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            auto colon = line.find(':');
            if (colon == std::string::npos || colon == 0) continue;
            req.headers[string_utils::toLower(string_utils::trim(std::string_view(line).substr(0, colon)))] =
                string_utils::trim(std::string_view(line).substr(colon + 1));
        }
        return req;
    }

    HttpResponse handleRequest(const HttpRequest& req) {
        if (req.method == HttpMethod::OPTIONS) {
            HttpResponse r; r.status = HttpStatus::NO_CONTENT; r.content_type.clear();
            r.headers["Access-Control-Allow-Methods"] = "GET, POST, OPTIONS";
            r.headers["Access-Control-Allow-Headers"] = req.header("access-control-request-headers").value_or("*");
            r.headers["Access-Control-Max-Age"] = "600";
            return r;
        }

        std::optional<Route> matched;
        bool pathMatched = false;
        {
            std::lock_guard<std::mutex> lock(routes_mutex_);
            for (const auto& route : routes_) {
                if (!std::regex_match(req.path, route.regex)) continue;
                pathMatched = true;
                if (route.method == req.method) { matched = route; break; }
            }
        }
        if (!matched) {
            return pathMatched ? HttpResponse::error(HttpStatus::METHOD_NOT_ALLOWED, "Method not allowed")
                               : HttpResponse::error(HttpStatus::NOT_FOUND, "Not found");
        }

        try {
            return matched->handler(req);
        } catch (const std::exception& e) {
            LOG_ERROR("RESTServer", "Handler for " + req.path + " failed: " + e.what());
            return HttpResponse::error(HttpStatus::INTERNAL_ERROR, e.what());
        }
    }

    std::string buildResponse(const HttpResponse& r) {
        std::ostringstream oss;
        oss << "HTTP/1.1 " << static_cast<int>(r.status) << " " << statusText(r.status) << "\r\n";
        if (!r.content_type.empty()) oss << "Content-Type: " << r.content_type << "\r\n";
        oss << "Content-Length: " << r.body.size() << "\r\n";
        oss << "Connection: close\r\nServer: MailBeacon/1.0.0\r\n";
        for (const auto& [n, v] : r.headers) oss << n << ": " << v << "\r\n";
        oss << "\r\n" << r.body;
        return oss.str();
    }

    std::string statusText(HttpStatus s) {
        switch (s) {
            case HttpStatus::OK: return "OK";
            case HttpStatus::NO_CONTENT: return "No Content";
            case HttpStatus::FOUND: return "Found";
            case HttpStatus::BAD_REQUEST: return "Bad Request";
            case HttpStatus::NOT_FOUND: return "Not Found";
            case HttpStatus::METHOD_NOT_ALLOWED: return "Method Not Allowed";
            case HttpStatus::PAYLOAD_TOO_LARGE: return "Payload Too Large";
            case HttpStatus::INTERNAL_ERROR: return "Internal Server Error";
            case HttpStatus::SERVICE_UNAVAILABLE: return "Service Unavailable";
            default: return "Unknown";
        }
    }

    socket_t server_socket_ = INVALID_SOCK;
    uint16_t port_;
    std::string bind_address_;
    int backlog_;
    std::atomic<bool> running_{false};
    std::thread server_thread_;
    mutable std::mutex routes_mutex_;
    std::vector<Route> routes_;

    std::mutex conn_mutex_;
    std::condition_variable conn_cv_;
    int active_connections_ = 0;
};

} // namespace mailbeacon
#endif
