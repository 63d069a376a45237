/**
 * @file tracking_api.hpp
 * @brief HTTP routes for pixel, click and tracking queries
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef MAILBEACON_TRACKING_API_HPP
#define MAILBEACON_TRACKING_API_HPP

#include "beacon_config.hpp"
#include "beacon_logger.hpp"
#include "beacon_string_utils.hpp"
#include "rest_api.hpp"
#include "tracking_service.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mailbeacon {

/**
 * @class TrackingAPI
 * @brief Binds the external HTTP interface onto a TrackingService
 */
class TrackingAPI {
public:
    TrackingAPI(std::shared_ptr<TrackingService> service, const ServerConfig& server)
        : service_(std::move(service)),
          server_(static_cast<uint16_t>(server.port), server.bind_address, server.backlog) {
        registerRoutes();
    }

    bool start() { return server_.start(); }
    void stop() { server_.stop(); }
    uint16_t getPort() const { return server_.getPort(); }
    bool isRunning() const { return server_.isRunning(); }

    /// Registered routes in match order
    std::vector<Route> routes() const { return server_.getRoutes(); }

private:
    static ClientInfo clientInfo(const HttpRequest& req) {
        ClientInfo info;
        info.user_agent = req.header("user-agent");
        if (!req.client_ip.empty()) info.remote_addr = req.client_ip;
        return info;
    }

    static std::optional<std::string> nonEmpty(std::optional<std::string> value) {
        if (value && value->empty()) return std::nullopt;
        return value;
    }

    static HttpResponse missing(const std::string& name) {
        return HttpResponse::error(HttpStatus::BAD_REQUEST, "Missing required parameter: " + name);
    }

    static HttpResponse attachment(Result<std::string> content, const std::string& filename) {
        if (!content) {
            LOG_ERROR("TrackingAPI", "Download of " + filename + " failed: " + content.error().toString());
            return HttpResponse::error(HttpStatus::INTERNAL_ERROR, content.error().message);
        }
        HttpResponse r;
        r.setText(std::move(content.value()));
        r.headers["Content-Disposition"] = "attachment; filename=" + filename;
        return r;
    }

    void registerRoutes() {
        server_.get("/api/img", [this](const HttpRequest& req) { return pixel(req); }, "Tracking pixel and image proxy");
        server_.get("/api/click", [this](const HttpRequest& req) { return click(req); }, "Click redirect");
        server_.get("/tracking/by_email", [this](const HttpRequest& req) {
            auto email = req.param("email");
            if (!email) return missing("email");
            HttpResponse r; r.setJSON(service_->byIdentity(*email).toJson().dump()); return r;
        }, "Events for one email");
        server_.get("/tracking/latest", [this](const HttpRequest& req) { return latest(req); }, "Most recent events");
        server_.get("/tracking/download", [this](const HttpRequest&) {
            return attachment(service_->downloadEvents(), "tracking_logs.jsonl");
        }, "Raw event log");
        server_.get("/tracking/download_imgreads", [this](const HttpRequest&) {
            return attachment(service_->downloadImageReads(), "img_reads.jsonl");
        }, "Raw image-read log");
        server_.get("/api/test", [this](const HttpRequest&) {
            HttpResponse r; r.setJSON(service_->statusJson().dump()); return r;
        }, "Liveness");
    }

    HttpResponse pixel(const HttpRequest& req) {
        auto email = req.param("email");
        if (!email) return missing("email");

        PixelRequest pr;
        pr.email = *email;
        pr.message_id = req.param("message_id");
        // Query values are decoded once by the server; image links arrive double-encoded
        if (auto image = nonEmpty(req.param("image"))) pr.image = string_utils::urlDecode(*image);
        pr.image = nonEmpty(pr.image);
        pr.client = clientInfo(req);

        auto outcome = service_->trackOpen(pr);
        HttpResponse r;
        r.setBinary(std::move(outcome.image.bytes), outcome.image.content_type);
        r.headers["Cache-Control"] = "no-cache, no-store, must-revalidate";
        r.headers["Pragma"] = "no-cache";
        r.headers["Expires"] = "0";
        r.headers["Content-Disposition"] = "inline; filename=pixel.gif";
        return r;
    }

    HttpResponse click(const HttpRequest& req) {
        auto email = req.param("email");
        if (!email) return missing("email");
        auto redirect = req.param("redirect");
        if (!redirect) return missing("redirect");

        ClickRequest cr;
        cr.email = *email;
        cr.message_id = req.param("message_id");
        cr.redirect = *redirect;
        cr.client = clientInfo(req);

        auto recorded = service_->trackClick(cr);
        if (!recorded) {
            LOG_WARNING("TrackingAPI", "Redirecting unrecorded click for " + cr.email);
        }
        return HttpResponse::redirect(cr.redirect);
    }

    HttpResponse latest(const HttpRequest& req) {
        auto raw = req.param("n");
        if (!raw) {
            HttpResponse r; r.setJSON(service_->latest().toJson().dump()); return r;
        }
        auto n = string_utils::toInt<long long>(*raw);
        if (!n || *n < 0) {
            return HttpResponse::error(HttpStatus::BAD_REQUEST, "Parameter n must be a non-negative integer");
        }
        HttpResponse r;
        r.setJSON(service_->latest(static_cast<std::size_t>(*n)).toJson().dump());
        return r;
    }

    std::shared_ptr<TrackingService> service_;
    RESTServer server_;
};

} // namespace mailbeacon
#endif
