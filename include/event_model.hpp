/**
 * @file event_model.hpp
 * @brief Tracking event and image-read record definitions
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef MAILBEACON_EVENT_MODEL_HPP
#define MAILBEACON_EVENT_MODEL_HPP

#include "beacon_json.hpp"

#include <optional>
#include <string>

namespace mailbeacon {

enum class EventType { PIXEL_OPEN, CLICK };

inline std::string toString(EventType t) {
    switch (t) {
        case EventType::PIXEL_OPEN: return "pixel_open";
        case EventType::CLICK: return "click";
        default: return "unknown";
    }
}

enum class ImageSource { PLACEHOLDER, LOCAL, REMOTE };

inline std::string toString(ImageSource s) {
    switch (s) {
        case ImageSource::PLACEHOLDER: return "placeholder";
        case ImageSource::LOCAL: return "local";
        case ImageSource::REMOTE: return "remote";
        default: return "unknown";
    }
}

/// Request metadata recorded with every tracking event
struct ClientInfo {
    std::optional<std::string> user_agent;
    std::optional<std::string> remote_addr;
};

/**
 * @brief Build a pixel_open event record
 *
 * Absent message_id, image_param and client fields are stored as JSON null.
 * The time field is left for the store to assign.
 */
inline json::JsonValue makePixelOpenEvent(const std::string& email,
                                          const std::optional<std::string>& messageId,
                                          const std::optional<std::string>& imageParam,
                                          const ClientInfo& client) {
    return json::object()
        .add("type", toString(EventType::PIXEL_OPEN))
        .add("email", email)
        .add("message_id", messageId)
        .add("image_param", imageParam)
        .add("user_agent", client.user_agent)
        .add("remote_addr", client.remote_addr)
        .build();
}

inline json::JsonValue makeClickEvent(const std::string& email,
                                      const std::optional<std::string>& messageId,
                                      const std::string& redirect,
                                      const ClientInfo& client) {
    return json::object()
        .add("type", toString(EventType::CLICK))
        .add("email", email)
        .add("message_id", messageId)
        .add("redirect", redirect)
        .add("user_agent", client.user_agent)
        .add("remote_addr", client.remote_addr)
        .build();
}

/**
 * @struct ImageReadEvent
 * @brief One attempt to serve a local or remote image
 */
struct ImageReadEvent {
    std::string email;
    std::optional<std::string> message_id;
    ImageSource served = ImageSource::LOCAL;
    std::string reference;              ///< filename (local) or url (remote)
    std::optional<std::string> error;

    [[nodiscard]] bool failed() const noexcept { return error.has_value(); }

    [[nodiscard]] json::JsonValue toJson() const {
        auto builder = json::object();
        builder.add("email", email)
               .add("message_id", message_id)
               .add("served", toString(served))
               .add(served == ImageSource::REMOTE ? "url" : "filename", reference);
        if (error) builder.add("error", *error);
        return builder.build();
    }
};

} // namespace mailbeacon
#endif
