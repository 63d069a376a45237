/**
 * @file query_facade.cpp
 * @brief Query facade implementation
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "query_facade.hpp"
#include "event_model.hpp"

namespace mailbeacon {

QueryFacade::QueryFacade(std::shared_ptr<const EventStore> events,
                         std::shared_ptr<const EventStore> imageReads)
    : events_(std::move(events)), image_reads_(std::move(imageReads)) {}

IdentityView QueryFacade::byIdentity(const std::string& email) const {
    IdentityView view;
    const auto openType = toString(EventType::PIXEL_OPEN);
    const auto clickType = toString(EventType::CLICK);

    for (auto& record : events_->readAll()) {
        if (record.getString("email") != email) continue;
        auto type = record.getString("type");
        if (type == openType) {
            view.opens.push_back(std::move(record));
        } else if (type == clickType) {
            view.clicks.push_back(std::move(record));
        }
    }
    for (auto& record : image_reads_->readAll()) {
        if (record.getString("email") == email) {
            view.img_reads.push_back(std::move(record));
        }
    }
    return view;
}

LatestView QueryFacade::latest(std::size_t n) const {
    LatestView view;
    view.events = newest(*events_, n);
    view.img_reads = newest(*image_reads_, n);
    return view;
}

json::JsonArray QueryFacade::newest(const EventStore& store, std::size_t n) {
    json::JsonArray out;
    if (n == 0) return out;
    store.scanReverse([&](const json::JsonValue& record) {
        out.push_back(record);
        return out.size() < n;
    });
    return out;
}

} // namespace mailbeacon
