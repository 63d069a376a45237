/**
 * @file image_resolver.cpp
 * @brief Image resolver implementation
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "image_resolver.hpp"
#include "beacon_logger.hpp"
#include "beacon_string_utils.hpp"
#include "mime_types.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace mailbeacon {

ImageResolver::ImageResolver(std::filesystem::path uploadDir,
                             std::shared_ptr<EventStore> imageReads,
                             std::shared_ptr<RemoteFetcher> fetcher,
                             std::chrono::milliseconds remoteTimeout)
    : upload_dir_(std::move(uploadDir)), image_reads_(std::move(imageReads)),
      fetcher_(std::move(fetcher)), remote_timeout_(remoteTimeout) {}

bool ImageResolver::isRemoteReference(std::string_view ref) noexcept {
    return string_utils::startsWithIgnoreCase(ref, "http://") ||
           string_utils::startsWithIgnoreCase(ref, "https://");
}

std::optional<std::filesystem::path> ImageResolver::localPath(const std::string& ref) const {
    std::string name = string_utils::lastPathSegment(ref);
    if (name.empty() || name == "." || name == "..") {
        return std::nullopt;
    }
    return upload_dir_ / name;
}

ResolvedImage ImageResolver::resolve(const std::optional<std::string>& imageParam,
                                     const std::string& email,
                                     const std::optional<std::string>& messageId) {
    if (!imageParam || imageParam->empty()) {
        ++placeholders_;
        return ResolvedImage::placeholder();
    }
    if (isRemoteReference(*imageParam)) {
        return serveRemote(*imageParam, email, messageId);
    }
    return serveLocal(*imageParam, email, messageId);
}

ResolvedImage ImageResolver::serveLocal(const std::string& ref, const std::string& email,
                                        const std::optional<std::string>& messageId) {
    ImageReadEvent event;
    event.email = email;
    event.message_id = messageId;
    event.served = ImageSource::LOCAL;
    event.reference = ref;

    auto path = localPath(ref);
    std::error_code ec;
    if (!path || !std::filesystem::is_regular_file(*path, ec)) {
        event.error = "File not found: " + (path ? path->string() : ref);
    } else {
        std::ifstream in(*path, std::ios::binary);
        std::ostringstream content;
        if (in) content << in.rdbuf();
        if (!in) {
            event.error = "Cannot read file: " + path->string();
        } else {
            record(event);
            ++local_served_;
            ResolvedImage img;
            img.bytes = content.str();
            img.content_type = mime::guessType(*path);
            img.source = ImageSource::LOCAL;
            return img;
        }
    }

    record(event);
    ++local_failed_;
    ++placeholders_;
    LOG_WARNING("ImageResolver", "Local image fallback for " + email + ": " + *event.error);
    return ResolvedImage::placeholder(event.error);
}

ResolvedImage ImageResolver::serveRemote(const std::string& url, const std::string& email,
                                         const std::optional<std::string>& messageId) {
    ImageReadEvent event;
    event.email = email;
    event.message_id = messageId;
    event.served = ImageSource::REMOTE;
    event.reference = url;

    Result<FetchResponse> fetched = fetcher_
        ? fetcher_->fetch(url, remote_timeout_)
        : Err<FetchResponse>(ErrorCode::NOT_SUPPORTED, "No remote fetcher configured");

    if (fetched) {
        record(event);
        ++remote_served_;
        ResolvedImage img;
        img.content_type = fetched->header("content-type").value_or(kRemoteDefaultContentType);
        img.bytes = std::move(fetched->body);
        img.source = ImageSource::REMOTE;
        return img;
    }

    event.error = fetched.error().toString();
    record(event);
    ++remote_failed_;
    ++placeholders_;
    LOG_WARNING("ImageResolver", "Remote image fallback for " + url + ": " + *event.error);
    return ResolvedImage::placeholder(event.error);
}

void ImageResolver::record(const ImageReadEvent& event) {
    if (!image_reads_) return;
    auto appended = image_reads_->append(event.toJson());
    if (!appended) {
        LOG_ERROR("ImageResolver", "Failed to record image read: " + appended.error().toString());
    }
}

} // namespace mailbeacon
