/**
 * @file image_resolver.hpp
 * @brief Local upload / remote proxy / placeholder image selection
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef MAILBEACON_IMAGE_RESOLVER_HPP
#define MAILBEACON_IMAGE_RESOLVER_HPP

#include "event_model.hpp"
#include "event_store.hpp"
#include "http_client.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mailbeacon {

/// 1x1 transparent GIF served when no real image is available
inline constexpr std::array<unsigned char, 41> kPlaceholderGif = {
    0x47, 0x49, 0x46, 0x38, 0x39, 0x61, 0x01, 0x00, 0x01, 0x00, 0x80, 0x00, 0x00, 0xff,
    0xff, 0xff, 0x00, 0xff, 0x21, 0xf9, 0x04, 0x01, 0x00, 0x00, 0x00, 0x00, 0x2c, 0x00,
    0x00, 0x00, 0x00, 0x01, 0x00, 0x01, 0x00, 0x00, 0x02, 0x01, 0x44, 0x00, 0x3b};

inline constexpr const char* kPlaceholderContentType = "image/gif";
inline constexpr const char* kRemoteDefaultContentType = "image/jpeg";

[[nodiscard]] inline std::string placeholderGif() {
    return std::string(reinterpret_cast<const char*>(kPlaceholderGif.data()), kPlaceholderGif.size());
}

/**
 * @struct ResolvedImage
 * @brief Bytes and type to return for a pixel request
 */
struct ResolvedImage {
    std::string bytes;
    std::string content_type;
    ImageSource source = ImageSource::PLACEHOLDER;
    std::optional<std::string> error;   ///< why a real image fell back

    [[nodiscard]] bool isPlaceholder() const noexcept { return source == ImageSource::PLACEHOLDER; }

    [[nodiscard]] static ResolvedImage placeholder(std::optional<std::string> reason = std::nullopt) {
        ResolvedImage img;
        img.bytes = placeholderGif();
        img.content_type = kPlaceholderContentType;
        img.source = ImageSource::PLACEHOLDER;
        img.error = std::move(reason);
        return img;
    }
};

/**
 * @struct ImageResolverStatistics
 * @brief Resolution counters
 */
struct ImageResolverStatistics {
    uint64_t placeholders = 0;
    uint64_t local_served = 0;
    uint64_t local_failed = 0;
    uint64_t remote_served = 0;
    uint64_t remote_failed = 0;
};

/**
 * @class ImageResolver
 * @brief Chooses between an uploaded file, a proxied URL and the placeholder
 *
 * Every local or remote attempt, successful or not, appends one
 * ImageReadEvent. Resolution never fails: any problem yields the
 * placeholder GIF.
 */
class ImageResolver {
public:
    static constexpr std::chrono::seconds kDefaultRemoteTimeout{8};

    ImageResolver(std::filesystem::path uploadDir,
                  std::shared_ptr<EventStore> imageReads,
                  std::shared_ptr<RemoteFetcher> fetcher,
                  std::chrono::milliseconds remoteTimeout = kDefaultRemoteTimeout);

    /**
     * @brief Resolve the image for a pixel request
     * @param imageParam Decoded image reference, absent or empty for none
     */
    [[nodiscard]] ResolvedImage resolve(const std::optional<std::string>& imageParam,
                                        const std::string& email,
                                        const std::optional<std::string>& messageId);

    /// True for references starting with http:// or https:// (any case)
    [[nodiscard]] static bool isRemoteReference(std::string_view ref) noexcept;

    /**
     * @brief Location inside the upload directory for a local reference
     *
     * Only the final path segment of the reference is used.
     * @return nullopt when that segment is empty, "." or ".."
     */
    [[nodiscard]] std::optional<std::filesystem::path> localPath(const std::string& ref) const;

    [[nodiscard]] const std::filesystem::path& uploadDir() const noexcept { return upload_dir_; }

    [[nodiscard]] ImageResolverStatistics statistics() const {
        ImageResolverStatistics s;
        s.placeholders = placeholders_.load();
        s.local_served = local_served_.load();
        s.local_failed = local_failed_.load();
        s.remote_served = remote_served_.load();
        s.remote_failed = remote_failed_.load();
        return s;
    }

private:
    ResolvedImage serveLocal(const std::string& ref, const std::string& email,
                             const std::optional<std::string>& messageId);
    ResolvedImage serveRemote(const std::string& url, const std::string& email,
                              const std::optional<std::string>& messageId);
    void record(const ImageReadEvent& event);

    std::filesystem::path upload_dir_;
    std::shared_ptr<EventStore> image_reads_;
    std::shared_ptr<RemoteFetcher> fetcher_;
    std::chrono::milliseconds remote_timeout_;

    std::atomic<uint64_t> placeholders_{0};
    std::atomic<uint64_t> local_served_{0};
    std::atomic<uint64_t> local_failed_{0};
    std::atomic<uint64_t> remote_served_{0};
    std::atomic<uint64_t> remote_failed_{0};
};

} // namespace mailbeacon
#endif
