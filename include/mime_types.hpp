/**
 * @file mime_types.hpp
 * @brief File extension to Content-Type mapping
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef MAILBEACON_MIME_TYPES_HPP
#define MAILBEACON_MIME_TYPES_HPP

#include "beacon_string_utils.hpp"

#include <filesystem>
#include <map>
#include <string>

namespace mailbeacon {
namespace mime {

inline constexpr const char* kDefaultType = "application/octet-stream";

inline const std::map<std::string, std::string>& extensionTable() {
    static const std::map<std::string, std::string> table = {
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".jpe", "image/jpeg"},
        {".gif", "image/gif"},
        {".webp", "image/webp"},
        {".bmp", "image/bmp"},
        {".ico", "image/vnd.microsoft.icon"},
        {".svg", "image/svg+xml"},
        {".tif", "image/tiff"},
        {".tiff", "image/tiff"},
        {".avif", "image/avif"},
        {".txt", "text/plain"},
        {".html", "text/html"},
        {".htm", "text/html"},
        {".css", "text/css"},
        {".js", "text/javascript"},
        {".json", "application/json"},
        {".pdf", "application/pdf"},
    };
    return table;
}

/**
 * @brief Guess a Content-Type from a file name's extension (case-insensitive)
 * @return Known type, or application/octet-stream
 */
[[nodiscard]] inline std::string guessType(const std::filesystem::path& file) {
    auto ext = string_utils::toLower(file.extension().string());
    const auto& table = extensionTable();
    auto it = table.find(ext);
    return it != table.end() ? it->second : kDefaultType;
}

} // namespace mime
} // namespace mailbeacon
#endif
