/**
 * @file beacon_ini.hpp
 * @brief INI configuration file parsing for MailBeacon
 * @author Bennie Shearer
 * @version 1.0.0
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * Format:
 *   ; or # starts a comment line
 *   [section]
 *   key = value          surrounding quotes on the value are stripped
 * Keys before the first header belong to the unnamed section "". A repeated
 * key keeps its last value. Lines that are none of the above are recorded
 * by number so callers can warn about them.
 */

#ifndef MAILBEACON_INI_HPP
#define MAILBEACON_INI_HPP

#include "beacon_string_utils.hpp"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace mailbeacon {
namespace ini {

class IniFile {
public:
    using Section = std::map<std::string, std::string>;

    [[nodiscard]] static IniFile parse(std::string_view text) {
        IniFile file;
        Section* current = &file.sections_[""];
        std::size_t lineNo = 0;

        std::istringstream in{std::string(text)};
        std::string raw;
        while (std::getline(in, raw)) {
            ++lineNo;
            std::string line = string_utils::trim(raw);
            if (line.empty() || line[0] == ';' || line[0] == '#') continue;

            if (line.front() == '[') {
                std::string name = line.back() == ']'
                    ? string_utils::trim(std::string_view(line).substr(1, line.size() - 2)) : std::string();
                if (name.empty()) {
                    file.invalid_lines_.push_back(lineNo);
                } else {
                    current = &file.sections_[name];
                }
                continue;
            }

            auto eq = line.find('=');
            std::string key = eq == std::string::npos ? std::string()
                : string_utils::trim(std::string_view(line).substr(0, eq));
            if (key.empty()) {
                file.invalid_lines_.push_back(lineNo);
                continue;
            }
            (*current)[key] = unquote(string_utils::trim(std::string_view(line).substr(eq + 1)));
        }
        return file;
    }

    /// nullopt when the file cannot be opened
    [[nodiscard]] static std::optional<IniFile> load(const std::filesystem::path& path) {
        std::ifstream in(path);
        if (!in) return std::nullopt;
        std::ostringstream text;
        text << in.rdbuf();
        return parse(text.str());
    }

    [[nodiscard]] std::optional<std::string> get(const std::string& section, const std::string& key) const {
        auto sec = sections_.find(section);
        if (sec == sections_.end()) return std::nullopt;
        auto it = sec->second.find(key);
        if (it == sec->second.end()) return std::nullopt;
        return it->second;
    }

    [[nodiscard]] bool hasSection(const std::string& name) const { return sections_.count(name) != 0; }

    /// All sections by name, including the unnamed one
    [[nodiscard]] const std::map<std::string, Section>& sections() const noexcept { return sections_; }

    /// 1-based numbers of lines that were neither comment, header nor key=value
    [[nodiscard]] const std::vector<std::size_t>& invalidLines() const noexcept { return invalid_lines_; }

private:
    static std::string unquote(std::string value) {
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
            value.back() == value.front()) {
            return value.substr(1, value.size() - 2);
        }
        return value;
    }

    std::map<std::string, Section> sections_;
    std::vector<std::size_t> invalid_lines_;
};

} // namespace ini
} // namespace mailbeacon

#endif // MAILBEACON_INI_HPP
