#include "displaysnap/strings.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace displaysnap {

    std::string_view trim_view(std::string_view value) {
        size_t start = 0;
        while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) {
            ++start;
        }
        size_t end = value.size();
        while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
            --end;
        }
        return value.substr(start, end - start);
    }

    std::string trim_copy(std::string_view value) {
        return std::string(trim_view(value));
    }

    std::vector<std::string> split_tokens(std::string_view value, char delim) {
        std::vector<std::string> tokens;
        size_t                   start = 0;
        while (start <= value.size()) {
            const auto end  = value.find(delim, start);
            const auto part = end == std::string_view::npos ? value.substr(start) : value.substr(start, end - start);
            tokens.emplace_back(trim_copy(part));
            if (end == std::string_view::npos) {
                break;
            }
            start = end + 1;
        }
        return tokens;
    }

    std::pair<std::string, std::string> split_key_value(std::string_view line, char delim) {
        const auto split = line.find(delim);
        if (split == std::string_view::npos) {
            throw std::runtime_error(std::string("entry missing '") + delim + "'");
        }
        auto key   = trim_copy(line.substr(0, split));
        auto value = trim_copy(line.substr(split + 1));
        if (key.empty() || value.empty()) {
            throw std::runtime_error("entry missing key/value");
        }
        return {std::move(key), std::move(value)};
    }

    std::optional<bool> parse_bool(std::string_view value) {
        auto trimmed = trim_copy(value);
        if (trimmed.empty()) {
            return std::nullopt;
        }
        std::transform(trimmed.begin(), trimmed.end(), trimmed.begin(), [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        if (trimmed == "true" || trimmed == "1" || trimmed == "yes" || trimmed == "on") {
            return true;
        }
        if (trimmed == "false" || trimmed == "0" || trimmed == "no" || trimmed == "off") {
            return false;
        }
        return std::nullopt;
    }

    std::optional<int> parse_int(std::string_view value) {
        const auto trimmed = trim_copy(value);
        if (trimmed.empty()) {
            return std::nullopt;
        }
        try {
            size_t index  = 0;
            int    parsed = std::stoi(trimmed, &index, 10);
            if (index != trimmed.size()) {
                return std::nullopt;
            }
            return parsed;
        } catch (const std::exception&) { return std::nullopt; }
    }

}
