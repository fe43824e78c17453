#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace displaysnap {

    std::optional<std::string> optional_string_field(const nlohmann::json& obj, const char* key);
    std::optional<int>         optional_int_field(const nlohmann::json& obj, const char* key);
    std::optional<double>      optional_number_field(const nlohmann::json& obj, const char* key);
    std::optional<bool>        optional_bool_field(const nlohmann::json& obj, const char* key);

}
