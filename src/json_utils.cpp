#include "displaysnap/json_utils.hpp"

namespace displaysnap {

    namespace {

        std::optional<std::string> non_empty_string(const nlohmann::json& value) {
            if (!value.is_string()) {
                return std::nullopt;
            }
            auto str = value.get<std::string>();
            if (str.empty()) {
                return std::nullopt;
            }
            return str;
        }

    } // namespace

    std::optional<std::string> optional_string_field(const nlohmann::json& obj, const char* key) {
        if (!obj.contains(key)) {
            return std::nullopt;
        }
        return non_empty_string(obj.at(key));
    }

    std::optional<int> optional_int_field(const nlohmann::json& obj, const char* key) {
        if (!obj.contains(key) || !obj.at(key).is_number_integer()) {
            return std::nullopt;
        }
        return obj.at(key).get<int>();
    }

    std::optional<double> optional_number_field(const nlohmann::json& obj, const char* key) {
        if (!obj.contains(key) || !obj.at(key).is_number()) {
            return std::nullopt;
        }
        return obj.at(key).get<double>();
    }

    std::optional<bool> optional_bool_field(const nlohmann::json& obj, const char* key) {
        if (!obj.contains(key) || !obj.at(key).is_boolean()) {
            return std::nullopt;
        }
        return obj.at(key).get<bool>();
    }

}
