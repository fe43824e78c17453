#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace displaysnap {

    std::string_view                    trim_view(std::string_view value);
    std::string                         trim_copy(std::string_view value);
    std::vector<std::string>            split_tokens(std::string_view value, char delim);
    std::pair<std::string, std::string> split_key_value(std::string_view line, char delim);
    std::optional<bool>                 parse_bool(std::string_view value);
    std::optional<int>                  parse_int(std::string_view value);

}
