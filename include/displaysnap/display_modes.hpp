#ifndef DISPLAYSNAP_DISPLAY_MODES_HPP
#define DISPLAYSNAP_DISPLAY_MODES_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "displaysnap/types.hpp"

namespace displaysnap {

    struct ModeChoice {
        DisplayMode mode;
        bool        exact = true;
    };

    // Parses compositor mode strings such as "2560x1440@59.95Hz".
    std::optional<DisplayMode> parse_display_mode(std::string_view text);
    std::vector<DisplayMode>   parse_display_modes(const std::vector<std::string>& entries);

    // Picks the advertised mode closest to the request. Exact resolution beats the rotated resolution, then
    // the refresh rate decides. Returns nullopt when nothing fits and fallback is off.
    std::optional<ModeChoice>  pick_display_mode(const std::vector<DisplayMode>& modes, Resolution resolution, int refresh_hz, bool fallback_to_highest);

    std::string                format_refresh(double refresh_hz);
    std::string                format_mode(const DisplayMode& mode);

} // namespace displaysnap

#endif // DISPLAYSNAP_DISPLAY_MODES_HPP
