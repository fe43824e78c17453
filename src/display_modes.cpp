#include "displaysnap/display_modes.hpp"

#include "displaysnap/strings.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace displaysnap {

    namespace {

        constexpr int kExactScore   = 1000;
        constexpr int kRotatedScore = 900;
        constexpr int kRefreshBonus = 100;
        constexpr int kRefreshRange = 50;

        std::optional<double> parse_refresh(std::string_view text) {
            if (text.ends_with("Hz")) {
                text.remove_suffix(2);
            }
            if (text.empty()) {
                return std::nullopt;
            }
            const std::string copy(text);
            char*             end   = nullptr;
            const double      value = std::strtod(copy.c_str(), &end);
            if (end != copy.c_str() + copy.size() || value <= 0.0) {
                return std::nullopt;
            }
            return value;
        }

        int refresh_score(double mode_hz, int target_hz) {
            const auto rounded = static_cast<int>(std::lround(mode_hz));
            if (rounded == target_hz) {
                return kRefreshBonus;
            }
            return std::max(0, kRefreshRange - std::abs(rounded - target_hz));
        }

        long long pixel_count(const DisplayMode& mode) {
            return static_cast<long long>(mode.resolution.width) * mode.resolution.height;
        }

    } // namespace

    std::optional<DisplayMode> parse_display_mode(std::string_view text) {
        text           = trim_view(text);
        const auto at  = text.find('@');
        const auto res = text.substr(0, at);
        const auto x   = res.find('x');
        if (x == std::string_view::npos) {
            return std::nullopt;
        }
        const auto width  = parse_int(res.substr(0, x));
        const auto height = parse_int(res.substr(x + 1));
        if (!width || !height || *width <= 0 || *height <= 0) {
            return std::nullopt;
        }
        DisplayMode mode{.resolution = {.width = *width, .height = *height}, .refresh_hz = 0.0};
        if (at != std::string_view::npos) {
            const auto refresh = parse_refresh(text.substr(at + 1));
            if (!refresh) {
                return std::nullopt;
            }
            mode.refresh_hz = *refresh;
        }
        return mode;
    }

    std::vector<DisplayMode> parse_display_modes(const std::vector<std::string>& entries) {
        std::vector<DisplayMode> modes;
        modes.reserve(entries.size());
        for (const auto& entry : entries) {
            if (auto mode = parse_display_mode(entry)) {
                modes.push_back(*mode);
            }
        }
        return modes;
    }

    std::optional<ModeChoice> pick_display_mode(const std::vector<DisplayMode>& modes, Resolution resolution, int refresh_hz, bool fallback_to_highest) {
        const Resolution           rotated{.width = resolution.height, .height = resolution.width};
        std::optional<DisplayMode> best;
        int                        best_score = -1;
        bool                       best_exact = false;
        std::optional<DisplayMode> highest;

        for (const auto& mode : modes) {
            if (!highest || pixel_count(mode) > pixel_count(*highest) || (pixel_count(mode) == pixel_count(*highest) && mode.refresh_hz > highest->refresh_hz)) {
                highest = mode;
            }
            const bool exact  = mode.resolution == resolution;
            const bool native = mode.resolution == rotated;
            if (!exact && !native) {
                continue;
            }
            const int score = (exact ? kExactScore : kRotatedScore) + refresh_score(mode.refresh_hz, refresh_hz);
            if (score > best_score) {
                best_score = score;
                best       = mode;
                best_exact = exact && std::lround(mode.refresh_hz) == refresh_hz;
            }
        }

        if (best) {
            return ModeChoice{.mode = *best, .exact = best_exact};
        }
        if (fallback_to_highest && highest) {
            return ModeChoice{.mode = *highest, .exact = false};
        }
        return std::nullopt;
    }

    std::string format_refresh(double refresh_hz) {
        std::ostringstream output;
        output << std::fixed << std::setprecision(2) << refresh_hz;
        return output.str();
    }

    std::string format_mode(const DisplayMode& mode) {
        std::ostringstream output;
        output << mode.resolution.width << "x" << mode.resolution.height;
        if (mode.refresh_hz > 0.0) {
            output << "@" << format_refresh(mode.refresh_hz);
        }
        return output.str();
    }

} // namespace displaysnap
