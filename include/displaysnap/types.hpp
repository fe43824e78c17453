#ifndef DISPLAYSNAP_TYPES_HPP
#define DISPLAYSNAP_TYPES_HPP

#include <optional>
#include <string>

namespace displaysnap {

    struct Resolution {
        int  width  = 0;
        int  height = 0;

        bool operator==(const Resolution&) const = default;
    };

    struct Position {
        int  x = 0;
        int  y = 0;

        bool operator==(const Position&) const = default;
    };

    // Connector path plus the display's index in the enumeration that produced it.
    struct DisplayIdentity {
        std::string path;
        int         ordinal = -1;

        bool        operator==(const DisplayIdentity&) const = default;
    };

    // Resolution is in mode pixels. Position is in layout coordinates, where the display covers
    // resolution / scale, with width and height swapped for transforms that rotate by 90 or 270 degrees.
    struct DisplayState {
        DisplayIdentity            identity;
        bool                       enabled     = false;
        Resolution                 resolution  = {};
        int                        refresh_hz  = 0;
        Position                   position    = {};
        bool                       is_primary  = false;
        std::optional<std::string> description = std::nullopt;
        double                     scale       = 1.0;
        int                        transform   = 0;

        bool                       operator==(const DisplayState&) const = default;
    };

    struct DisplayMode {
        Resolution resolution;
        double     refresh_hz = 0.0;
    };

} // namespace displaysnap

#endif // DISPLAYSNAP_TYPES_HPP
