#ifndef DISPLAYSNAP_ENUMERATOR_HPP
#define DISPLAYSNAP_ENUMERATOR_HPP

#include <expected>
#include <string>
#include <vector>

#include "displaysnap/display_backend.hpp"
#include "displaysnap/types.hpp"

namespace displaysnap {

    struct EnumerationError {
        std::string message;
    };

    using LiveState = std::vector<DisplayState>;

    // Converts one raw backend listing into live state. Ordinals follow the listing order.
    std::expected<LiveState, EnumerationError> normalize_displays(const std::vector<RawDisplay>& raw);

    class DisplayEnumerator {
      public:
        explicit DisplayEnumerator(DisplayBackend& backend);
        virtual ~DisplayEnumerator() = default;

        virtual std::expected<LiveState, EnumerationError> enumerate();

      private:
        DisplayBackend& backend_;
    };

} // namespace displaysnap

#endif // DISPLAYSNAP_ENUMERATOR_HPP
