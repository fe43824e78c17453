#ifndef DISPLAYSNAP_FAILSAFE_HPP
#define DISPLAYSNAP_FAILSAFE_HPP

#include <exception>
#include <string_view>
#include <utility>

namespace displaysnap::failsafe {

    // Runs fn and reports any escaping exception to on_error. Returns fn's exit code, or error_code when it threw.
    template <typename F, typename OnError>
    [[nodiscard]] int guard(F&& fn, OnError&& on_error, std::string_view context, int error_code = 1) noexcept {
        try {
            return std::forward<F>(fn)();
        } catch (const std::exception& ex) {
            try {
                std::forward<OnError>(on_error)(context, ex.what());
            } catch (...) {}
        } catch (...) {
            try {
                std::forward<OnError>(on_error)(context, "unknown exception");
            } catch (...) {}
        }
        return error_code;
    }

} // namespace displaysnap::failsafe

#endif // DISPLAYSNAP_FAILSAFE_HPP
