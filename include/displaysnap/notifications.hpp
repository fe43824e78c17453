#ifndef DISPLAYSNAP_NOTIFICATIONS_HPP
#define DISPLAYSNAP_NOTIFICATIONS_HPP

#include <cstddef>
#include <string>
#include <string_view>

#include "displaysnap/applier.hpp"

namespace displaysnap {

    enum class ProfileAction {
        kSave,
        kApply,
    };

    struct ApplySummary {
        std::size_t applied  = 0;
        std::size_t disabled = 0;
        std::size_t skipped  = 0;
        std::size_t failed   = 0;
    };

    // Desktop popup for save and apply outcomes. Delivery is best-effort.
    class Notifier {
      public:
        virtual ~Notifier()                                      = default;
        virtual void notify(bool success, std::string_view text) = 0;
    };

    ApplySummary summarize_report(const ApplyReport& report);

    std::string  profile_notification_text(ProfileAction action, bool success, std::string_view profile, std::string_view detail);
    std::string  apply_headline(const ApplyReport& report);

} // namespace displaysnap

#endif // DISPLAYSNAP_NOTIFICATIONS_HPP
