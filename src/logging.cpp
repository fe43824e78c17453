#include "displaysnap/logging.hpp"

#include <string>

namespace displaysnap {

    namespace {

        constexpr std::string_view kPrefix      = "[displaysnap]";
        constexpr std::string_view kDebugPrefix = "[displaysnap][debug]";

        DebugLogSink               debug_sink = nullptr;
        ErrorLogSink               error_sink = nullptr;

        std::string_view           basename(std::string_view path) {
            const auto slash = path.find_last_of("/\\");
            if (slash == std::string_view::npos) {
                return path;
            }
            return path.substr(slash + 1);
        }

        std::string format_entry(std::string_view prefix, std::string_view context, std::string_view message) {
            std::string text;
            text.reserve(prefix.size() + context.size() + message.size() + 8);
            text.append(prefix);
            text.push_back(' ');
            if (!context.empty()) {
                text.append(context);
                text.append(": ");
            }
            text.append(message);
            return text;
        }

        std::string format_entry_with_location(std::string_view prefix, std::string_view context, std::string_view message, const std::source_location& location) {
            auto text = format_entry(prefix, context, message);
            text.append(" @");
            text.append(basename(location.file_name()));
            text.push_back(':');
            text.append(std::to_string(location.line()));
            const std::string_view function = location.function_name();
            if (!function.empty()) {
                text.push_back(' ');
                text.append(function);
            }
            return text;
        }

    } // namespace

    std::string format_log_entry(std::string_view context, std::string_view message) {
        return format_entry(kPrefix, context, message);
    }

    void set_debug_log_sink(DebugLogSink sink) {
        debug_sink = sink;
    }

    void clear_debug_log_sink() {
        debug_sink = nullptr;
    }

    void debug_log(bool enabled, std::string_view context, std::string_view message, const std::source_location& location) {
        if (!enabled || !debug_sink) {
            return;
        }
        debug_sink(format_entry_with_location(kDebugPrefix, context, message, location));
    }

    void set_error_log_sink(ErrorLogSink sink) {
        error_sink = sink;
    }

    void clear_error_log_sink() {
        error_sink = nullptr;
    }

    void error_log(std::string_view context, std::string_view message, const std::source_location& location) {
        if (!error_sink) {
            return;
        }
        error_sink(format_entry_with_location(kPrefix, context, message, location));
    }

} // namespace displaysnap
