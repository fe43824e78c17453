#ifndef DISPLAYSNAP_LOGGING_HPP
#define DISPLAYSNAP_LOGGING_HPP

#include <source_location>
#include <string>
#include <string_view>

namespace displaysnap {

    using DebugLogSink = void (*)(std::string_view message);
    using ErrorLogSink = void (*)(std::string_view message);

    // "[displaysnap] <context>: <message>"; an empty context drops the "<context>: " part.
    std::string format_log_entry(std::string_view context, std::string_view message);

    void        set_debug_log_sink(DebugLogSink sink);
    void        clear_debug_log_sink();
    // Both loggers append " @<file>:<line> <function>" of the caller and are silent until a sink is set.
    void        debug_log(bool enabled, std::string_view context, std::string_view message, const std::source_location& location = std::source_location::current());

    void        set_error_log_sink(ErrorLogSink sink);
    void        clear_error_log_sink();
    void        error_log(std::string_view context, std::string_view message, const std::source_location& location = std::source_location::current());

} // namespace displaysnap

#endif // DISPLAYSNAP_LOGGING_HPP
