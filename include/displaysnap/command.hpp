#ifndef DISPLAYSNAP_COMMAND_HPP
#define DISPLAYSNAP_COMMAND_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace displaysnap {

    enum class CommandKind {
        kHelp,
        kVersion,
        kDisplays,
        kList,
        kShow,
        kSave,
        kPlan,
        kApply,
        kDelete,
        kRename,
        kMove,
        kExport,
        kImport,
    };

    enum class OutputFormat {
        kNormal,
        kJson,
    };

    struct Command {
        CommandKind                kind;
        OutputFormat               format              = OutputFormat::kNormal;
        bool                       verbose             = false;
        std::optional<std::string> config_path         = std::nullopt;
        std::optional<std::string> profile_name        = std::nullopt;
        std::optional<std::string> new_name            = std::nullopt;
        std::optional<std::size_t> from_index          = std::nullopt;
        std::optional<std::size_t> to_index            = std::nullopt;
        std::optional<std::string> file                = std::nullopt;
        std::vector<std::string>   disabled_displays   = {};
        std::optional<bool>        auto_disable_extras = std::nullopt;
    };

    struct ParseError {
        std::string message;
    };

    std::variant<Command, ParseError> parse_command(const std::vector<std::string>& args);
    std::string_view                  usage_text();

} // namespace displaysnap

#endif // DISPLAYSNAP_COMMAND_HPP
