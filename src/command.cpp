#include "displaysnap/command.hpp"

#include "displaysnap/strings.hpp"

namespace displaysnap {

    namespace {

        constexpr std::string_view kUsage = "usage: displaysnap [--json] [--verbose] [--config <file>] <command>\n"
                                            "\n"
                                            "commands:\n"
                                            "  displays                                   list connected displays\n"
                                            "  list                                       list saved profiles\n"
                                            "  show <name>                                show a saved profile\n"
                                            "  save <name> [--disable <display>]...       capture the current layout\n"
                                            "  plan <name> [--disable-extras|--keep-extras]\n"
                                            "  apply <name> [--disable-extras|--keep-extras]\n"
                                            "  delete <name>\n"
                                            "  rename <old> <new>\n"
                                            "  move <from> <to>                           swap two profile positions\n"
                                            "  export <file>\n"
                                            "  import <file>\n"
                                            "  version\n";

        std::optional<std::size_t> parse_position(std::string_view value) {
            const auto parsed = parse_int(value);
            if (!parsed || *parsed < 1) {
                return std::nullopt;
            }
            return static_cast<std::size_t>(*parsed - 1);
        }

        std::optional<CommandKind> command_kind(std::string_view name) {
            if (name == "help") {
                return CommandKind::kHelp;
            }
            if (name == "version") {
                return CommandKind::kVersion;
            }
            if (name == "displays") {
                return CommandKind::kDisplays;
            }
            if (name == "list") {
                return CommandKind::kList;
            }
            if (name == "show") {
                return CommandKind::kShow;
            }
            if (name == "save") {
                return CommandKind::kSave;
            }
            if (name == "plan") {
                return CommandKind::kPlan;
            }
            if (name == "apply") {
                return CommandKind::kApply;
            }
            if (name == "delete") {
                return CommandKind::kDelete;
            }
            if (name == "rename") {
                return CommandKind::kRename;
            }
            if (name == "move") {
                return CommandKind::kMove;
            }
            if (name == "export") {
                return CommandKind::kExport;
            }
            if (name == "import") {
                return CommandKind::kImport;
            }
            return std::nullopt;
        }

        size_t expected_positionals(CommandKind kind) {
            switch (kind) {
                case CommandKind::kShow:
                case CommandKind::kSave:
                case CommandKind::kPlan:
                case CommandKind::kApply:
                case CommandKind::kDelete:
                case CommandKind::kExport:
                case CommandKind::kImport: return 1;
                case CommandKind::kRename:
                case CommandKind::kMove: return 2;
                default: return 0;
            }
        }

    } // namespace

    std::string_view usage_text() {
        return kUsage;
    }

    std::variant<Command, ParseError> parse_command(const std::vector<std::string>& args) {
        Command                    command{.kind = CommandKind::kHelp};
        std::optional<std::string> name;
        std::vector<std::string>   positionals;

        for (size_t i = 0; i < args.size(); ++i) {
            const auto& token = args[i];
            if (token == "--json") {
                command.format = OutputFormat::kJson;
                continue;
            }
            if (token == "--verbose" || token == "-v") {
                command.verbose = true;
                continue;
            }
            if (token == "--help" || token == "-h") {
                return Command{.kind = CommandKind::kHelp};
            }
            if (token == "--config") {
                if (i + 1 >= args.size()) {
                    return ParseError{"missing value for --config"};
                }
                command.config_path = args[++i];
                continue;
            }
            if (token == "--disable") {
                if (i + 1 >= args.size()) {
                    return ParseError{"missing display for --disable"};
                }
                command.disabled_displays.push_back(args[++i]);
                continue;
            }
            if (token == "--disable-extras" || token == "--keep-extras") {
                const bool value = token == "--disable-extras";
                if (command.auto_disable_extras && *command.auto_disable_extras != value) {
                    return ParseError{"--disable-extras and --keep-extras conflict"};
                }
                command.auto_disable_extras = value;
                continue;
            }
            if (token.size() > 1 && token.starts_with("-")) {
                return ParseError{"unknown option " + token};
            }
            if (!name) {
                name = token;
                continue;
            }
            positionals.push_back(token);
        }

        if (!name) {
            return ParseError{"missing command"};
        }
        const auto kind = command_kind(*name);
        if (!kind) {
            return ParseError{"unknown command " + *name};
        }
        command.kind = *kind;

        const auto wanted = expected_positionals(command.kind);
        if (positionals.size() < wanted) {
            return ParseError{"missing arguments for " + *name};
        }
        if (positionals.size() > wanted) {
            return ParseError{"unexpected extra arguments"};
        }
        if (!command.disabled_displays.empty() && command.kind != CommandKind::kSave) {
            return ParseError{"--disable only applies to save"};
        }
        if (command.auto_disable_extras && command.kind != CommandKind::kPlan && command.kind != CommandKind::kApply) {
            return ParseError{"--disable-extras and --keep-extras only apply to plan and apply"};
        }

        switch (command.kind) {
            case CommandKind::kExport:
            case CommandKind::kImport: command.file = positionals[0]; break;
            case CommandKind::kRename:
                command.profile_name = positionals[0];
                command.new_name     = positionals[1];
                if (trim_view(*command.new_name).empty()) {
                    return ParseError{"new profile name is empty"};
                }
                break;
            case CommandKind::kMove:
                command.from_index = parse_position(positionals[0]);
                command.to_index   = parse_position(positionals[1]);
                if (!command.from_index || !command.to_index) {
                    return ParseError{"positions must be numbers starting at 1"};
                }
                break;
            default:
                if (wanted == 1) {
                    command.profile_name = positionals[0];
                }
                break;
        }
        return command;
    }

} // namespace displaysnap
