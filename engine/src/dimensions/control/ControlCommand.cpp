#include <dimensions/control/ControlCommand.hpp>

namespace dimensions::control
{

ControlCommand parseControlCommand(std::string_view text) noexcept
{
    if (text == "players")
        return ControlCommand::Players;
    if (text == "reload")
        return ControlCommand::Reload;
    if (text == "reloadhandlers")
        return ControlCommand::ReloadHandlers;
    if (text == "reloadcmds")
        return ControlCommand::ReloadCommands;
    if (text == "reloadextensions" || text == "reloadplugins")
        return ControlCommand::ReloadExtensions;
    return ControlCommand::PassThrough;
}

std::string_view controlCommandName(ControlCommand cmd) noexcept
{
    switch (cmd)
    {
    case ControlCommand::Players:
        return "players";
    case ControlCommand::Reload:
        return "reload";
    case ControlCommand::ReloadHandlers:
        return "reloadhandlers";
    case ControlCommand::ReloadCommands:
        return "reloadcmds";
    case ControlCommand::ReloadExtensions:
        return "reloadextensions";
    case ControlCommand::PassThrough:
        return "passthrough";
    }
    return "unknown";
}

} // namespace dimensions::control
