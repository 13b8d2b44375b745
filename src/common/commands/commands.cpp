#include "cephdu/commands.hpp"

namespace cephdu::commands
{

const char *commandHint(std::uint16_t command) noexcept
{
    switch (command)
    {
    case OpenDirectory:
        return "Browse another directory";
    case ParentDirectory:
        return "Go to the parent directory (Backspace, h)";
    case OriginalDirectory:
        return "Return to the starting directory (Space)";
    case Reload:
        return "Re-read the current directory";
    case EnterDirectory:
        return "Open the selected directory (Enter)";
    case About:
        return "Show version information";
    case HelpKeys:
        return "List key bindings (?)";
    case SortName:
        return "Sort by name, again to reverse (n)";
    case SortSize:
        return "Sort by recursive size, again to reverse (s)";
    case SortEntries:
        return "Sort by recursive entry count, again to reverse (c)";
    case SortOwner:
        return "Sort by owner and group, again to reverse (U)";
    case SortChangeTime:
        return "Sort by recursive change time, again to reverse (t)";
    case ToggleOwner:
        return "Show or hide the owner:group column (u)";
    case OptionLoad:
        return "Load options from a JSON file";
    case OptionSave:
        return "Save options to a JSON file";
    case OptionSaveDefaults:
        return "Save options as the startup defaults";
    default:
        return nullptr;
    }
}

} // namespace cephdu::commands
