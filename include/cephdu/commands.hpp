#pragma once

#include <cstdint>

namespace cephdu::commands
{

inline constexpr std::uint16_t OpenDirectory = 2001;
inline constexpr std::uint16_t ParentDirectory = 2002;
inline constexpr std::uint16_t OriginalDirectory = 2003;
inline constexpr std::uint16_t Reload = 2004;
inline constexpr std::uint16_t EnterDirectory = 2005;

inline constexpr std::uint16_t About = 2100;
inline constexpr std::uint16_t HelpKeys = 2101;

inline constexpr std::uint16_t SortName = 2300;
inline constexpr std::uint16_t SortSize = 2301;
inline constexpr std::uint16_t SortEntries = 2302;
inline constexpr std::uint16_t SortOwner = 2303;
inline constexpr std::uint16_t SortChangeTime = 2304;

inline constexpr std::uint16_t ToggleOwner = 2400;
inline constexpr std::uint16_t OptionLoad = 2409;
inline constexpr std::uint16_t OptionSave = 2410;
inline constexpr std::uint16_t OptionSaveDefaults = 2411;

// Short description shown on the status line while a menu item is focused.
const char *commandHint(std::uint16_t command) noexcept;

} // namespace cephdu::commands
