#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include <spdlog/common.h>

namespace cephdu::logging
{

struct LogSettings
{
    std::string level = "warn";
    // Empty selects defaultLogPath().
    std::filesystem::path file;
};

spdlog::level::level_enum parseLevel(std::string_view name, spdlog::level::level_enum fallback) noexcept;

std::filesystem::path defaultLogPath();

// Logger used until initialize() runs: warnings and above go to stderr as
// "cephdu: <message>", before the UI owns the terminal.
void installStartupLogger();

// Installs the process default logger. The terminal belongs to the UI, so
// records only ever go to a file; when the file cannot be opened, or the level
// is "off", a null sink is installed instead. Returns false in that case.
bool initialize(const LogSettings &settings);

} // namespace cephdu::logging
