#include "cephdu/logging.hpp"

#include "cephdu/options.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <system_error>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace cephdu::logging
{
namespace
{

constexpr const char *kLoggerName = "cephdu";

void installNullLogger()
{
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, std::make_shared<spdlog::sinks::null_sink_mt>());
    logger->set_level(spdlog::level::off);
    spdlog::set_default_logger(std::move(logger));
}

} // namespace

spdlog::level::level_enum parseLevel(std::string_view name, spdlog::level::level_enum fallback) noexcept
{
    std::string lower;
    lower.reserve(name.size());
    for (char ch : name)
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    if (lower == "warning")
        lower = "warn";
    if (lower == "error")
        lower = "err";
    if (lower == "crit")
        lower = "critical";

    static constexpr std::pair<const char *, spdlog::level::level_enum> kLevels[] = {
        {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug}, {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},   {"err", spdlog::level::err},     {"critical", spdlog::level::critical},
        {"off", spdlog::level::off}};
    for (const auto &[levelName, level] : kLevels)
    {
        if (lower == levelName)
            return level;
    }
    return fallback;
}

void installStartupLogger()
{
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, std::make_shared<spdlog::sinks::stderr_sink_mt>());
    logger->set_level(spdlog::level::warn);
    logger->set_pattern("cephdu: %v");
    spdlog::set_default_logger(std::move(logger));
}

std::filesystem::path defaultLogPath()
{
    return config::OptionRegistry::configRoot() / "cephdu.log";
}

bool initialize(const LogSettings &settings)
{
    const auto level = parseLevel(settings.level, spdlog::level::warn);
    if (level == spdlog::level::off)
    {
        installNullLogger();
        return false;
    }

    std::filesystem::path path = settings.file.empty() ? defaultLogPath() : settings.file;
    std::error_code ec;
    if (path.has_parent_path())
        std::filesystem::create_directories(path.parent_path(), ec);

    try
    {
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string());
        auto logger = std::make_shared<spdlog::logger>(kLoggerName, std::move(sink));
        logger->set_level(level);
        logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%l] %v");
        logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(std::move(logger));
    }
    catch (const spdlog::spdlog_ex &)
    {
        installNullLogger();
        return false;
    }

    spdlog::info("logging to '{}' at level {}", path.string(), spdlog::level::to_string_view(level));
    return true;
}

} // namespace cephdu::logging
