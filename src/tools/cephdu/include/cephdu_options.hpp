#pragma once

#include "cephdu/options.hpp"
#include "metadata_probe.hpp"
#include "sort_engine.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace cephdu
{

inline constexpr const char *kOptionDefaultPath = "defaultPath";
inline constexpr const char *kOptionSortField = "sortField";
inline constexpr const char *kOptionShowOwner = "showOwner";
inline constexpr const char *kOptionGaugeWidth = "gaugeWidth";
inline constexpr const char *kOptionPageStep = "pageStep";
inline constexpr const char *kOptionRentriesAttribute = "rentriesAttribute";
inline constexpr const char *kOptionRbytesAttribute = "rbytesAttribute";
inline constexpr const char *kOptionRctimeAttribute = "rctimeAttribute";
inline constexpr const char *kOptionLogLevel = "logLevel";
inline constexpr const char *kOptionLogFile = "logFile";

inline constexpr int kMinGaugeWidth = 6;
inline constexpr int kMaxGaugeWidth = 60;
inline constexpr const char *kCephUsersRoot = "/mnt/ceph/users";

void registerCephDuOptions(config::OptionRegistry &registry);

struct CephDuOptions
{
    std::string defaultPath;
    SortField sortField = SortField::Size;
    bool showOwner = false;
    int gaugeWidth = 20;
    std::size_t pageStep = 10;
    RecursiveAttributeNames attributes;
    std::string logLevel = "warn";
    std::string logFile;
};

CephDuOptions optionsFromRegistry(const config::OptionRegistry &registry);

std::optional<SortField> sortFieldFromString(const std::string &name);
const char *sortFieldName(SortField field) noexcept;

// `defaultPath` when set, otherwise /mnt/ceph/users/$USER.
std::filesystem::path startupPath(const CephDuOptions &options);

} // namespace cephdu
