#include "cephdu_options.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <spdlog/spdlog.h>

namespace cephdu
{
namespace
{

std::string lowercase(const std::string &value)
{
    std::string lowered;
    lowered.reserve(value.size());
    for (char ch : value)
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    return lowered;
}

} // namespace

void registerCephDuOptions(config::OptionRegistry &registry)
{
    using config::OptionKind;
    using config::OptionValue;

    registry.registerOption({kOptionDefaultPath, OptionKind::String, OptionValue(std::string()),
                             "Directory opened when none is given. Empty means /mnt/ceph/users/$USER."});
    registry.registerOption({kOptionSortField, OptionKind::String, OptionValue("size"),
                             "Initial sort field: name, size, entries, owner or ctime."});
    registry.registerOption({kOptionShowOwner, OptionKind::Boolean, OptionValue(false), "Show the owner:group column."});
    registry.registerOption({kOptionGaugeWidth, OptionKind::Integer, OptionValue(std::int64_t{20}),
                             "Width of each usage gauge in cells."});
    registry.registerOption({kOptionPageStep, OptionKind::Integer, OptionValue(std::int64_t{10}),
                             "Rows moved by Page Up and Page Down."});
    registry.registerOption({kOptionRentriesAttribute, OptionKind::String, OptionValue("ceph.dir.rentries"),
                             "Extended attribute holding the recursive entry count."});
    registry.registerOption({kOptionRbytesAttribute, OptionKind::String, OptionValue("ceph.dir.rbytes"),
                             "Extended attribute holding the recursive byte size."});
    registry.registerOption({kOptionRctimeAttribute, OptionKind::String, OptionValue("ceph.dir.rctime"),
                             "Extended attribute holding the recursive change time."});
    registry.registerOption({kOptionLogLevel, OptionKind::String, OptionValue("warn"),
                             "trace, debug, info, warn, error, critical or off."});
    registry.registerOption({kOptionLogFile, OptionKind::String, OptionValue(std::string()),
                             "Log destination. Empty means cephdu.log in the configuration directory."});
}

CephDuOptions optionsFromRegistry(const config::OptionRegistry &registry)
{
    CephDuOptions options;
    options.defaultPath = registry.getString(kOptionDefaultPath);

    std::string field = registry.getString(kOptionSortField, "size");
    if (std::optional<SortField> parsed = sortFieldFromString(field))
        options.sortField = *parsed;
    else
        spdlog::warn("unknown sort field '{}', using size", field);

    options.showOwner = registry.getBool(kOptionShowOwner);
    options.gaugeWidth = static_cast<int>(
        std::clamp<std::int64_t>(registry.getInteger(kOptionGaugeWidth, 20), kMinGaugeWidth, kMaxGaugeWidth));
    options.pageStep = static_cast<std::size_t>(std::max<std::int64_t>(1, registry.getInteger(kOptionPageStep, 10)));

    options.attributes.entries = registry.getString(kOptionRentriesAttribute, options.attributes.entries);
    options.attributes.bytes = registry.getString(kOptionRbytesAttribute, options.attributes.bytes);
    options.attributes.changeTime = registry.getString(kOptionRctimeAttribute, options.attributes.changeTime);

    options.logLevel = registry.getString(kOptionLogLevel, "warn");
    options.logFile = registry.getString(kOptionLogFile);
    return options;
}

std::optional<SortField> sortFieldFromString(const std::string &name)
{
    std::string lowered = lowercase(name);
    if (lowered == "name")
        return SortField::Name;
    if (lowered == "size")
        return SortField::Size;
    if (lowered == "entries" || lowered == "rentries" || lowered == "count")
        return SortField::RecursiveEntryCount;
    if (lowered == "owner")
        return SortField::Owner;
    if (lowered == "ctime" || lowered == "time")
        return SortField::ChangeTime;
    return std::nullopt;
}

const char *sortFieldName(SortField field) noexcept
{
    switch (field)
    {
    case SortField::Name:
        return "name";
    case SortField::Size:
        return "size";
    case SortField::RecursiveEntryCount:
        return "entries";
    case SortField::Owner:
        return "owner";
    case SortField::ChangeTime:
        return "ctime";
    }
    return "size";
}

std::filesystem::path startupPath(const CephDuOptions &options)
{
    if (!options.defaultPath.empty())
        return options.defaultPath;
    const char *user = std::getenv("USER");
    return std::filesystem::path(kCephUsersRoot) / (user ? user : "");
}

} // namespace cephdu
