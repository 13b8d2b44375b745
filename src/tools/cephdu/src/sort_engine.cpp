#include "sort_engine.hpp"

#include <algorithm>
#include <tuple>

namespace cephdu
{

bool reversedByDefault(SortField field) noexcept
{
    switch (field)
    {
    case SortField::Size:
    case SortField::RecursiveEntryCount:
    case SortField::ChangeTime:
        return true;
    case SortField::Name:
    case SortField::Owner:
    default:
        return false;
    }
}

SortMode defaultSortMode(SortField field) noexcept
{
    return SortMode{field, reversedByDefault(field)};
}

SortMode nextSortMode(const SortMode &current, SortField requested) noexcept
{
    if (current.field == requested)
        return SortMode{requested, !current.reversed};
    return defaultSortMode(requested);
}

const char *sortFieldLabel(SortField field) noexcept
{
    switch (field)
    {
    case SortField::Name:
        return "Name";
    case SortField::Size:
        return "Size";
    case SortField::RecursiveEntryCount:
        return "Entries";
    case SortField::Owner:
        return "Owner";
    case SortField::ChangeTime:
        return "Change Time";
    default:
        return "Unknown";
    }
}

bool entryLess(const DirEntry &lhs, const DirEntry &rhs, SortField field)
{
    // std::optional orders nullopt below every engaged value.
    switch (field)
    {
    case SortField::Name:
        return std::tie(lhs.name, lhs.size) < std::tie(rhs.name, rhs.size);
    case SortField::Size:
        return std::tie(lhs.size, lhs.rentries) < std::tie(rhs.size, rhs.rentries);
    case SortField::RecursiveEntryCount:
        return std::tie(lhs.rentries, lhs.size) < std::tie(rhs.rentries, rhs.size);
    case SortField::Owner:
        return std::tie(lhs.owner, lhs.group, lhs.size) < std::tie(rhs.owner, rhs.group, rhs.size);
    case SortField::ChangeTime:
        return lhs.changeTime < rhs.changeTime;
    }
    return false;
}

void sortEntries(std::vector<DirEntry> &entries, SortField field)
{
    std::stable_sort(entries.begin(), entries.end(),
                     [field](const DirEntry &a, const DirEntry &b) { return entryLess(a, b, field); });
}

std::optional<std::size_t> DisplayMapping::storageSlot(std::size_t display) const noexcept
{
    if (hasParent)
    {
        if (display == 0)
            return std::nullopt;
        --display;
    }
    if (display >= storageLength)
        return std::nullopt;
    return reversed ? storageLength - display - 1 : display;
}

std::size_t DisplayMapping::displayIndex(std::size_t slot) const noexcept
{
    std::size_t offset = reversed ? storageLength - slot - 1 : slot;
    return hasParent ? offset + 1 : offset;
}

} // namespace cephdu
