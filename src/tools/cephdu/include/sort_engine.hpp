#pragma once

#include "dir_entry.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace cephdu
{

enum class SortField
{
    Name,
    Size,
    RecursiveEntryCount,
    Owner,
    ChangeTime
};

struct SortMode
{
    SortField field = SortField::Size;
    bool reversed = true;

    bool operator==(const SortMode &) const noexcept = default;
};

bool reversedByDefault(SortField field) noexcept;
SortMode defaultSortMode(SortField field) noexcept;

// Toggle rule: the active field flips direction, another field starts at its
// default direction.
SortMode nextSortMode(const SortMode &current, SortField requested) noexcept;

const char *sortFieldLabel(SortField field) noexcept;

// Ascending total order for a field, absent values first.
bool entryLess(const DirEntry &lhs, const DirEntry &rhs, SortField field);
void sortEntries(std::vector<DirEntry> &entries, SortField field);

// Maps display rows (parent first, then storage or its mirror) to storage
// slots of an ascending backing sequence.
class DisplayMapping
{
public:
    DisplayMapping(std::size_t storageLength, bool hasParent, bool reversed) noexcept
        : storageLength(storageLength), hasParent(hasParent), reversed(reversed)
    {
    }

    std::size_t displayLength() const noexcept { return storageLength + (hasParent ? 1 : 0); }
    bool isParentRow(std::size_t display) const noexcept { return hasParent && display == 0; }

    // nullopt for the parent row and for rows past the end.
    std::optional<std::size_t> storageSlot(std::size_t display) const noexcept;
    std::size_t displayIndex(std::size_t slot) const noexcept;

private:
    std::size_t storageLength;
    bool hasParent;
    bool reversed;
};

} // namespace cephdu
