#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace cephdu
{

enum class EntryKind
{
    File,
    Dir,
    Symlink
};

// Snapshot of one directory child. Absent values are unknown, never zero.
struct DirEntry
{
    std::string name;
    EntryKind kind = EntryKind::File;
    std::optional<std::uint64_t> size;
    std::optional<std::uint64_t> rentries;
    std::optional<std::string> owner;
    std::optional<std::string> group;
    std::optional<std::int64_t> changeTime;

    bool isDirectory() const noexcept { return kind == EntryKind::Dir; }
};

inline constexpr const char *kParentEntryName = "..";

inline DirEntry makeParentEntry()
{
    DirEntry entry;
    entry.name = kParentEntryName;
    entry.kind = EntryKind::Dir;
    return entry;
}

} // namespace cephdu
