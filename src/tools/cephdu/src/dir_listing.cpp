#include "dir_listing.hpp"

#include <algorithm>
#include <cerrno>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <sys/stat.h>
#include <sys/types.h>

namespace cephdu
{
namespace
{
namespace fs = std::filesystem;

struct ListingCancelled
{
};

void reportError(const ListingLoadOptions &options, const fs::path &path, const std::error_code &ec)
{
    spdlog::warn("skipping '{}': {}", path.string(), ec.message());
    if (options.errorCallback)
        options.errorCallback(path, ec);
}

ListingLoadResult ioFailure(const fs::path &path, const std::error_code &ec)
{
    spdlog::error("cannot list '{}': {}", path.string(), ec.message());
    ListingLoadResult result;
    result.status = ListingLoadStatus::IoError;
    result.error = ec;
    result.failedPath = path;
    return result;
}

EntryKind kindFromMode(mode_t mode) noexcept
{
    if (S_ISDIR(mode))
        return EntryKind::Dir;
    if (S_ISLNK(mode))
        return EntryKind::Symlink;
    return EntryKind::File;
}

} // namespace

DirListing::DirListing(fs::path path, std::vector<DirEntry> entries, SortMode mode, FilesystemKind filesystem)
    : directory(std::move(path)), storage(std::move(entries)), mode(mode), filesystem(filesystem)
{
    if (directory.has_relative_path())
        parent = makeParentEntry();
    sortStorage(mode.field);
    computeMaxima();
    cursor.selectFirst(size());
}

const DirEntry &DirListing::at(std::size_t display) const
{
    if (mapping().isParentRow(display))
        return *parent;
    std::optional<std::size_t> slot = mapping().storageSlot(display);
    if (!slot)
        throw std::out_of_range("listing row out of range");
    return storage[*slot];
}

std::vector<const DirEntry *> DirListing::displayOrder() const
{
    std::vector<const DirEntry *> rows;
    rows.reserve(size());
    for (std::size_t i = 0; i < size(); ++i)
        rows.push_back(&at(i));
    return rows;
}

DisplayMapping DirListing::mapping() const noexcept
{
    return DisplayMapping(storage.size(), parent.has_value(), mode.reversed);
}

void DirListing::setTotals(std::uint64_t totalSize, std::uint64_t totalEntries) noexcept
{
    summary.totalSize = totalSize;
    summary.totalEntries = totalEntries;
}

void DirListing::applySortMode(const SortMode &requested)
{
    std::optional<std::string> selectedName;
    if (const DirEntry *entry = selectedEntry())
        selectedName = entry->name;

    if (requested.field != mode.field)
        sortStorage(requested.field);
    mode = requested;

    if (selectedName)
        selectByName(*selectedName);
}

void DirListing::requestSort(SortField field)
{
    applySortMode(nextSortMode(mode, field));
}

const DirEntry *DirListing::selectedEntry() const
{
    std::optional<std::size_t> index = cursor.selected();
    if (!index || *index >= size())
        return nullptr;
    return &at(*index);
}

std::optional<std::size_t> DirListing::selectByName(const std::string &name)
{
    for (std::size_t i = 0; i < size(); ++i)
    {
        if (at(i).name == name)
        {
            cursor.select(i, size());
            return i;
        }
    }
    return std::nullopt;
}

void DirListing::sortStorage(SortField field)
{
    sortEntries(storage, field);
    ++sortPasses;
}

void DirListing::computeMaxima() noexcept
{
    summary.maxSize = 0;
    summary.maxEntries = 0;
    for (const DirEntry &entry : storage)
    {
        summary.maxSize = std::max(summary.maxSize, entry.size.value_or(0));
        summary.maxEntries = std::max(summary.maxEntries, entry.rentries.value_or(0));
    }
}

std::string ListingLoadResult::message() const
{
    switch (status)
    {
    case ListingLoadStatus::Interrupted:
        return "Interrupted by user";
    case ListingLoadStatus::IoError:
        return error.message();
    case ListingLoadStatus::Loaded:
    default:
        return std::string();
    }
}

DirEntry probeEntry(const fs::path &path, MetadataProbe &probe, std::error_code &ec)
{
    DirEntry entry;
    struct stat sb{};
    if (::lstat(path.c_str(), &sb) != 0)
    {
        ec = std::error_code(errno, std::generic_category());
        return entry;
    }
    ec.clear();

    entry.kind = kindFromMode(sb.st_mode);
    entry.name = path.filename().string();
    if (entry.kind == EntryKind::Dir)
        entry.name.push_back('/');
    entry.size = static_cast<std::uint64_t>(sb.st_size);
    entry.owner = probe.resolveUserName(static_cast<std::uint32_t>(sb.st_uid));
    entry.group = probe.resolveGroupName(static_cast<std::uint32_t>(sb.st_gid));
    entry.changeTime = static_cast<std::int64_t>(sb.st_ctime);

    if (entry.kind == EntryKind::Dir)
    {
        entry.rentries = probe.recursiveEntryCount(path);
        if (std::optional<std::uint64_t> rctime = probe.recursiveChangeTime(path))
            entry.changeTime = static_cast<std::int64_t>(*rctime);
    }
    return entry;
}

ListingLoadResult loadDirListing(const fs::path &path, const SortMode &mode, MetadataProbe &probe,
                                 const ListingLoadOptions &options)
{
    std::error_code ec;
    fs::path canonicalPath = fs::canonical(path, ec);
    if (ec)
        return ioFailure(path, ec);

    FilesystemKind kind = probe.filesystemKind(canonicalPath);
    bool recursive = supportsRecursiveAccounting(kind);

    fs::directory_iterator it(canonicalPath, ec);
    if (ec)
        return ioFailure(canonicalPath, ec);

    std::vector<DirEntry> entries;
    try
    {
        for (fs::directory_iterator end; it != end; it.increment(ec))
        {
            if (ec)
                break;
            if (options.cancelRequested && options.cancelRequested())
                throw ListingCancelled{};

            const fs::path &entryPath = it->path();
            if (options.progressCallback)
                options.progressCallback(entryPath);

            std::error_code entryEc;
            DirEntry entry = probeEntry(entryPath, probe, entryEc);
            if (entryEc)
            {
                reportError(options, entryPath, entryEc);
                continue;
            }
            if (!recursive && entry.kind == EntryKind::Dir)
                entry.size.reset();
            entries.push_back(std::move(entry));
        }
    }
    catch (const ListingCancelled &)
    {
        spdlog::warn("listing of '{}' interrupted after {} entries", canonicalPath.string(), entries.size());
        ListingLoadResult result;
        result.status = ListingLoadStatus::Interrupted;
        result.failedPath = canonicalPath;
        return result;
    }
    if (ec)
        return ioFailure(canonicalPath, ec);

    std::uint64_t totalEntries = probe.recursiveEntryCount(canonicalPath).value_or(0);
    std::uint64_t totalSize = recursive ? probe.recursiveByteSize(canonicalPath).value_or(0) : 0;

    spdlog::debug("listed '{}' ({}): {} entries", canonicalPath.string(), filesystemKindName(kind), entries.size());

    ListingLoadResult result;
    result.listing = std::make_unique<DirListing>(canonicalPath, std::move(entries), mode, kind);
    result.listing->setTotals(totalSize, totalEntries);
    return result;
}

} // namespace cephdu
