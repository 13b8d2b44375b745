#pragma once

#include "dir_entry.hpp"
#include "metadata_probe.hpp"
#include "selection.hpp"
#include "sort_engine.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace cephdu
{

struct ListingStats
{
    std::uint64_t maxSize = 0;
    std::uint64_t maxEntries = 0;
    std::uint64_t totalSize = 0;
    std::uint64_t totalEntries = 0;
};

// Sorted view of one directory. Storage stays ascending for the active field;
// a reversed mode only mirrors the display order.
class DirListing
{
public:
    DirListing(std::filesystem::path path, std::vector<DirEntry> entries, SortMode mode,
               FilesystemKind filesystem);

    const std::filesystem::path &path() const noexcept { return directory; }
    SortMode sortMode() const noexcept { return mode; }
    const ListingStats &stats() const noexcept { return summary; }
    FilesystemKind filesystemKind() const noexcept { return filesystem; }
    bool hasRecursiveAccounting() const noexcept { return supportsRecursiveAccounting(filesystem); }

    bool hasParentEntry() const noexcept { return parent.has_value(); }
    const std::vector<DirEntry> &entries() const noexcept { return storage; }

    // Number of displayed rows, parent included.
    std::size_t size() const noexcept { return mapping().displayLength(); }
    bool empty() const noexcept { return size() == 0; }

    const DirEntry &at(std::size_t display) const;
    std::vector<const DirEntry *> displayOrder() const;
    DisplayMapping mapping() const noexcept;

    void setTotals(std::uint64_t totalSize, std::uint64_t totalEntries) noexcept;

    void applySortMode(const SortMode &requested);
    void requestSort(SortField field);

    // Times storage has been sorted. A direction-only change does not count.
    std::size_t storageSorts() const noexcept { return sortPasses; }

    std::optional<std::size_t> selected() const noexcept { return cursor.selected(); }
    const DirEntry *selectedEntry() const;

    void selectNext(std::size_t by = 1) noexcept { cursor.selectNext(by, size()); }
    void selectPrev(std::size_t by = 1) noexcept { cursor.selectPrev(by, size()); }
    void selectFirst() noexcept { cursor.selectFirst(size()); }
    void selectLast() noexcept { cursor.selectLast(size()); }
    std::optional<std::size_t> saturatingSelect(std::size_t index) noexcept
    {
        return cursor.saturatingSelect(index, size());
    }
    std::optional<std::size_t> selectByName(const std::string &name);

private:
    void sortStorage(SortField field);
    void computeMaxima() noexcept;

    std::filesystem::path directory;
    std::vector<DirEntry> storage;
    std::optional<DirEntry> parent;
    SortMode mode;
    ListingStats summary;
    FilesystemKind filesystem;
    SelectionCursor cursor;
    std::size_t sortPasses = 0;
};

struct ListingLoadOptions
{
    std::function<bool()> cancelRequested;
    std::function<void(const std::filesystem::path &)> progressCallback;
    std::function<void(const std::filesystem::path &, const std::error_code &)> errorCallback;
};

enum class ListingLoadStatus
{
    Loaded,
    IoError,
    Interrupted
};

struct ListingLoadResult
{
    ListingLoadStatus status = ListingLoadStatus::Loaded;
    std::unique_ptr<DirListing> listing;
    std::error_code error;
    std::filesystem::path failedPath;

    bool ok() const noexcept { return status == ListingLoadStatus::Loaded && listing != nullptr; }
    std::string message() const;
};

DirEntry probeEntry(const std::filesystem::path &path, MetadataProbe &probe, std::error_code &ec);

ListingLoadResult loadDirListing(const std::filesystem::path &path, const SortMode &mode, MetadataProbe &probe,
                                 const ListingLoadOptions &options = {});

} // namespace cephdu
