#include "browser_session.hpp"

#include <spdlog/spdlog.h>

namespace cephdu
{
namespace
{
namespace fs = std::filesystem;

fs::path stripTrailingSeparators(const fs::path &path)
{
    std::string text = path.string();
    while (text.size() > 1 && text.back() == '/')
        text.pop_back();
    return fs::path(text);
}

} // namespace

BrowserSession::BrowserSession(std::shared_ptr<MetadataProbe> probe, SortMode initialMode)
    : metadataProbe(std::move(probe)), pendingMode(initialMode)
{
    if (!metadataProbe)
        metadataProbe = std::make_shared<MetadataProbe>();
}

ListingLoadStatus BrowserSession::open(const fs::path &path, const ListingLoadOptions &options)
{
    ListingLoadStatus status = changeDirectory(path, options);
    if (status == ListingLoadStatus::Loaded)
        originalCwd = cwd;
    return status;
}

ListingLoadStatus BrowserSession::changeDirectory(const fs::path &path, const ListingLoadOptions &options)
{
    fs::path target = stripTrailingSeparators(path);
    if (target.is_relative() && !cwd.empty())
        target = cwd / target;
    return load(target, options);
}

std::optional<ListingLoadStatus> BrowserSession::enterSelected(const ListingLoadOptions &options)
{
    if (!activeListing)
        return std::nullopt;
    const DirEntry *entry = activeListing->selectedEntry();
    if (!entry || entry->kind != EntryKind::Dir)
        return std::nullopt;
    return changeDirectory(fs::path(entry->name), options);
}

ListingLoadStatus BrowserSession::goToParent(const ListingLoadOptions &options)
{
    return changeDirectory(fs::path(kParentEntryName), options);
}

ListingLoadStatus BrowserSession::returnToOrigin(const ListingLoadOptions &options)
{
    return changeDirectory(originalCwd.empty() ? cwd : originalCwd, options);
}

ListingLoadStatus BrowserSession::reload(const ListingLoadOptions &options)
{
    return changeDirectory(cwd, options);
}

void BrowserSession::requestSort(SortField field)
{
    if (activeListing)
        activeListing->requestSort(field);
    else
        pendingMode = nextSortMode(pendingMode, field);
}

void BrowserSession::applySortMode(const SortMode &mode)
{
    if (activeListing)
        activeListing->applySortMode(mode);
    else
        pendingMode = mode;
}

SortMode BrowserSession::sortMode() const noexcept
{
    return activeListing ? activeListing->sortMode() : pendingMode;
}

ListingLoadStatus BrowserSession::load(const fs::path &target, const ListingLoadOptions &options)
{
    rememberSelection();

    ListingLoadResult result = loadDirListing(target, sortMode(), *metadataProbe, options);
    switch (result.status)
    {
    case ListingLoadStatus::Interrupted:
        lastLoadError = std::make_error_code(std::errc::interrupted);
        statusMessage = StatusMessage{result.message(), MessageKind::Warning};
        return result.status;
    case ListingLoadStatus::IoError:
        lastLoadError = result.error;
        statusMessage = StatusMessage{"Error changing directory: " + result.message(), MessageKind::Error};
        return result.status;
    case ListingLoadStatus::Loaded:
        break;
    }

    lastLoadError.clear();
    activeListing = std::move(result.listing);
    cwd = activeListing->path();
    if (activeListing->hasRecursiveAccounting())
        statusMessage.reset();
    else
        statusMessage = StatusMessage{"Warning: not a Ceph directory", MessageKind::Warning};

    restoreSelection();
    spdlog::debug("now browsing '{}'", cwd.string());
    return ListingLoadStatus::Loaded;
}

void BrowserSession::rememberSelection()
{
    if (!activeListing)
        return;
    std::optional<std::size_t> index = activeListing->selected();
    const DirEntry *entry = activeListing->selectedEntry();
    if (!index || !entry)
        return;
    memory.remember(cwd, entry->name, *index);
}

void BrowserSession::restoreSelection()
{
    std::optional<RememberedSelection> remembered = memory.recall(cwd);
    if (!remembered)
    {
        activeListing->selectFirst();
        return;
    }
    if (!activeListing->selectByName(remembered->name))
        activeListing->saturatingSelect(remembered->index);
}

} // namespace cephdu
