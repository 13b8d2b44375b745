#pragma once

#include "dir_listing.hpp"
#include "metadata_probe.hpp"
#include "selection.hpp"
#include "sort_engine.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <system_error>

namespace cephdu
{

enum class MessageKind
{
    Error,
    Warning,
    Info
};

struct StatusMessage
{
    std::string text;
    MessageKind kind = MessageKind::Info;
};

// One interactive browsing session. Directory changes either replace the
// directory, listing and message together or leave all three untouched.
class BrowserSession
{
public:
    explicit BrowserSession(std::shared_ptr<MetadataProbe> probe, SortMode initialMode = defaultSortMode(SortField::Size));

    // Loads the first directory and records it as the original directory.
    ListingLoadStatus open(const std::filesystem::path &path, const ListingLoadOptions &options = {});

    // Relative paths resolve against the current directory.
    ListingLoadStatus changeDirectory(const std::filesystem::path &path, const ListingLoadOptions &options = {});
    // nullopt when the selected row is not a directory.
    std::optional<ListingLoadStatus> enterSelected(const ListingLoadOptions &options = {});
    ListingLoadStatus goToParent(const ListingLoadOptions &options = {});
    ListingLoadStatus returnToOrigin(const ListingLoadOptions &options = {});
    ListingLoadStatus reload(const ListingLoadOptions &options = {});

    void requestSort(SortField field);
    void applySortMode(const SortMode &mode);
    SortMode sortMode() const noexcept;

    bool isOpen() const noexcept { return activeListing != nullptr; }
    const std::filesystem::path &currentDirectory() const noexcept { return cwd; }
    const std::filesystem::path &originalDirectory() const noexcept { return originalCwd; }

    // Only valid while isOpen().
    DirListing &listing() { return *activeListing; }
    const DirListing &listing() const { return *activeListing; }

    const std::optional<StatusMessage> &message() const noexcept { return statusMessage; }
    void setMessage(std::optional<StatusMessage> message) { statusMessage = std::move(message); }
    void clearMessage() noexcept { statusMessage.reset(); }

    // Reason of the last failed load, cleared by a successful one.
    const std::error_code &lastError() const noexcept { return lastLoadError; }

    MetadataProbe &probe() noexcept { return *metadataProbe; }
    const SelectionMemory &selectionMemory() const noexcept { return memory; }

private:
    ListingLoadStatus load(const std::filesystem::path &target, const ListingLoadOptions &options);
    void rememberSelection();
    void restoreSelection();

    std::shared_ptr<MetadataProbe> metadataProbe;
    SortMode pendingMode;
    std::filesystem::path cwd;
    std::filesystem::path originalCwd;
    std::unique_ptr<DirListing> activeListing;
    SelectionMemory memory;
    std::optional<StatusMessage> statusMessage;
    std::error_code lastLoadError;
};

} // namespace cephdu
