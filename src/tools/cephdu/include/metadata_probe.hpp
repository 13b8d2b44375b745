#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace cephdu
{

enum class FilesystemKind
{
    Unknown,
    Generic,
    Ceph,
    CephFuse
};

inline constexpr std::int64_t kCephSuperMagic = 0x00c36400;
inline constexpr std::int64_t kFuseSuperMagic = 0x65735546;

FilesystemKind classifyFilesystemMagic(std::int64_t magic) noexcept;
bool supportsRecursiveAccounting(FilesystemKind kind) noexcept;
const char *filesystemKindName(FilesystemKind kind) noexcept;

struct RecursiveAttributeNames
{
    std::string entries = "ceph.dir.rentries";
    std::string bytes = "ceph.dir.rbytes";
    std::string changeTime = "ceph.dir.rctime";
};

// Raw access to statfs(2) and lgetxattr(2). Kept behind an interface so the
// probe logic can run against directories that carry no recursive attributes.
class AttributeSource
{
public:
    virtual ~AttributeSource() = default;

    virtual std::optional<std::int64_t> filesystemMagic(const std::filesystem::path &path) = 0;
    virtual std::optional<std::string> readAttribute(const std::filesystem::path &path,
                                                     const std::string &name) = 0;
};

std::shared_ptr<AttributeSource> systemAttributeSource();

std::optional<std::uint64_t> parseUnsignedAttribute(std::string_view text) noexcept;
std::optional<std::uint64_t> parseChangeTimeAttribute(std::string_view text) noexcept;

using NameLookup = std::function<std::optional<std::string>(std::uint32_t)>;

std::optional<std::string> lookupUserName(std::uint32_t uid);
std::optional<std::string> lookupGroupName(std::uint32_t gid);

// uid/gid to name cache. Lookups are serialized; entries live as long as the
// cache.
class IdentityCache
{
public:
    IdentityCache();
    IdentityCache(NameLookup userLookup, NameLookup groupLookup);

    IdentityCache(const IdentityCache &) = delete;
    IdentityCache &operator=(const IdentityCache &) = delete;

    std::string userName(std::uint32_t uid);
    std::string groupName(std::uint32_t gid);

    std::size_t cachedUsers() const;
    std::size_t cachedGroups() const;

private:
    using NameMap = std::unordered_map<std::uint32_t, std::string>;

    std::string resolve(NameMap &cache, const NameLookup &lookup, std::uint32_t id);

    mutable std::mutex mutex;
    NameLookup userLookup;
    NameLookup groupLookup;
    NameMap users;
    NameMap groups;
};

class MetadataProbe
{
public:
    MetadataProbe();
    explicit MetadataProbe(std::shared_ptr<AttributeSource> source, RecursiveAttributeNames names = {});

    FilesystemKind filesystemKind(const std::filesystem::path &path) const;

    // Subtree entry count excluding the directory itself.
    std::optional<std::uint64_t> recursiveEntryCount(const std::filesystem::path &path) const;
    std::optional<std::uint64_t> recursiveByteSize(const std::filesystem::path &path) const;
    // Whole seconds of the subtree change time.
    std::optional<std::uint64_t> recursiveChangeTime(const std::filesystem::path &path) const;

    std::string resolveUserName(std::uint32_t uid);
    std::string resolveGroupName(std::uint32_t gid);

    const RecursiveAttributeNames &attributeNames() const noexcept { return names; }
    IdentityCache &identities() noexcept { return identityCache; }

private:
    std::optional<std::string> readAttribute(const std::filesystem::path &path, const std::string &name) const;

    std::shared_ptr<AttributeSource> source;
    RecursiveAttributeNames names;
    IdentityCache identityCache;
};

} // namespace cephdu
