#ifndef _GNU_SOURCE
#define _GNU_SOURCE
#endif

#include "metadata_probe.hpp"

#include <cerrno>
#include <charconv>
#include <cstring>
#include <grp.h>
#include <pwd.h>
#include <spdlog/spdlog.h>
#include <sys/statfs.h>
#include <sys/types.h>
#include <sys/xattr.h>
#include <unistd.h>
#include <vector>

namespace cephdu
{
namespace
{

class SystemAttributeSource : public AttributeSource
{
public:
    std::optional<std::int64_t> filesystemMagic(const std::filesystem::path &path) override
    {
        struct statfs sfs{};
        if (::statfs(path.c_str(), &sfs) != 0)
        {
            spdlog::trace("statfs('{}') failed: {}", path.string(), std::strerror(errno));
            return std::nullopt;
        }
        return static_cast<std::int64_t>(sfs.f_type);
    }

    std::optional<std::string> readAttribute(const std::filesystem::path &path, const std::string &name) override
    {
        ssize_t size = ::lgetxattr(path.c_str(), name.c_str(), nullptr, 0);
        if (size < 0)
        {
            spdlog::trace("{} missing on '{}': {}", name, path.string(), std::strerror(errno));
            return std::nullopt;
        }

        std::vector<char> buffer(static_cast<std::size_t>(size) + 1, '\0');
        ssize_t read = ::lgetxattr(path.c_str(), name.c_str(), buffer.data(), buffer.size());
        if (read < 0)
        {
            spdlog::trace("{} unreadable on '{}': {}", name, path.string(), std::strerror(errno));
            return std::nullopt;
        }
        return std::string(buffer.data(), static_cast<std::size_t>(read));
    }
};

std::string_view trimAttribute(std::string_view text) noexcept
{
    auto isPadding = [](char ch) {
        return ch == '\0' || ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
    };
    while (!text.empty() && isPadding(text.front()))
        text.remove_prefix(1);
    while (!text.empty() && isPadding(text.back()))
        text.remove_suffix(1);
    return text;
}

std::size_t lookupBufferSize(int name)
{
    long hint = ::sysconf(name);
    return hint > 0 ? static_cast<std::size_t>(hint) : 1024;
}

constexpr std::size_t kMaxLookupBuffer = 1u << 20;

} // namespace

FilesystemKind classifyFilesystemMagic(std::int64_t magic) noexcept
{
    switch (magic)
    {
    case kCephSuperMagic:
        return FilesystemKind::Ceph;
    case kFuseSuperMagic:
        return FilesystemKind::CephFuse;
    default:
        return FilesystemKind::Generic;
    }
}

bool supportsRecursiveAccounting(FilesystemKind kind) noexcept
{
    return kind == FilesystemKind::Ceph || kind == FilesystemKind::CephFuse;
}

const char *filesystemKindName(FilesystemKind kind) noexcept
{
    switch (kind)
    {
    case FilesystemKind::Ceph:
        return "ceph";
    case FilesystemKind::CephFuse:
        return "ceph-fuse";
    case FilesystemKind::Generic:
        return "generic";
    case FilesystemKind::Unknown:
    default:
        return "unknown";
    }
}

std::shared_ptr<AttributeSource> systemAttributeSource()
{
    return std::make_shared<SystemAttributeSource>();
}

std::optional<std::uint64_t> parseUnsignedAttribute(std::string_view text) noexcept
{
    text = trimAttribute(text);
    if (text.empty())
        return std::nullopt;
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size())
        return std::nullopt;
    return value;
}

std::optional<std::uint64_t> parseChangeTimeAttribute(std::string_view text) noexcept
{
    text = trimAttribute(text);
    auto dot = text.find('.');
    if (dot != std::string_view::npos)
        text = text.substr(0, dot);
    return parseUnsignedAttribute(text);
}

std::optional<std::string> lookupUserName(std::uint32_t uid)
{
    std::vector<char> buffer(lookupBufferSize(_SC_GETPW_R_SIZE_MAX));
    passwd entry{};
    passwd *result = nullptr;

    for (;;)
    {
        int rc = ::getpwuid_r(static_cast<uid_t>(uid), &entry, buffer.data(), buffer.size(), &result);
        if (rc == ERANGE && buffer.size() < kMaxLookupBuffer)
        {
            buffer.resize(buffer.size() * 2);
            continue;
        }
        if (rc != 0 || result == nullptr)
            return std::nullopt;
        return std::string(result->pw_name);
    }
}

std::optional<std::string> lookupGroupName(std::uint32_t gid)
{
    std::vector<char> buffer(lookupBufferSize(_SC_GETGR_R_SIZE_MAX));
    group entry{};
    group *result = nullptr;

    for (;;)
    {
        int rc = ::getgrgid_r(static_cast<gid_t>(gid), &entry, buffer.data(), buffer.size(), &result);
        if (rc == ERANGE && buffer.size() < kMaxLookupBuffer)
        {
            buffer.resize(buffer.size() * 2);
            continue;
        }
        if (rc != 0 || result == nullptr)
            return std::nullopt;
        return std::string(result->gr_name);
    }
}

IdentityCache::IdentityCache()
    : IdentityCache(lookupUserName, lookupGroupName)
{
}

IdentityCache::IdentityCache(NameLookup userLookup, NameLookup groupLookup)
    : userLookup(std::move(userLookup)), groupLookup(std::move(groupLookup))
{
}

std::string IdentityCache::userName(std::uint32_t uid)
{
    return resolve(users, userLookup, uid);
}

std::string IdentityCache::groupName(std::uint32_t gid)
{
    return resolve(groups, groupLookup, gid);
}

std::size_t IdentityCache::cachedUsers() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return users.size();
}

std::size_t IdentityCache::cachedGroups() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return groups.size();
}

// The lookup runs unlocked since NSS may block on a remote directory. When two
// callers race on the same id the first stored name wins.
std::string IdentityCache::resolve(NameMap &cache, const NameLookup &lookup, std::uint32_t id)
{
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = cache.find(id);
        if (it != cache.end())
            return it->second;
    }

    std::optional<std::string> name;
    if (lookup)
        name = lookup(id);

    std::lock_guard<std::mutex> lock(mutex);
    auto [it, inserted] = cache.try_emplace(id, name.value_or(std::to_string(id)));
    return it->second;
}

MetadataProbe::MetadataProbe()
    : MetadataProbe(systemAttributeSource())
{
}

MetadataProbe::MetadataProbe(std::shared_ptr<AttributeSource> source, RecursiveAttributeNames names)
    : source(std::move(source)), names(std::move(names))
{
}

FilesystemKind MetadataProbe::filesystemKind(const std::filesystem::path &path) const
{
    if (!source)
        return FilesystemKind::Unknown;
    std::optional<std::int64_t> magic = source->filesystemMagic(path);
    if (!magic)
        return FilesystemKind::Unknown;
    return classifyFilesystemMagic(*magic);
}

std::optional<std::uint64_t> MetadataProbe::recursiveEntryCount(const std::filesystem::path &path) const
{
    std::optional<std::string> raw = readAttribute(path, names.entries);
    if (!raw)
        return std::nullopt;
    std::optional<std::uint64_t> count = parseUnsignedAttribute(*raw);
    if (!count)
        return std::nullopt;
    return *count > 0 ? *count - 1 : 0;
}

std::optional<std::uint64_t> MetadataProbe::recursiveByteSize(const std::filesystem::path &path) const
{
    std::optional<std::string> raw = readAttribute(path, names.bytes);
    if (!raw)
        return std::nullopt;
    return parseUnsignedAttribute(*raw);
}

std::optional<std::uint64_t> MetadataProbe::recursiveChangeTime(const std::filesystem::path &path) const
{
    std::optional<std::string> raw = readAttribute(path, names.changeTime);
    if (!raw)
        return std::nullopt;
    return parseChangeTimeAttribute(*raw);
}

std::string MetadataProbe::resolveUserName(std::uint32_t uid)
{
    return identityCache.userName(uid);
}

std::string MetadataProbe::resolveGroupName(std::uint32_t gid)
{
    return identityCache.groupName(gid);
}

std::optional<std::string> MetadataProbe::readAttribute(const std::filesystem::path &path,
                                                        const std::string &name) const
{
    if (!source || name.empty())
        return std::nullopt;
    return source->readAttribute(path, name);
}

} // namespace cephdu
