#pragma once

#include "metadata_probe.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>

namespace cephdu::test
{

// Attribute source answering from a table keyed by path and attribute name.
class FakeAttributeSource : public AttributeSource
{
public:
    explicit FakeAttributeSource(std::optional<std::int64_t> magic = kCephSuperMagic)
        : magic(magic)
    {
    }

    std::optional<std::int64_t> filesystemMagic(const std::filesystem::path &) override
    {
        ++statfsCalls;
        return magic;
    }

    std::optional<std::string> readAttribute(const std::filesystem::path &path, const std::string &name) override
    {
        auto it = attributes.find({path.string(), name});
        if (it == attributes.end())
            return std::nullopt;
        return it->second;
    }

    void set(const std::filesystem::path &path, const std::string &name, std::string value)
    {
        attributes[{path.string(), name}] = std::move(value);
    }

    std::optional<std::int64_t> magic;
    int statfsCalls = 0;

private:
    std::map<std::pair<std::string, std::string>, std::string> attributes;
};

// Scratch directory removed on destruction. The path is canonical.
class TempDir
{
public:
    TempDir()
    {
        auto base = std::filesystem::temp_directory_path();
        std::random_device rd;
        std::mt19937_64 rng(rd());
        std::uniform_int_distribution<std::uint64_t> dist;
        for (int attempt = 0; attempt < 16; ++attempt)
        {
            auto candidate = base / ("cephdu_test_" + std::to_string(dist(rng)));
            std::error_code ec;
            if (std::filesystem::create_directory(candidate, ec))
            {
                root = std::filesystem::canonical(candidate);
                return;
            }
        }
        throw std::runtime_error("cannot create a scratch directory");
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const std::filesystem::path &path() const noexcept { return root; }

    std::filesystem::path writeFile(const std::filesystem::path &relative, std::size_t bytes) const
    {
        std::filesystem::path target = root / relative;
        std::filesystem::create_directories(target.parent_path());
        std::ofstream out(target, std::ios::binary);
        out << std::string(bytes, 'x');
        return target;
    }

    std::filesystem::path makeDir(const std::filesystem::path &relative) const
    {
        std::filesystem::path target = root / relative;
        std::filesystem::create_directories(target);
        return target;
    }

private:
    std::filesystem::path root;
};

} // namespace cephdu::test
