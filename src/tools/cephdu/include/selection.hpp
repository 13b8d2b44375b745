#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace cephdu
{

// Index cursor over a displayed sequence of `length` rows. An empty sequence
// never holds a selection.
class SelectionCursor
{
public:
    std::optional<std::size_t> selected() const noexcept { return current; }

    void clear() noexcept { current.reset(); }
    void select(std::size_t index, std::size_t length) noexcept;

    void selectNext(std::size_t by, std::size_t length) noexcept;
    void selectPrev(std::size_t by, std::size_t length) noexcept;
    void selectFirst(std::size_t length) noexcept;
    void selectLast(std::size_t length) noexcept;
    std::optional<std::size_t> saturatingSelect(std::size_t index, std::size_t length) noexcept;

private:
    std::optional<std::size_t> current;
};

struct RememberedSelection
{
    std::string name;
    std::size_t index = 0;
};

// Per-directory record of the last highlighted row, keyed by canonical path.
class SelectionMemory
{
public:
    void remember(const std::filesystem::path &directory, std::string name, std::size_t index);
    std::optional<RememberedSelection> recall(const std::filesystem::path &directory) const;
    void forget(const std::filesystem::path &directory);

    std::size_t size() const noexcept { return records.size(); }

private:
    std::map<std::filesystem::path, RememberedSelection> records;
};

} // namespace cephdu
