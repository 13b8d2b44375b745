#include "selection.hpp"

#include <algorithm>

namespace cephdu
{

void SelectionCursor::select(std::size_t index, std::size_t length) noexcept
{
    if (length == 0)
    {
        current.reset();
        return;
    }
    current = std::min(index, length - 1);
}

void SelectionCursor::selectNext(std::size_t by, std::size_t length) noexcept
{
    if (length == 0)
    {
        current.reset();
        return;
    }
    if (!current)
    {
        current = 0;
        return;
    }
    std::size_t index = std::min(*current, length - 1);
    current = index + std::min(by, length - 1 - index);
}

void SelectionCursor::selectPrev(std::size_t by, std::size_t length) noexcept
{
    if (length == 0)
    {
        current.reset();
        return;
    }
    if (!current)
    {
        current = length - 1;
        return;
    }
    std::size_t index = std::min(*current, length - 1);
    current = index > by ? index - by : 0;
}

void SelectionCursor::selectFirst(std::size_t length) noexcept
{
    if (length == 0)
        current.reset();
    else
        current = 0;
}

void SelectionCursor::selectLast(std::size_t length) noexcept
{
    if (length == 0)
        current.reset();
    else
        current = length - 1;
}

std::optional<std::size_t> SelectionCursor::saturatingSelect(std::size_t index, std::size_t length) noexcept
{
    select(index, length);
    return current;
}

void SelectionMemory::remember(const std::filesystem::path &directory, std::string name, std::size_t index)
{
    records[directory] = RememberedSelection{std::move(name), index};
}

std::optional<RememberedSelection> SelectionMemory::recall(const std::filesystem::path &directory) const
{
    auto it = records.find(directory);
    if (it == records.end())
        return std::nullopt;
    return it->second;
}

void SelectionMemory::forget(const std::filesystem::path &directory)
{
    records.erase(directory);
}

} // namespace cephdu
