#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace cephdu
{

inline constexpr std::size_t kPopupTextHeight = 10;

// Scroll offset of an overlay viewport, kept within [0, total - viewport].
class PopupScroll
{
public:
    explicit PopupScroll(std::size_t totalLines = 0, std::size_t viewportHeight = kPopupTextHeight) noexcept
        : total(totalLines), viewport(viewportHeight)
    {
    }

    std::size_t offset() const noexcept { return current; }
    std::size_t maxOffset() const noexcept { return total > viewport ? total - viewport : 0; }
    std::size_t totalLines() const noexcept { return total; }
    std::size_t viewportHeight() const noexcept { return viewport; }

    std::size_t scrollBy(std::ptrdiff_t delta) noexcept;
    std::size_t scrollTo(std::size_t line) noexcept;
    void resize(std::size_t totalLines, std::size_t viewportHeight) noexcept;

private:
    std::size_t total = 0;
    std::size_t viewport = kPopupTextHeight;
    std::size_t current = 0;
};

struct PopupText
{
    std::string title;
    std::string bottomTitle;
    std::vector<std::string> lines;

    PopupText() = default;
    PopupText(std::string title, std::string bottomTitle, const std::string &body);

    // Longest of the lines, the title, and the bottom title plus 2.
    std::size_t width() const noexcept;
    std::size_t height() const noexcept { return lines.size(); }
};

} // namespace cephdu
