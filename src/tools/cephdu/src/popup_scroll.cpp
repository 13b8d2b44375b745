#include "popup_scroll.hpp"

#include <algorithm>
#include <sstream>

namespace cephdu
{
namespace
{

std::size_t displayWidth(const std::string &text) noexcept
{
    // Counts code points; continuation bytes do not occupy a cell.
    std::size_t width = 0;
    for (unsigned char ch : text)
    {
        if ((ch & 0xC0) != 0x80)
            ++width;
    }
    return width;
}

} // namespace

std::size_t PopupScroll::scrollBy(std::ptrdiff_t delta) noexcept
{
    if (delta < 0)
    {
        std::size_t back = static_cast<std::size_t>(-(delta + 1)) + 1;
        return scrollTo(current > back ? current - back : 0);
    }
    return scrollTo(current + std::min(static_cast<std::size_t>(delta), maxOffset()));
}

std::size_t PopupScroll::scrollTo(std::size_t line) noexcept
{
    current = std::min(line, maxOffset());
    return current;
}

void PopupScroll::resize(std::size_t totalLines, std::size_t viewportHeight) noexcept
{
    total = totalLines;
    viewport = viewportHeight;
    scrollTo(current);
}

PopupText::PopupText(std::string title, std::string bottomTitle, const std::string &body)
    : title(std::move(title)), bottomTitle(std::move(bottomTitle))
{
    std::istringstream in(body);
    std::string line;
    while (std::getline(in, line))
        lines.push_back(line);
}

std::size_t PopupText::width() const noexcept
{
    std::size_t result = std::max(displayWidth(title), displayWidth(bottomTitle) + 2);
    for (const std::string &line : lines)
        result = std::max(result, displayWidth(line));
    return result;
}

} // namespace cephdu
