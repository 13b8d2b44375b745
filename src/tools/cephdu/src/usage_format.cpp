#include "usage_format.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace cephdu
{
namespace
{

// Index of the largest power of 1000 not above `value`.
int thousandsExponent(std::uint64_t value) noexcept
{
    int exponent = 0;
    while (value >= 1000)
    {
        value /= 1000;
        ++exponent;
    }
    return exponent;
}

double scaleDown(std::uint64_t value, int exponent) noexcept
{
    double scaled = static_cast<double>(value);
    for (int i = 0; i < exponent; ++i)
        scaled /= 1000.0;
    return scaled;
}

} // namespace

std::string sizeString(std::optional<std::uint64_t> bytes, bool align)
{
    static const char *const kUnits[] = {" B", "KB", "MB", "GB", "TB", "PB", "EB"};
    if (!bytes)
        return std::string();

    int exponent = thousandsExponent(*bytes);
    std::ostringstream out;
    if (exponent == 0)
    {
        out << *bytes << (align ? "  " : "") << kUnits[0];
        return out.str();
    }
    out << std::fixed << std::setprecision(1) << scaleDown(*bytes, exponent) << ' ' << kUnits[exponent];
    return out.str();
}

std::string entriesString(std::optional<std::uint64_t> count, bool align)
{
    static const char *const kUnits[] = {"", "K", "M", "G", "T", "P", "E"};
    if (!count)
        return std::string();

    int exponent = thousandsExponent(*count);
    std::ostringstream out;
    if (exponent == 0)
    {
        out << *count << (align ? "    " : "");
        return out.str();
    }
    out << std::fixed << std::setprecision(1) << scaleDown(*count, exponent) << ' ' << kUnits[exponent];
    return out.str();
}

std::string changeTimeString(std::optional<std::int64_t> seconds)
{
    if (!seconds)
        return std::string();

    std::time_t tt = static_cast<std::time_t>(*seconds);
    std::tm tm{};
    if (!localtime_r(&tt, &tm))
        return "-";
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%d %H:%M");
    return out.str();
}

} // namespace cephdu
