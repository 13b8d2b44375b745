#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace cephdu
{

// Decimal units, one decimal above bytes: "1.5 MB". With `align`, byte values
// are padded to the unit column: "512   B". Absent values render empty.
std::string sizeString(std::optional<std::uint64_t> bytes, bool align = false);

// "12.3 K". With `align`, values below a thousand get four trailing spaces.
std::string entriesString(std::optional<std::uint64_t> count, bool align = false);

std::string changeTimeString(std::optional<std::int64_t> seconds);

} // namespace cephdu
