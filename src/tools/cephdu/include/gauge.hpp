#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cephdu
{

enum class GaugeStyle
{
    Bar,
    Label,
    // Label characters covered by the fill; drawn with swapped colours.
    InvertedLabel
};

struct GaugeSpan
{
    std::string text; // UTF-8
    GaugeStyle style = GaugeStyle::Bar;
    int cells = 0;
    int eighths = 0;
};

struct Gauge
{
    std::vector<GaugeSpan> spans;
    bool selected = false;

    int width() const noexcept;
    int filledEighths() const noexcept;
    std::string text() const;
};

inline constexpr int kMinimumLabelWidth = 6;

double safeFraction(std::uint64_t value, std::uint64_t max) noexcept;
double clampUnit(double value) noexcept;

std::string formatPercentLabel(double percent);
// `filled` is measured in cells. Always spans exactly `width` cells.
GaugeSpan fillRun(double filled, int width);

Gauge renderGauge(double fraction, std::optional<double> percent, int width, bool selected = false);

} // namespace cephdu
