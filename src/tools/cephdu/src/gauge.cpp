#include "gauge.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace cephdu
{
namespace
{

const char *const kEighths[] = {"", "▏", "▎", "▍", "▌", "▋", "▊", "▉"};
const char *const kFullBlock = "█";

} // namespace

int Gauge::width() const noexcept
{
    int total = 0;
    for (const GaugeSpan &span : spans)
        total += span.cells;
    return total;
}

int Gauge::filledEighths() const noexcept
{
    int total = 0;
    for (const GaugeSpan &span : spans)
        total += span.eighths;
    return total;
}

std::string Gauge::text() const
{
    std::string result;
    for (const GaugeSpan &span : spans)
        result += span.text;
    return result;
}

double safeFraction(std::uint64_t value, std::uint64_t max) noexcept
{
    if (max == 0)
        return 0.0;
    return static_cast<double>(value) / static_cast<double>(max);
}

double clampUnit(double value) noexcept
{
    if (std::isnan(value))
        return 0.0;
    return std::clamp(value, 0.0, 1.0);
}

std::string formatPercentLabel(double percent)
{
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%5.1f%%", clampUnit(percent) * 100.0);
    return buffer;
}

GaugeSpan fillRun(double filled, int width)
{
    GaugeSpan span;
    span.style = GaugeStyle::Bar;
    if (width <= 0)
        return span;

    double scaled = std::round(filled * 8.0);
    int whole = std::isnan(scaled) ? 0 : static_cast<int>(std::clamp(scaled, 0.0, 8.0 * width));
    int full = whole / 8;
    int remainder = whole % 8;

    for (int i = 0; i < full; ++i)
        span.text += kFullBlock;
    span.text += kEighths[remainder];
    span.text.append(static_cast<std::size_t>(width - full - (remainder > 0 ? 1 : 0)), ' ');
    span.cells = width;
    span.eighths = whole;
    return span;
}

Gauge renderGauge(double fraction, std::optional<double> percent, int width, bool selected)
{
    Gauge gauge;
    gauge.selected = selected;
    if (width <= 0)
        return gauge;

    double filled = clampUnit(fraction) * width;
    if (!percent || width < kMinimumLabelWidth)
    {
        gauge.spans.push_back(fillRun(filled, width));
        return gauge;
    }

    int textStart = width / 2 - 3;
    std::string label = formatPercentLabel(*percent);
    int labelWidth = static_cast<int>(label.size());

    double leftFilled = std::min(filled, static_cast<double>(textStart));
    if (textStart > 0)
        gauge.spans.push_back(fillRun(leftFilled, textStart));

    double overlap = std::round(filled - textStart);
    int split = overlap > 0 ? std::min(static_cast<int>(overlap), labelWidth) : 0;
    if (split > 0)
        gauge.spans.push_back({label.substr(0, static_cast<std::size_t>(split)), GaugeStyle::InvertedLabel, split,
                               split * 8});
    if (split < labelWidth)
        gauge.spans.push_back(
            {label.substr(static_cast<std::size_t>(split)), GaugeStyle::Label, labelWidth - split, 0});

    int rightWidth = std::max(0, width - textStart - labelWidth);
    double rightFilled = std::max(0.0, filled - (leftFilled + labelWidth));
    if (rightWidth > 0)
        gauge.spans.push_back(fillRun(rightFilled, rightWidth));
    return gauge;
}

} // namespace cephdu
