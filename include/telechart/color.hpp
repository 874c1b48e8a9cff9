#pragma once

#include <cstddef>
#include <string>

namespace telechart
{

struct Color
{
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;

    constexpr Color() = default;
    constexpr Color(float r, float g, float b, float a = 1.0f) : r(r), g(g), b(b), a(a) {}

    // "#rrggbb", or "#rrggbbaa" when not fully opaque.
    std::string to_hex() const;

    bool operator==(const Color&) const = default;
};

inline constexpr Color rgb(float r, float g, float b)
{
    return Color{r, g, b, 1.0f};
}

inline constexpr Color rgba(float r, float g, float b, float a)
{
    return Color{r, g, b, a};
}

// Per-channel linear blend, t in [0, 1].
Color lerp(const Color& from, const Color& to, float t);

namespace colors
{
inline constexpr Color black{0.0f, 0.0f, 0.0f};
inline constexpr Color white{1.0f, 1.0f, 1.0f};
inline constexpr Color red{1.0f, 0.0f, 0.0f};
inline constexpr Color green{0.0f, 1.0f, 0.0f};
inline constexpr Color blue{0.0f, 0.0f, 1.0f};
inline constexpr Color orange{1.0f, 0.65f, 0.0f};
inline constexpr Color gray{0.5f, 0.5f, 0.5f};
}   // namespace colors

// Categorical palette for ordinal scales (10 visually distinct colors).
namespace palette
{
inline constexpr Color category10[] = {
    {0.122f, 0.467f, 0.706f},   // steel blue
    {1.000f, 0.498f, 0.055f},   // orange
    {0.173f, 0.627f, 0.173f},   // green
    {0.839f, 0.153f, 0.157f},   // red
    {0.580f, 0.404f, 0.741f},   // purple
    {0.549f, 0.337f, 0.294f},   // brown
    {0.890f, 0.467f, 0.761f},   // pink
    {0.498f, 0.498f, 0.498f},   // gray
    {0.737f, 0.741f, 0.133f},   // olive
    {0.090f, 0.745f, 0.812f},   // cyan
};
inline constexpr size_t category10_size = sizeof(category10) / sizeof(category10[0]);

// Severity colors used by threshold overlays.
inline constexpr Color severity_info{0.129f, 0.588f, 0.953f};
inline constexpr Color severity_warning{1.000f, 0.596f, 0.000f};
inline constexpr Color severity_error{0.957f, 0.263f, 0.212f};
inline constexpr Color severity_critical{0.612f, 0.153f, 0.690f};
}   // namespace palette

}   // namespace telechart
