#include "math/colormap.hpp"

#include <algorithm>
#include <cmath>

namespace telechart
{

const char* colormap_name(ColormapType cm)
{
    switch (cm)
    {
        case ColormapType::Viridis:
            return "viridis";
        case ColormapType::Plasma:
            return "plasma";
        case ColormapType::Inferno:
            return "inferno";
        case ColormapType::Magma:
            return "magma";
        case ColormapType::Jet:
            return "jet";
        case ColormapType::Coolwarm:
            return "coolwarm";
        case ColormapType::Grayscale:
            return "grayscale";
        case ColormapType::RdYlGn:
            return "rdylgn";
    }
    return "viridis";
}

std::optional<ColormapType> parse_colormap(std::string_view name)
{
    if (name == "viridis")
        return ColormapType::Viridis;
    if (name == "plasma")
        return ColormapType::Plasma;
    if (name == "inferno")
        return ColormapType::Inferno;
    if (name == "magma")
        return ColormapType::Magma;
    if (name == "jet")
        return ColormapType::Jet;
    if (name == "coolwarm")
        return ColormapType::Coolwarm;
    if (name == "grayscale" || name == "greys")
        return ColormapType::Grayscale;
    if (name == "rdylgn")
        return ColormapType::RdYlGn;
    return std::nullopt;
}

Color sample_colormap(ColormapType cm, float t)
{
    t = std::fmax(0.0f, std::fmin(1.0f, t));

    switch (cm)
    {
        case ColormapType::Viridis:
        {
            // Simplified viridis: dark purple → teal → yellow
            float r =
                std::fmax(0.0f,
                          std::fmin(1.0f, -0.35f + 1.7f * t - 0.9f * t * t + 0.55f * t * t * t));
            float g = std::fmax(0.0f, std::fmin(1.0f, -0.05f + 0.7f * t + 0.3f * t * t));
            float b =
                std::fmax(0.0f,
                          std::fmin(1.0f, 0.33f + 0.7f * t - 1.6f * t * t + 0.6f * t * t * t));
            return {r, g, b, 1.0f};
        }
        case ColormapType::Plasma:
        {
            // Simplified plasma: dark blue → magenta → yellow
            float r = std::fmax(0.0f, std::fmin(1.0f, 0.05f + 2.2f * t - 1.3f * t * t));
            float g = std::fmax(0.0f, std::fmin(1.0f, -0.2f + 1.2f * t));
            float b =
                std::fmax(0.0f,
                          std::fmin(1.0f, 0.53f + 0.5f * t - 2.0f * t * t + 1.0f * t * t * t));
            return {r, g, b, 1.0f};
        }
        case ColormapType::Inferno:
        {
            float r = std::fmax(0.0f, std::fmin(1.0f, -0.1f + 2.5f * t - 1.5f * t * t));
            float g = std::fmax(0.0f, std::fmin(1.0f, -0.3f + 1.5f * t));
            float b =
                std::fmax(0.0f, std::fmin(1.0f, 0.1f + 2.0f * t - 3.5f * t * t + 1.5f * t * t * t));
            return {r, g, b, 1.0f};
        }
        case ColormapType::Magma:
        {
            float r = std::fmax(0.0f, std::fmin(1.0f, -0.05f + 2.0f * t - 0.8f * t * t));
            float g = std::fmax(0.0f, std::fmin(1.0f, -0.3f + 1.3f * t + 0.1f * t * t));
            float b =
                std::fmax(0.0f,
                          std::fmin(1.0f, 0.15f + 1.5f * t - 2.5f * t * t + 1.5f * t * t * t));
            return {r, g, b, 1.0f};
        }
        case ColormapType::Jet:
        {
            // Classic jet: blue → cyan → green → yellow → red
            float r = std::fmax(0.0f, std::fmin(1.0f, 1.5f - std::fabs(t - 0.75f) * 4.0f));
            float g = std::fmax(0.0f, std::fmin(1.0f, 1.5f - std::fabs(t - 0.5f) * 4.0f));
            float b = std::fmax(0.0f, std::fmin(1.0f, 1.5f - std::fabs(t - 0.25f) * 4.0f));
            return {r, g, b, 1.0f};
        }
        case ColormapType::Coolwarm:
        {
            float r = std::fmax(0.0f, std::fmin(1.0f, 0.23f + 1.5f * t - 0.7f * t * t));
            float g = std::fmax(0.0f, std::fmin(1.0f, 0.3f + 1.2f * t - 1.5f * t * t));
            float b = std::fmax(0.0f, std::fmin(1.0f, 0.75f - 0.5f * t - 0.2f * t * t));
            return {r, g, b, 1.0f};
        }
        case ColormapType::Grayscale:
            return {t, t, t, 1.0f};
        case ColormapType::RdYlGn:
        {
            // Red → yellow → green, used for "percent healthy" gauges
            constexpr Color red{0.84f, 0.19f, 0.15f, 1.0f};
            constexpr Color yellow{1.0f, 1.0f, 0.75f, 1.0f};
            constexpr Color green{0.10f, 0.60f, 0.31f, 1.0f};
            return t < 0.5f ? lerp(red, yellow, t * 2.0f) : lerp(yellow, green, (t - 0.5f) * 2.0f);
        }
    }
    return {0.5f, 0.5f, 0.5f, 1.0f};
}

}   // namespace telechart
