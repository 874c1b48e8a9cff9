#pragma once

#include <telechart/color.hpp>

#include <optional>
#include <string_view>

namespace telechart
{

enum class ColormapType
{
    Viridis,
    Plasma,
    Inferno,
    Magma,
    Jet,
    Coolwarm,
    Grayscale,
    RdYlGn,
};

// Lowercase names: "viridis", "plasma", ... , "rdylgn".
const char*                 colormap_name(ColormapType cm);
std::optional<ColormapType> parse_colormap(std::string_view name);

// t is clamped to [0, 1].
Color sample_colormap(ColormapType cm, float t);

}   // namespace telechart
