#include <telechart/color.hpp>

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace telechart
{

static int to_byte(float channel)
{
    return static_cast<int>(std::lround(std::clamp(channel, 0.0f, 1.0f) * 255.0f));
}

std::string Color::to_hex() const
{
    char buf[16];
    if (a >= 1.0f)
        std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", to_byte(r), to_byte(g), to_byte(b));
    else
        std::snprintf(buf,
                      sizeof(buf),
                      "#%02x%02x%02x%02x",
                      to_byte(r),
                      to_byte(g),
                      to_byte(b),
                      to_byte(a));
    return buf;
}

Color lerp(const Color& from, const Color& to, float t)
{
    t = std::clamp(t, 0.0f, 1.0f);
    return {from.r + (to.r - from.r) * t,
            from.g + (to.g - from.g) * t,
            from.b + (to.b - from.b) * t,
            from.a + (to.a - from.a) * t};
}

}   // namespace telechart
