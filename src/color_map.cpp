#include "color_map.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace pairwise_heatmap {

namespace {

struct ColorStop {
    double t;
    double r, g, b;
};

// Sampled from the coolwarm table; interpolated linearly in RGB
const ColorStop COOLWARM[] = {
    {0.000,  59,  76, 192},
    {0.125,  98, 130, 234},
    {0.250, 141, 176, 254},
    {0.375, 184, 208, 249},
    {0.500, 221, 221, 221},
    {0.625, 244, 196, 173},
    {0.750, 244, 154, 123},
    {0.875, 222,  96,  77},
    {1.000, 180,   4,  38}
};

const size_t N_STOPS = sizeof(COOLWARM) / sizeof(COOLWARM[0]);

unsigned char channel(const double v)
{
    return static_cast<unsigned char>(std::round(std::min(255.0, std::max(0.0, v))));
}

double linearize(const unsigned char c)
{
    const double v = c / 255.0;
    return v <= 0.03928 ? v / 12.92 : std::pow((v + 0.055) / 1.055, 2.4);
}

}

std::string Color::hex() const
{
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", r, g, b);
    return buf;
}

Color coolwarm(const double t)
{
    const double x = std::isnan(t) ? 0.0 : std::min(1.0, std::max(0.0, t));
    size_t i = 1;
    while(i < N_STOPS - 1 && COOLWARM[i].t < x)
        i++;
    const ColorStop& lo = COOLWARM[i - 1];
    const ColorStop& hi = COOLWARM[i];
    const double f = (x - lo.t) / (hi.t - lo.t);
    return Color {channel(lo.r + f * (hi.r - lo.r)),
                  channel(lo.g + f * (hi.g - lo.g)),
                  channel(lo.b + f * (hi.b - lo.b))};
}

Color identityColor(const double value)
{
    return coolwarm((value - SCALE_MIN) / (SCALE_MAX - SCALE_MIN));
}

double relativeLuminance(const Color& c)
{
    return 0.2126 * linearize(c.r) + 0.7152 * linearize(c.g) + 0.0722 * linearize(c.b);
}

Color annotationColor(const Color& background)
{
    return relativeLuminance(background) > 0.408 ? BLACK : WHITE;
}

}
