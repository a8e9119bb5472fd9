#ifndef PAIRWISE_HEATMAP_COLOR_MAP_H
#define PAIRWISE_HEATMAP_COLOR_MAP_H

#include <string>

namespace pairwise_heatmap {

struct Color {
    unsigned char r, g, b;

    /// "#rrggbb"
    std::string hex() const;
    bool operator==(const Color& other) const { return r == other.r && g == other.g && b == other.b; }
    bool operator!=(const Color& other) const { return !(*this == other); }
};

const Color BLACK {0, 0, 0};
const Color WHITE {255, 255, 255};

/// Fixed colour-scale domain for identity values
const double SCALE_MIN = 60.0;
const double SCALE_MAX = 100.0;

/// Moreland's blue-white-red diverging map; t is clipped to [0, 1]
Color coolwarm(const double t);

/// Colour of an identity value on the [SCALE_MIN, SCALE_MAX] scale; out-of-range values are clipped
Color identityColor(const double value);

/// WCAG relative luminance in [0, 1]
double relativeLuminance(const Color& c);

/// Text colour legible on background
Color annotationColor(const Color& background);

}

#endif
