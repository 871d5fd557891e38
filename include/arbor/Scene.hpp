#pragma once
#include <vector>

#include "Config.hpp"
#include "RenderTypes.hpp"

namespace arbor
{
    class GrowthModel;
    struct Line;

    struct Scene
    {
        std::vector<LineVertex> bands; // triangles, 6 vertices per line
        std::vector<LineVertex> lines; // segments, 2 vertices per line
    };

    // h in degrees, s and l in percent.
    Rgb hslToRgb(double h, double s, double l);

    double bandHue(const Line &line, const StyleConfig &style);
    double bandWidth(const Line &line, const StyleConfig &style);

    Scene buildScene(const GrowthModel &model, const StyleConfig &style);
} // namespace arbor
