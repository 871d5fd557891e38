#include "arbor/Scene.hpp"
#include "arbor/Growth.hpp"
#include "arbor/Math.hpp"

#include <algorithm>
#include <cmath>

namespace arbor
{
    Rgb hslToRgb(double h, double s, double l)
    {
        h = std::fmod(h, 360.0);
        if (h < 0.0)
            h += 360.0;
        s = std::clamp(s / 100.0, 0.0, 1.0);
        l = std::clamp(l / 100.0, 0.0, 1.0);

        const double c  = (1.0 - std::abs(2.0 * l - 1.0)) * s;
        const double hp = h / 60.0;
        const double x  = c * (1.0 - std::abs(std::fmod(hp, 2.0) - 1.0));

        double r = 0.0, g = 0.0, b = 0.0;
        if (hp < 1.0)
        {
            r = c;
            g = x;
        }
        else if (hp < 2.0)
        {
            r = x;
            g = c;
        }
        else if (hp < 3.0)
        {
            g = c;
            b = x;
        }
        else if (hp < 4.0)
        {
            g = x;
            b = c;
        }
        else if (hp < 5.0)
        {
            r = x;
            b = c;
        }
        else
        {
            r = c;
            b = x;
        }

        const double m = l - c / 2.0;
        return {static_cast<float>(r + m), static_cast<float>(g + m), static_cast<float>(b + m)};
    }

    double bandHue(const Line &line, const StyleConfig &style)
    {
        return std::fmod(style.rectBaseHue + (line.tag - 0.5) * style.rectHueVariation, 360.0);
    }

    double bandWidth(const Line &line, const StyleConfig &style)
    {
        return std::min(style.maxRectWidth, static_cast<double>(line.steps));
    }

    namespace
    {
        LineVertex vertex(const Vec2 &p, const Rgb &c, const double alpha)
        {
            return {static_cast<float>(p.x), static_cast<float>(p.y), c.r, c.g, c.b, static_cast<float>(alpha)};
        }

        void appendBand(std::vector<LineVertex> &out, const Line &line, const StyleConfig &style)
        {
            const Rgb    col    = hslToRgb(bandHue(line, style), style.rectSaturation, style.rectLightness);
            const double inner  = style.rectAlpha;
            const double outer  = style.useGradients ? 0.0 : style.rectAlpha;
            const Vec2   dir    = heading(line.angle);
            const Vec2   offset = Vec2{dir.y, -dir.x} * bandWidth(line, style);

            const Vec2 a = line.origin;
            const Vec2 b = line.tip;
            const Vec2 c = line.tip + offset;
            const Vec2 d = line.origin + offset;

            out.push_back(vertex(a, col, inner));
            out.push_back(vertex(b, col, inner));
            out.push_back(vertex(c, col, outer));

            out.push_back(vertex(a, col, inner));
            out.push_back(vertex(c, col, outer));
            out.push_back(vertex(d, col, outer));
        }
    } // namespace

    Scene buildScene(const GrowthModel &model, const StyleConfig &style)
    {
        Scene scene;
        scene.bands.reserve(model.lineCount() * 6);
        scene.lines.reserve(model.lineCount() * 2);

        const float grey = static_cast<float>(std::round(style.lineDarkness * 100.0) / 255.0);
        const Rgb   lc{grey, grey, grey};

        model.forEachLineUntilTrue([&](const Line &line)
        {
            appendBand(scene.bands, line, style);
            scene.lines.push_back(vertex(line.origin, lc, 1.0));
            scene.lines.push_back(vertex(line.tip, lc, 1.0));
            return false;
        });

        return scene;
    }
} // namespace arbor
