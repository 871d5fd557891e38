#include "arbor/Line.hpp"
#include "arbor/Random.hpp"

namespace arbor
{
    Line createLine(const LineId &id, const Vec2 &origin, const double angle, const Line *parent,
                    const GrowthConfig &config, Rng &rng)
    {
        Line line;
        line.id         = id;
        line.parent     = parent ? parent->id : LineId{};
        line.origin     = origin;
        line.tip        = origin;
        line.angle      = angle;
        line.generation = parent ? parent->generation + 1 : 0;
        line.tag        = rng.next();

        growLine(line, config, rng);
        return line;
    }

    void growLine(Line &line, const GrowthConfig &config, Rng &rng)
    {
        line.tip += heading(line.angle);
        ++line.steps;
        line.pendingSplit = rng.chance(config.pBifurcation);
        if (rng.chance(expiryProbability(line.generation, config)))
            line.expired = true;
    }

    void retractLine(Line &line)
    {
        line.tip -= heading(line.angle);
    }

    double expiryProbability(const int generation, const GrowthConfig &config)
    {
        return static_cast<double>(generation) * config.expiryThreshold;
    }

    bool areAdjacent(const Line &a, const Line &b)
    {
        return (a.parent.valid() && a.parent == b.id) || (b.parent.valid() && b.parent == a.id);
    }
} // namespace arbor
