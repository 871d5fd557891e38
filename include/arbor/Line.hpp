#pragma once
#include <cstdint>
#include <functional>

#include "Config.hpp"
#include "Math.hpp"

namespace arbor
{
    class Rng;

    // Position of a line in the forest: owning seed, then index inside that seed.
    struct LineId
    {
        int seed = -1;
        int line = -1;

        [[nodiscard]] bool valid() const
        {
            return seed >= 0 && line >= 0;
        }

        friend bool operator==(const LineId &a, const LineId &b)
        {
            return a.seed == b.seed && a.line == b.line;
        }

        friend bool operator!=(const LineId &a, const LineId &b)
        {
            return !(a == b);
        }
    };

    struct Line
    {
        LineId id;
        LineId parent; // invalid for a root

        Vec2   origin;
        Vec2   tip;
        double angle      = 0.0;
        int    generation = 0;

        bool active       = true;
        bool expired      = false;
        bool pendingSplit = false;

        uint32_t steps = 0;
        double   tag   = 0.0; // opaque, forwarded to rendering

        [[nodiscard]] bool isRoot() const
        {
            return !parent.valid();
        }
    };

    using LineVisitor = std::function<bool(const Line &)>;

    // Builds a line at `origin` and grows it once, so a fresh line is never zero-length.
    Line createLine(const LineId &id, const Vec2 &origin, double angle, const Line *parent,
                    const GrowthConfig &config, Rng &rng);

    void growLine(Line &line, const GrowthConfig &config, Rng &rng);

    // Undoes the last step; approximates clipping at a collision.
    void retractLine(Line &line);

    double expiryProbability(int generation, const GrowthConfig &config);

    // Parent/child pairs share an endpoint and must never be tested against each other.
    bool areAdjacent(const Line &a, const Line &b);
} // namespace arbor
