#pragma once
#include <functional>

#include "Canvas.hpp"
#include "Line.hpp"
#include "Math.hpp"

namespace arbor
{
    enum class Orientation
    {
        Collinear,
        Clockwise,
        CounterClockwise,
    };

    Orientation orientation(const Vec2 &p, const Vec2 &q, const Vec2 &r);

    // True when q lies inside the bounding box of p and r.
    bool onSegment(const Vec2 &p, const Vec2 &q, const Vec2 &r);

    // Touching and collinear-overlapping segments count as intersecting.
    bool segmentsIntersect(const Vec2 &a0, const Vec2 &a1, const Vec2 &b0, const Vec2 &b1);

    bool linesIntersect(const Line &a, const Line &b);

    // Visits lines until the visitor returns true; returns whether it stopped early.
    using ForestTraversal = std::function<bool(const LineVisitor &)>;

    class CollisionDetector
    {
        public:
            explicit CollisionDetector(VisibilityFn isVisible);

            // An off-canvas tip collides with the boundary. Otherwise the line is tested against
            // every other line in the forest except its parent and its own children.
            [[nodiscard]] bool checkForCollisions(const Line &line, const ForestTraversal &forEachLineUntilTrue) const;

            [[nodiscard]] bool isOffscreen(const Line &line) const;

        private:
            VisibilityFn m_isVisible;
    };
} // namespace arbor
