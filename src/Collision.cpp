#include "arbor/Collision.hpp"

#include <algorithm>
#include <utility>

namespace arbor
{
    Orientation orientation(const Vec2 &p, const Vec2 &q, const Vec2 &r)
    {
        const double val = (q.y - p.y) * (r.x - q.x) - (q.x - p.x) * (r.y - q.y);
        if (val > 0.0)
            return Orientation::Clockwise;
        if (val < 0.0)
            return Orientation::CounterClockwise;
        return Orientation::Collinear;
    }

    bool onSegment(const Vec2 &p, const Vec2 &q, const Vec2 &r)
    {
        return q.x <= std::max(p.x, r.x) && q.x >= std::min(p.x, r.x) && q.y <= std::max(p.y, r.y) &&
               q.y >= std::min(p.y, r.y);
    }

    bool segmentsIntersect(const Vec2 &a0, const Vec2 &a1, const Vec2 &b0, const Vec2 &b1)
    {
        const Orientation o1 = orientation(a0, a1, b0);
        const Orientation o2 = orientation(a0, a1, b1);
        const Orientation o3 = orientation(b0, b1, a0);
        const Orientation o4 = orientation(b0, b1, a1);

        if (o1 != o2 && o3 != o4)
            return true;

        if (o1 == Orientation::Collinear && onSegment(a0, b0, a1))
            return true;
        if (o2 == Orientation::Collinear && onSegment(a0, b1, a1))
            return true;
        if (o3 == Orientation::Collinear && onSegment(b0, a0, b1))
            return true;
        if (o4 == Orientation::Collinear && onSegment(b0, a1, b1))
            return true;

        return false;
    }

    bool linesIntersect(const Line &a, const Line &b)
    {
        return segmentsIntersect(a.origin, a.tip, b.origin, b.tip);
    }

    CollisionDetector::CollisionDetector(VisibilityFn isVisible): m_isVisible(std::move(isVisible))
    {
    }

    bool CollisionDetector::isOffscreen(const Line &line) const
    {
        return !m_isVisible(line.tip.x, line.tip.y);
    }

    bool CollisionDetector::checkForCollisions(const Line &line, const ForestTraversal &forEachLineUntilTrue) const
    {
        if (isOffscreen(line))
            return true;

        return forEachLineUntilTrue([&line](const Line &other)
        {
            if (other.id == line.id || areAdjacent(line, other))
                return false;
            return linesIntersect(line, other);
        });
    }
} // namespace arbor
