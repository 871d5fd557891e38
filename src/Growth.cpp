#include "arbor/Growth.hpp"
#include "arbor/Random.hpp"

namespace arbor
{
    GrowthModel::GrowthModel(const GrowthConfig &config, Rng &rng, const CollisionDetector &detector,
                             const Canvas &canvas): m_config(config), m_rng(rng), m_detector(detector),
                                                    m_canvas(canvas)
    {
    }

    Line GrowthModel::spawnLine(const LineId &id, const Vec2 &origin, const double angle, const Line *parent)
    {
        ++m_activeLineCount;
        return createLine(id, origin, angle, parent, m_config, m_rng);
    }

    Seed GrowthModel::buildSeed(const int seedIndex)
    {
        Seed seed;
        seed.angle = m_rng.next(0.0, kPi * 2.0);

        Vec2 origin;
        origin.x = m_rng.next(0.0, m_canvas.width);
        origin.y = m_rng.next(0.0, m_canvas.height);

        seed.lines.push_back(spawnLine(LineId{seedIndex, 0}, origin, seed.angle, nullptr));
        return seed;
    }

    void GrowthModel::generate()
    {
        m_seeds.clear();
        m_activeLineCount = 0;
        m_ticks           = 0;

        if (m_config.seedCount <= 0)
            return;

        m_seeds.reserve(static_cast<size_t>(m_config.seedCount));
        for (int i = 0; i < m_config.seedCount; ++i)
            m_seeds.push_back(buildSeed(i));
    }

    void GrowthModel::deactivate(Line &line)
    {
        line.active = false;
        --m_activeLineCount;
    }

    void GrowthModel::advance(const LineId &id)
    {
        auto &lines = m_seeds[static_cast<size_t>(id.seed)].lines;
        Line &line  = lines[static_cast<size_t>(id.line)];

        growLine(line, m_config, m_rng);

        if (line.expired)
        {
            deactivate(line);
            return;
        }

        const ForestTraversal forest = [this](const LineVisitor &visitor)
        {
            return forEachLineUntilTrue(visitor);
        };

        if (m_detector.checkForCollisions(line, forest))
        {
            retractLine(line);
            deactivate(line);
            return;
        }

        if (line.pendingSplit)
        {
            line.pendingSplit    = false;
            const double turn    = m_rng.chance(0.5) ? 1.0 : -1.0;
            const double angle   = line.angle + kPi / 2.0 * turn;
            const LineId childId = {id.seed, static_cast<int>(lines.size())};

            // push_back may reallocate; `line` is not used past this point
            Line child = spawnLine(childId, line.tip, angle, &line);
            lines.push_back(child);
        }
    }

    void GrowthModel::grow()
    {
        std::vector<LineId> snapshot;
        snapshot.reserve(static_cast<size_t>(m_activeLineCount > 0 ? m_activeLineCount : 0));
        for (const auto &seed : m_seeds)
            for (const auto &line : seed.lines)
                if (line.active)
                    snapshot.push_back(line.id);

        for (const auto &id : snapshot)
            advance(id);

        ++m_ticks;
    }

    bool GrowthModel::forEachLineUntilTrue(const LineVisitor &visitor) const
    {
        for (const auto &seed : m_seeds)
            for (const auto &line : seed.lines)
                if (visitor(line))
                    return true;
        return false;
    }

    size_t GrowthModel::lineCount() const
    {
        size_t n = 0;
        for (const auto &seed : m_seeds)
            n += seed.lines.size();
        return n;
    }

    const Line &GrowthModel::line(const LineId &id) const
    {
        return m_seeds.at(static_cast<size_t>(id.seed)).lines.at(static_cast<size_t>(id.line));
    }
} // namespace arbor
