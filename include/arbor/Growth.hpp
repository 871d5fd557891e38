#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "Canvas.hpp"
#include "Collision.hpp"
#include "Config.hpp"
#include "Line.hpp"

namespace arbor
{
    class Rng;

    struct Seed
    {
        double            angle = 0.0;
        std::vector<Line> lines; // append-only, lines[0] is the root
    };

    class GrowthModel
    {
        public:
            GrowthModel(const GrowthConfig &config, Rng &rng, const CollisionDetector &detector, const Canvas &canvas);

            // Replaces the forest with `seedCount` fresh seeds.
            void generate();

            // One tick. Lines active at tick start are advanced exactly once; children spawned
            // during the tick wait for the next one.
            void grow();

            [[nodiscard]] bool isActive() const
            {
                return m_activeLineCount > 0;
            }

            bool forEachLineUntilTrue(const LineVisitor &visitor) const;

            [[nodiscard]] int activeLineCount() const
            {
                return m_activeLineCount;
            }

            [[nodiscard]] size_t lineCount() const;

            [[nodiscard]] uint64_t ticks() const
            {
                return m_ticks;
            }

            [[nodiscard]] const std::vector<Seed> &seeds() const
            {
                return m_seeds;
            }

            [[nodiscard]] const Line &line(const LineId &id) const;

            [[nodiscard]] const GrowthConfig &config() const
            {
                return m_config;
            }

        private:
            const GrowthConfig      &m_config;
            Rng                     &m_rng;
            const CollisionDetector &m_detector;
            Canvas                   m_canvas;

            std::vector<Seed> m_seeds;
            int               m_activeLineCount = 0;
            uint64_t          m_ticks           = 0;

            Seed buildSeed(int seedIndex);
            Line spawnLine(const LineId &id, const Vec2 &origin, double angle, const Line *parent);
            void advance(const LineId &id);
            void deactivate(Line &line);
    };
} // namespace arbor
