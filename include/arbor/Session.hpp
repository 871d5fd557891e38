#pragma once
#include <cstdint>
#include <string>

#include "Canvas.hpp"
#include "Collision.hpp"
#include "Config.hpp"
#include "Growth.hpp"
#include "Random.hpp"

namespace arbor
{
    // One seeded run: stream -> drawn configuration -> detector -> generated model.
    class Session
    {
        public:
            Session(uint32_t seed, const Canvas &canvas, const std::string &configPath = {});

            Session(const Session &)            = delete;
            Session &operator=(const Session &) = delete;

            // Advances one tick unless paused. Returns true once growth is exhausted.
            bool update();

            void pause()
            {
                m_paused = true;
            }

            void resume()
            {
                m_paused = false;
            }

            [[nodiscard]] bool paused() const
            {
                return m_paused;
            }

            [[nodiscard]] bool finished() const
            {
                return !m_model.isActive();
            }

            [[nodiscard]] uint32_t seed() const
            {
                return m_seed;
            }

            [[nodiscard]] const RunConfig &config() const
            {
                return m_config;
            }

            [[nodiscard]] const GrowthModel &model() const
            {
                return m_model;
            }

            [[nodiscard]] const Canvas &canvas() const
            {
                return m_canvas;
            }

            [[nodiscard]] bool configLoaded() const
            {
                return m_configLoaded;
            }

            static uint32_t seedFromClock();
            static uint32_t seedFromText(const std::string &text);

        private:
            uint32_t          m_seed;
            Canvas            m_canvas;
            Rng               m_rng;
            bool              m_configLoaded = false;
            RunConfig         m_config;
            CollisionDetector m_detector;
            GrowthModel       m_model;
            bool              m_paused = false;
    };
} // namespace arbor
