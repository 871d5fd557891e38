#pragma once
#include <algorithm>
#include <cstdint>

namespace arbor
{
    // Mulberry32: 32-bit state, one additive step and two xorshift-multiply rounds per draw.
    class Rng
    {
        public:
            explicit Rng(const uint32_t seed = 1u): m_state(seed)
            {
            }

            double next()
            {
                m_state += 0x6D2B79F5u;
                uint32_t t = m_state;
                t          = (t ^ (t >> 15)) * (t | 1u);
                t ^= t + (t ^ (t >> 7)) * (t | 61u);
                t ^= t >> 14;
                return static_cast<double>(t) / 4294967296.0;
            }

            double next(const double a)
            {
                return next(0.0, a);
            }

            double next(const double a, const double b)
            {
                const double lo = std::min(a, b);
                const double hi = std::max(a, b);
                return lo + next() * (hi - lo);
            }

            bool chance(const double p)
            {
                return next() < p;
            }

            [[nodiscard]] uint32_t state() const
            {
                return m_state;
            }

        private:
            uint32_t m_state;
    };
} // namespace arbor
