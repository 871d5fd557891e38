#pragma once
#include <cmath>

namespace arbor
{
    constexpr double kPi = 3.14159265358979323846;

    struct Vec2
    {
        double x = 0.0, y = 0.0;

        constexpr Vec2() = default;

        constexpr Vec2(const double X, const double Y): x(X), y(Y)
        {
        }

        constexpr Vec2 operator+(const Vec2 &o) const
        {
            return {x + o.x, y + o.y};
        }

        constexpr Vec2 operator-(const Vec2 &o) const
        {
            return {x - o.x, y - o.y};
        }

        constexpr Vec2 operator*(const double s) const
        {
            return {x * s, y * s};
        }

        Vec2 &operator+=(const Vec2 &o)
        {
            x += o.x;
            y += o.y;
            return *this;
        }

        Vec2 &operator-=(const Vec2 &o)
        {
            x -= o.x;
            y -= o.y;
            return *this;
        }

        friend constexpr bool operator==(const Vec2 &a, const Vec2 &b)
        {
            return a.x == b.x && a.y == b.y;
        }
    };

    inline double len(const Vec2 &v)
    {
        return std::sqrt(v.x * v.x + v.y * v.y);
    }

    // Unit step for a heading; angle 0 points along +y.
    inline Vec2 heading(const double angle)
    {
        return {std::sin(angle), std::cos(angle)};
    }

    struct Mat4
    {
        float m[16]{};

        static Mat4 identity()
        {
            Mat4 r;
            r.m[0] = r.m[5] = r.m[10] = r.m[15] = 1.f;
            return r;
        }
    };

    inline Mat4 ortho(const float left, const float right, const float bottom, const float top)
    {
        Mat4 r  = Mat4::identity();
        r.m[0]  = 2.f / (right - left);
        r.m[5]  = 2.f / (top - bottom);
        r.m[10] = -1.f;
        r.m[12] = -(right + left) / (right - left);
        r.m[13] = -(top + bottom) / (top - bottom);
        return r;
    }
} // namespace arbor
