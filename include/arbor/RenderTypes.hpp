#pragma once
namespace arbor
{
    struct LineVertex
    {
        float x, y;
        float r, g, b, a;
    };

    struct Rgb
    {
        float r, g, b;
    };
} // namespace arbor
