#pragma once
#include <functional>

namespace arbor
{
    using VisibilityFn = std::function<bool(double, double)>;

    struct Canvas
    {
        double width  = 800.0;
        double height = 600.0;

        [[nodiscard]] bool isVisible(const double x, const double y) const
        {
            return x >= 0.0 && x <= width && y >= 0.0 && y <= height;
        }

        [[nodiscard]] VisibilityFn visibility() const
        {
            const Canvas self = *this;
            return [self](const double x, const double y)
            {
                return self.isVisible(x, y);
            };
        }
    };
} // namespace arbor
