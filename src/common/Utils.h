#pragma once

#include <QElapsedTimer>
#include <QPointF>

#include <cmath>

#include "Types.h"

/**
 * Generic helpers used across modules.
 */

namespace Utils
{

    inline double clamp(double v, double min, double max)
    {
        if (v < min)
            return min;
        if (v > max)
            return max;
        return v;
    }

    inline float distance2D(const Landmark &a, const Landmark &b)
    {
        const float dx = a.x - b.x;
        const float dy = a.y - b.y;
        return std::sqrt(dx * dx + dy * dy);
    }

    inline QPointF midpoint(const Landmark &a, const Landmark &b)
    {
        return QPointF((a.x + b.x) * 0.5, (a.y + b.y) * 0.5);
    }

    inline double length(const QPointF &p)
    {
        return std::sqrt(p.x() * p.x() + p.y() * p.y());
    }

    // FPS timer for debugging performance
    class FPSTimer
    {
    public:
        FPSTimer()
        {
            timer_.start();
        }

        float fps()
        {
            qint64 ms = timer_.restart();
            if (ms <= 0)
                return 0.f;
            return 1000.f / ms;
        }

    private:
        QElapsedTimer timer_;
    };
}
