/**
 * @file HandFixtures.h
 * @brief Synthetic hand poses for classifier and control loop tests
 *
 * All poses share one palm (wrist at 0.5,0.7, palm size 0.16) drawn in
 * normalized camera coordinates, y pointing down. An offset moves the
 * whole hand so cursor motion can be exercised with a stable pose.
 */
#pragma once

#include <QPointF>

#include <cmath>
#include <limits>

#include "common/Types.h"

namespace HandFixtures
{
    using namespace HandLandmark;

    enum class Pose
    {
        Point,
        Pinch,
        Fist,
        Peace,
        Open
    };

    inline void setPoint(LandmarkFrame &f, int index, float x, float y)
    {
        f.points[index].x = x;
        f.points[index].y = y;
        f.points[index].z = 0.0f;
    }

    // dx: sideways lean of an extended finger
    inline void extendFinger(LandmarkFrame &f, int mcp, float dx)
    {
        const float mx = f.points[mcp].x;
        const float my = f.points[mcp].y;
        setPoint(f, mcp + 1, mx + dx * 0.45f, my - 0.05f);
        setPoint(f, mcp + 2, mx + dx * 0.7f, my - 0.08f);
        setPoint(f, mcp + 3, mx + dx, my - 0.11f);
    }

    inline void curlFinger(LandmarkFrame &f, int mcp)
    {
        const float mx = f.points[mcp].x;
        const float my = f.points[mcp].y;
        setPoint(f, mcp + 1, mx, my - 0.04f);
        setPoint(f, mcp + 2, mx, my - 0.01f);
        setPoint(f, mcp + 3, mx, my + 0.02f);
    }

    inline void extendThumb(LandmarkFrame &f)
    {
        setPoint(f, ThumbIp, 0.37f, 0.59f);
        setPoint(f, ThumbTip, 0.34f, 0.56f);
    }

    inline void tuckThumb(LandmarkFrame &f)
    {
        setPoint(f, ThumbIp, 0.44f, 0.61f);
        setPoint(f, ThumbTip, 0.52f, 0.62f);
    }

    inline LandmarkFrame makeHand(Pose pose, QPointF offset = QPointF(), qint64 timestampMs = 0)
    {
        LandmarkFrame f;
        f.handedness = QStringLiteral("Right");
        f.timestampMs = timestampMs;
        f.points.resize(21);

        setPoint(f, Wrist, 0.50f, 0.70f);
        setPoint(f, ThumbCmc, 0.44f, 0.66f);
        setPoint(f, ThumbMcp, 0.40f, 0.62f);
        setPoint(f, IndexMcp, 0.46f, 0.55f);
        setPoint(f, MiddleMcp, 0.50f, 0.54f);
        setPoint(f, RingMcp, 0.54f, 0.55f);
        setPoint(f, PinkyMcp, 0.58f, 0.57f);

        switch (pose)
        {
        case Pose::Point:
            extendFinger(f, IndexMcp, -0.02f);
            curlFinger(f, MiddleMcp);
            curlFinger(f, RingMcp);
            curlFinger(f, PinkyMcp);
            tuckThumb(f);
            break;
        case Pose::Pinch:
            setPoint(f, IndexPip, 0.45f, 0.50f);
            setPoint(f, IndexDip, 0.43f, 0.49f);
            setPoint(f, IndexTip, 0.41f, 0.52f);
            curlFinger(f, MiddleMcp);
            curlFinger(f, RingMcp);
            curlFinger(f, PinkyMcp);
            setPoint(f, ThumbIp, 0.37f, 0.59f);
            setPoint(f, ThumbTip, 0.40f, 0.53f);
            break;
        case Pose::Fist:
            curlFinger(f, IndexMcp);
            curlFinger(f, MiddleMcp);
            curlFinger(f, RingMcp);
            curlFinger(f, PinkyMcp);
            tuckThumb(f);
            break;
        case Pose::Peace:
            extendFinger(f, IndexMcp, -0.02f);
            extendFinger(f, MiddleMcp, 0.0f);
            curlFinger(f, RingMcp);
            curlFinger(f, PinkyMcp);
            tuckThumb(f);
            break;
        case Pose::Open:
            extendFinger(f, IndexMcp, -0.02f);
            extendFinger(f, MiddleMcp, 0.0f);
            extendFinger(f, RingMcp, 0.02f);
            extendFinger(f, PinkyMcp, 0.04f);
            extendThumb(f);
            break;
        }

        for (Landmark &p : f.points)
        {
            p.x += float(offset.x());
            p.y += float(offset.y());
        }
        return f;
    }

    inline LandmarkFrame makeTruncated()
    {
        LandmarkFrame f = makeHand(Pose::Point);
        f.points.resize(12);
        return f;
    }

    inline LandmarkFrame makeWithNaN()
    {
        LandmarkFrame f = makeHand(Pose::Point);
        f.points[IndexTip].x = std::numeric_limits<float>::quiet_NaN();
        return f;
    }
}
