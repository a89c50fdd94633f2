#pragma once
#include <QPointF>
#include <QRectF>

#include "../CursorConfig.h"

/**
 * FilterState
 * --------------------------
 * Internals of one cursor filter. `target` and `smoothed` live in
 * screen pixels and are never clamped; only the position handed out
 * by MotionFilter::update() is.
 */
struct FilterState
{
    bool initialized = false;
    QPointF smoothed;
    QPointF target;
    QPointF lastRaw;  // normalized camera space
    QPointF velocity; // px/s
    qint64 lastSampleMs = -1;
};

/**
 * MotionFilter
 * --------------------------
 * Relative (delta based) cursor mapping:
 *  - deadzone on the raw delta
 *  - sensitivity and acceleration gain on the delta
 *  - exponential smoothing towards the accumulated target
 *  - clamp of the reported position to the display
 */
class MotionFilter
{
public:
    explicit MotionFilter(const QRectF &bounds = QRectF(0, 0, 1920, 1080))
        : bounds_(bounds) {}

    void setBounds(const QRectF &bounds) { bounds_ = bounds; }
    const QRectF &bounds() const { return bounds_; }

    // dt in seconds since the previous sample
    QPointF update(const QPointF &raw, double dt,
                   const CursorConfig &config, FilterState &state) const;

    // Moves the raw anchor without moving the cursor.
    static void rebase(const QPointF &raw, FilterState &state);

    static void reset(FilterState &state) { state = FilterState(); }

    QPointF toScreen(const QPointF &raw, bool invert) const;
    QPointF clampToBounds(const QPointF &p) const;

private:
    QRectF bounds_;
};
