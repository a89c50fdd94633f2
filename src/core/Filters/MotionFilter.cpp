#include "MotionFilter.h"

#include "../../common/Constants.h"
#include "../../common/Utils.h"

QPointF MotionFilter::update(const QPointF &raw, double dt,
                             const CursorConfig &config, FilterState &state) const
{
    if (!state.initialized)
    {
        // First sample after a reset is reported as is.
        const QPointF p = toScreen(raw, config.invert);
        state.initialized = true;
        state.smoothed = p;
        state.target = p;
        state.lastRaw = raw;
        state.velocity = QPointF();
        return clampToBounds(p);
    }

    const QPointF delta((raw.x() - state.lastRaw.x()) * bounds_.width(),
                        (raw.y() - state.lastRaw.y()) * bounds_.height());

    QPointF gained;
    if (Utils::length(delta) >= config.deadzone)
    {
        double gain = config.sensitivity;
        if (Utils::length(state.velocity) > ACCELERATION_THRESHOLD_PX_S)
            gain *= config.acceleration;

        gained = delta * gain;
        if (config.invert)
            gained = -gained;

        state.lastRaw = raw;
    }

    const double seconds = dt > 0.0 ? dt : TICK_INTERVAL_MS / 1000.0;
    state.velocity = state.velocity * VELOCITY_SMOOTHING +
                     (gained / seconds) * (1.0 - VELOCITY_SMOOTHING);

    state.target += gained;
    state.smoothed = state.smoothed * config.smoothing +
                     state.target * (1.0 - config.smoothing);

    return clampToBounds(state.smoothed);
}

void MotionFilter::rebase(const QPointF &raw, FilterState &state)
{
    state.lastRaw = raw;
    state.velocity = QPointF();
}

QPointF MotionFilter::toScreen(const QPointF &raw, bool invert) const
{
    const double nx = invert ? 1.0 - raw.x() : raw.x();
    const double ny = invert ? 1.0 - raw.y() : raw.y();
    return QPointF(bounds_.left() + nx * bounds_.width(),
                   bounds_.top() + ny * bounds_.height());
}

QPointF MotionFilter::clampToBounds(const QPointF &p) const
{
    const double right = bounds_.left() + bounds_.width() - 1.0;
    const double bottom = bounds_.top() + bounds_.height() - 1.0;
    return QPointF(Utils::clamp(p.x(), bounds_.left(), right),
                   Utils::clamp(p.y(), bounds_.top(), bottom));
}
