#include "GestureClassifier.h"

#include <QDebug>

#include <algorithm>
#include <cmath>
#include <limits>

#include "../common/Utils.h"

using namespace HandLandmark;

bool ClassifierConfig::validate(QString *error) const
{
    auto fail = [error](const QString &msg)
    {
        if (error)
            *error = msg;
        return false;
    };

    if (historySize < 1)
        return fail(QStringLiteral("history size must be >= 1"));
    if (holdDurationTicks < 1)
        return fail(QStringLiteral("hold duration must be >= 1 tick"));
    if (lossTimeoutTicks < 0)
        return fail(QStringLiteral("loss timeout must be >= 0 ticks"));
    if (scrollRepeatTicks < 1)
        return fail(QStringLiteral("scroll repeat must be >= 1 tick"));
    if (!(pinchThreshold > 0.0f) || pinchReleaseThreshold < pinchThreshold)
        return fail(QStringLiteral("pinch thresholds must satisfy 0 < enter <= release"));
    if (!(openSpreadThreshold >= 0.0f))
        return fail(QStringLiteral("open spread threshold must be >= 0"));
    if (!(coordinateMargin >= 0.0f))
        return fail(QStringLiteral("coordinate margin must be >= 0"));
    return true;
}

FrameHistory::FrameHistory(int capacity)
    : capacity_(std::max(1, capacity))
{
}

void FrameHistory::push(const LandmarkFrame &frame)
{
    frames_.push_back(frame);
    while (int(frames_.size()) > capacity_)
        frames_.pop_front();
}

GestureClassifier::GestureClassifier(const ClassifierConfig &config)
    : config_(config)
{
    QString error;
    if (!config_.validate(&error))
    {
        qWarning() << "[GestureClassifier] invalid config, using defaults:" << error;
        config_ = ClassifierConfig();
    }
}

GestureUpdate GestureClassifier::classify(const LandmarkFrame *frame,
                                          FrameHistory &history,
                                          ClassifierState &state) const
{
    GestureUpdate out;
    out.previous = state.state;

    if (!frame || !isValidFrame(*frame))
    {
        // Hold the current state and stay silent until the loss timeout
        // runs out; then drop to Idle without a release event.
        state.missingTicks++;
        if (state.missingTicks == config_.lossTimeoutTicks + 1)
        {
            out.trackingLost = state.state != GestureState::Idle || !history.isEmpty();
            state.state = GestureState::Idle;
            state.ticksInState = 0;
            history.clear();
        }
        out.current = state.state;
        return out;
    }

    state.missingTicks = 0;
    history.push(*frame);
    out.frameAccepted = true;

    const bool pinchEngaged = isPinchState(state.state);
    HandPose pose = HandPose::None;
    if (!confirmPose(history, pinchEngaged, &pose))
    {
        advanceHeldState(state, out);
    }
    else
    {
        const GestureState next = targetState(pose, state.state);
        if (next == state.state)
            advanceHeldState(state, out);
        else
            enterState(next, trailingPoseFrames(history, pose, pinchEngaged), state, out);
    }

    out.current = state.state;
    return out;
}

bool GestureClassifier::confirmPose(const FrameHistory &history,
                                    bool pinchEngaged,
                                    HandPose *confirmed) const
{
    if (history.isEmpty())
        return false;

    const HandPose candidate = classifyPose(history.latest(), pinchEngaged);

    int votes = 0;
    for (const LandmarkFrame &f : history.frames())
    {
        if (classifyPose(f, pinchEngaged) == candidate)
            votes++;
    }

    if (votes * 2 <= history.capacity())
        return false;

    *confirmed = candidate;
    return true;
}

// Consecutive frames, newest first, that show the given pose.
int GestureClassifier::trailingPoseFrames(const FrameHistory &history,
                                          HandPose pose,
                                          bool pinchEngaged) const
{
    int count = 0;
    const std::deque<LandmarkFrame> &frames = history.frames();
    for (auto it = frames.rbegin(); it != frames.rend(); ++it)
    {
        if (classifyPose(*it, pinchEngaged) != pose)
            break;
        count++;
    }
    return count;
}

GestureState GestureClassifier::targetState(HandPose pose, GestureState current) const
{
    switch (pose)
    {
    case HandPose::Pinch:
        return isPinchState(current) ? current : GestureState::PinchArmed;
    case HandPose::Fist:
        return GestureState::FistHeld;
    case HandPose::Peace:
        return GestureState::PeaceHeld;
    case HandPose::Open:
        return GestureState::OpenHeld;
    case HandPose::Point:
        return GestureState::Pointing;
    case HandPose::None:
        break;
    }
    return GestureState::Idle;
}

void GestureClassifier::enterState(GestureState next,
                                   int heldFrames,
                                   ClassifierState &state,
                                   GestureUpdate &out) const
{
    // exit edge
    if (state.state == GestureState::PinchArmed)
        out.events.append(GestureEvent::Click);
    else if (state.state == GestureState::PinchHolding)
        out.events.append(GestureEvent::DragEnd);

    state.state = next;
    state.ticksInState = 1;

    // entry edge
    switch (next)
    {
    case GestureState::FistHeld:
        out.events.append(GestureEvent::LeftClick);
        break;
    case GestureState::PeaceHeld:
        out.events.append(GestureEvent::RightClick);
        break;
    case GestureState::OpenHeld:
        out.events.append(GestureEvent::ScrollUp);
        break;
    case GestureState::PinchArmed:
        // The hold counts from the first pinch frame, not from the vote.
        state.ticksInState = std::max(1, heldFrames);
        if (state.ticksInState >= config_.holdDurationTicks)
        {
            state.state = GestureState::PinchHolding;
            state.ticksInState = 1;
            out.events.append(GestureEvent::DragStart);
        }
        break;
    default:
        break;
    }
}

void GestureClassifier::advanceHeldState(ClassifierState &state, GestureUpdate &out) const
{
    state.ticksInState++;

    if (state.state == GestureState::PinchArmed &&
        state.ticksInState >= config_.holdDurationTicks)
    {
        state.state = GestureState::PinchHolding;
        state.ticksInState = 1;
        out.events.append(GestureEvent::DragStart);
    }
    else if (state.state == GestureState::OpenHeld &&
             (state.ticksInState - 1) % config_.scrollRepeatTicks == 0)
    {
        out.events.append(GestureEvent::ScrollUp);
    }
}

bool GestureClassifier::isValidFrame(const LandmarkFrame &frame) const
{
    if (frame.points.size() < HAND_LANDMARK_COUNT)
        return false;

    const float lo = -config_.coordinateMargin;
    const float hi = 1.0f + config_.coordinateMargin;

    for (int i = 0; i < HAND_LANDMARK_COUNT; ++i)
    {
        const Landmark &p = frame.points[i];
        if (!std::isfinite(p.x) || !std::isfinite(p.y) || !std::isfinite(p.z))
            return false;
        if (p.x < lo || p.x > hi || p.y < lo || p.y > hi)
            return false;
        if (std::fabs(p.z) > 1.0f)
            return false;
    }

    return palmSize(frame) >= MIN_PALM_SIZE;
}

HandPose GestureClassifier::classifyPose(const LandmarkFrame &frame, bool pinchEngaged) const
{
    const float threshold = pinchEngaged ? config_.pinchReleaseThreshold
                                         : config_.pinchThreshold;
    if (pinchRatio(frame) < threshold)
        return HandPose::Pinch;

    const bool index = isFingerExtended(frame, IndexPip, IndexTip);
    const bool middle = isFingerExtended(frame, MiddlePip, MiddleTip);
    const bool ring = isFingerExtended(frame, RingPip, RingTip);
    const bool pinky = isFingerExtended(frame, PinkyPip, PinkyTip);
    const bool thumb = isThumbExtended(frame);

    if (!index && !middle && !ring && !pinky && !thumb)
        return HandPose::Fist;

    if (index && middle && !ring && !pinky)
        return HandPose::Peace;

    if (index && middle && ring && pinky && thumb)
    {
        const auto &p = frame.points;
        const float palm = palmSize(frame);
        const float spread = std::min({Utils::distance2D(p[IndexTip], p[MiddleTip]),
                                       Utils::distance2D(p[MiddleTip], p[RingTip]),
                                       Utils::distance2D(p[RingTip], p[PinkyTip])});
        if (spread / palm > config_.openSpreadThreshold)
            return HandPose::Open;
    }

    if (index && !middle && !ring && !pinky)
        return HandPose::Point;

    return HandPose::None;
}

bool GestureClassifier::isFingerExtended(const LandmarkFrame &frame, int pip, int tip)
{
    const auto &p = frame.points;
    return Utils::distance2D(p[Wrist], p[tip]) > Utils::distance2D(p[Wrist], p[pip]);
}

bool GestureClassifier::isThumbExtended(const LandmarkFrame &frame)
{
    // A tucked thumb crosses the palm towards the pinky side.
    const auto &p = frame.points;
    return Utils::distance2D(p[ThumbTip], p[PinkyMcp]) >
           Utils::distance2D(p[ThumbIp], p[PinkyMcp]);
}

float GestureClassifier::palmSize(const LandmarkFrame &frame)
{
    return Utils::distance2D(frame.points[Wrist], frame.points[MiddleMcp]);
}

float GestureClassifier::pinchRatio(const LandmarkFrame &frame)
{
    const float palm = palmSize(frame);
    if (palm <= 0.0f)
        return std::numeric_limits<float>::infinity();
    return Utils::distance2D(frame.points[ThumbTip], frame.points[IndexTip]) / palm;
}
