#pragma once
#include <QVector>

#include <deque>

#include "../common/Constants.h"
#include "../common/Types.h"

/**
 * GestureClassifier
 * --------------------
 * Prevents:
 *  - gesture jitter (majority vote over a short frame history)
 *  - repeated click events (events fire on state transitions only)
 *
 * The classifier itself only holds thresholds. Per-session data
 * (FrameHistory, ClassifierState) belongs to the caller and is
 * passed in by reference on every tick, so two trackers never share
 * state.
 */

struct ClassifierConfig
{
    int historySize = GESTURE_HISTORY_FRAMES;
    int holdDurationTicks = PINCH_HOLD_TICKS;
    int lossTimeoutTicks = TRACKING_LOSS_TICKS;
    int scrollRepeatTicks = SCROLL_REPEAT_TICKS;

    float pinchThreshold = PINCH_ENTER_RATIO;
    float pinchReleaseThreshold = PINCH_EXIT_RATIO;
    float openSpreadThreshold = OPEN_SPREAD_RATIO;
    float coordinateMargin = COORDINATE_MARGIN;

    bool validate(QString *error = nullptr) const;
};

// Raw per-frame pose, before debouncing.
enum class HandPose
{
    None,
    Point,
    Pinch,
    Fist,
    Peace,
    Open
};

class FrameHistory
{
public:
    explicit FrameHistory(int capacity = GESTURE_HISTORY_FRAMES);

    void push(const LandmarkFrame &frame);
    void clear() { frames_.clear(); }

    int capacity() const { return capacity_; }
    int size() const { return int(frames_.size()); }
    bool isEmpty() const { return frames_.empty(); }

    const LandmarkFrame &latest() const { return frames_.back(); }
    const std::deque<LandmarkFrame> &frames() const { return frames_; }

private:
    int capacity_;
    std::deque<LandmarkFrame> frames_;
};

struct ClassifierState
{
    GestureState state = GestureState::Idle;
    int ticksInState = 0;
    int missingTicks = 0;
};

struct GestureUpdate
{
    GestureState previous = GestureState::Idle;
    GestureState current = GestureState::Idle;
    QVector<GestureEvent> events;
    bool frameAccepted = false;
    bool trackingLost = false;
};

class GestureClassifier
{
public:
    explicit GestureClassifier(const ClassifierConfig &config = ClassifierConfig());

    const ClassifierConfig &config() const { return config_; }

    // frame == nullptr means no observation this tick.
    GestureUpdate classify(const LandmarkFrame *frame,
                           FrameHistory &history,
                           ClassifierState &state) const;

    bool isValidFrame(const LandmarkFrame &frame) const;

    HandPose classifyPose(const LandmarkFrame &frame, bool pinchEngaged) const;

    static bool isFingerExtended(const LandmarkFrame &frame, int pip, int tip);
    static bool isThumbExtended(const LandmarkFrame &frame);
    static float palmSize(const LandmarkFrame &frame);
    static float pinchRatio(const LandmarkFrame &frame);

    static bool isPinchState(GestureState s)
    {
        return s == GestureState::PinchArmed || s == GestureState::PinchHolding;
    }

private:
    bool confirmPose(const FrameHistory &history, bool pinchEngaged, HandPose *confirmed) const;
    int trailingPoseFrames(const FrameHistory &history, HandPose pose, bool pinchEngaged) const;
    GestureState targetState(HandPose pose, GestureState current) const;
    void enterState(GestureState next, int heldFrames, ClassifierState &state, GestureUpdate &out) const;
    void advanceHeldState(ClassifierState &state, GestureUpdate &out) const;

    ClassifierConfig config_;
};
