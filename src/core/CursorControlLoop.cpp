#include "CursorControlLoop.h"

#include <QDebug>
#include <QMutexLocker>

#include "../common/Utils.h"
#include "../platform/InputSimulator.h"

using namespace HandLandmark;

CursorControlLoop::CursorControlLoop(LandmarkSource *source,
                                     InputSimulator *actuator,
                                     const ClassifierConfig &classifierConfig,
                                     QObject *parent)
    : QObject(parent),
      source_(source),
      actuator_(actuator),
      classifier_(classifierConfig),
      history_(classifier_.config().historySize),
      config_(std::make_shared<const CursorConfig>()),
      frameTimeoutMs_(FRAME_TIMEOUT_MS)
{
    timer_.setInterval(TICK_INTERVAL_MS);
    connect(&timer_, &QTimer::timeout, this, &CursorControlLoop::tick);
}

CursorControlLoop::~CursorControlLoop()
{
    stop();
}

void CursorControlLoop::setScreenGeometry(const QRectF &bounds)
{
    if (bounds.width() < 1.0 || bounds.height() < 1.0)
    {
        qWarning() << "[CursorControlLoop] ignoring empty screen geometry" << bounds;
        return;
    }
    filter_.setBounds(bounds);
}

void CursorControlLoop::setTickInterval(int ms)
{
    timer_.setInterval(ms);
    if (running_)
    {
        if (ms > 0)
            timer_.start();
        else
            timer_.stop();
    }
}

bool CursorControlLoop::setConfig(const CursorConfig &config, QString *error)
{
    QString reason;
    if (!config.validate(&reason))
    {
        qWarning() << "[CursorControlLoop] config rejected:" << reason;
        if (error)
            *error = reason;
        emit configRejected(reason);
        return false;
    }

    auto snapshot = std::make_shared<const CursorConfig>(config);
    {
        QMutexLocker lock(&configMutex_);
        config_ = std::move(snapshot);
    }

    qDebug() << "[CursorControlLoop] config applied: sensitivity" << config.sensitivity
             << "smoothing" << config.smoothing << "deadzone" << config.deadzone;
    return true;
}

std::shared_ptr<const CursorConfig> CursorControlLoop::config() const
{
    QMutexLocker lock(&configMutex_);
    return config_;
}

void CursorControlLoop::start()
{
    if (running_)
        return;

    resetSession();
    running_ = true;
    if (timer_.interval() > 0)
        timer_.start();

    qInfo() << "[CursorControlLoop] started";
    emit runningChanged(true);
    emit gestureStateChanged(classifierState_.state);
}

void CursorControlLoop::stop()
{
    if (!running_)
        return;

    lastCommands_.clear();

    // Never leave a button down behind the user's back.
    releaseHeldButtons();

    timer_.stop();
    running_ = false;
    resetSession();

    qInfo() << "[CursorControlLoop] stopped";
    emit gestureStateChanged(classifierState_.state);
    emit runningChanged(false);
}

void CursorControlLoop::tick()
{
    lastCommands_.clear();
    if (!running_)
        return;

    // One snapshot for the whole tick, whatever setConfig() does meanwhile.
    const std::shared_ptr<const CursorConfig> cfg = config();

    std::optional<LandmarkFrame> frame;
    if (source_)
        frame = source_->nextFrame(frameTimeoutMs_);

    const GestureUpdate update =
        classifier_.classify(frame ? &*frame : nullptr, history_, classifierState_);

    if (update.trackingLost)
    {
        if (!heldButtons_.isEmpty())
            qInfo() << "[CursorControlLoop] tracking lost, releasing held buttons";
        releaseHeldButtons();
        MotionFilter::reset(filterState_);
        emit trackingLost();
    }

    for (GestureEvent event : update.events)
    {
        qDebug() << "[CursorControlLoop]" << gestureEventName(event);
        emit gestureTriggered(event);
        dispatch(event, *cfg);
    }

    if (update.frameAccepted && drivesCursor(update.current))
    {
        const QPointF raw = anchorFor(update.current, *frame);

        // The anchor landmark changes with the state; re-anchor instead of jumping.
        if (filterState_.initialized && update.previous != update.current)
            MotionFilter::rebase(raw, filterState_);

        double dt = 0.0;
        if (filterState_.lastSampleMs >= 0 && frame->timestampMs > filterState_.lastSampleMs)
            dt = (frame->timestampMs - filterState_.lastSampleMs) / 1000.0;
        filterState_.lastSampleMs = frame->timestampMs;

        const QPointF pos = filter_.update(raw, dt, *cfg, filterState_);
        issue(ActuationCommand::moveTo(qRound(pos.x()), qRound(pos.y())));
        emit cursorMoved(pos);
    }

    if (update.previous != update.current)
        emit gestureStateChanged(update.current);
}

void CursorControlLoop::dispatch(GestureEvent event, const CursorConfig &config)
{
    const QVector<ActuationCommand> commands =
        commandsForAction(config.actionFor(event), config);
    for (const ActuationCommand &cmd : commands)
        issue(cmd);
}

void CursorControlLoop::issue(const ActuationCommand &cmd)
{
    lastCommands_.append(cmd);

    if (!actuator_ || !actuator_->execute(cmd))
    {
        const QString what = describeCommand(cmd);
        qDebug() << "[CursorControlLoop] actuation failed:" << what;
        emit actuationFailed(what);
        return;
    }

    // A release that failed leaves the button held so the next release retries it.
    if (cmd.type == ActuationCommand::Type::MouseDown && !heldButtons_.contains(cmd.button))
        heldButtons_.append(cmd.button);
    else if (cmd.type == ActuationCommand::Type::MouseUp)
        heldButtons_.removeAll(cmd.button);
}

void CursorControlLoop::releaseHeldButtons()
{
    // issue() edits the list as releases succeed.
    const QVector<MouseButton> held = heldButtons_;
    for (MouseButton button : held)
        issue(ActuationCommand::mouseUp(button));
}

void CursorControlLoop::resetSession()
{
    classifierState_ = ClassifierState();
    history_.clear();
    MotionFilter::reset(filterState_);
}

bool CursorControlLoop::drivesCursor(GestureState state)
{
    return state == GestureState::Pointing || state == GestureState::PinchHolding;
}

QPointF CursorControlLoop::anchorFor(GestureState state, const LandmarkFrame &frame)
{
    if (state == GestureState::PinchHolding)
        return Utils::midpoint(frame.points[ThumbTip], frame.points[IndexTip]);

    const Landmark &tip = frame.points[IndexTip];
    return QPointF(tip.x, tip.y);
}
