#pragma once
#include <QMutex>
#include <QObject>
#include <QPointF>
#include <QRectF>
#include <QTimer>
#include <QVector>

#include <memory>

#include "CursorConfig.h"
#include "Filters/MotionFilter.h"
#include "GestureClassifier.h"
#include "LandmarkSource.h"

class InputSimulator;

/**
 * CursorControlLoop
 * -----------------------
 * One tracking session: pulls a frame per tick, classifies it, moves
 * the cursor and forwards mouse commands to the actuator.
 *
 * The loop owns the classifier state, frame history and filter state.
 * The CursorConfig is a shared immutable snapshot; setConfig() swaps
 * the whole snapshot and every tick reads exactly one.
 */
class CursorControlLoop : public QObject
{
    Q_OBJECT

public:
    CursorControlLoop(LandmarkSource *source,
                      InputSimulator *actuator,
                      const ClassifierConfig &classifierConfig = ClassifierConfig(),
                      QObject *parent = nullptr);
    ~CursorControlLoop() override;

    void setScreenGeometry(const QRectF &bounds);
    void setTickInterval(int ms);
    void setFrameTimeout(int ms) { frameTimeoutMs_ = ms; }

    // Rejects invalid configs and keeps the previous one.
    bool setConfig(const CursorConfig &config, QString *error = nullptr);
    std::shared_ptr<const CursorConfig> config() const;

    bool isRunning() const { return running_; }
    GestureState gestureState() const { return classifierState_.state; }

    bool isButtonHeld(MouseButton button) const { return heldButtons_.contains(button); }

    // Commands issued by the most recent tick, in order.
    const QVector<ActuationCommand> &lastCommands() const { return lastCommands_; }

public slots:
    void start();
    void stop();
    void tick();

signals:
    void runningChanged(bool running);
    void gestureStateChanged(GestureState state);
    void gestureTriggered(GestureEvent event);
    void cursorMoved(const QPointF &position);
    void trackingLost();
    void actuationFailed(const QString &command);
    void configRejected(const QString &reason);

private:
    void dispatch(GestureEvent event, const CursorConfig &config);
    void issue(const ActuationCommand &cmd);
    void releaseHeldButtons();
    void resetSession();
    static bool drivesCursor(GestureState state);
    static QPointF anchorFor(GestureState state, const LandmarkFrame &frame);

    LandmarkSource *source_;
    InputSimulator *actuator_;

    GestureClassifier classifier_;
    MotionFilter filter_;

    // session state
    ClassifierState classifierState_;
    FrameHistory history_;
    FilterState filterState_;

    std::shared_ptr<const CursorConfig> config_;
    mutable QMutex configMutex_;

    QTimer timer_;
    int frameTimeoutMs_;
    bool running_ = false;

    QVector<ActuationCommand> lastCommands_;

    // Buttons pressed through issue() and not yet released.
    QVector<MouseButton> heldButtons_;
};
