#pragma once
#include <QMap>
#include <QString>
#include <QVariantMap>
#include <QVector>

#include "../common/Constants.h"
#include "../common/Types.h"

/**
 * Action
 * --------------------
 * What a gesture event does to the mouse.
 * Press/Release pairs are meant for DragStart/DragEnd.
 */
enum class Action
{
    None,
    LeftClick,
    RightClick,
    MiddleClick,
    DoubleClick,
    LeftPress,
    LeftRelease,
    RightPress,
    RightRelease,
    ScrollUp,
    ScrollDown
};

QString actionName(Action action);
bool parseAction(const QString &name, Action *out);
QVector<Action> allActions();

/**
 * CursorConfig
 * --------------------
 * Immutable snapshot of everything the control loop needs per tick.
 * A new snapshot replaces the old one as a whole; never edit a
 * snapshot that has been handed to the loop.
 */
struct CursorConfig
{
    double sensitivity = DEFAULT_SENSITIVITY;
    double smoothing = DEFAULT_SMOOTHING;
    double deadzone = DEFAULT_DEADZONE_PX;
    double acceleration = DEFAULT_ACCELERATION;
    bool invert = false;
    int scrollStep = DEFAULT_SCROLL_STEP;

    QMap<GestureEvent, Action> gestureToAction = defaultGestureBindings();

    static QMap<GestureEvent, Action> defaultGestureBindings();

    Action actionFor(GestureEvent event) const;

    // sensitivity > 0, smoothing in [0,1), deadzone >= 0, acceleration >= 1
    bool validate(QString *error = nullptr) const;

    // Settings store record: {sensitivity, smoothing, deadzone}
    QVariantMap toRecord() const;
    static bool fromRecord(const QVariantMap &record,
                           const CursorConfig &base,
                           CursorConfig *out,
                           QString *error = nullptr);

    bool operator==(const CursorConfig &o) const;
    bool operator!=(const CursorConfig &o) const { return !(*this == o); }
};

// Expands an action into the ordered commands the actuator should run.
QVector<ActuationCommand> commandsForAction(Action action, const CursorConfig &config);

Q_DECLARE_METATYPE(CursorConfig)
