#pragma once
#include <QMetaType>
#include <QString>
#include <QVector>

struct Landmark
{
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
};

/**
 * One observation of a single hand.
 * Points follow the MediaPipe hand topology (see HandLandmark).
 */
struct LandmarkFrame
{
    quint64 sequence = 0;
    qint64 timestampMs = 0;
    QString handedness;
    QVector<Landmark> points;
};

namespace HandLandmark
{
    enum Index
    {
        Wrist = 0,
        ThumbCmc = 1,
        ThumbMcp = 2,
        ThumbIp = 3,
        ThumbTip = 4,
        IndexMcp = 5,
        IndexPip = 6,
        IndexDip = 7,
        IndexTip = 8,
        MiddleMcp = 9,
        MiddlePip = 10,
        MiddleDip = 11,
        MiddleTip = 12,
        RingMcp = 13,
        RingPip = 14,
        RingDip = 15,
        RingTip = 16,
        PinkyMcp = 17,
        PinkyPip = 18,
        PinkyDip = 19,
        PinkyTip = 20
    };
}

enum class GestureState
{
    Idle,
    Pointing,
    PinchArmed,
    PinchHolding,
    FistHeld,
    PeaceHeld,
    OpenHeld
};

enum class GestureEvent
{
    Click,
    DragStart,
    DragEnd,
    LeftClick,
    RightClick,
    ScrollUp
};

enum class MouseButton
{
    Left,
    Right,
    Middle
};

struct ActuationCommand
{
    enum class Type
    {
        MoveTo,
        MouseDown,
        MouseUp,
        ScrollBy
    };

    Type type = Type::MoveTo;
    int x = 0;
    int y = 0;
    MouseButton button = MouseButton::Left;
    int delta = 0;

    static ActuationCommand moveTo(int x, int y)
    {
        ActuationCommand c;
        c.type = Type::MoveTo;
        c.x = x;
        c.y = y;
        return c;
    }

    static ActuationCommand mouseDown(MouseButton b)
    {
        ActuationCommand c;
        c.type = Type::MouseDown;
        c.button = b;
        return c;
    }

    static ActuationCommand mouseUp(MouseButton b)
    {
        ActuationCommand c;
        c.type = Type::MouseUp;
        c.button = b;
        return c;
    }

    static ActuationCommand scrollBy(int delta)
    {
        ActuationCommand c;
        c.type = Type::ScrollBy;
        c.delta = delta;
        return c;
    }

    bool operator==(const ActuationCommand &o) const
    {
        return type == o.type && x == o.x && y == o.y &&
               button == o.button && delta == o.delta;
    }
};

QString gestureStateName(GestureState state);
QString gestureEventName(GestureEvent event);
bool parseGestureEvent(const QString &name, GestureEvent *out);
QString describeCommand(const ActuationCommand &cmd);

Q_DECLARE_METATYPE(GestureState)
Q_DECLARE_METATYPE(GestureEvent)
