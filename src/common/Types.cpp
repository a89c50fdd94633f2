#include "Types.h"

QString gestureStateName(GestureState state)
{
    switch (state)
    {
    case GestureState::Idle:
        return QStringLiteral("idle");
    case GestureState::Pointing:
        return QStringLiteral("pointing");
    case GestureState::PinchArmed:
        return QStringLiteral("pinch_armed");
    case GestureState::PinchHolding:
        return QStringLiteral("pinch_holding");
    case GestureState::FistHeld:
        return QStringLiteral("fist");
    case GestureState::PeaceHeld:
        return QStringLiteral("peace");
    case GestureState::OpenHeld:
        return QStringLiteral("open_hand");
    }
    return QStringLiteral("unknown");
}

QString gestureEventName(GestureEvent event)
{
    switch (event)
    {
    case GestureEvent::Click:
        return QStringLiteral("pinch_click");
    case GestureEvent::DragStart:
        return QStringLiteral("drag_start");
    case GestureEvent::DragEnd:
        return QStringLiteral("drag_end");
    case GestureEvent::LeftClick:
        return QStringLiteral("fist_click");
    case GestureEvent::RightClick:
        return QStringLiteral("peace_click");
    case GestureEvent::ScrollUp:
        return QStringLiteral("open_scroll");
    }
    return QStringLiteral("unknown");
}

bool parseGestureEvent(const QString &name, GestureEvent *out)
{
    static const GestureEvent all[] = {
        GestureEvent::Click, GestureEvent::DragStart, GestureEvent::DragEnd,
        GestureEvent::LeftClick, GestureEvent::RightClick, GestureEvent::ScrollUp};

    const QString key = name.trimmed().toLower();
    for (GestureEvent e : all)
    {
        if (gestureEventName(e) == key)
        {
            if (out)
                *out = e;
            return true;
        }
    }
    return false;
}

static QString buttonName(MouseButton b)
{
    switch (b)
    {
    case MouseButton::Left:
        return QStringLiteral("left");
    case MouseButton::Right:
        return QStringLiteral("right");
    case MouseButton::Middle:
        return QStringLiteral("middle");
    }
    return QStringLiteral("?");
}

QString describeCommand(const ActuationCommand &cmd)
{
    switch (cmd.type)
    {
    case ActuationCommand::Type::MoveTo:
        return QStringLiteral("MoveTo(%1,%2)").arg(cmd.x).arg(cmd.y);
    case ActuationCommand::Type::MouseDown:
        return QStringLiteral("MouseDown(%1)").arg(buttonName(cmd.button));
    case ActuationCommand::Type::MouseUp:
        return QStringLiteral("MouseUp(%1)").arg(buttonName(cmd.button));
    case ActuationCommand::Type::ScrollBy:
        return QStringLiteral("ScrollBy(%1)").arg(cmd.delta);
    }
    return QStringLiteral("Unknown");
}
