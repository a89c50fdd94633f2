#include "CursorConfig.h"

#include <cmath>

namespace
{
    struct ActionEntry
    {
        Action action;
        const char *name;
    };

    const ActionEntry kActions[] = {
        {Action::None, "no_action"},
        {Action::LeftClick, "left_click"},
        {Action::RightClick, "right_click"},
        {Action::MiddleClick, "middle_click"},
        {Action::DoubleClick, "double_click"},
        {Action::LeftPress, "left_press"},
        {Action::LeftRelease, "left_release"},
        {Action::RightPress, "right_press"},
        {Action::RightRelease, "right_release"},
        {Action::ScrollUp, "scroll_up"},
        {Action::ScrollDown, "scroll_down"},
    };
}

QString actionName(Action action)
{
    for (const auto &entry : kActions)
    {
        if (entry.action == action)
            return QString::fromLatin1(entry.name);
    }
    return QStringLiteral("no_action");
}

bool parseAction(const QString &name, Action *out)
{
    const QString key = name.trimmed().toLower();
    for (const auto &entry : kActions)
    {
        if (key == QLatin1String(entry.name))
        {
            if (out)
                *out = entry.action;
            return true;
        }
    }
    return false;
}

QVector<Action> allActions()
{
    QVector<Action> out;
    for (const auto &entry : kActions)
        out.append(entry.action);
    return out;
}

QMap<GestureEvent, Action> CursorConfig::defaultGestureBindings()
{
    QMap<GestureEvent, Action> bindings;
    bindings[GestureEvent::Click] = Action::LeftClick;
    bindings[GestureEvent::DragStart] = Action::LeftPress;
    bindings[GestureEvent::DragEnd] = Action::LeftRelease;
    bindings[GestureEvent::LeftClick] = Action::LeftClick;
    bindings[GestureEvent::RightClick] = Action::RightClick;
    bindings[GestureEvent::ScrollUp] = Action::ScrollUp;
    return bindings;
}

Action CursorConfig::actionFor(GestureEvent event) const
{
    return gestureToAction.value(event, Action::None);
}

bool CursorConfig::validate(QString *error) const
{
    auto fail = [error](const QString &msg)
    {
        if (error)
            *error = msg;
        return false;
    };

    if (!std::isfinite(sensitivity) || sensitivity <= 0.0)
        return fail(QStringLiteral("sensitivity must be > 0 (got %1)").arg(sensitivity));
    if (!std::isfinite(smoothing) || smoothing < 0.0 || smoothing >= 1.0)
        return fail(QStringLiteral("smoothing must be in [0, 1) (got %1)").arg(smoothing));
    if (!std::isfinite(deadzone) || deadzone < 0.0)
        return fail(QStringLiteral("deadzone must be >= 0 (got %1)").arg(deadzone));
    if (!std::isfinite(acceleration) || acceleration < 1.0)
        return fail(QStringLiteral("acceleration must be >= 1 (got %1)").arg(acceleration));
    if (scrollStep <= 0)
        return fail(QStringLiteral("scroll step must be > 0 (got %1)").arg(scrollStep));

    return true;
}

QVariantMap CursorConfig::toRecord() const
{
    QVariantMap record;
    record[QStringLiteral("sensitivity")] = sensitivity;
    record[QStringLiteral("smoothing")] = smoothing;
    record[QStringLiteral("deadzone")] = deadzone;
    return record;
}

bool CursorConfig::fromRecord(const QVariantMap &record,
                              const CursorConfig &base,
                              CursorConfig *out,
                              QString *error)
{
    CursorConfig cfg = base;

    const auto readNumber = [&record, error](const char *key, double *target)
    {
        const QString k = QString::fromLatin1(key);
        if (!record.contains(k))
            return true;

        bool ok = false;
        const double v = record.value(k).toDouble(&ok);
        if (!ok)
        {
            if (error)
                *error = QStringLiteral("'%1' is not a number").arg(k);
            return false;
        }
        *target = v;
        return true;
    };

    if (!readNumber("sensitivity", &cfg.sensitivity) ||
        !readNumber("smoothing", &cfg.smoothing) ||
        !readNumber("deadzone", &cfg.deadzone))
        return false;

    if (!cfg.validate(error))
        return false;

    if (out)
        *out = cfg;
    return true;
}

bool CursorConfig::operator==(const CursorConfig &o) const
{
    return sensitivity == o.sensitivity &&
           smoothing == o.smoothing &&
           deadzone == o.deadzone &&
           acceleration == o.acceleration &&
           invert == o.invert &&
           scrollStep == o.scrollStep &&
           gestureToAction == o.gestureToAction;
}

QVector<ActuationCommand> commandsForAction(Action action, const CursorConfig &config)
{
    using C = ActuationCommand;

    switch (action)
    {
    case Action::None:
        return {};
    case Action::LeftClick:
        return {C::mouseDown(MouseButton::Left), C::mouseUp(MouseButton::Left)};
    case Action::RightClick:
        return {C::mouseDown(MouseButton::Right), C::mouseUp(MouseButton::Right)};
    case Action::MiddleClick:
        return {C::mouseDown(MouseButton::Middle), C::mouseUp(MouseButton::Middle)};
    case Action::DoubleClick:
        return {C::mouseDown(MouseButton::Left), C::mouseUp(MouseButton::Left),
                C::mouseDown(MouseButton::Left), C::mouseUp(MouseButton::Left)};
    case Action::LeftPress:
        return {C::mouseDown(MouseButton::Left)};
    case Action::LeftRelease:
        return {C::mouseUp(MouseButton::Left)};
    case Action::RightPress:
        return {C::mouseDown(MouseButton::Right)};
    case Action::RightRelease:
        return {C::mouseUp(MouseButton::Right)};
    case Action::ScrollUp:
        return {C::scrollBy(config.scrollStep)};
    case Action::ScrollDown:
        return {C::scrollBy(-config.scrollStep)};
    }
    return {};
}
