#include "InputSimulator.h"

#include <QDebug>

bool InputSimulator::execute(const ActuationCommand &cmd)
{
    if (!backend_)
    {
        qWarning() << "[InputSimulator] No platform backend available.";
        return false;
    }

    switch (cmd.type)
    {
    case ActuationCommand::Type::MoveTo:
        return backend_->moveAbsolute(cmd.x, cmd.y);
    case ActuationCommand::Type::MouseDown:
        return backend_->mouseDown(cmd.button);
    case ActuationCommand::Type::MouseUp:
        return backend_->mouseUp(cmd.button);
    case ActuationCommand::Type::ScrollBy:
        return backend_->scroll(cmd.delta);
    }
    return false;
}
