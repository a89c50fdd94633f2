#pragma once
#include <QRect>

#include "../common/Types.h"

/**
 * OS-level mouse injection. Every call reports whether the OS accepted it.
 */
class InputBackend
{
public:
    virtual ~InputBackend() = default;

    // Backends that need the desktop size to scale absolute moves
    virtual void setScreenGeometry(const QRect &) {}

    // Absolute mouse movement, screen pixels
    virtual bool moveAbsolute(int x, int y) = 0;

    // Button press + release (clicks are a pair of these)
    virtual bool mouseDown(MouseButton button) = 0;
    virtual bool mouseUp(MouseButton button) = 0;

    // Scrolling, wheel units (positive = up)
    virtual bool scroll(int delta) = 0;
};
