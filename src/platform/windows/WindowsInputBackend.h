#pragma once
#include "../InputBackend.h"
#include <windows.h>

class WindowsInputBackend : public InputBackend
{
public:
    WindowsInputBackend() = default;

    bool moveAbsolute(int x, int y) override;

    bool mouseDown(MouseButton button) override;
    bool mouseUp(MouseButton button) override;

    bool scroll(int delta) override;
};
