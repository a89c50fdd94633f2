#include "WindowsInputBackend.h"

static bool sendMouse(DWORD flags, int dx = 0, int dy = 0, DWORD data = 0)
{
    INPUT in = {};
    in.type = INPUT_MOUSE;
    in.mi.dwFlags = flags;

    in.mi.dx = dx;
    in.mi.dy = dy;
    in.mi.mouseData = data;

    return SendInput(1, &in, sizeof(INPUT)) == 1;
}

bool WindowsInputBackend::moveAbsolute(int x, int y)
{
    const int w = GetSystemMetrics(SM_CXSCREEN);
    const int h = GetSystemMetrics(SM_CYSCREEN);
    if (w <= 1 || h <= 1)
        return false;

    int mx = (x * 65535) / (w - 1);
    int my = (y * 65535) / (h - 1);

    return sendMouse(MOUSEEVENTF_MOVE | MOUSEEVENTF_ABSOLUTE, mx, my);
}

bool WindowsInputBackend::mouseDown(MouseButton button)
{
    switch (button)
    {
    case MouseButton::Left:
        return sendMouse(MOUSEEVENTF_LEFTDOWN);
    case MouseButton::Right:
        return sendMouse(MOUSEEVENTF_RIGHTDOWN);
    case MouseButton::Middle:
        return sendMouse(MOUSEEVENTF_MIDDLEDOWN);
    }
    return false;
}

bool WindowsInputBackend::mouseUp(MouseButton button)
{
    switch (button)
    {
    case MouseButton::Left:
        return sendMouse(MOUSEEVENTF_LEFTUP);
    case MouseButton::Right:
        return sendMouse(MOUSEEVENTF_RIGHTUP);
    case MouseButton::Middle:
        return sendMouse(MOUSEEVENTF_MIDDLEUP);
    }
    return false;
}

bool WindowsInputBackend::scroll(int delta)
{
    return sendMouse(MOUSEEVENTF_WHEEL, 0, 0, DWORD(delta));
}
