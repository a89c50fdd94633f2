#pragma once
#include "../InputBackend.h"

/**
 * Virtual absolute pointer on /dev/uinput.
 * Needs write access to /dev/uinput (input group or a udev rule).
 */
class LinuxInputBackend : public InputBackend
{
public:
    LinuxInputBackend();
    ~LinuxInputBackend() override;

    LinuxInputBackend(const LinuxInputBackend &) = delete;
    LinuxInputBackend &operator=(const LinuxInputBackend &) = delete;

    bool isOpen() const { return fd_ >= 0; }

    void setScreenGeometry(const QRect &geometry) override;

    bool moveAbsolute(int x, int y) override;

    bool mouseDown(MouseButton button) override;
    bool mouseUp(MouseButton button) override;

    bool scroll(int delta) override;

private:
    bool openDevice();
    bool sendEvent(int type, int code, int value);
    bool sendButton(MouseButton button, int value);

    int fd_ = -1;
    QRect screen_{0, 0, 1920, 1080};
};
