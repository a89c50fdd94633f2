#include "LinuxInputBackend.h"

#include <QDebug>

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <linux/uinput.h>
#include <sys/ioctl.h>
#include <unistd.h>

static constexpr int ABS_RANGE = 65535;

static int buttonCode(MouseButton button)
{
    switch (button)
    {
    case MouseButton::Left:
        return BTN_LEFT;
    case MouseButton::Right:
        return BTN_RIGHT;
    case MouseButton::Middle:
        return BTN_MIDDLE;
    }
    return BTN_LEFT;
}

LinuxInputBackend::LinuxInputBackend()
{
    if (!openDevice())
        qWarning() << "[LinuxInputBackend] uinput unavailable:" << std::strerror(errno);
}

LinuxInputBackend::~LinuxInputBackend()
{
    if (fd_ >= 0)
    {
        ioctl(fd_, UI_DEV_DESTROY);
        close(fd_);
    }
}

bool LinuxInputBackend::openDevice()
{
    fd_ = open("/dev/uinput", O_WRONLY | O_NONBLOCK);
    if (fd_ < 0)
        return false;

    bool ok = ioctl(fd_, UI_SET_EVBIT, EV_KEY) == 0 &&
              ioctl(fd_, UI_SET_KEYBIT, BTN_LEFT) == 0 &&
              ioctl(fd_, UI_SET_KEYBIT, BTN_RIGHT) == 0 &&
              ioctl(fd_, UI_SET_KEYBIT, BTN_MIDDLE) == 0 &&
              ioctl(fd_, UI_SET_EVBIT, EV_REL) == 0 &&
              ioctl(fd_, UI_SET_RELBIT, REL_WHEEL) == 0 &&
              ioctl(fd_, UI_SET_EVBIT, EV_ABS) == 0 &&
              ioctl(fd_, UI_SET_ABSBIT, ABS_X) == 0 &&
              ioctl(fd_, UI_SET_ABSBIT, ABS_Y) == 0;

    for (int axis : {ABS_X, ABS_Y})
    {
        if (!ok)
            break;
        uinput_abs_setup abs;
        std::memset(&abs, 0, sizeof(abs));
        abs.code = axis;
        abs.absinfo.minimum = 0;
        abs.absinfo.maximum = ABS_RANGE;
        ok = ioctl(fd_, UI_ABS_SETUP, &abs) == 0;
    }

    if (ok)
    {
        uinput_setup setup;
        std::memset(&setup, 0, sizeof(setup));
        setup.id.bustype = BUS_VIRTUAL;
        setup.id.vendor = 0x1209;
        setup.id.product = 0x4843;
        std::strncpy(setup.name, "HandCursor virtual pointer", UINPUT_MAX_NAME_SIZE - 1);
        ok = ioctl(fd_, UI_DEV_SETUP, &setup) == 0 &&
             ioctl(fd_, UI_DEV_CREATE) == 0;
    }

    if (!ok)
    {
        close(fd_);
        fd_ = -1;
    }
    return ok;
}

void LinuxInputBackend::setScreenGeometry(const QRect &geometry)
{
    if (geometry.width() > 1 && geometry.height() > 1)
        screen_ = geometry;
}

bool LinuxInputBackend::sendEvent(int type, int code, int value)
{
    if (fd_ < 0)
        return false;

    input_event ev;
    std::memset(&ev, 0, sizeof(ev));
    ev.type = type;
    ev.code = code;
    ev.value = value;
    return write(fd_, &ev, sizeof(ev)) == ssize_t(sizeof(ev));
}

bool LinuxInputBackend::moveAbsolute(int x, int y)
{
    const int ax = int(qint64(x - screen_.left()) * ABS_RANGE / (screen_.width() - 1));
    const int ay = int(qint64(y - screen_.top()) * ABS_RANGE / (screen_.height() - 1));

    return sendEvent(EV_ABS, ABS_X, qBound(0, ax, ABS_RANGE)) &&
           sendEvent(EV_ABS, ABS_Y, qBound(0, ay, ABS_RANGE)) &&
           sendEvent(EV_SYN, SYN_REPORT, 0);
}

bool LinuxInputBackend::sendButton(MouseButton button, int value)
{
    return sendEvent(EV_KEY, buttonCode(button), value) &&
           sendEvent(EV_SYN, SYN_REPORT, 0);
}

bool LinuxInputBackend::mouseDown(MouseButton button)
{
    return sendButton(button, 1);
}

bool LinuxInputBackend::mouseUp(MouseButton button)
{
    return sendButton(button, 0);
}

bool LinuxInputBackend::scroll(int delta)
{
    // One wheel detent is 120 units
    int notches = delta / 120;
    if (notches == 0 && delta != 0)
        notches = delta > 0 ? 1 : -1;

    return sendEvent(EV_REL, REL_WHEEL, notches) &&
           sendEvent(EV_SYN, SYN_REPORT, 0);
}
