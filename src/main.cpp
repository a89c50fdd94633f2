#include <QApplication>
#include <QDebug>
#include <QGuiApplication>
#include <QScreen>

#include "core/CursorControlLoop.h"
#include "core/LandmarkStream.h"
#include "core/Settings.h"
#include "platform/InputSimulator.h"
#include "platform/PlatformFactory.h"
#include "ui/MainWindow.h"

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    QApplication::setApplicationName("HandCursor");
    QApplication::setOrganizationName("HandCursor");

    const AppSettings settings = Settings::load();

    std::unique_ptr<InputBackend> backend = PlatformFactory::createBackend();
    if (!backend)
        qWarning() << "[main] no input backend for this platform; cursor control disabled";

    InputSimulator inputSim(backend.get());

    LandmarkStream stream;
    stream.setEndpoint(settings.serverHost, settings.serverPort);

    CursorControlLoop loop(&stream, &inputSim, settings.classifier);
    loop.setTickInterval(settings.tickIntervalMs);
    loop.setFrameTimeout(settings.frameTimeoutMs);
    loop.setConfig(settings.cursor);

    if (QScreen *screen = QGuiApplication::primaryScreen())
    {
        const QRect geom = screen->geometry();
        loop.setScreenGeometry(geom);
        if (backend)
            backend->setScreenGeometry(geom);
    }

    MainWindow w;
    w.setInputSimulator(&inputSim);
    w.setLandmarkStream(&stream);
    w.setControlLoop(&loop);
    w.setSettings(settings);
    w.initialize();
    w.show();

    const int rc = app.exec();
    loop.stop();
    stream.stop();
    return rc;
}
