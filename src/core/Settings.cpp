#include "Settings.h"

#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

namespace
{
    void warn(QStringList *warnings, const QString &msg)
    {
        qWarning() << "[Settings]" << msg;
        if (warnings)
            warnings->append(msg);
    }

    void readServer(const QJsonObject &obj, AppSettings *out, QStringList *warnings)
    {
        out->serverHost = obj.value("host").toString(out->serverHost);

        const int port = obj.value("port").toInt(out->serverPort);
        if (port <= 0 || port > 65535)
            warn(warnings, QStringLiteral("landmark_server.port %1 out of range").arg(port));
        else
            out->serverPort = static_cast<quint16>(port);
    }

    void readLoop(const QJsonObject &obj, AppSettings *out, QStringList *warnings)
    {
        const int tick = obj.value("tick_interval_ms").toInt(out->tickIntervalMs);
        const int timeout = obj.value("frame_timeout_ms").toInt(out->frameTimeoutMs);

        if (tick <= 0)
            warn(warnings, QStringLiteral("loop.tick_interval_ms must be positive"));
        else
            out->tickIntervalMs = tick;

        if (timeout < 0 || timeout >= out->tickIntervalMs)
            warn(warnings, QStringLiteral("loop.frame_timeout_ms must be below the tick interval"));
        else
            out->frameTimeoutMs = timeout;
    }

    void readClassifier(const QJsonObject &obj, AppSettings *out, QStringList *warnings)
    {
        ClassifierConfig cfg = out->classifier;
        cfg.historySize = obj.value("history_frames").toInt(cfg.historySize);
        cfg.holdDurationTicks = obj.value("hold_ticks").toInt(cfg.holdDurationTicks);
        cfg.lossTimeoutTicks = obj.value("loss_timeout_ticks").toInt(cfg.lossTimeoutTicks);
        cfg.scrollRepeatTicks = obj.value("scroll_repeat_ticks").toInt(cfg.scrollRepeatTicks);
        cfg.pinchThreshold = float(obj.value("pinch_threshold").toDouble(cfg.pinchThreshold));
        cfg.pinchReleaseThreshold =
            float(obj.value("pinch_release_threshold").toDouble(cfg.pinchReleaseThreshold));
        cfg.openSpreadThreshold =
            float(obj.value("open_spread_threshold").toDouble(cfg.openSpreadThreshold));
        cfg.coordinateMargin = float(obj.value("coordinate_margin").toDouble(cfg.coordinateMargin));

        QString error;
        if (!cfg.validate(&error))
        {
            warn(warnings, QStringLiteral("classifier section ignored: %1").arg(error));
            return;
        }
        out->classifier = cfg;
    }

    void readCursor(const QJsonObject &obj, AppSettings *out, QStringList *warnings)
    {
        CursorConfig cfg = out->cursor;
        cfg.sensitivity = obj.value("sensitivity").toDouble(cfg.sensitivity);
        cfg.smoothing = obj.value("smoothing").toDouble(cfg.smoothing);
        cfg.deadzone = obj.value("deadzone").toDouble(cfg.deadzone);
        cfg.acceleration = obj.value("acceleration").toDouble(cfg.acceleration);
        cfg.invert = obj.value("invert").toBool(cfg.invert);
        cfg.scrollStep = obj.value("scroll_step").toInt(cfg.scrollStep);

        QString error;
        if (!cfg.validate(&error))
        {
            warn(warnings, QStringLiteral("cursor section ignored: %1").arg(error));
            return;
        }
        out->cursor.sensitivity = cfg.sensitivity;
        out->cursor.smoothing = cfg.smoothing;
        out->cursor.deadzone = cfg.deadzone;
        out->cursor.acceleration = cfg.acceleration;
        out->cursor.invert = cfg.invert;
        out->cursor.scrollStep = cfg.scrollStep;
    }

    void readGestures(const QJsonObject &obj, AppSettings *out, QStringList *warnings)
    {
        for (auto it = obj.constBegin(); it != obj.constEnd(); ++it)
        {
            GestureEvent event;
            if (!parseGestureEvent(it.key(), &event))
            {
                warn(warnings, QStringLiteral("unknown gesture '%1'").arg(it.key()));
                continue;
            }

            Action action;
            if (!parseAction(it.value().toString(), &action))
            {
                warn(warnings, QStringLiteral("unknown action '%1' for gesture '%2'")
                                   .arg(it.value().toString(), it.key()));
                continue;
            }
            out->cursor.gestureToAction[event] = action;
        }
    }

    void readCalibration(const QJsonObject &obj, AppSettings *out, QStringList *warnings)
    {
        CalibrationGrid grid = out->calibrationGrid;
        const int buckets = obj.value("buckets").toInt(grid.sensitivityBuckets);
        grid.sensitivityBuckets = obj.value("sensitivity_buckets").toInt(buckets);
        grid.smoothingBuckets = obj.value("smoothing_buckets").toInt(buckets);
        grid.sensitivityMin = obj.value("sensitivity_min").toDouble(grid.sensitivityMin);
        grid.sensitivityMax = obj.value("sensitivity_max").toDouble(grid.sensitivityMax);
        grid.smoothingMin = obj.value("smoothing_min").toDouble(grid.smoothingMin);
        grid.smoothingMax = obj.value("smoothing_max").toDouble(grid.smoothingMax);
        grid.eightConnected = obj.value("eight_connected").toBool(grid.eightConnected);

        QString error;
        if (grid.validate(&error))
            out->calibrationGrid = grid;
        else
            warn(warnings, QStringLiteral("calibration grid ignored: %1").arg(error));

        const int budget = obj.value("budget").toInt(out->calibrationBudget);
        if (budget < 1)
            warn(warnings, QStringLiteral("calibration.budget must be at least 1"));
        else
            out->calibrationBudget = budget;

        const QJsonObject weights = obj.value("weights").toObject();
        CostWeights w = out->costWeights;
        w.timeWeight = weights.value("time").toDouble(w.timeWeight);
        w.missWeight = weights.value("miss").toDouble(w.missWeight);
        if (w.timeWeight < 0.0 || w.missWeight < 0.0)
            warn(warnings, QStringLiteral("calibration weights must not be negative"));
        else
            out->costWeights = w;
    }
}

namespace Settings
{
    QString resolveConfigPath(const QString &relativePath)
    {
        const QFileInfo info(relativePath);
        if (info.isAbsolute())
            return info.exists() ? info.absoluteFilePath() : QString();

        const auto searchDir = [&relativePath](QDir dir) -> QString
        {
            for (int i = 0; i < 3; ++i)
            {
                const QString candidate = dir.absoluteFilePath(relativePath);
                if (QFileInfo::exists(candidate))
                    return QFileInfo(candidate).absoluteFilePath();
                if (!dir.cdUp())
                    break;
            }
            return QString();
        };

        if (const QString fromCwd = searchDir(QDir::current()); !fromCwd.isEmpty())
            return fromCwd;

        if (const QString fromApp =
                searchDir(QDir(QCoreApplication::applicationDirPath()));
            !fromApp.isEmpty())
        {
            return fromApp;
        }

        return QString();
    }

    bool parse(const QByteArray &json, AppSettings *out, QStringList *warnings)
    {
        QJsonParseError err;
        const QJsonDocument doc = QJsonDocument::fromJson(json, &err);
        if (err.error != QJsonParseError::NoError || !doc.isObject())
        {
            warn(warnings, QStringLiteral("unreadable settings: %1").arg(err.errorString()));
            return false;
        }

        const QJsonObject root = doc.object();
        readServer(root.value("landmark_server").toObject(), out, warnings);
        readLoop(root.value("loop").toObject(), out, warnings);
        readClassifier(root.value("classifier").toObject(), out, warnings);
        readCursor(root.value("cursor").toObject(), out, warnings);
        readGestures(root.value("gestures").toObject(), out, warnings);
        readCalibration(root.value("calibration").toObject(), out, warnings);
        return true;
    }

    AppSettings load(const QString &relativePath)
    {
        AppSettings settings;

        const QString path = resolveConfigPath(relativePath);
        if (path.isEmpty())
        {
            qInfo() << "[Settings]" << relativePath << "not found, using defaults";
            return settings;
        }

        QFile f(path);
        if (!f.open(QIODevice::ReadOnly))
        {
            qWarning() << "[Settings] cannot open" << path << ":" << f.errorString();
            return settings;
        }

        if (parse(f.readAll(), &settings))
            settings.sourcePath = path;

        qInfo() << "[Settings] loaded" << path;
        return settings;
    }
}
