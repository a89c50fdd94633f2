#pragma once
#include <QByteArray>
#include <QString>
#include <QStringList>

#include "../calibration/CalibrationSearch.h"
#include "../calibration/CalibrationTrial.h"
#include "CursorConfig.h"
#include "GestureClassifier.h"

/**
 * AppSettings
 * --------------------
 * Everything read from config/client_settings.json at start-up.
 * Missing keys keep the compiled defaults. The file is never written.
 */
struct AppSettings
{
    QString serverHost = QString::fromLatin1(LANDMARK_SERVER_IP);
    quint16 serverPort = LANDMARK_SERVER_PORT;

    int tickIntervalMs = TICK_INTERVAL_MS;
    int frameTimeoutMs = FRAME_TIMEOUT_MS;

    ClassifierConfig classifier;
    CursorConfig cursor;

    CalibrationGrid calibrationGrid;
    int calibrationBudget = CALIBRATION_TRIAL_BUDGET;
    CostWeights costWeights;

    // Absolute path of the file the values came from; empty for defaults.
    QString sourcePath;
};

namespace Settings
{
    constexpr const char *DEFAULT_FILE = "config/client_settings.json";

    // Looks in the working directory and the application directory,
    // each up to three levels up. Returns an empty string if nothing is found.
    QString resolveConfigPath(const QString &relativePath = QString::fromLatin1(DEFAULT_FILE));

    // Fills *out from a JSON document. Sections that fail validation keep
    // their defaults and add a line to *warnings. Returns false only when
    // the document itself is unreadable.
    bool parse(const QByteArray &json, AppSettings *out, QStringList *warnings = nullptr);

    AppSettings load(const QString &relativePath = QString::fromLatin1(DEFAULT_FILE));
}
