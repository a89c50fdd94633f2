#pragma once

#include <QMainWindow>
#include <QPointF>
#include <QVariantMap>

class QListWidget;
class QListWidgetItem;
class QComboBox;
class QPushButton;
class QLabel;
class QCheckBox;

#include "../common/Utils.h"
#include "../core/CursorControlLoop.h"
#include "../core/LandmarkStream.h"
#include "../core/Settings.h"
#include "../platform/InputSimulator.h"

class TrainingSession;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(QWidget *parent = nullptr);

    void initialize(); // called after injection

    void setInputSimulator(InputSimulator *sim) { inputSim_ = sim; }
    void setLandmarkStream(LandmarkStream *stream) { stream_ = stream; }
    void setControlLoop(CursorControlLoop *loop) { loop_ = loop; }
    void setSettings(const AppSettings &settings) { settings_ = settings; }

private slots:
    void onGestureSelected(QListWidgetItem *item);
    void onBindActionChanged(int index);
    void onTestActionClicked();
    void onTrackingToggled(bool checked);

    void onConnectionStatusChanged(const QString &status);
    void onGestureStateChanged(GestureState state);
    void onGestureTriggered(GestureEvent event);
    void onCursorMoved(const QPointF &position);
    void onActuationFailed(const QString &command);
    void onConfigRejected(const QString &reason);

    void openSettingsDialog();
    void openTrainingDialog();
    void onCalibrated(const QVariantMap &record);

private:
    void setupUi();
    void loadGestureList();
    GestureEvent selectedEvent(bool *ok) const;

private:
    QListWidget *gestureList_ = nullptr;
    QLabel *gestureLabel_ = nullptr;
    QComboBox *actionCombo_ = nullptr;
    QPushButton *testButton_ = nullptr;
    QCheckBox *trackingCheckBox_ = nullptr;
    QLabel *stateLabel_ = nullptr;
    QLabel *fpsLabel_ = nullptr;
    QLabel *statusLabel_ = nullptr;

    InputSimulator *inputSim_ = nullptr;
    LandmarkStream *stream_ = nullptr;
    CursorControlLoop *loop_ = nullptr;
    TrainingSession *training_ = nullptr;

    AppSettings settings_;
    Utils::FPSTimer fpsTimer_;
    float fps_ = 0.f;
};
