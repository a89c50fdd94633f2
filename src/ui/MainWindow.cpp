#include "MainWindow.h"
#include "SettingsDialog.h"
#include "TrainingDialog.h"

#include "../calibration/TrainingSession.h"

#include <QAction>
#include <QCheckBox>
#include <QComboBox>
#include <QDebug>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QListWidget>
#include <QMenuBar>
#include <QPushButton>
#include <QSignalBlocker>
#include <QSplitter>
#include <QStatusBar>
#include <QVBoxLayout>
#include <QWidget>

// -------------------------------
// Constructor
// -------------------------------
MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent)
{
    setupUi();
    loadGestureList();
}

// ---------------------------------------
// Called after dependencies are injected
// ---------------------------------------
void MainWindow::initialize()
{
    if (!loop_ || !stream_)
    {
        qWarning() << "[MW] ERROR: control loop or landmark stream not set before initialize()!";
        return;
    }

    training_ = new TrainingSession(loop_, settings_.calibrationGrid, this);
    connect(training_, &TrainingSession::calibrated,
            this, &MainWindow::onCalibrated);

    connect(stream_, &LandmarkStream::connectionStatusChanged,
            this, &MainWindow::onConnectionStatusChanged);

    connect(loop_, &CursorControlLoop::gestureStateChanged,
            this, &MainWindow::onGestureStateChanged);
    connect(loop_, &CursorControlLoop::gestureTriggered,
            this, &MainWindow::onGestureTriggered);
    connect(loop_, &CursorControlLoop::cursorMoved,
            this, &MainWindow::onCursorMoved);
    connect(loop_, &CursorControlLoop::actuationFailed,
            this, &MainWindow::onActuationFailed);
    connect(loop_, &CursorControlLoop::configRejected,
            this, &MainWindow::onConfigRejected);
    connect(loop_, &CursorControlLoop::trackingLost, this, [this]()
            { statusLabel_->setText(tr("Hand lost")); });
    connect(loop_, &CursorControlLoop::runningChanged, this, [this](bool running)
            {
                const QSignalBlocker block(trackingCheckBox_);
                trackingCheckBox_->setChecked(running);
            });

    // local UI connections
    connect(gestureList_, &QListWidget::itemClicked,
            this, &MainWindow::onGestureSelected);

    connect(actionCombo_, QOverload<int>::of(&QComboBox::currentIndexChanged),
            this, &MainWindow::onBindActionChanged);

    connect(testButton_, &QPushButton::clicked,
            this, &MainWindow::onTestActionClicked);

    connect(trackingCheckBox_, &QCheckBox::toggled,
            this, &MainWindow::onTrackingToggled);

    if (auto *item = gestureList_->currentItem())
        onGestureSelected(item);

    qDebug() << "[MW] initialize(): connections established.";
}

void MainWindow::setupUi()
{
    auto *central = new QWidget(this);
    auto *mainLayout = new QHBoxLayout(central);

    auto *gestureGroup = new QGroupBox(tr("Gestures"), central);
    auto *gestureLayout = new QVBoxLayout(gestureGroup);

    gestureList_ = new QListWidget(gestureGroup);
    gestureLayout->addWidget(gestureList_);

    auto *bindGroup = new QGroupBox(tr("Binding / Actions"), central);
    auto *bindLayout = new QVBoxLayout(bindGroup);

    gestureLabel_ = new QLabel(tr("Selected: (none)"), bindGroup);

    auto *settingsAct = new QAction(tr("Cursor Settings..."), this);
    menuBar()->addAction(settingsAct);
    connect(settingsAct, &QAction::triggered, this, &MainWindow::openSettingsDialog);

    auto *trainingAct = new QAction(tr("Calibrate..."), this);
    menuBar()->addAction(trainingAct);
    connect(trainingAct, &QAction::triggered, this, &MainWindow::openTrainingDialog);

    actionCombo_ = new QComboBox(bindGroup);
    for (Action action : allActions())
        actionCombo_->addItem(actionName(action), static_cast<int>(action));

    testButton_ = new QPushButton(tr("Test action"), bindGroup);
    trackingCheckBox_ = new QCheckBox(tr("Enable tracking (connect to hand tracker)"), bindGroup);
    stateLabel_ = new QLabel(tr("Gesture: idle"), bindGroup);

    bindLayout->addWidget(gestureLabel_);
    bindLayout->addWidget(new QLabel(tr("Action for this gesture:"), bindGroup));
    bindLayout->addWidget(actionCombo_);
    bindLayout->addWidget(testButton_);
    bindLayout->addWidget(trackingCheckBox_);
    bindLayout->addWidget(stateLabel_);
    bindLayout->addStretch();

    auto *splitter = new QSplitter(Qt::Horizontal, central);
    splitter->addWidget(gestureGroup);
    splitter->addWidget(bindGroup);
    splitter->setStretchFactor(0, 1);
    splitter->setStretchFactor(1, 2);

    mainLayout->addWidget(splitter);
    setCentralWidget(central);

    statusLabel_ = new QLabel(tr("Ready"), this);
    fpsLabel_ = new QLabel(this);
    statusBar()->addWidget(statusLabel_, 1);
    statusBar()->addPermanentWidget(fpsLabel_);

    setWindowTitle(tr("HandCursor"));
    resize(900, 550);
}

void MainWindow::loadGestureList()
{
    const GestureEvent events[] = {
        GestureEvent::Click,
        GestureEvent::DragStart,
        GestureEvent::DragEnd,
        GestureEvent::LeftClick,
        GestureEvent::RightClick,
        GestureEvent::ScrollUp};

    for (GestureEvent event : events)
    {
        auto *item = new QListWidgetItem(gestureEventName(event), gestureList_);
        item->setData(Qt::UserRole, static_cast<int>(event));
    }

    gestureList_->setCurrentRow(0);
}

GestureEvent MainWindow::selectedEvent(bool *ok) const
{
    auto *item = gestureList_->currentItem();
    *ok = item != nullptr;
    if (!item)
        return GestureEvent::Click;
    return static_cast<GestureEvent>(item->data(Qt::UserRole).toInt());
}

void MainWindow::onGestureSelected(QListWidgetItem *item)
{
    if (!item || !loop_)
        return;

    const auto event = static_cast<GestureEvent>(item->data(Qt::UserRole).toInt());
    gestureLabel_->setText(tr("Selected: %1").arg(gestureEventName(event)));

    const Action current = loop_->config()->actionFor(event);
    int index = actionCombo_->findData(static_cast<int>(current));
    if (index < 0)
        index = 0;

    const QSignalBlocker block(actionCombo_);
    actionCombo_->setCurrentIndex(index);
}

void MainWindow::onBindActionChanged(int index)
{
    bool ok = false;
    const GestureEvent event = selectedEvent(&ok);
    if (!ok || !loop_ || index < 0)
        return;

    const auto action = static_cast<Action>(actionCombo_->itemData(index).toInt());

    // Snapshots are immutable; bind on a copy and swap it in.
    CursorConfig cfg = *loop_->config();
    cfg.gestureToAction[event] = action;
    if (!loop_->setConfig(cfg))
        return;

    statusLabel_->setText(
        tr("Bound gesture '%1' to action '%2'")
            .arg(gestureEventName(event), actionName(action)));
}

void MainWindow::onTestActionClicked()
{
    bool ok = false;
    const GestureEvent event = selectedEvent(&ok);
    if (!ok || !loop_ || !inputSim_)
        return;

    const auto cfg = loop_->config();
    const Action action = cfg->actionFor(event);

    statusLabel_->setText(
        tr("Testing action '%1' for gesture '%2'")
            .arg(actionName(action), gestureEventName(event)));

    for (const ActuationCommand &cmd : commandsForAction(action, *cfg))
    {
        if (!inputSim_->execute(cmd))
        {
            onActuationFailed(describeCommand(cmd));
            break;
        }
    }
}

void MainWindow::onTrackingToggled(bool checked)
{
    if (checked)
    {
        stream_->start();
        loop_->start();
        statusLabel_->setText(tr("Connecting to hand tracker..."));
    }
    else
    {
        loop_->stop();
        stream_->stop();
        fpsLabel_->clear();
        statusLabel_->setText(tr("Tracking disabled"));
    }
}

void MainWindow::onConnectionStatusChanged(const QString &status)
{
    statusLabel_->setText(status);
}

void MainWindow::onGestureStateChanged(GestureState state)
{
    stateLabel_->setText(tr("Gesture: %1").arg(gestureStateName(state)));
}

void MainWindow::onGestureTriggered(GestureEvent event)
{
    const Action action = loop_->config()->actionFor(event);
    statusLabel_->setText(
        tr("%1 -> %2").arg(gestureEventName(event), actionName(action)));
}

void MainWindow::onCursorMoved(const QPointF &position)
{
    Q_UNUSED(position);

    const float instant = fpsTimer_.fps();
    fps_ = fps_ <= 0.f ? instant : 0.9f * fps_ + 0.1f * instant;
    fpsLabel_->setText(tr("%1 fps").arg(fps_, 0, 'f', 1));
}

void MainWindow::onActuationFailed(const QString &command)
{
    statusLabel_->setText(tr("Input failed: %1").arg(command));
}

void MainWindow::onConfigRejected(const QString &reason)
{
    statusLabel_->setText(tr("Config rejected: %1").arg(reason));
}

void MainWindow::openSettingsDialog()
{
    if (!loop_)
        return;

    SettingsDialog dlg(loop_, this);
    connect(&dlg, &SettingsDialog::configApplied, this, [this]()
            { statusLabel_->setText(tr("Cursor settings applied")); });
    dlg.exec();
}

void MainWindow::openTrainingDialog()
{
    if (!training_)
        return;

    if (!stream_->isConnected())
        stream_->start();

    TrainingDialog dlg(training_, settings_.costWeights, settings_.calibrationBudget, this);
    dlg.exec();
}

void MainWindow::onCalibrated(const QVariantMap &record)
{
    statusLabel_->setText(
        tr("Calibrated: sensitivity %1, smoothing %2, deadzone %3")
            .arg(record.value("sensitivity").toDouble(), 0, 'f', 2)
            .arg(record.value("smoothing").toDouble(), 0, 'f', 2)
            .arg(record.value("deadzone").toDouble(), 0, 'f', 1));
}
