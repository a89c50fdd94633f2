#include "TrainingDialog.h"

#include <QDebug>
#include <QHBoxLayout>
#include <QLabel>
#include <QMouseEvent>
#include <QPainter>
#include <QPushButton>
#include <QRandomGenerator>
#include <QVBoxLayout>

#include "../calibration/TrainingSession.h"
#include "../common/Utils.h"

namespace
{
    constexpr double ZONE_RADIUS = 36.0;
    constexpr double TOKEN_RADIUS = 18.0;
    constexpr int TARGETS_PER_TRIAL = 4;
}

// ---------------------------------------
// TrainingBoard
// ---------------------------------------
TrainingBoard::TrainingBoard(QWidget *parent)
    : QWidget(parent)
{
    setMinimumSize(640, 400);
    setMouseTracking(false);
}

void TrainingBoard::startRound(const QVector<QPointF> &targets)
{
    targets_ = targets;
    showTarget(0);
}

void TrainingBoard::clearRound()
{
    targets_.clear();
    current_ = -1;
    dragging_ = false;
    update();
}

void TrainingBoard::showTarget(int index)
{
    current_ = index;
    dragging_ = false;
    wasInZone_ = false;
    misses_ = 0;
    overshoots_ = 0;
    token_ = QPointF(width() * 0.5, height() * 0.15);
    clock_.start();
    update();
}

QPointF TrainingBoard::zoneCentre() const
{
    const QPointF &t = targets_[current_];
    return QPointF(t.x() * width(), t.y() * height());
}

bool TrainingBoard::inZone(const QPointF &pos) const
{
    return Utils::length(pos - zoneCentre()) <= ZONE_RADIUS;
}

void TrainingBoard::paintEvent(QPaintEvent *)
{
    QPainter p(this);
    p.setRenderHint(QPainter::Antialiasing);
    p.fillRect(rect(), QColor(44, 62, 80));

    if (current_ < 0 || current_ >= targets_.size())
    {
        p.setPen(Qt::white);
        p.drawText(rect(), Qt::AlignCenter, tr("Press Start to begin"));
        return;
    }

    p.setPen(QPen(QColor(46, 204, 113), 4, Qt::DashLine));
    p.setBrush(Qt::NoBrush);
    p.drawEllipse(zoneCentre(), ZONE_RADIUS, ZONE_RADIUS);

    p.setPen(QPen(dragging_ ? Qt::yellow : Qt::white, 3));
    p.setBrush(QColor(231, 76, 60));
    p.drawEllipse(token_, TOKEN_RADIUS, TOKEN_RADIUS);

    p.setPen(Qt::white);
    p.drawText(10, 20, tr("Target %1 / %2").arg(current_ + 1).arg(targets_.size()));
}

void TrainingBoard::mousePressEvent(QMouseEvent *event)
{
    if (current_ < 0)
        return;

    const QPointF pos = event->pos();
    if (Utils::length(pos - token_) <= TOKEN_RADIUS * 1.5)
    {
        dragging_ = true;
        wasInZone_ = inZone(pos);
        update();
    }
}

void TrainingBoard::mouseMoveEvent(QMouseEvent *event)
{
    if (!dragging_)
        return;

    token_ = event->pos();
    const bool nowInZone = inZone(token_);
    if (wasInZone_ && !nowInZone)
        overshoots_++;
    wasInZone_ = nowInZone;
    update();
}

void TrainingBoard::mouseReleaseEvent(QMouseEvent *event)
{
    if (!dragging_)
        return;

    dragging_ = false;
    token_ = event->pos();

    if (!inZone(token_))
    {
        misses_++;
        update();
        return;
    }

    TargetOutcome outcome;
    outcome.seconds = clock_.elapsed() / 1000.0;
    outcome.misses = misses_;
    outcome.overshoots = overshoots_;
    // Clear first: the last outcome may start the next round from the listener.
    const int next = current_ + 1;
    if (next < targets_.size())
        showTarget(next);
    else
        clearRound();

    emit targetCompleted(outcome);
}

// ---------------------------------------
// TrainingDialog
// ---------------------------------------
TrainingDialog::TrainingDialog(TrainingSession *session,
                               const CostWeights &weights,
                               int budget,
                               QWidget *parent)
    : QDialog(parent),
      session_(session),
      weights_(weights),
      budget_(budget)
{
    setWindowTitle(tr("Calibrate Cursor"));
    auto *layout = new QVBoxLayout(this);

    infoLabel_ = new QLabel(
        tr("Drag the red token into the green ring with your hand. "
           "Each round tries different cursor settings."),
        this);
    infoLabel_->setWordWrap(true);
    layout->addWidget(infoLabel_);

    board_ = new TrainingBoard(this);
    layout->addWidget(board_, 1);

    auto *btnBox = new QHBoxLayout();
    startBtn_ = new QPushButton(tr("Start"));
    acceptBtn_ = new QPushButton(tr("Use these settings"));
    discardBtn_ = new QPushButton(tr("Discard"));
    acceptBtn_->setEnabled(false);
    discardBtn_->setEnabled(false);
    btnBox->addWidget(startBtn_);
    btnBox->addStretch();
    btnBox->addWidget(discardBtn_);
    btnBox->addWidget(acceptBtn_);
    layout->addLayout(btnBox);

    connect(startBtn_, &QPushButton::clicked, this, &TrainingDialog::onStart);
    connect(acceptBtn_, &QPushButton::clicked, this, &TrainingDialog::onAccept);
    connect(discardBtn_, &QPushButton::clicked, this, &TrainingDialog::onDiscard);

    connect(board_, &TrainingBoard::targetCompleted,
            this, &TrainingDialog::onTargetCompleted);

    connect(session_, &TrainingSession::trialRequested,
            this, &TrainingDialog::onTrialRequested);
    connect(session_, &TrainingSession::searchFinished,
            this, &TrainingDialog::onSearchFinished);

    resize(760, 560);
}

QVector<QPointF> TrainingDialog::makeTargets(int count)
{
    // Same targets for every trial so costs stay comparable.
    QVector<QPointF> out;
    out.reserve(count);
    auto *rng = QRandomGenerator::global();
    for (int i = 0; i < count; ++i)
        out.append(QPointF(0.1 + 0.8 * rng->generateDouble(),
                           0.4 + 0.5 * rng->generateDouble()));
    return out;
}

void TrainingDialog::onStart()
{
    startBtn_->setEnabled(false);
    if (!session_->begin(makeTargets(TARGETS_PER_TRIAL), budget_))
    {
        infoLabel_->setText(tr("Calibration could not start."));
        startBtn_->setEnabled(true);
    }
}

void TrainingDialog::onTrialRequested(const CursorConfig &config, int index)
{
    trial_ = CalibrationTrial(config, session_->targets(), weights_);
    infoLabel_->setText(tr("Round %1 of up to %2 (sensitivity %3, smoothing %4)")
                            .arg(index + 1)
                            .arg(budget_)
                            .arg(config.sensitivity, 0, 'f', 2)
                            .arg(config.smoothing, 0, 'f', 2));
    board_->startRound(session_->targets());
}

void TrainingDialog::onTargetCompleted(const TargetOutcome &outcome)
{
    if (!trial_.record(outcome))
        return;

    if (trial_.isSealed())
        session_->submitTrial(trial_);
}

void TrainingDialog::onSearchFinished(const CursorConfig &best, double score)
{
    board_->clearRound();
    infoLabel_->setText(tr("Best: sensitivity %1, smoothing %2 (cost %3)")
                            .arg(best.sensitivity, 0, 'f', 2)
                            .arg(best.smoothing, 0, 'f', 2)
                            .arg(score, 0, 'f', 1));
    acceptBtn_->setEnabled(true);
    discardBtn_->setEnabled(true);
}

void TrainingDialog::onAccept()
{
    session_->finish(true);
    accept();
}

void TrainingDialog::onDiscard()
{
    session_->finish(false);
    QDialog::reject();
}

void TrainingDialog::reject()
{
    if (session_->isActive())
    {
        if (session_->isSearchDone())
        {
            session_->finish(false);
        }
        else
        {
            qInfo() << "[TrainingDialog] closed mid-trial, aborting";
            trial_.abort();
            session_->submitTrial(trial_);
        }
    }
    QDialog::reject();
}
