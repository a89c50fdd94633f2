#pragma once
#include <QDialog>
#include <QElapsedTimer>
#include <QPointF>
#include <QVector>
#include <QWidget>

#include "../calibration/CalibrationTrial.h"

QT_BEGIN_NAMESPACE
class QLabel;
class QPushButton;
QT_END_NAMESPACE

class TrainingSession;

/**
 * TrainingBoard
 * -----------------------
 * Drag-and-drop playfield. One token and one drop zone are shown at a
 * time; the user drags the token into the zone with the hand cursor.
 * Targets are stored normalized to [0,1] and scaled to the widget.
 *
 * A release outside the zone is a miss. Leaving the zone again while
 * still dragging counts as an overshoot.
 */
class TrainingBoard : public QWidget
{
    Q_OBJECT

public:
    explicit TrainingBoard(QWidget *parent = nullptr);

    void startRound(const QVector<QPointF> &targets);
    void clearRound();

    int currentTarget() const { return current_; }

signals:
    void targetCompleted(const TargetOutcome &outcome);

protected:
    void paintEvent(QPaintEvent *event) override;
    void mousePressEvent(QMouseEvent *event) override;
    void mouseMoveEvent(QMouseEvent *event) override;
    void mouseReleaseEvent(QMouseEvent *event) override;

private:
    QPointF zoneCentre() const;
    bool inZone(const QPointF &pos) const;
    void showTarget(int index);

    QVector<QPointF> targets_;
    int current_ = -1;

    QPointF token_;
    bool dragging_ = false;
    bool wasInZone_ = false;

    QElapsedTimer clock_;
    int misses_ = 0;
    int overshoots_ = 0;
};

/**
 * TrainingDialog
 * -----------------------
 * Hosts the board and drives a TrainingSession: every candidate config
 * gets one round over the same targets, recorded as a CalibrationTrial.
 * Closing the dialog mid-trial aborts the trial and cancels the session.
 */
class TrainingDialog : public QDialog
{
    Q_OBJECT

public:
    TrainingDialog(TrainingSession *session,
                   const CostWeights &weights,
                   int budget,
                   QWidget *parent = nullptr);

public slots:
    void reject() override;

private slots:
    void onStart();
    void onTrialRequested(const CursorConfig &config, int index);
    void onTargetCompleted(const TargetOutcome &outcome);
    void onSearchFinished(const CursorConfig &best, double score);
    void onAccept();
    void onDiscard();

private:
    static QVector<QPointF> makeTargets(int count);

    TrainingSession *session_;
    CostWeights weights_;
    int budget_;

    TrainingBoard *board_;
    QLabel *infoLabel_;
    QPushButton *startBtn_;
    QPushButton *acceptBtn_;
    QPushButton *discardBtn_;

    CalibrationTrial trial_;
};
