#pragma once
#include <QObject>
#include <QPointF>
#include <QVariantMap>
#include <QVector>

#include "CalibrationSearch.h"

class CursorControlLoop;

/**
 * TrainingSession
 * -----------------------
 * Lends the control loop's config slot to a CalibrationSearch. Every
 * candidate is swapped into the live loop while the user runs a trial
 * with it; when the session ends the previous config comes back unless
 * the best candidate was accepted.
 *
 * Typical use from the training dialog:
 *   begin(targets, budget)  -> trialRequested(config, 0)
 *   submitTrial(trial)      -> trialRequested(config, 1) ... searchFinished(best, score)
 *   finish(true)            -> calibrated(record), ended(true)
 */
class TrainingSession : public QObject
{
    Q_OBJECT

public:
    explicit TrainingSession(CursorControlLoop *loop,
                             const CalibrationGrid &grid = CalibrationGrid(),
                             QObject *parent = nullptr);

    bool begin(const QVector<QPointF> &targets, int budget);
    bool submitTrial(const CalibrationTrial &trial);
    void finish(bool accept);
    void cancel();

    bool isActive() const { return active_; }
    bool isSearchDone() const { return searchDone_; }
    int trialIndex() const { return trialIndex_; }

    const QVector<QPointF> &targets() const { return targets_; }
    const CursorConfig &candidate() const { return candidate_; }
    const CursorConfig &previousConfig() const { return previous_; }
    const CalibrationSearch &search() const { return search_; }

signals:
    void trialRequested(const CursorConfig &config, int index);
    void searchFinished(const CursorConfig &best, double score);
    void calibrated(const QVariantMap &record);
    void ended(bool accepted);

private:
    void advance();
    void end(bool accepted);

    CursorControlLoop *loop_;
    CalibrationSearch search_;

    QVector<QPointF> targets_;
    CursorConfig previous_;
    CursorConfig candidate_;

    bool active_ = false;
    bool searchDone_ = false;
    bool loopWasRunning_ = false;
    int trialIndex_ = -1;
};
