#include "TrainingSession.h"

#include <QDebug>

#include <limits>

#include "../core/CursorControlLoop.h"

TrainingSession::TrainingSession(CursorControlLoop *loop,
                                 const CalibrationGrid &grid,
                                 QObject *parent)
    : QObject(parent),
      loop_(loop),
      search_(grid)
{
}

bool TrainingSession::begin(const QVector<QPointF> &targets, int budget)
{
    if (!loop_)
    {
        qWarning() << "[TrainingSession] no control loop attached";
        return false;
    }
    if (active_)
    {
        qWarning() << "[TrainingSession] already running";
        return false;
    }
    if (targets.isEmpty())
    {
        qWarning() << "[TrainingSession] refusing to start without drop targets";
        return false;
    }

    targets_ = targets;
    previous_ = *loop_->config();
    search_.setBaseConfig(previous_);
    search_.begin(budget);

    active_ = true;
    searchDone_ = false;
    trialIndex_ = -1;
    loopWasRunning_ = loop_->isRunning();
    loop_->start();

    qInfo() << "[TrainingSession] started with" << targets_.size() << "targets, budget" << budget;
    advance();
    return true;
}

bool TrainingSession::submitTrial(const CalibrationTrial &trial)
{
    if (!active_ || searchDone_)
    {
        qWarning() << "[TrainingSession] trial submitted while no candidate is pending";
        return false;
    }
    if (!trial.isSealed())
    {
        qWarning() << "[TrainingSession] trial must be sealed before it is submitted";
        return false;
    }
    if (!trial.isAborted() && !trial.isComplete())
    {
        qWarning() << "[TrainingSession] trial covers" << trial.outcomes().size() << "of"
                   << trial.targets().size() << "targets, refused";
        return false;
    }

    search_.report(trial);

    if (trial.isAborted())
    {
        cancel();
        return true;
    }

    advance();
    return true;
}

void TrainingSession::advance()
{
    while (search_.hasNext())
    {
        const CursorConfig next = search_.next();
        QString error;
        if (loop_->setConfig(next, &error))
        {
            candidate_ = next;
            ++trialIndex_;
            emit trialRequested(candidate_, trialIndex_);
            return;
        }

        // Unusable cell; score it out of contention and move on.
        qWarning() << "[TrainingSession] skipping candidate:" << error;
        search_.report(std::numeric_limits<double>::infinity());
    }

    searchDone_ = true;

    const std::optional<SearchNode> best = search_.bestNode();
    candidate_ = search_.bestConfig();
    loop_->setConfig(candidate_);

    const double score = best ? *best->score : std::numeric_limits<double>::quiet_NaN();
    qInfo() << "[TrainingSession] search finished after" << search_.trialsRun()
            << "trials, best sensitivity" << candidate_.sensitivity
            << "smoothing" << candidate_.smoothing << "cost" << score;
    emit searchFinished(candidate_, score);
}

void TrainingSession::finish(bool accept)
{
    if (!active_)
        return;

    if (accept)
    {
        const CursorConfig best = search_.bestConfig();
        if (loop_->setConfig(best))
        {
            emit calibrated(best.toRecord());
            end(true);
            return;
        }
        qWarning() << "[TrainingSession] best config rejected, restoring previous";
    }

    loop_->setConfig(previous_);
    end(false);
}

void TrainingSession::cancel()
{
    if (!active_)
        return;

    qInfo() << "[TrainingSession] cancelled";
    search_.cancel();
    loop_->setConfig(previous_);
    loop_->stop();
    loopWasRunning_ = false;
    end(false);
}

void TrainingSession::end(bool accepted)
{
    if (!loopWasRunning_)
        loop_->stop();

    active_ = false;
    searchDone_ = true;
    emit ended(accepted);
}
