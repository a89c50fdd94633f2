#include "CalibrationTrial.h"

#include <QDebug>

CalibrationTrial::CalibrationTrial(const CursorConfig &config,
                                   const QVector<QPointF> &targets,
                                   const CostWeights &weights)
    : config_(config),
      targets_(targets),
      weights_(weights)
{
    outcomes_.reserve(targets_.size());
}

bool CalibrationTrial::record(const TargetOutcome &outcome)
{
    if (sealed_)
    {
        qWarning() << "[CalibrationTrial] outcome recorded after seal, ignored";
        return false;
    }
    if (isComplete())
    {
        qWarning() << "[CalibrationTrial] more outcomes than targets, ignored";
        return false;
    }

    const int errors = outcome.misses + outcome.overshoots;
    outcomes_.append(weights_.timeWeight * outcome.seconds +
                     weights_.missWeight * errors);
    seconds_ += outcome.seconds;
    misses_ += errors;

    if (isComplete())
        seal();
    return true;
}

void CalibrationTrial::abort()
{
    aborted_ = true;
    sealed_ = true;
}

double CalibrationTrial::totalCost() const
{
    double sum = 0.0;
    for (double c : outcomes_)
        sum += c;
    return sum;
}
