#pragma once
#include <QPointF>
#include <QVector>

#include "../core/CursorConfig.h"

struct TargetOutcome
{
    double seconds = 0.0;
    int misses = 0;
    int overshoots = 0;
};

struct CostWeights
{
    double timeWeight = 1.0;
    double missWeight = 2.0;
};

/**
 * CalibrationTrial
 * -----------------------
 * One drag-and-drop run under a fixed config. Outcomes are appended
 * per target while the trial runs; seal() makes it read-only.
 * An aborted trial carries no usable score.
 */
class CalibrationTrial
{
public:
    CalibrationTrial() = default;
    CalibrationTrial(const CursorConfig &config,
                     const QVector<QPointF> &targets,
                     const CostWeights &weights = CostWeights());

    const CursorConfig &config() const { return config_; }
    const QVector<QPointF> &targets() const { return targets_; }
    const QVector<double> &outcomes() const { return outcomes_; }

    bool record(const TargetOutcome &outcome);
    void seal() { sealed_ = true; }
    void abort();

    bool isSealed() const { return sealed_; }
    bool isAborted() const { return aborted_; }
    bool isComplete() const { return outcomes_.size() == targets_.size(); }

    double totalCost() const;
    double totalSeconds() const { return seconds_; }
    int totalMisses() const { return misses_; }

private:
    CursorConfig config_;
    QVector<QPointF> targets_;
    CostWeights weights_;

    QVector<double> outcomes_;
    double seconds_ = 0.0;
    int misses_ = 0;
    bool sealed_ = false;
    bool aborted_ = false;
};
