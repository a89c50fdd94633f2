#pragma once
#include <QMap>
#include <QPointF>
#include <QQueue>
#include <QVector>

#include <optional>

#include "../common/Constants.h"
#include "../core/CursorConfig.h"
#include "CalibrationTrial.h"

struct GridKey
{
    int sensitivity = 0;
    int smoothing = 0;

    bool operator<(const GridKey &o) const
    {
        return sensitivity != o.sensitivity ? sensitivity < o.sensitivity
                                            : smoothing < o.smoothing;
    }
    bool operator==(const GridKey &o) const
    {
        return sensitivity == o.sensitivity && smoothing == o.smoothing;
    }
};

/**
 * Discretized (sensitivity, smoothing) space. Each cell is a node,
 * adjacent to its 4 (or 8) neighbouring cells.
 */
struct CalibrationGrid
{
    int sensitivityBuckets = CALIBRATION_BUCKETS;
    int smoothingBuckets = CALIBRATION_BUCKETS;
    double sensitivityMin = CALIBRATION_SENSITIVITY_MIN;
    double sensitivityMax = CALIBRATION_SENSITIVITY_MAX;
    double smoothingMin = CALIBRATION_SMOOTHING_MIN;
    double smoothingMax = CALIBRATION_SMOOTHING_MAX;
    bool eightConnected = false;

    bool validate(QString *error = nullptr) const;

    bool contains(const GridKey &key) const;
    GridKey centre() const { return {sensitivityBuckets / 2, smoothingBuckets / 2}; }
    QVector<GridKey> neighbours(const GridKey &key) const;

    double sensitivityAt(int bucket) const;
    double smoothingAt(int bucket) const;
};

struct SearchNode
{
    GridKey key;
    CursorConfig config;
    std::optional<double> score; // empty until evaluated
    int depth = 0;

    bool isEvaluated() const { return score.has_value(); }
};

/**
 * Source of trial outcomes. In the app this is the training dialog;
 * tests plug in a deterministic cost function.
 */
class TrialRunner
{
public:
    virtual ~TrialRunner() = default;

    virtual CalibrationTrial runTrial(const CursorConfig &config,
                                      const QVector<QPointF> &targets) = 0;
};

/**
 * CalibrationSearch
 * -----------------------
 * Breadth-first search over the calibration grid from a seed cell.
 * Every cell is scored at most once and no more than `costBudget`
 * trials run. Can be driven step by step (begin/next/report) or in
 * one go with run().
 */
class CalibrationSearch
{
public:
    explicit CalibrationSearch(const CalibrationGrid &grid = CalibrationGrid(),
                               const CursorConfig &base = CursorConfig());

    void setBaseConfig(const CursorConfig &base) { base_ = base; }
    const CursorConfig &baseConfig() const { return base_; }

    // Seed outside the grid falls back to the centre cell.
    void setSeed(const GridKey &seed) { seed_ = seed; }

    const CalibrationGrid &grid() const { return grid_; }

    CursorConfig run(const QVector<QPointF> &targets, int costBudget, TrialRunner &runner);

    void begin(int costBudget);
    bool hasNext() const;
    CursorConfig next();
    void report(double cost);
    void report(const CalibrationTrial &trial);
    void cancel();

    bool isCancelled() const { return cancelled_; }
    int trialsRun() const { return trials_; }
    int budget() const { return budget_; }

    std::optional<SearchNode> bestNode() const;
    CursorConfig bestConfig() const;

    // Evaluated nodes in the order they were scored.
    QVector<SearchNode> visitedNodes() const;

    // Every discovered cell, evaluated or still queued.
    const QMap<GridKey, SearchNode> &nodes() const { return nodes_; }

private:
    CursorConfig configFor(const GridKey &key) const;
    void discover(const GridKey &key, int depth);

    CalibrationGrid grid_;
    CursorConfig base_;
    std::optional<GridKey> seed_;

    QMap<GridKey, SearchNode> nodes_;
    QQueue<GridKey> frontier_;
    QVector<GridKey> order_;
    std::optional<GridKey> pending_;

    int budget_ = 0;
    int trials_ = 0;
    bool cancelled_ = false;
};
