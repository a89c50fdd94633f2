/**
 * @file test_calibration_search.cpp
 * @brief Unit tests for CalibrationTrial and CalibrationSearch
 *
 * Validates:
 * - Trial cost accounting and sealing
 * - Grid values and adjacency
 * - Breadth-first order from the seed, each cell visited once
 * - Budget and grid exhaustion, aborted and incomplete trials
 * - Best-node selection and tie-breaking
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <set>

#include "calibration/CalibrationSearch.h"

namespace
{
    /**
     * @brief Trial runner backed by a cost function of the candidate config
     */
    class FunctionRunner : public TrialRunner
    {
    public:
        explicit FunctionRunner(std::function<double(const CursorConfig &)> cost)
            : cost_(std::move(cost))
        {
        }

        CalibrationTrial runTrial(const CursorConfig &config,
                                  const QVector<QPointF> &targets) override
        {
            seen.append(config);
            CalibrationTrial trial(config, targets);

            if (calls++ == abortOnCall)
            {
                trial.abort();
                return trial;
            }
            if (calls - 1 == partialOnCall)
            {
                // One target reached at no cost, then the run stops early.
                trial.record(TargetOutcome());
                trial.seal();
                return trial;
            }

            const double share = cost_(config) / targets.size();
            for (int i = 0; i < targets.size(); ++i)
            {
                TargetOutcome outcome;
                outcome.seconds = share;
                trial.record(outcome);
            }
            return trial;
        }

        int calls = 0;
        int abortOnCall = -1;
        int partialOnCall = -1;
        QVector<CursorConfig> seen;

    private:
        std::function<double(const CursorConfig &)> cost_;
    };

    const QVector<QPointF> kTargets = {QPointF(0.2, 0.5), QPointF(0.8, 0.6)};

    double bowl(const CursorConfig &c)
    {
        return std::pow(c.sensitivity - 1.3, 2) + std::pow(c.smoothing - 0.45, 2);
    }
}

// ---------------------------------------
// CalibrationTrial
// ---------------------------------------

TEST(CalibrationTrialTest, CostCombinesTimeAndErrors)
{
    CostWeights weights;
    weights.timeWeight = 1.0;
    weights.missWeight = 2.0;
    CalibrationTrial trial(CursorConfig(), kTargets, weights);

    TargetOutcome a;
    a.seconds = 2.0;
    a.misses = 1;
    a.overshoots = 1;
    EXPECT_TRUE(trial.record(a));
    EXPECT_FALSE(trial.isSealed());

    TargetOutcome b;
    b.seconds = 1.5;
    EXPECT_TRUE(trial.record(b));

    EXPECT_TRUE(trial.isComplete());
    EXPECT_TRUE(trial.isSealed());
    EXPECT_DOUBLE_EQ(trial.totalCost(), 6.0 + 1.5);
    EXPECT_DOUBLE_EQ(trial.totalSeconds(), 3.5);
    EXPECT_EQ(trial.totalMisses(), 2);
}

TEST(CalibrationTrialTest, SealedTrialIsReadOnly)
{
    CalibrationTrial trial(CursorConfig(), kTargets);
    trial.seal();

    EXPECT_FALSE(trial.record(TargetOutcome()));
    EXPECT_TRUE(trial.outcomes().isEmpty());
}

TEST(CalibrationTrialTest, AbortSealsTrial)
{
    CalibrationTrial trial(CursorConfig(), kTargets);
    trial.record(TargetOutcome());
    trial.abort();

    EXPECT_TRUE(trial.isAborted());
    EXPECT_TRUE(trial.isSealed());
    EXPECT_FALSE(trial.record(TargetOutcome()));
}

// ---------------------------------------
// CalibrationGrid
// ---------------------------------------

TEST(CalibrationGridTest, BucketValuesSpanRange)
{
    CalibrationGrid grid;
    EXPECT_DOUBLE_EQ(grid.sensitivityAt(0), CALIBRATION_SENSITIVITY_MIN);
    EXPECT_DOUBLE_EQ(grid.sensitivityAt(grid.sensitivityBuckets - 1), CALIBRATION_SENSITIVITY_MAX);
    EXPECT_DOUBLE_EQ(grid.smoothingAt(0), CALIBRATION_SMOOTHING_MIN);
    EXPECT_NEAR(grid.smoothingAt(grid.smoothingBuckets - 1), CALIBRATION_SMOOTHING_MAX, 1e-12);

    EXPECT_EQ(grid.centre().sensitivity, 3);
    EXPECT_EQ(grid.centre().smoothing, 3);
}

TEST(CalibrationGridTest, NeighboursStayInsideGrid)
{
    CalibrationGrid grid;
    EXPECT_EQ(grid.neighbours({0, 0}).size(), 2);
    EXPECT_EQ(grid.neighbours({3, 3}).size(), 4);
    EXPECT_EQ(grid.neighbours({5, 2}).size(), 3);

    grid.eightConnected = true;
    EXPECT_EQ(grid.neighbours({0, 0}).size(), 3);
    EXPECT_EQ(grid.neighbours({3, 3}).size(), 8);
}

TEST(CalibrationGridTest, RejectsBadRanges)
{
    CalibrationGrid grid;
    grid.smoothingMax = 1.0;
    EXPECT_FALSE(grid.validate());

    grid = CalibrationGrid();
    grid.sensitivityBuckets = 0;
    QString error;
    EXPECT_FALSE(grid.validate(&error));
    EXPECT_FALSE(error.isEmpty());
}

// ---------------------------------------
// CalibrationSearch
// ---------------------------------------

TEST(CalibrationSearchTest, SixBySixGridWithBudgetOfFifteen)
{
    CalibrationSearch search;
    FunctionRunner runner(bowl);

    const CursorConfig best = search.run(kTargets, 15, runner);

    EXPECT_EQ(runner.calls, 15);
    EXPECT_EQ(search.trialsRun(), 15);

    const QVector<SearchNode> visited = search.visitedNodes();
    ASSERT_EQ(visited.size(), 15);

    std::set<GridKey> unique;
    double minScore = std::numeric_limits<double>::infinity();
    for (const SearchNode &n : visited)
    {
        unique.insert(n.key);
        ASSERT_TRUE(n.isEvaluated());
        minScore = std::min(minScore, *n.score);
    }
    EXPECT_EQ(unique.size(), 15u);

    ASSERT_TRUE(search.bestNode().has_value());
    EXPECT_NEAR(*search.bestNode()->score, minScore, 1e-12);
    EXPECT_NEAR(bowl(best), minScore, 1e-9);
}

TEST(CalibrationSearchTest, VisitsBreadthFirstFromCentre)
{
    CalibrationSearch search;
    FunctionRunner runner(bowl);
    search.run(kTargets, 13, runner);

    const QVector<SearchNode> visited = search.visitedNodes();
    ASSERT_EQ(visited.size(), 13);
    EXPECT_EQ(visited[0].key, search.grid().centre());
    EXPECT_EQ(visited[0].depth, 0);

    for (int i = 1; i < visited.size(); ++i)
        EXPECT_GE(visited[i].depth, visited[i - 1].depth) << "visit " << i;

    for (int i = 1; i <= 4; ++i)
        EXPECT_EQ(visited[i].depth, 1);
    for (int i = 5; i < 13; ++i)
        EXPECT_EQ(visited[i].depth, 2);
}

TEST(CalibrationSearchTest, SmallGridIsExhaustedBeforeBudget)
{
    CalibrationGrid grid;
    grid.sensitivityBuckets = 2;
    grid.smoothingBuckets = 2;
    CalibrationSearch search(grid);
    FunctionRunner runner(bowl);

    search.run(kTargets, 100, runner);

    EXPECT_EQ(runner.calls, 4);
    EXPECT_EQ(search.visitedNodes().size(), 4);
    EXPECT_FALSE(search.isCancelled());
}

TEST(CalibrationSearchTest, TiesPreferHigherSmoothing)
{
    CalibrationSearch search;
    FunctionRunner runner([](const CursorConfig &)
                          { return 5.0; });

    const CursorConfig best = search.run(kTargets, 5, runner);

    // Seed (3,3) and its four neighbours: (3,4) has the most smoothing.
    ASSERT_TRUE(search.bestNode().has_value());
    EXPECT_EQ(search.bestNode()->key, (GridKey{3, 4}));
    EXPECT_DOUBLE_EQ(best.smoothing, search.grid().smoothingAt(4));
}

TEST(CalibrationSearchTest, FullTiesKeepEarlierVisit)
{
    CalibrationGrid grid;
    grid.smoothingBuckets = 1;
    CalibrationSearch search(grid);
    FunctionRunner runner([](const CursorConfig &)
                          { return 1.0; });

    search.run(kTargets, 10, runner);
    ASSERT_TRUE(search.bestNode().has_value());
    EXPECT_EQ(search.bestNode()->key, search.grid().centre());
}

TEST(CalibrationSearchTest, AbortedTrialStopsSearch)
{
    CalibrationSearch search;
    FunctionRunner runner(bowl);
    runner.abortOnCall = 2;

    search.run(kTargets, 15, runner);

    EXPECT_EQ(runner.calls, 3);
    EXPECT_EQ(search.trialsRun(), 2);
    EXPECT_TRUE(search.isCancelled());
    EXPECT_FALSE(search.hasNext());
}

TEST(CalibrationSearchTest, IncompleteTrialStopsSearchWithoutScore)
{
    CalibrationSearch search;
    FunctionRunner runner(bowl);
    runner.partialOnCall = 1;

    const CursorConfig result = search.run(kTargets, 15, runner);

    EXPECT_EQ(runner.calls, 2);
    EXPECT_EQ(search.trialsRun(), 1);
    EXPECT_TRUE(search.isCancelled());
    EXPECT_FALSE(search.hasNext());

    // The partial trial cost nothing but must not win.
    ASSERT_TRUE(search.bestNode().has_value());
    EXPECT_EQ(search.bestNode()->config, runner.seen[0]);
    EXPECT_EQ(result, runner.seen[0]);
}

TEST(CalibrationSearchTest, UnsealedTrialIsNotScored)
{
    CalibrationSearch search;
    search.begin(10);
    const CursorConfig candidate = search.next();

    CalibrationTrial trial(candidate, kTargets);
    trial.record(TargetOutcome());
    ASSERT_FALSE(trial.isSealed());

    search.report(trial);
    EXPECT_EQ(search.trialsRun(), 0);
    EXPECT_FALSE(search.bestNode().has_value());
    EXPECT_TRUE(search.isCancelled());
}

TEST(CalibrationSearchTest, ZeroBudgetReturnsBaseConfig)
{
    CursorConfig base;
    base.sensitivity = 0.77;
    base.deadzone = 5.0;
    CalibrationSearch search(CalibrationGrid(), base);
    FunctionRunner runner(bowl);

    const CursorConfig result = search.run(kTargets, 0, runner);

    EXPECT_EQ(runner.calls, 0);
    EXPECT_FALSE(search.bestNode().has_value());
    EXPECT_EQ(result, base);
}

TEST(CalibrationSearchTest, CandidatesKeepBaseFields)
{
    CursorConfig base;
    base.deadzone = 7.0;
    base.invert = true;
    base.gestureToAction[GestureEvent::LeftClick] = Action::DoubleClick;
    CalibrationSearch search(CalibrationGrid(), base);
    FunctionRunner runner(bowl);

    search.run(kTargets, 6, runner);

    for (const CursorConfig &c : runner.seen)
    {
        EXPECT_DOUBLE_EQ(c.deadzone, 7.0);
        EXPECT_TRUE(c.invert);
        EXPECT_EQ(c.actionFor(GestureEvent::LeftClick), Action::DoubleClick);
        EXPECT_TRUE(c.validate());
    }
}

TEST(CalibrationSearchTest, SeedOutsideGridFallsBackToCentre)
{
    CalibrationSearch search;
    search.setSeed({10, -1});
    FunctionRunner runner(bowl);

    search.run(kTargets, 1, runner);
    ASSERT_EQ(search.visitedNodes().size(), 1);
    EXPECT_EQ(search.visitedNodes()[0].key, search.grid().centre());
}

TEST(CalibrationSearchTest, CustomSeedIsVisitedFirst)
{
    CalibrationSearch search;
    search.setSeed({0, 0});
    FunctionRunner runner(bowl);

    search.run(kTargets, 3, runner);
    const QVector<SearchNode> visited = search.visitedNodes();
    ASSERT_EQ(visited.size(), 3);
    EXPECT_EQ(visited[0].key, (GridKey{0, 0}));
    EXPECT_EQ(visited[1].depth, 1);
    EXPECT_EQ(visited[2].depth, 1);
}

TEST(CalibrationSearchTest, EightConnectedReachesDiagonalsFirst)
{
    CalibrationGrid grid;
    grid.eightConnected = true;
    CalibrationSearch search(grid);
    FunctionRunner runner(bowl);

    search.run(kTargets, 9, runner);
    const QVector<SearchNode> visited = search.visitedNodes();
    ASSERT_EQ(visited.size(), 9);
    for (int i = 1; i < 9; ++i)
        EXPECT_EQ(visited[i].depth, 1);
}

TEST(CalibrationSearchTest, StepwiseDriving)
{
    CalibrationSearch search;
    search.begin(2);

    ASSERT_TRUE(search.hasNext());
    const CursorConfig first = search.next();
    EXPECT_FALSE(search.hasNext()); // waiting for a report

    search.report(3.0);
    ASSERT_TRUE(search.hasNext());
    const CursorConfig second = search.next();
    EXPECT_NE(first, second);

    search.report(1.0);
    EXPECT_FALSE(search.hasNext());
    EXPECT_EQ(search.bestConfig(), second);

    // A stray report changes nothing.
    search.report(0.0);
    EXPECT_EQ(search.trialsRun(), 2);
    EXPECT_EQ(search.bestConfig(), second);
}

TEST(CalibrationSearchTest, BeginRestartsSearch)
{
    CalibrationSearch search;
    FunctionRunner runner(bowl);
    search.run(kTargets, 4, runner);
    search.cancel();

    search.begin(3);
    EXPECT_FALSE(search.isCancelled());
    EXPECT_EQ(search.trialsRun(), 0);
    EXPECT_TRUE(search.visitedNodes().isEmpty());
    EXPECT_TRUE(search.hasNext());
}
