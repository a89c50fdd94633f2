#include "CalibrationSearch.h"

#include <QDebug>

bool CalibrationGrid::validate(QString *error) const
{
    auto fail = [error](const QString &msg)
    {
        if (error)
            *error = msg;
        return false;
    };

    if (sensitivityBuckets < 1 || smoothingBuckets < 1)
        return fail(QStringLiteral("grid needs at least one bucket per axis"));
    if (!(sensitivityMin > 0.0) || sensitivityMax < sensitivityMin)
        return fail(QStringLiteral("sensitivity range must be positive and ordered"));
    if (smoothingMin < 0.0 || smoothingMax >= 1.0 || smoothingMax < smoothingMin)
        return fail(QStringLiteral("smoothing range must lie in [0, 1) and be ordered"));
    return true;
}

bool CalibrationGrid::contains(const GridKey &key) const
{
    return key.sensitivity >= 0 && key.sensitivity < sensitivityBuckets &&
           key.smoothing >= 0 && key.smoothing < smoothingBuckets;
}

QVector<GridKey> CalibrationGrid::neighbours(const GridKey &key) const
{
    static const int straight[4][2] = {{1, 0}, {-1, 0}, {0, 1}, {0, -1}};
    static const int diagonal[4][2] = {{1, 1}, {1, -1}, {-1, 1}, {-1, -1}};

    QVector<GridKey> out;
    for (const auto &d : straight)
    {
        const GridKey n{key.sensitivity + d[0], key.smoothing + d[1]};
        if (contains(n))
            out.append(n);
    }
    if (eightConnected)
    {
        for (const auto &d : diagonal)
        {
            const GridKey n{key.sensitivity + d[0], key.smoothing + d[1]};
            if (contains(n))
                out.append(n);
        }
    }
    return out;
}

static double bucketValue(int bucket, int count, double lo, double hi)
{
    if (count <= 1)
        return lo;
    return lo + bucket * (hi - lo) / (count - 1);
}

double CalibrationGrid::sensitivityAt(int bucket) const
{
    return bucketValue(bucket, sensitivityBuckets, sensitivityMin, sensitivityMax);
}

double CalibrationGrid::smoothingAt(int bucket) const
{
    return bucketValue(bucket, smoothingBuckets, smoothingMin, smoothingMax);
}

CalibrationSearch::CalibrationSearch(const CalibrationGrid &grid, const CursorConfig &base)
    : grid_(grid),
      base_(base)
{
    QString error;
    if (!grid_.validate(&error))
    {
        qWarning() << "[CalibrationSearch] invalid grid, using defaults:" << error;
        grid_ = CalibrationGrid();
    }
}

CursorConfig CalibrationSearch::run(const QVector<QPointF> &targets,
                                    int costBudget,
                                    TrialRunner &runner)
{
    begin(costBudget);
    while (hasNext())
    {
        const CursorConfig config = next();
        report(runner.runTrial(config, targets));
    }
    return bestConfig();
}

void CalibrationSearch::begin(int costBudget)
{
    nodes_.clear();
    frontier_.clear();
    order_.clear();
    pending_.reset();
    trials_ = 0;
    cancelled_ = false;
    budget_ = qMax(0, costBudget);

    GridKey seed = grid_.centre();
    if (seed_ && grid_.contains(*seed_))
        seed = *seed_;

    discover(seed, 0);

    qInfo() << "[CalibrationSearch] start: grid" << grid_.sensitivityBuckets << "x"
            << grid_.smoothingBuckets << "budget" << budget_;
}

bool CalibrationSearch::hasNext() const
{
    return !cancelled_ && !pending_ && trials_ < budget_ && !frontier_.isEmpty();
}

CursorConfig CalibrationSearch::next()
{
    if (!hasNext())
    {
        qWarning() << "[CalibrationSearch] next() called with nothing to evaluate";
        return bestConfig();
    }

    const GridKey key = frontier_.dequeue();
    pending_ = key;
    return nodes_[key].config;
}

void CalibrationSearch::report(double cost)
{
    if (!pending_)
    {
        qWarning() << "[CalibrationSearch] report() without a pending trial";
        return;
    }

    const GridKey key = *pending_;
    pending_.reset();

    SearchNode &node = nodes_[key];
    node.score = cost;
    order_.append(key);
    trials_++;

    qDebug() << "[CalibrationSearch] trial" << trials_ << "sensitivity"
             << node.config.sensitivity << "smoothing" << node.config.smoothing
             << "cost" << cost;

    const int depth = node.depth;
    for (const GridKey &n : grid_.neighbours(key))
        discover(n, depth + 1);

    if (trials_ >= budget_)
        qInfo() << "[CalibrationSearch] trial budget exhausted after" << trials_ << "trials";
    else if (frontier_.isEmpty())
        qInfo() << "[CalibrationSearch] grid exhausted after" << trials_ << "trials";
}

void CalibrationSearch::report(const CalibrationTrial &trial)
{
    if (trial.isAborted())
    {
        qInfo() << "[CalibrationSearch] trial aborted, stopping search";
        pending_.reset();
        cancelled_ = true;
        return;
    }
    if (!trial.isSealed() || !trial.isComplete())
    {
        qWarning() << "[CalibrationSearch] incomplete trial (" << trial.outcomes().size()
                   << "of" << trial.targets().size() << "targets), stopping search";
        pending_.reset();
        cancelled_ = true;
        return;
    }
    report(trial.totalCost());
}

void CalibrationSearch::cancel()
{
    pending_.reset();
    cancelled_ = true;
}

void CalibrationSearch::discover(const GridKey &key, int depth)
{
    if (nodes_.contains(key))
        return;

    SearchNode node;
    node.key = key;
    node.config = configFor(key);
    node.depth = depth;
    nodes_.insert(key, node);
    frontier_.enqueue(key);
}

CursorConfig CalibrationSearch::configFor(const GridKey &key) const
{
    CursorConfig cfg = base_;
    cfg.sensitivity = grid_.sensitivityAt(key.sensitivity);
    cfg.smoothing = grid_.smoothingAt(key.smoothing);
    return cfg;
}

std::optional<SearchNode> CalibrationSearch::bestNode() const
{
    std::optional<SearchNode> best;
    for (const GridKey &key : order_)
    {
        const SearchNode &node = nodes_[key];
        if (!best || *node.score < *best->score ||
            (*node.score == *best->score && node.config.smoothing > best->config.smoothing))
        {
            best = node;
        }
    }
    return best;
}

CursorConfig CalibrationSearch::bestConfig() const
{
    const std::optional<SearchNode> best = bestNode();
    return best ? best->config : base_;
}

QVector<SearchNode> CalibrationSearch::visitedNodes() const
{
    QVector<SearchNode> out;
    out.reserve(order_.size());
    for (const GridKey &key : order_)
        out.append(nodes_[key]);
    return out;
}
