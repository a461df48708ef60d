// TravelOptimizer.cpp sequences independent contours so the rapid moves between them stay short.
// Greedy ordering gets most of the win; the 2-opt pass straightens the crossings greedy leaves behind.

#include "tp/TravelOptimizer.h"

#include "common/log.h"

#include <algorithm>
#include <limits>

namespace tp
{

namespace
{

constexpr double kImprovementEpsilon = 0.001;
constexpr std::size_t kMaxTwoOptPasses = 20;
constexpr std::size_t kTwoOptMinPaths = 4;

const geom::Point2D kHome{0.0, 0.0};

// Orientation-aware view of a path inside a candidate order.
struct Entry
{
    std::size_t index{0};
    bool reversed{false};
};

class Tour
{
public:
    explicit Tour(const std::vector<geom::Polyline>& polylines)
        : m_polylines(polylines)
    {
    }

    [[nodiscard]] geom::Point2D start(const Entry& entry) const
    {
        const auto& pts = m_polylines[entry.index].points;
        return entry.reversed ? pts.back() : pts.front();
    }

    [[nodiscard]] geom::Point2D end(const Entry& entry) const
    {
        const auto& pts = m_polylines[entry.index].points;
        return entry.reversed ? pts.front() : pts.back();
    }

    [[nodiscard]] bool reversible(const Entry& entry) const { return !m_polylines[entry.index].closed; }

    [[nodiscard]] double cost(const std::vector<Entry>& order) const
    {
        double total = 0.0;
        geom::Point2D cursor = kHome;
        for (const Entry& entry : order)
        {
            total += geom::distance2D(cursor, start(entry));
            cursor = end(entry);
        }
        return total;
    }

    [[nodiscard]] std::vector<Entry> greedy() const
    {
        const std::size_t count = m_polylines.size();
        std::vector<Entry> order;
        order.reserve(count);
        std::vector<bool> used(count, false);
        geom::Point2D cursor = kHome;

        for (std::size_t step = 0; step < count; ++step)
        {
            double bestDist = std::numeric_limits<double>::infinity();
            Entry best{count, false};
            for (std::size_t i = 0; i < count; ++i)
            {
                if (used[i])
                {
                    continue;
                }
                const double toStart = geom::distance2D(cursor, m_polylines[i].points.front());
                if (toStart < bestDist)
                {
                    bestDist = toStart;
                    best = {i, false};
                }
                if (!m_polylines[i].closed)
                {
                    const double toEnd = geom::distance2D(cursor, m_polylines[i].points.back());
                    if (toEnd < bestDist)
                    {
                        bestDist = toEnd;
                        best = {i, true};
                    }
                }
            }
            used[best.index] = true;
            order.push_back(best);
            cursor = end(best);
        }
        return order;
    }

    void reverseRange(std::vector<Entry>& order, std::size_t i, std::size_t j) const
    {
        std::reverse(order.begin() + static_cast<std::ptrdiff_t>(i),
                     order.begin() + static_cast<std::ptrdiff_t>(j) + 1);
        for (std::size_t k = i; k <= j; ++k)
        {
            if (reversible(order[k]))
            {
                order[k].reversed = !order[k].reversed;
            }
        }
    }

    // Cost change of reversing [i, j]; only the two boundary links move.
    [[nodiscard]] double reversalDelta(const std::vector<Entry>& order, std::size_t i, std::size_t j) const
    {
        const geom::Point2D before = (i == 0) ? kHome : end(order[i - 1]);
        Entry newFirst = order[j];
        Entry newLast = order[i];
        if (reversible(newFirst))
        {
            newFirst.reversed = !newFirst.reversed;
        }
        if (reversible(newLast))
        {
            newLast.reversed = !newLast.reversed;
        }

        double delta = geom::distance2D(before, start(newFirst)) - geom::distance2D(before, start(order[i]));
        if (j + 1 < order.size())
        {
            const geom::Point2D after = start(order[j + 1]);
            delta += geom::distance2D(end(newLast), after) - geom::distance2D(end(order[j]), after);
        }
        return delta;
    }

    int twoOpt(std::vector<Entry>& order) const
    {
        const std::size_t n = order.size();
        const std::size_t maxPasses = std::min(kMaxTwoOptPasses, n);
        double currentCost = cost(order);
        int applied = 0;

        for (std::size_t pass = 0; pass < maxPasses; ++pass)
        {
            double bestDelta = -kImprovementEpsilon;
            std::size_t bestI = n;
            std::size_t bestJ = n;
            for (std::size_t i = 0; i + 1 < n; ++i)
            {
                for (std::size_t j = i + 1; j < n; ++j)
                {
                    const double delta = reversalDelta(order, i, j);
                    if (delta < bestDelta)
                    {
                        bestDelta = delta;
                        bestI = i;
                        bestJ = j;
                    }
                }
            }
            if (bestI == n)
            {
                break;
            }

            // Closed paths whose ends are not coincident make the delta approximate; confirm.
            std::vector<Entry> candidate = order;
            reverseRange(candidate, bestI, bestJ);
            const double candidateCost = cost(candidate);
            if (candidateCost >= currentCost - kImprovementEpsilon)
            {
                break;
            }
            order = std::move(candidate);
            currentCost = candidateCost;
            ++applied;
        }
        return applied;
    }

    [[nodiscard]] std::vector<geom::Polyline> materialize(const std::vector<Entry>& order) const
    {
        std::vector<geom::Polyline> result;
        result.reserve(order.size());
        for (const Entry& entry : order)
        {
            const geom::Polyline& source = m_polylines[entry.index];
            result.push_back(entry.reversed ? geom::reversePolyline(source) : source);
        }
        return result;
    }

private:
    const std::vector<geom::Polyline>& m_polylines;
};

} // namespace

double travelDistance(const std::vector<geom::Polyline>& polylines)
{
    double total = 0.0;
    geom::Point2D cursor = kHome;
    for (const geom::Polyline& polyline : polylines)
    {
        if (polyline.points.empty())
        {
            continue;
        }
        total += geom::distance2D(cursor, polyline.points.front());
        cursor = polyline.points.back();
    }
    return total;
}

std::vector<geom::Polyline> optimizePathOrder(const std::vector<geom::Polyline>& polylines)
{
    std::vector<geom::Polyline> usable;
    usable.reserve(polylines.size());
    for (const geom::Polyline& polyline : polylines)
    {
        if (!polyline.points.empty())
        {
            usable.push_back(polyline);
        }
    }
    if (usable.size() <= 1)
    {
        return usable;
    }

    const Tour tour(usable);
    std::vector<Entry> order = tour.greedy();
    int twoOptMoves = 0;
    if (usable.size() >= kTwoOptMinPaths)
    {
        twoOptMoves = tour.twoOpt(order);
    }

    const double inputCost = travelDistance(usable);
    const double optimizedCost = tour.cost(order);
    if (optimizedCost > inputCost)
    {
        LOG_INFO(Tp, QStringLiteral("Travel order kept as given (%1 mm)").arg(inputCost, 0, 'f', 2));
        return usable;
    }

    LOG_INFO(Tp, QStringLiteral("Travel reduced from %1 mm to %2 mm (%3 2-opt moves)")
                     .arg(inputCost, 0, 'f', 2)
                     .arg(optimizedCost, 0, 'f', 2)
                     .arg(twoOptMoves));
    return tour.materialize(order);
}

} // namespace tp
