#include "doctest/doctest.h"

#include "tp/PathSynthesizer.h"
#include "tp/Toolpath.h"
#include "tp/TravelOptimizer.h"

#include <cmath>
#include <random>
#include <vector>

namespace
{

geom::Polyline openLine(double x0, double y0, double x1, double y1)
{
    return {{{x0, y0}, {x1, y1}}, false};
}

geom::Polyline closedSquare(double x, double y, double size)
{
    return {{{x, y}, {x + size, y}, {x + size, y + size}, {x, y + size}, {x, y}}, true};
}

} // namespace

TEST_CASE("optimizer never regresses against the input order")
{
    std::mt19937 rng(1234);
    std::uniform_real_distribution<double> coord(0.0, 200.0);

    for (int trial = 0; trial < 25; ++trial)
    {
        std::vector<geom::Polyline> input;
        const int count = 2 + trial % 9;
        for (int i = 0; i < count; ++i)
        {
            if (i % 3 == 0)
            {
                input.push_back(closedSquare(coord(rng), coord(rng), 5.0));
            }
            else
            {
                input.push_back(openLine(coord(rng), coord(rng), coord(rng), coord(rng)));
            }
        }

        const std::vector<geom::Polyline> optimized = tp::optimizePathOrder(input);
        CHECK(optimized.size() == input.size());
        CHECK(tp::travelDistance(optimized) <= tp::travelDistance(input) + 1e-9);
    }
}

TEST_CASE("optimizer enters an open path from its nearer end")
{
    const std::vector<geom::Polyline> input{openLine(50.0, 0.0, 10.0, 0.0), openLine(60.0, 0.0, 70.0, 0.0)};
    const std::vector<geom::Polyline> optimized = tp::optimizePathOrder(input);
    REQUIRE(optimized.size() == 2);
    CHECK(optimized[0].points.front().x == doctest::Approx(10.0));
    CHECK(optimized[1].points.front().x == doctest::Approx(60.0));
    CHECK(tp::travelDistance(optimized) == doctest::Approx(20.0));
}

TEST_CASE("optimizer never reverses closed paths")
{
    std::vector<geom::Polyline> input;
    for (int i = 0; i < 6; ++i)
    {
        input.push_back(closedSquare(30.0 * (5 - i), 10.0 * (i % 2), 4.0));
    }
    for (const geom::Polyline& p : tp::optimizePathOrder(input))
    {
        REQUIRE(p.points.size() == 5);
        CHECK(p.points[1].x > p.points[0].x);
    }
}

TEST_CASE("2-opt untangles the crossing left by the greedy order")
{
    const geom::Polyline square = closedSquare(0.0, 60.0, 5.0);
    const geom::Polyline far = openLine(50.0, 30.0, 40.0, 0.0);
    const geom::Polyline diagonal = openLine(0.0, 50.0, 20.0, 40.0);
    const geom::Polyline vertical = openLine(10.0, 40.0, 10.0, 10.0);

    // Nearest-endpoint order: vertical reversed, diagonal reversed, square, far.
    const double greedyCost = std::sqrt(200.0) + 10.0 + 10.0 + std::sqrt(3400.0);

    const std::vector<geom::Polyline> optimized = tp::optimizePathOrder({square, far, diagonal, vertical});
    REQUIRE(optimized.size() == 4);
    CHECK(tp::travelDistance(optimized) < greedyCost - 1.0);
    CHECK(tp::travelDistance(optimized) == doctest::Approx(std::sqrt(200.0) + std::sqrt(500.0) + 10.0 + std::sqrt(1000.0)));

    CHECK(optimized[0].points.front().y == doctest::Approx(10.0));

    // Square and diagonal swapped places; the closed square keeps its winding, the open line flips back.
    CHECK(optimized[1].closed);
    CHECK(optimized[1].points == square.points);
    CHECK_FALSE(optimized[2].closed);
    CHECK(optimized[2].points == diagonal.points);

    CHECK(optimized[3].points.front().x == doctest::Approx(50.0));
}

TEST_CASE("optimizer filters empty paths")
{
    const std::vector<geom::Polyline> input{geom::Polyline{}, openLine(0.0, 0.0, 1.0, 0.0)};
    CHECK(tp::optimizePathOrder(input).size() == 1);
}

TEST_CASE("synthesizer plunges vertically into a short open line")
{
    tp::SynthesisParams params;
    params.cutDepth_mm = 1.0;
    params.safeZ_mm = 5.0;
    params.feedRate_mm_min = 800.0;
    params.plungeRate_mm_min = 300.0;

    const tp::ToolPath path = tp::synthesizeToolpath({openLine(0.0, 0.0, 10.0, 0.0)}, params);
    REQUIRE(path.segments.size() == 3);
    CHECK(path.segments[0].kind == tp::MoveKind::Plunge);
    CHECK(path.segments[1].kind == tp::MoveKind::Cut);
    CHECK(path.segments[2].kind == tp::MoveKind::Retract);

    CHECK(path.stats.cuttingDistance_mm == doctest::Approx(10.0));
    CHECK(path.stats.rapidDistance_mm == doctest::Approx(6.0));
    CHECK(path.stats.totalDistance_mm == doctest::Approx(22.0));
    const double expectedTime = 10.0 / 800.0 + 6.0 / 300.0 + 6.0 / tp::kNominalRapidRate_mm_min;
    CHECK(path.stats.estimatedTime_min == doctest::Approx(expectedTime));

    for (const geom::Point3D& p : path.segments[1].points)
    {
        CHECK(p.z == doctest::Approx(-1.0));
    }
    CHECK(path.segments[2].points.back().z == doctest::Approx(5.0));
}

TEST_CASE("synthesizer ramps into a long closed contour")
{
    tp::SynthesisParams params;
    const tp::ToolPath path = tp::synthesizeToolpath({closedSquare(0.0, 0.0, 50.0)}, params);
    REQUIRE(path.segments.size() == 3);

    const tp::ToolPathSegment& ramp = path.segments[0];
    REQUIRE(ramp.kind == tp::MoveKind::Plunge);
    REQUIRE(ramp.points.size() > 2);
    CHECK(ramp.points.front().z == doctest::Approx(params.safeZ_mm));
    CHECK(ramp.points.back().z == doctest::Approx(-params.cutDepth_mm));
    for (std::size_t i = 1; i < ramp.points.size(); ++i)
    {
        CHECK(ramp.points[i].z <= ramp.points[i - 1].z + 1e-12);
    }

    const tp::ToolPathSegment& cut = path.segments[1];
    for (const geom::Point3D& p : cut.points)
    {
        CHECK(p.z == doctest::Approx(-params.cutDepth_mm));
    }
    CHECK(cut.points.front() == ramp.points.back());
    CHECK(cut.points.back() == ramp.points.back());
    CHECK(path.stats.cuttingDistance_mm == doctest::Approx(200.0));
}

TEST_CASE("synthesizer links contours with rapids at safe height")
{
    tp::SynthesisParams params;
    const tp::ToolPath path =
        tp::synthesizeToolpath({openLine(0.0, 0.0, 5.0, 0.0), openLine(20.0, 0.0, 25.0, 0.0)}, params);

    int rapids = 0;
    for (const tp::ToolPathSegment& segment : path.segments)
    {
        if (segment.kind == tp::MoveKind::Rapid)
        {
            ++rapids;
            for (const geom::Point3D& p : segment.points)
            {
                CHECK(p.z == doctest::Approx(params.safeZ_mm));
            }
        }
    }
    CHECK(rapids == 1);
    CHECK(path.stats.cuttingDistance_mm == doctest::Approx(10.0));
}

TEST_CASE("flat buffer carries four floats per point")
{
    tp::SynthesisParams params;
    const tp::ToolPath path = tp::synthesizeToolpath({openLine(0.0, 0.0, 10.0, 0.0)}, params);
    const std::vector<float> buffer = tp::toFlatBuffer(path);
    REQUIRE(buffer.size() == path.pointCount() * 4);
    CHECK(buffer[3] == doctest::Approx(static_cast<float>(tp::MoveKind::Plunge)));
    CHECK(buffer[buffer.size() - 1] == doctest::Approx(static_cast<float>(tp::MoveKind::Retract)));
}

TEST_CASE("measureToolPath splits distances by move kind")
{
    tp::ToolPath path;
    path.segments.push_back({tp::MoveKind::Rapid, {{0.0, 0.0, 5.0}, {10.0, 0.0, 5.0}}});
    path.segments.push_back({tp::MoveKind::Plunge, {{10.0, 0.0, 0.0}}});
    path.segments.push_back({tp::MoveKind::Cut, {{20.0, 0.0, 0.0}}});
    const tp::ToolPathStats stats = tp::measureToolPath(path, 100.0, 50.0);
    CHECK(stats.rapidDistance_mm == doctest::Approx(10.0));
    CHECK(stats.cuttingDistance_mm == doctest::Approx(10.0));
    CHECK(stats.totalDistance_mm == doctest::Approx(25.0));
    CHECK(stats.estimatedTime_min == doctest::Approx(10.0 / 5000.0 + 5.0 / 50.0 + 10.0 / 100.0));
}
