#include "doctest/doctest.h"

#include "tp/ArcFitter.h"

#include <cmath>
#include <numbers>
#include <vector>

namespace
{

std::vector<geom::Point3D> sampleArc(double radius, double fromDeg, double toDeg, int segments, double z)
{
    std::vector<geom::Point3D> points;
    for (int i = 0; i <= segments; ++i)
    {
        const double deg = fromDeg + (toDeg - fromDeg) * i / segments;
        const double rad = deg * std::numbers::pi / 180.0;
        points.emplace_back(radius * std::cos(rad), radius * std::sin(rad), z);
    }
    return points;
}

} // namespace

TEST_CASE("fitCircle through three points")
{
    const auto circle = tp::fitCircle({1.0, 0.0}, {0.0, 1.0}, {-1.0, 0.0});
    REQUIRE(circle.has_value());
    CHECK(circle->center.x == doctest::Approx(0.0));
    CHECK(circle->center.y == doctest::Approx(0.0));
    CHECK(circle->radius == doctest::Approx(1.0));

    CHECK_FALSE(tp::fitCircle({0.0, 0.0}, {1.0, 1.0}, {2.0, 2.0}).has_value());
}

TEST_CASE("quarter circle becomes one counter-clockwise arc")
{
    const std::vector<geom::Point3D> points = sampleArc(10.0, 0.0, 90.0, 10, -1.0);
    const std::vector<tp::FittedMove> moves = tp::detectArcs(points);
    REQUIRE(moves.size() == 1);
    const tp::FittedMove& arc = moves.front();
    CHECK(arc.kind == tp::FittedMove::Kind::Arc);
    CHECK_FALSE(arc.clockwise);
    CHECK(arc.start.x == doctest::Approx(10.0));
    CHECK(arc.end.x == doctest::Approx(0.0));
    CHECK(arc.end.y == doctest::Approx(10.0));
    CHECK(arc.end.z == doctest::Approx(-1.0));
    CHECK(arc.centerI == doctest::Approx(-10.0));
    CHECK(arc.centerJ == doctest::Approx(0.0));
}

TEST_CASE("reversed samples wind clockwise")
{
    const std::vector<geom::Point3D> points = sampleArc(10.0, 90.0, 0.0, 10, 0.0);
    const std::vector<tp::FittedMove> moves = tp::detectArcs(points);
    REQUIRE(moves.size() == 1);
    CHECK(moves.front().kind == tp::FittedMove::Kind::Arc);
    CHECK(moves.front().clockwise);
}

TEST_CASE("straight runs stay linear")
{
    std::vector<geom::Point3D> points;
    for (int i = 0; i < 8; ++i)
    {
        points.emplace_back(i * 1.0, 0.0, -1.0);
    }
    const std::vector<tp::FittedMove> moves = tp::detectArcs(points);
    REQUIRE(moves.size() == points.size());
    for (const tp::FittedMove& move : moves)
    {
        CHECK(move.kind == tp::FittedMove::Kind::Linear);
    }
}

TEST_CASE("changing depth prevents arcs")
{
    std::vector<geom::Point3D> points = sampleArc(10.0, 0.0, 90.0, 10, 0.0);
    for (std::size_t i = 0; i < points.size(); ++i)
    {
        points[i].z = -0.1 * static_cast<double>(i);
    }
    for (const tp::FittedMove& move : tp::detectArcs(points))
    {
        CHECK(move.kind == tp::FittedMove::Kind::Linear);
    }
}

TEST_CASE("a closed circle is not emitted as a full-turn arc")
{
    const std::vector<geom::Point3D> points = sampleArc(5.0, 0.0, 360.0, 36, -2.0);
    const std::vector<tp::FittedMove> moves = tp::detectArcs(points);
    REQUIRE(moves.size() == 2);
    CHECK(moves[0].kind == tp::FittedMove::Kind::Arc);
    CHECK(moves[1].kind == tp::FittedMove::Kind::Linear);
    CHECK(moves[1].end.x == doctest::Approx(5.0));
    CHECK(moves[1].end.y == doctest::Approx(0.0).epsilon(1e-9));
}

TEST_CASE("radius limits reject arcs")
{
    tp::ArcFitOptions options;
    options.maxRadius = 5.0;
    for (const tp::FittedMove& move : tp::detectArcs(sampleArc(10.0, 0.0, 90.0, 10, 0.0), options))
    {
        CHECK(move.kind == tp::FittedMove::Kind::Linear);
    }
}

TEST_CASE("too few points stay linear")
{
    const std::vector<geom::Point3D> points = sampleArc(10.0, 0.0, 30.0, 2, 0.0);
    const std::vector<tp::FittedMove> moves = tp::detectArcs(points);
    REQUIRE(moves.size() == 3);
    CHECK(moves[2].kind == tp::FittedMove::Kind::Linear);
    CHECK(tp::detectArcs({}).empty());
}

TEST_CASE("simplifyCollinear keeps only the corners")
{
    const std::vector<geom::Point3D> line{{0.0, 0.0, 0.0}, {1.0, 0.0, 0.0}, {2.0, 0.0, 0.0}, {3.0, 0.0, 0.0},
                                          {3.0, 4.0, 0.0}};
    const std::vector<geom::Point3D> result = tp::simplifyCollinear(line, 0.001);
    REQUIRE(result.size() == 3);
    CHECK(result[1].x == doctest::Approx(3.0));
    CHECK(result[1].y == doctest::Approx(0.0));
}

TEST_CASE("simplifyCollinear keeps reversals")
{
    const std::vector<geom::Point3D> outAndBack{{0.0, 0.0, 0.0}, {5.0, 0.0, 0.0}, {0.0, 0.0, 0.0}};
    CHECK(tp::simplifyCollinear(outAndBack, 0.001).size() == 3);

    const std::vector<geom::Point3D> overshoot{{0.0, 0.0, 0.0}, {5.0, 0.0, 0.0}, {2.0, 0.0, 0.0}};
    CHECK(tp::simplifyCollinear(overshoot, 0.001).size() == 3);
}
