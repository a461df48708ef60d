#include "doctest/doctest.h"

#include "common/Enforce.h"
#include "tp/ConfigError.h"
#include "tp/MeshInput.h"
#include "tp/RasterGenerator.h"
#include "tp/Stock.h"
#include "tp/Tool.h"
#include "tp/TriangleGrid.h"
#include "tp/heightfield/DropCutter.h"
#include "tp/heightfield/HeightMap.h"

#include <cmath>
#include <limits>
#include <vector>

namespace
{

tp::ToolConfig makeTool(tp::ToolKind kind, double diameter, double angle = 90.0)
{
    tp::ToolConfig tool = tp::makeDefaultTool();
    tool.kind = kind;
    tool.diameter_mm = diameter;
    tool.angle_deg = angle;
    return tool;
}

tp::StockConfig makeStock(double width, double height)
{
    tp::StockConfig stock = tp::makeDefaultStock();
    stock.width_mm = width;
    stock.height_mm = height;
    return stock;
}

const tp::Triangle kFloorCorner{{0.0, 0.0, 0.0}, {10.0, 0.0, 0.0}, {0.0, 10.0, 0.0}};

} // namespace

TEST_CASE("tool contact offsets per profile")
{
    const tp::ToolConfig ball = makeTool(tp::ToolKind::BallNose, 6.0);
    CHECK(tp::toolContactOffset(ball, 2.0) == doctest::Approx(-3.0 + std::sqrt(5.0)));
    CHECK(tp::toolContactOffset(ball, 2.0) == doctest::Approx(-0.764).epsilon(0.001));
    CHECK(tp::toolContactOffset(ball, 0.0) == doctest::Approx(0.0));

    const tp::ToolConfig flat = makeTool(tp::ToolKind::FlatEnd, 6.0);
    CHECK(tp::toolContactOffset(flat, 2.9) == doctest::Approx(0.0));
    CHECK(std::isinf(tp::toolContactOffset(flat, 3.5)));

    const tp::ToolConfig vbit = makeTool(tp::ToolKind::VBit, 6.0, 90.0);
    CHECK(tp::toolContactOffset(vbit, 2.0) == doctest::Approx(-2.0));
    CHECK(tp::vBitWidthAtDepth(2.0, 90.0) == doctest::Approx(4.0));
    CHECK(tp::vBitDepthForWidth(4.0, 90.0) == doctest::Approx(2.0));
}

TEST_CASE("drop cutter touches a flat edge from beside the triangle")
{
    const double ballZ = tp::heightfield::dropCutterOnTriangle(-2.0, 5.0, kFloorCorner,
                                                               makeTool(tp::ToolKind::BallNose, 6.0));
    CHECK(ballZ == doctest::Approx(-3.0 + std::sqrt(5.0)));

    const double flatZ = tp::heightfield::dropCutterOnTriangle(-2.0, 5.0, kFloorCorner,
                                                               makeTool(tp::ToolKind::FlatEnd, 6.0));
    CHECK(flatZ == doctest::Approx(0.0));

    const double vZ = tp::heightfield::dropCutterOnTriangle(-2.0, 5.0, kFloorCorner,
                                                            makeTool(tp::ToolKind::VBit, 6.0, 90.0));
    CHECK(vZ == doctest::Approx(-2.0));
}

TEST_CASE("drop cutter misses triangles out of reach")
{
    const double z = tp::heightfield::dropCutterOnTriangle(-5.0, 5.0, kFloorCorner,
                                                           makeTool(tp::ToolKind::BallNose, 6.0));
    CHECK(std::isinf(z));
    CHECK(z < 0.0);
}

TEST_CASE("drop cutter reads a sloped face under the tool axis")
{
    // Plane z = x; all edges and vertices are beyond the radius from (2, 2).
    const tp::Triangle ramp{{0.0, 0.0, 0.0}, {10.0, 0.0, 10.0}, {0.0, 10.0, 0.0}};
    const double z = tp::heightfield::dropCutterOnTriangle(2.0, 2.0, ramp, makeTool(tp::ToolKind::FlatEnd, 2.0));
    CHECK(z == doctest::Approx(2.0));
}

TEST_CASE("point in triangle counts edges as inside")
{
    CHECK(tp::heightfield::isPointInTriangleXY(1.0, 1.0, kFloorCorner));
    CHECK(tp::heightfield::isPointInTriangleXY(5.0, 0.0, kFloorCorner));
    CHECK_FALSE(tp::heightfield::isPointInTriangleXY(6.0, 6.0, kFloorCorner));
}

TEST_CASE("height map of a horizontal triangle")
{
    const std::vector<tp::Triangle> triangles{{{2.0, 2.0, 5.0}, {10.0, 2.0, 5.0}, {2.0, 10.0, 5.0}}};
    const tp::heightfield::ZMapConfig config = tp::heightfield::makeZMapConfig(makeStock(20.0, 20.0), 0.5);
    REQUIRE(config.gridWidth == 40);
    REQUIRE(config.gridHeight == 40);

    const tp::heightfield::HeightMap map =
        tp::heightfield::computeHeightMap(triangles, config, makeTool(tp::ToolKind::FlatEnd, 1.0));

    CHECK(map.at(7, 7) == doctest::Approx(5.0));
    CHECK(map.at(9, 6) == doctest::Approx(5.0));
    CHECK(map.at(35, 35) == 0.0);
    CHECK(map.at(0, 39) == 0.0);
    CHECK(map.at(39, 0) == 0.0);
}

TEST_CASE("height map accepts a flat vertex buffer")
{
    const std::vector<float> vertices{0.f, 0.f, 2.f, 10.f, 0.f, 2.f, 0.f, 10.f, 2.f};
    const tp::heightfield::ZMapConfig config = tp::heightfield::makeZMapConfig(makeStock(10.0, 10.0), 1.0);
    const tp::heightfield::HeightMap map =
        tp::heightfield::computeHeightMap(vertices, config, makeTool(tp::ToolKind::FlatEnd, 1.0));
    CHECK(map.at(1, 1) == doctest::Approx(2.0));

    const std::vector<float> broken{0.f, 0.f, 2.f, 10.f};
    CHECK_THROWS_AS((void)tp::heightfield::computeHeightMap(broken, config, makeTool(tp::ToolKind::FlatEnd, 1.0)),
                    tp::MeshInputError);
}

TEST_CASE("height map progress stays within range")
{
    const std::vector<tp::Triangle> triangles{kFloorCorner};
    const tp::heightfield::ZMapConfig config = tp::heightfield::makeZMapConfig(makeStock(10.0, 10.0), 0.2);
    std::vector<int> reported;
    (void)tp::heightfield::computeHeightMap(triangles, config, makeTool(tp::ToolKind::BallNose, 2.0),
                                            [&](int pct) { reported.push_back(pct); });
    REQUIRE_FALSE(reported.empty());
    for (std::size_t i = 0; i < reported.size(); ++i)
    {
        CHECK(reported[i] >= 0);
        CHECK(reported[i] <= 100);
        if (i > 0)
        {
            CHECK(reported[i] >= reported[i - 1]);
        }
    }
}

TEST_CASE("zmap config sizing")
{
    const tp::heightfield::ZMapConfig config = tp::heightfield::makeZMapConfig(makeStock(200.0, 100.0), 0.5);
    CHECK(config.gridWidth == 400);
    CHECK(config.gridHeight == 200);
    CHECK(config.xAt(config.gridWidth - 1) == doctest::Approx(200.0));

    const tp::heightfield::ZMapConfig tiny = tp::heightfield::makeZMapConfig(makeStock(0.1, 0.1), 1.0);
    CHECK(tiny.gridWidth == 2);
    CHECK(tiny.gridHeight == 2);

    CHECK_THROWS_AS((void)tp::heightfield::makeZMapConfig(makeStock(10.0, 10.0), 0.0), tp::ConfigError);
    CHECK_THROWS_AS((void)tp::heightfield::makeZMapConfig(makeStock(10.0, 10.0), -1.0), tp::ConfigError);
}

TEST_CASE("height map rejects a degenerate grid")
{
    tp::heightfield::ZMapConfig config = tp::heightfield::makeZMapConfig(makeStock(10.0, 10.0), 1.0);
    config.gridWidth = 1;
    CHECK_THROWS_AS(tp::heightfield::HeightMap{config}, common::InvariantError);
}

TEST_CASE("inverting a height map keeps empty cells at zero")
{
    tp::heightfield::HeightMap map(tp::heightfield::makeZMapConfig(makeStock(4.0, 4.0), 2.0));
    map.set(0, 0, 3.0);
    map.set(1, 1, -2.0);
    const tp::heightfield::HeightMap inverted = tp::heightfield::invertHeightMap(map);
    CHECK(inverted.at(0, 0) == doctest::Approx(-3.0));
    CHECK(inverted.at(1, 1) == doctest::Approx(2.0));
    CHECK(inverted.at(1, 0) == 0.0);
    CHECK_FALSE(std::signbit(inverted.at(1, 0)));
}

TEST_CASE("mesh input validation")
{
    CHECK_THROWS_AS((void)tp::meshFromFlatVertices(std::vector<float>(10, 0.f)), tp::MeshInputError);

    std::vector<float> nan(9, 1.f);
    nan[4] = std::numeric_limits<float>::quiet_NaN();
    CHECK_THROWS_AS((void)tp::meshFromFlatVertices(nan), tp::MeshInputError);

    std::vector<float> two(18, 0.f);
    two[17] = 4.f;
    const std::vector<tp::Triangle> triangles = tp::meshFromFlatVertices(two);
    REQUIRE(triangles.size() == 2);
    const tp::MeshBounds bounds = tp::computeMeshBounds(triangles);
    CHECK(bounds.valid);
    CHECK(bounds.max.z == doctest::Approx(4.0));
}

TEST_CASE("bucket grid lists nearby triangles highest first")
{
    const std::vector<tp::Triangle> triangles{
        {{1.0, 1.0, 1.0}, {3.0, 1.0, 1.0}, {1.0, 3.0, 1.0}},
        {{1.0, 1.0, 4.0}, {3.0, 1.0, 4.0}, {1.0, 3.0, 4.0}},
        {{500.0, 500.0, 9.0}, {501.0, 500.0, 9.0}, {500.0, 501.0, 9.0}},
    };
    const tp::TriangleGrid grid(triangles, 100.0, 100.0, 0.5);
    CHECK(tp::TriangleGrid::cellSizeFor(200.0, 200.0, 1.0) == doctest::Approx(6.25));
    CHECK(grid.stats().registered == 2);
    CHECK(grid.stats().dropped == 1);

    const auto bucket = grid.bucketAt(2.0, 2.0);
    REQUIRE(bucket.size() == 2);
    CHECK(bucket[0] == 1u);
    CHECK(bucket[1] == 0u);
    CHECK(grid.maxZ(bucket[0]) == doctest::Approx(4.0));
    CHECK(grid.bucketAt(90.0, 90.0).empty());
}

TEST_CASE("raster zigzags over the sampled rows")
{
    const tp::heightfield::HeightMap map(tp::heightfield::makeZMapConfig(makeStock(10.0, 10.0), 1.0));
    tp::RasterParams params;
    params.stepover_mm = 1.0;

    std::vector<int> progress;
    const tp::ToolPath path = tp::generateRasterPaths(map, params, [&](int pct) { progress.push_back(pct); });

    REQUIRE(path.segments.size() == 13);
    CHECK(path.segments.front().kind == tp::MoveKind::Rapid);
    CHECK(path.segments.front().points.front().z == doctest::Approx(params.safeZ_mm));
    CHECK(path.segments[1].kind == tp::MoveKind::Plunge);
    CHECK(path.segments.back().kind == tp::MoveKind::Retract);
    CHECK(path.segments[3].points.front().x == doctest::Approx(10.0));
    CHECK(path.segments[4].points.front().x == doctest::Approx(0.0));

    CHECK(path.stats.gridWidth == 10);
    CHECK(path.stats.gridHeight == 10);
    CHECK(path.stats.cuttingDistance_mm == doctest::Approx(110.0));
    REQUIRE(progress.size() == 1);
    CHECK(progress.front() == 100);
}

TEST_CASE("raster stepover skips grid rows")
{
    const tp::heightfield::HeightMap map(tp::heightfield::makeZMapConfig(makeStock(10.0, 10.0), 1.0));
    tp::RasterParams params;
    params.stepover_mm = 3.0;
    const tp::ToolPath path = tp::generateRasterPaths(map, params);
    CHECK(path.segments.size() == 7);
}
