#include "doctest/doctest.h"

#include "geom/AffineTransform.h"
#include "geom/Primitives.h"

#include <string>
#include <vector>

TEST_CASE("parseTransform translate moves the origin")
{
    const geom::AffineTransform m = geom::parseTransform("translate(10,20)");
    const geom::Point2D p = m.apply({0.0, 0.0});
    CHECK(p.x == doctest::Approx(10.0));
    CHECK(p.y == doctest::Approx(20.0));
}

TEST_CASE("parseTransform composes left to right")
{
    const geom::AffineTransform m = geom::parseTransform("translate(10,0) scale(2)");
    const geom::Point2D p = m.apply({5.0, 0.0});
    CHECK(p.x == doctest::Approx(20.0));
    CHECK(p.y == doctest::Approx(0.0));
}

TEST_CASE("parseTransform rotate about a center")
{
    const geom::AffineTransform about = geom::parseTransform("rotate(90, 1, 1)");
    const geom::Point2D p = about.apply({2.0, 1.0});
    CHECK(p.x == doctest::Approx(1.0));
    CHECK(p.y == doctest::Approx(2.0));

    const geom::Point2D q = geom::parseTransform("rotate(90)").apply({1.0, 0.0});
    CHECK(q.x == doctest::Approx(0.0));
    CHECK(q.y == doctest::Approx(1.0));
}

TEST_CASE("parseTransform matrix and single-value scale")
{
    const geom::AffineTransform m = geom::parseTransform("matrix(1 0 0 1 3 4)");
    CHECK(m.e == doctest::Approx(3.0));
    CHECK(m.f == doctest::Approx(4.0));

    const geom::AffineTransform s = geom::parseTransform("scale(3)");
    CHECK(s.a == doctest::Approx(3.0));
    CHECK(s.d == doctest::Approx(3.0));
}

TEST_CASE("parseTransform empty or unknown text is identity")
{
    CHECK(geom::parseTransform("").isIdentity());
    CHECK(geom::parseTransform("perspective(4)").isIdentity());
}

TEST_CASE("parseTransform reports unknown functions between known ones")
{
    std::vector<std::string> skipped;
    const geom::AffineTransform m = geom::parseTransform("translate(1,2) perspective(3), scale(2)", &skipped);
    REQUIRE(skipped.size() == 1);
    CHECK(skipped.front() == "perspective(3)");

    const geom::Point2D p = m.apply({1.0, 1.0});
    CHECK(p.x == doctest::Approx(3.0));
    CHECK(p.y == doctest::Approx(4.0));

    skipped.clear();
    (void)geom::parseTransform("rotate(45) skew(2)", &skipped);
    CHECK(skipped == std::vector<std::string>{"skew(2)"});

    skipped.clear();
    (void)geom::parseTransform(" translate(1 2) , scale(2) ", &skipped);
    CHECK(skipped.empty());
}

TEST_CASE("parseTransform rejects malformed arguments")
{
    CHECK_THROWS_AS(geom::parseTransform("translate(abc)"), geom::TransformError);
    CHECK_THROWS_AS(geom::parseTransform("matrix(1, 2, 3)"), geom::TransformError);
    CHECK_THROWS_AS(geom::parseTransform("scale()"), geom::TransformError);
}

TEST_CASE("multiply keeps identity neutral")
{
    const geom::AffineTransform r = geom::AffineTransform::rotation(30.0);
    const geom::AffineTransform left = geom::multiply(geom::AffineTransform::identity(), r);
    const geom::AffineTransform right = geom::multiply(r, geom::AffineTransform::identity());
    CHECK(left.a == doctest::Approx(r.a));
    CHECK(left.b == doctest::Approx(r.b));
    CHECK(right.c == doctest::Approx(r.c));
    CHECK(right.d == doctest::Approx(r.d));
}

TEST_CASE("primitive helpers")
{
    const std::vector<geom::Point2D> pts{{0.0, 0.0}, {3.0, 4.0}, {3.0, 10.0}};
    CHECK(geom::polylineLength(pts) == doctest::Approx(11.0));

    geom::Polyline polyline{pts, false};
    const geom::Bounds2D bounds = geom::computeBounds({polyline});
    REQUIRE(bounds.valid);
    CHECK(bounds.width() == doctest::Approx(3.0));
    CHECK(bounds.height() == doctest::Approx(10.0));

    const geom::Polyline reversed = geom::reversePolyline(polyline);
    CHECK(reversed.points.front() == pts.back());
    CHECK(geom::radToDeg(geom::degToRad(45.0)) == doctest::Approx(45.0));
}
