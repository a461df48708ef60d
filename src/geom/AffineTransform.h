#pragma once

#include "geom/Primitives.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace geom
{

class TransformError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Row form [a c e; b d f; 0 0 1]: x' = a*x + c*y + e, y' = b*x + d*y + f.
struct AffineTransform
{
    double a{1.0};
    double b{0.0};
    double c{0.0};
    double d{1.0};
    double e{0.0};
    double f{0.0};

    [[nodiscard]] static AffineTransform identity() noexcept { return {}; }
    [[nodiscard]] static AffineTransform translation(double tx, double ty);
    [[nodiscard]] static AffineTransform scaling(double sx, double sy);
    [[nodiscard]] static AffineTransform rotation(double degrees);

    [[nodiscard]] Point2D apply(const Point2D& point) const;
    [[nodiscard]] bool isIdentity() const noexcept;
};

// m1 * m2: the result applies m2 first, then m1.
[[nodiscard]] AffineTransform multiply(const AffineTransform& m1, const AffineTransform& m2);

// Parses a transform attribute such as "translate(10,20) rotate(45 5 5)".
// Functions compose left to right. Throws TransformError on malformed arguments.
// Text that is not a known function is logged, skipped and, when given, appended to skipped.
[[nodiscard]] AffineTransform parseTransform(const std::string& text,
                                             std::vector<std::string>* skipped = nullptr);

} // namespace geom
