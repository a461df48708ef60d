#include "geom/AffineTransform.h"

#include "common/log.h"

#include <QtCore/QRegularExpression>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include <cmath>
#include <vector>

namespace geom
{

namespace
{

constexpr double kIdentityEps = 1e-12;

std::vector<double> parseArguments(const QString& name, const QString& body)
{
    static const QRegularExpression separators(QStringLiteral("[\\s,]+"));

    std::vector<double> values;
    const QStringList tokens = body.trimmed().split(separators, Qt::SkipEmptyParts);
    values.reserve(static_cast<std::size_t>(tokens.size()));
    for (const QString& token : tokens)
    {
        bool ok = false;
        const double value = token.toDouble(&ok);
        if (!ok || !std::isfinite(value))
        {
            throw TransformError(QStringLiteral("%1(): invalid argument '%2'")
                                     .arg(name, token)
                                     .toStdString());
        }
        values.push_back(value);
    }
    if (values.empty())
    {
        throw TransformError(QStringLiteral("%1(): missing arguments").arg(name).toStdString());
    }
    return values;
}

AffineTransform skew(double degreesX, double degreesY)
{
    AffineTransform m;
    m.c = std::tan(degToRad(degreesX));
    m.b = std::tan(degToRad(degreesY));
    return m;
}

AffineTransform buildFunction(const QString& name, const std::vector<double>& args)
{
    if (name == QLatin1String("translate"))
    {
        return AffineTransform::translation(args[0], args.size() > 1 ? args[1] : 0.0);
    }
    if (name == QLatin1String("scale"))
    {
        return AffineTransform::scaling(args[0], args.size() > 1 ? args[1] : args[0]);
    }
    if (name == QLatin1String("rotate"))
    {
        const AffineTransform r = AffineTransform::rotation(args[0]);
        if (args.size() >= 3)
        {
            const double cx = args[1];
            const double cy = args[2];
            return multiply(multiply(AffineTransform::translation(cx, cy), r),
                            AffineTransform::translation(-cx, -cy));
        }
        return r;
    }
    if (name == QLatin1String("matrix"))
    {
        if (args.size() < 6)
        {
            throw TransformError(QStringLiteral("matrix(): expected 6 values, got %1")
                                     .arg(args.size())
                                     .toStdString());
        }
        return AffineTransform{args[0], args[1], args[2], args[3], args[4], args[5]};
    }
    if (name == QLatin1String("skewX"))
    {
        return skew(args[0], 0.0);
    }
    return skew(0.0, args[0]);
}

} // namespace

AffineTransform AffineTransform::translation(double tx, double ty)
{
    AffineTransform m;
    m.e = tx;
    m.f = ty;
    return m;
}

AffineTransform AffineTransform::scaling(double sx, double sy)
{
    AffineTransform m;
    m.a = sx;
    m.d = sy;
    return m;
}

AffineTransform AffineTransform::rotation(double degrees)
{
    const double rad = degToRad(degrees);
    const double cosA = std::cos(rad);
    const double sinA = std::sin(rad);
    return AffineTransform{cosA, sinA, -sinA, cosA, 0.0, 0.0};
}

Point2D AffineTransform::apply(const Point2D& point) const
{
    return {a * point.x + c * point.y + e, b * point.x + d * point.y + f};
}

bool AffineTransform::isIdentity() const noexcept
{
    return std::abs(a - 1.0) < kIdentityEps && std::abs(b) < kIdentityEps
           && std::abs(c) < kIdentityEps && std::abs(d - 1.0) < kIdentityEps
           && std::abs(e) < kIdentityEps && std::abs(f) < kIdentityEps;
}

AffineTransform multiply(const AffineTransform& m1, const AffineTransform& m2)
{
    return AffineTransform{m1.a * m2.a + m1.c * m2.b,
                           m1.b * m2.a + m1.d * m2.b,
                           m1.a * m2.c + m1.c * m2.d,
                           m1.b * m2.c + m1.d * m2.d,
                           m1.a * m2.e + m1.c * m2.f + m1.e,
                           m1.b * m2.e + m1.d * m2.f + m1.f};
}

AffineTransform parseTransform(const std::string& text, std::vector<std::string>* skipped)
{
    static const QRegularExpression pattern(
        QStringLiteral("(translate|scale|rotate|matrix|skewX|skewY)\\s*\\(([^)]*)\\)"));
    static const QRegularExpression edgeSeparators(QStringLiteral("^[\\s,]+|[\\s,]+$"));

    AffineTransform result = AffineTransform::identity();
    const QString source = QString::fromStdString(text);

    const auto skip = [&](qsizetype from, qsizetype to) {
        const QString gap = source.mid(from, to - from).remove(edgeSeparators);
        if (gap.isEmpty())
        {
            return;
        }
        LOG_WARN(Geom, QStringLiteral("Ignoring unrecognised transform '%1'").arg(gap));
        if (skipped)
        {
            skipped->push_back(gap.toStdString());
        }
    };

    qsizetype consumed = 0;
    auto it = pattern.globalMatch(source);
    while (it.hasNext())
    {
        const QRegularExpressionMatch match = it.next();
        skip(consumed, match.capturedStart());
        consumed = match.capturedEnd();

        const QString name = match.captured(1);
        const std::vector<double> args = parseArguments(name, match.captured(2));
        result = multiply(result, buildFunction(name, args));
    }
    skip(consumed, source.size());
    return result;
}

} // namespace geom
