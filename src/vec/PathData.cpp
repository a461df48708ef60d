#include "vec/PathData.h"

#include "vec/CurveFlattener.h"

#include "common/log.h"

#include <QtCore/QRegularExpression>
#include <QtCore/QString>

#include <cmath>

namespace vec
{

namespace
{

struct Token
{
    QString text;
    qsizetype offset{0};
    bool isCommand{false};
};

std::vector<Token> tokenize(const QString& data)
{
    static const QRegularExpression pattern(
        QStringLiteral("([A-Za-z])|([+-]?(?:\\d+\\.?\\d*|\\.\\d+)(?:[eE][+-]?\\d+)?)|([^\\s,])"));

    std::vector<Token> tokens;
    auto it = pattern.globalMatch(data);
    while (it.hasNext())
    {
        const QRegularExpressionMatch match = it.next();
        if (match.hasCaptured(3))
        {
            throw PathDataError(QStringLiteral("unexpected character '%1' at offset %2")
                                    .arg(match.captured(3))
                                    .arg(match.capturedStart(3))
                                    .toStdString());
        }
        tokens.push_back({match.captured(0), match.capturedStart(0), match.hasCaptured(1)});
    }
    return tokens;
}

class PathReader
{
public:
    PathReader(const QString& data, const geom::AffineTransform& transform)
        : m_tokens(tokenize(data))
        , m_transform(transform)
    {
    }

    std::vector<geom::Polyline> read()
    {
        while (m_index < m_tokens.size())
        {
            const Token& token = m_tokens[m_index];
            if (!token.isCommand)
            {
                throw PathDataError(QStringLiteral("expected a command but found '%1' at offset %2")
                                        .arg(token.text)
                                        .arg(token.offset)
                                        .toStdString());
            }
            ++m_index;
            execute(token);
        }
        finishSubpath(false);
        return std::move(m_polylines);
    }

private:
    bool hasNumber() const { return m_index < m_tokens.size() && !m_tokens[m_index].isCommand; }

    double number(const Token& command)
    {
        if (!hasNumber())
        {
            const qsizetype offset = m_index < m_tokens.size() ? m_tokens[m_index].offset
                                                                : m_tokens.back().offset;
            throw PathDataError(QStringLiteral("command '%1' at offset %2 is missing a number (offset %3)")
                                    .arg(command.text)
                                    .arg(command.offset)
                                    .arg(offset)
                                    .toStdString());
        }
        const Token& token = m_tokens[m_index++];
        bool ok = false;
        const double value = token.text.toDouble(&ok);
        if (!ok || !std::isfinite(value))
        {
            throw PathDataError(QStringLiteral("non-finite number '%1' at offset %2")
                                    .arg(token.text)
                                    .arg(token.offset)
                                    .toStdString());
        }
        return value;
    }

    geom::Point2D point(const Token& command, bool relative)
    {
        const double x = number(command);
        const double y = number(command);
        return relative ? m_current + geom::Point2D(x, y) : geom::Point2D(x, y);
    }

    void ensureSubpathStarted()
    {
        if (m_points.empty())
        {
            m_points.push_back(m_transform.apply(m_current));
        }
    }

    void lineTo(const geom::Point2D& p)
    {
        ensureSubpathStarted();
        m_points.push_back(m_transform.apply(p));
        m_current = p;
    }

    void finishSubpath(bool closed)
    {
        if (m_points.size() >= 2)
        {
            m_polylines.push_back({std::move(m_points), closed});
        }
        m_points.clear();
    }

    void execute(const Token& command)
    {
        const QChar letter = command.text.at(0);
        const bool relative = letter.isLower();
        const char op = letter.toUpper().toLatin1();
        const bool smoothCubic = m_lastOp == 'C' || m_lastOp == 'S';
        const bool smoothQuad = m_lastOp == 'Q' || m_lastOp == 'T';

        switch (op)
        {
        case 'M': {
            finishSubpath(false);
            m_current = point(command, relative);
            m_start = m_current;
            m_points.push_back(m_transform.apply(m_current));
            // Further pairs are implicit line-to commands.
            while (hasNumber())
            {
                lineTo(point(command, relative));
            }
            break;
        }
        case 'L':
            do
            {
                lineTo(point(command, relative));
            } while (hasNumber());
            break;
        case 'H':
            do
            {
                const double x = number(command);
                lineTo({relative ? m_current.x + x : x, m_current.y});
            } while (hasNumber());
            break;
        case 'V':
            do
            {
                const double y = number(command);
                lineTo({m_current.x, relative ? m_current.y + y : y});
            } while (hasNumber());
            break;
        case 'C':
        case 'S': {
            bool smooth = smoothCubic;
            do
            {
                geom::Point2D c1 = m_current;
                if (op == 'C')
                {
                    c1 = point(command, relative);
                }
                else if (smooth)
                {
                    c1 = m_current * 2.0 - m_lastControl;
                }
                const geom::Point2D c2 = point(command, relative);
                const geom::Point2D end = point(command, relative);
                ensureSubpathStarted();
                flattenCubic(m_current, c1, c2, end, m_transform, m_points);
                m_lastControl = c2;
                m_current = end;
                smooth = true;
            } while (hasNumber());
            break;
        }
        case 'Q':
        case 'T': {
            bool smooth = smoothQuad;
            do
            {
                geom::Point2D control = m_current;
                if (op == 'Q')
                {
                    control = point(command, relative);
                }
                else if (smooth)
                {
                    control = m_current * 2.0 - m_lastControl;
                }
                const geom::Point2D end = point(command, relative);
                ensureSubpathStarted();
                flattenQuadratic(m_current, control, end, m_transform, m_points);
                m_lastControl = control;
                m_current = end;
                smooth = true;
            } while (hasNumber());
            break;
        }
        case 'A':
            do
            {
                const double rx = number(command);
                const double ry = number(command);
                const double rotation = number(command);
                const bool largeArc = number(command) != 0.0;
                const bool sweep = number(command) != 0.0;
                const geom::Point2D end = point(command, relative);
                ensureSubpathStarted();
                flattenArc(m_current, rx, ry, rotation, largeArc, sweep, end, m_transform, m_points);
                m_current = end;
            } while (hasNumber());
            break;
        case 'Z':
            if (!m_points.empty())
            {
                m_points.push_back(m_transform.apply(m_start));
                finishSubpath(true);
            }
            m_current = m_start;
            break;
        default:
            throw PathDataError(QStringLiteral("unknown path command '%1' at offset %2")
                                    .arg(command.text)
                                    .arg(command.offset)
                                    .toStdString());
        }
        m_lastOp = op;
    }

    std::vector<Token> m_tokens;
    std::size_t m_index{0};
    geom::AffineTransform m_transform;

    std::vector<geom::Polyline> m_polylines;
    std::vector<geom::Point2D> m_points;
    geom::Point2D m_current{0.0};
    geom::Point2D m_start{0.0};
    geom::Point2D m_lastControl{0.0};
    char m_lastOp{0};
};

} // namespace

std::vector<geom::Polyline> parsePathData(const std::string& data, const geom::AffineTransform& transform)
{
    PathReader reader(QString::fromStdString(data), transform);
    std::vector<geom::Polyline> polylines = reader.read();
    LOG_INFO(Vec, QStringLiteral("Path data produced %1 polylines").arg(polylines.size()));
    return polylines;
}

} // namespace vec
