#include "tp/TriangleGrid.h"

#include "common/Enforce.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace tp
{

namespace
{
constexpr double kBucketRadiusFactor = 4.0;
constexpr double kBucketExtentDivisor = 32.0;
} // namespace

double TriangleGrid::cellSizeFor(double width, double height, double toolRadius)
{
    return std::max(kBucketRadiusFactor * toolRadius, std::max(width, height) / kBucketExtentDivisor);
}

TriangleGrid::TriangleGrid(const std::vector<Triangle>& triangles, double width, double height, double toolRadius)
    : m_triangles(triangles)
    , m_width(width)
    , m_height(height)
    , m_radius(toolRadius)
{
    m_cellSize = cellSizeFor(width, height, toolRadius);
    CARVEKIT_ENFORCE(m_cellSize > 0.0, "bucket size must be positive");
    m_cellsX = static_cast<int>(std::floor(width / m_cellSize)) + 2;
    m_cellsY = static_cast<int>(std::floor(height / m_cellSize)) + 2;

    m_maxZ.reserve(m_triangles.size());
    for (const Triangle& tri : m_triangles)
    {
        m_maxZ.push_back(std::max({tri.v0.z, tri.v1.z, tri.v2.z}));
    }

    // Counting pass, then a fill pass into one flat index array.
    const std::size_t cellCount = static_cast<std::size_t>(m_cellsX) * static_cast<std::size_t>(m_cellsY);
    std::vector<std::uint32_t> cellCounts(cellCount, 0);
    std::vector<CellSpan> spans;
    spans.reserve(m_triangles.size());

    for (const Triangle& tri : m_triangles)
    {
        const CellSpan span = cellSpanFor(tri);
        spans.push_back(span);
        if (span.ixMax < span.ixMin)
        {
            ++m_stats.dropped;
            continue;
        }
        ++m_stats.registered;
        for (int iy = span.iyMin; iy <= span.iyMax; ++iy)
        {
            for (int ix = span.ixMin; ix <= span.ixMax; ++ix)
            {
                ++cellCounts[static_cast<std::size_t>(iy) * static_cast<std::size_t>(m_cellsX)
                             + static_cast<std::size_t>(ix)];
            }
        }
    }

    std::vector<std::uint32_t> offsets(cellCount, 0);
    std::exclusive_scan(cellCounts.begin(), cellCounts.end(), offsets.begin(), 0u);
    const std::uint32_t totalEntries = offsets.back() + cellCounts.back();
    m_cellIndices.resize(totalEntries);
    m_cellRanges.resize(cellCount);
    m_stats.entries = totalEntries;

    std::vector<std::uint32_t> writeCursor = offsets;
    for (std::uint32_t triIndex = 0; triIndex < static_cast<std::uint32_t>(spans.size()); ++triIndex)
    {
        const CellSpan& span = spans[triIndex];
        for (int iy = span.iyMin; iy <= span.iyMax; ++iy)
        {
            for (int ix = span.ixMin; ix <= span.ixMax; ++ix)
            {
                const std::size_t cell = static_cast<std::size_t>(iy) * static_cast<std::size_t>(m_cellsX)
                                         + static_cast<std::size_t>(ix);
                m_cellIndices[writeCursor[cell]++] = triIndex;
            }
        }
    }

    for (std::size_t cell = 0; cell < cellCount; ++cell)
    {
        m_cellRanges[cell] = CellRange{offsets[cell], cellCounts[cell]};
        m_stats.largestBucket = std::max<std::size_t>(m_stats.largestBucket, cellCounts[cell]);

        auto begin = m_cellIndices.begin() + offsets[cell];
        auto end = begin + cellCounts[cell];
        std::sort(begin, end, [this](std::uint32_t lhs, std::uint32_t rhs) {
            if (m_maxZ[lhs] == m_maxZ[rhs])
            {
                return lhs < rhs;
            }
            return m_maxZ[lhs] > m_maxZ[rhs];
        });
    }
}

TriangleGrid::CellSpan TriangleGrid::cellSpanFor(const Triangle& tri) const
{
    const double minX = std::min({tri.v0.x, tri.v1.x, tri.v2.x}) - m_radius;
    const double maxX = std::max({tri.v0.x, tri.v1.x, tri.v2.x}) + m_radius;
    const double minY = std::min({tri.v0.y, tri.v1.y, tri.v2.y}) - m_radius;
    const double maxY = std::max({tri.v0.y, tri.v1.y, tri.v2.y}) + m_radius;

    if (maxX < 0.0 || minX > m_width || maxY < 0.0 || minY > m_height)
    {
        return {};
    }

    CellSpan span;
    span.ixMin = cellIndex(minX, m_cellsX);
    span.ixMax = cellIndex(maxX, m_cellsX);
    span.iyMin = cellIndex(minY, m_cellsY);
    span.iyMax = cellIndex(maxY, m_cellsY);
    return span;
}

int TriangleGrid::cellIndex(double value, int cells) const
{
    const int index = static_cast<int>(std::floor(value / m_cellSize));
    return std::clamp(index, 0, cells - 1);
}

std::span<const std::uint32_t> TriangleGrid::bucketAt(double x, double y) const
{
    const int ix = cellIndex(x, m_cellsX);
    const int iy = cellIndex(y, m_cellsY);
    const CellRange& range = m_cellRanges[static_cast<std::size_t>(iy) * static_cast<std::size_t>(m_cellsX)
                                          + static_cast<std::size_t>(ix)];
    return {m_cellIndices.data() + range.offset, range.count};
}

} // namespace tp
