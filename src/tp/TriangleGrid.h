#pragma once

#include "tp/MeshInput.h"

#include <cstdint>
#include <span>
#include <vector>

namespace tp
{

// Uniform bucket grid over the stock rectangle [0, W] x [0, H]. Each triangle is listed in
// every bucket its XY box, grown by the tool radius, touches, so a query at (x, y) only needs
// the bucket containing (x, y). Buckets are ordered by descending triangle max Z.
class TriangleGrid
{
public:
    struct BuildStats
    {
        std::size_t registered{0};
        std::size_t dropped{0};
        std::size_t entries{0};
        std::size_t largestBucket{0};
    };

    TriangleGrid(const std::vector<Triangle>& triangles, double width, double height, double toolRadius);

    [[nodiscard]] std::span<const std::uint32_t> bucketAt(double x, double y) const;

    [[nodiscard]] const Triangle& triangle(std::uint32_t index) const { return m_triangles[index]; }
    [[nodiscard]] double maxZ(std::uint32_t index) const { return m_maxZ[index]; }

    [[nodiscard]] double cellSize() const noexcept { return m_cellSize; }
    [[nodiscard]] int cellsX() const noexcept { return m_cellsX; }
    [[nodiscard]] int cellsY() const noexcept { return m_cellsY; }
    [[nodiscard]] const BuildStats& stats() const noexcept { return m_stats; }

    // max(4r, max(W, H) / 32)
    [[nodiscard]] static double cellSizeFor(double width, double height, double toolRadius);

private:
    struct CellRange
    {
        std::uint32_t offset{0};
        std::uint32_t count{0};
    };

    struct CellSpan
    {
        int ixMin{0};
        int iyMin{0};
        int ixMax{-1};
        int iyMax{-1};
    };

    [[nodiscard]] CellSpan cellSpanFor(const Triangle& tri) const;
    [[nodiscard]] int cellIndex(double value, int cells) const;

    const std::vector<Triangle>& m_triangles;
    std::vector<double> m_maxZ;
    double m_width{0.0};
    double m_height{0.0};
    double m_radius{0.0};
    double m_cellSize{1.0};
    int m_cellsX{1};
    int m_cellsY{1};
    std::vector<CellRange> m_cellRanges;
    std::vector<std::uint32_t> m_cellIndices;
    BuildStats m_stats;
};

} // namespace tp
