#pragma once

#include <cstddef>
#include <vector>

namespace tp
{
struct StockConfig;
}

namespace tp::heightfield
{

struct ZMapConfig
{
    double resolution_mm{0.5};
    int gridWidth{2};
    int gridHeight{2};
    double physicalWidth_mm{0.0};
    double physicalHeight_mm{0.0};

    // Spacing between grid points; the first and last columns sit on the stock edges.
    [[nodiscard]] double cellSizeX() const noexcept;
    [[nodiscard]] double cellSizeY() const noexcept;
    [[nodiscard]] double xAt(int gx) const noexcept { return gx * cellSizeX(); }
    [[nodiscard]] double yAt(int gy) const noexcept { return gy * cellSizeY(); }
    [[nodiscard]] std::size_t sampleCount() const noexcept;
};

// Grid of max(2, ceil(W / res)) by max(2, ceil(H / res)) points over the stock.
// Throws ConfigError for a non-positive resolution.
[[nodiscard]] ZMapConfig makeZMapConfig(const StockConfig& stock, double resolution);

// Dense row-major samples; a point the tool never touches holds 0.
class HeightMap
{
public:
    explicit HeightMap(const ZMapConfig& config);

    [[nodiscard]] const ZMapConfig& config() const noexcept { return m_config; }
    [[nodiscard]] const std::vector<double>& data() const noexcept { return m_data; }

    [[nodiscard]] double at(int gx, int gy) const { return m_data[offset(gx, gy)]; }
    void set(int gx, int gy, double z) { m_data[offset(gx, gy)] = z; }

private:
    [[nodiscard]] std::size_t offset(int gx, int gy) const noexcept
    {
        return static_cast<std::size_t>(gy) * static_cast<std::size_t>(m_config.gridWidth)
               + static_cast<std::size_t>(gx);
    }

    ZMapConfig m_config;
    std::vector<double> m_data;
};

// Negates every sample for engrave mode; untouched (zero) cells stay at zero.
[[nodiscard]] HeightMap invertHeightMap(const HeightMap& heightMap);

} // namespace tp::heightfield
