// File: Rescaler.hpp
#ifndef SUITGEO_RESCALER_HPP
#define SUITGEO_RESCALER_HPP

#include "OverlayCommon.h"
#include <optional>

namespace suitgeo {

    /** @brief Observed integer range of the valid cells of a grid. */
    struct ValueRange {
        int min = 0;
        int max = 0;
        std::size_t valid_cells = 0;
    };

    /**
     * @brief Scans the valid cells for their truncated minimum and maximum.
     * @return std::nullopt if the grid has no valid cell.
     */
    std::optional<ValueRange> observedRange(const Raster& grid);

    /**
     * @brief Linear remap from the given source range into [targetMin, targetMax]:
     *        out = (in - srcMin) * (targetMax - targetMin) / (srcMax - srcMin) + targetMin,
     *        truncated and stored in the 8-bit range. Nodata cells stay nodata.
     * @throws OverlayError(DegenerateRange) if srcMax == srcMin or the target range is not
     *         0 <= targetMin < targetMax <= 255.
     */
    Raster rescale(const Raster& grid, const ValueRange& source, int targetMin, int targetMax);

    /** @brief Rescale using the grid's own observed range. Throws DegenerateRange without valid cells. */
    Raster rescale(const Raster& grid, int targetMin, int targetMax);

} // namespace suitgeo

#endif // SUITGEO_RESCALER_HPP
