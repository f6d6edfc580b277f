// File: WeightedOverlay.hpp
#ifndef SUITGEO_WEIGHTED_OVERLAY_HPP
#define SUITGEO_WEIGHTED_OVERLAY_HPP

#include "OverlayCommon.h"
#include "GridStore.hpp"
#include <string>
#include <vector>

namespace suitgeo {

    /**
     * @brief Weighted-sum raster algebra over the processing window.
     *
     * The reference grid (referenceId, or the first entry when empty) defines cell size and
     * snap; the output frame is its lattice clipped to the box. Each output cell is
     * sum(weight_i * input_i) sampled at the cell centre. A cell is nodata when any input
     * is nodata there or does not cover it. Results are stored in the 8-bit range by
     * truncation and clamping (clamped cells carry FLAG_CLAMPED); nodata cells hold 0.
     *
     * @throws OverlayError EmptyWeightTable (before any lookup), UnknownLayer, MisalignedGrid.
     */
    Raster weightedSum(GridStore& store, const std::string& referenceId,
        const std::vector<WeightEntry>& weights, const BoundingBox& box);

    /**
     * @brief Sums already aligned grids cell by cell. All grids must share one frame.
     * @throws std::invalid_argument if the sizes of grids and weights differ or frames mismatch.
     */
    Raster sumAligned(const std::vector<Raster>& grids, const std::vector<double>& weights);

} // namespace suitgeo

#endif // SUITGEO_WEIGHTED_OVERLAY_HPP
