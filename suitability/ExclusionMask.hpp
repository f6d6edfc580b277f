// File: ExclusionMask.hpp
#ifndef SUITGEO_EXCLUSION_MASK_HPP
#define SUITGEO_EXCLUSION_MASK_HPP

#include "OverlayCommon.h"
#include "GridStore.hpp"
#include <string>
#include <vector>

namespace suitgeo {

    /**
     * @brief Builds the combined exclusion grid over a frame: the binary OR of the
     *        exclusion attribute of every listed layer, aligned to the frame.
     *        Excluded cells hold 1, all other cells are nodata.
     * @throws OverlayError UnknownLayer, MisalignedGrid.
     */
    Raster buildExclusionMask(GridStore& store, const std::vector<std::string>& layerIds, const GridFrame& frame);

    /**
     * @brief Forces every excluded cell to the lowest score (1, valid, FLAG_EXCLUDED);
     *        other cells are copied unchanged. A mask without any excluded cell is a no-op.
     * @throws OverlayError(MisalignedGrid) if mask and cost grid frames differ.
     */
    Raster applyExclusionMask(const Raster& cost, const Raster& mask);

    /** @brief Builds the mask over the cost grid's frame and applies it. Empty list is a no-op. */
    Raster applyExclusions(GridStore& store, const Raster& cost, const std::vector<std::string>& layerIds);

} // namespace suitgeo

#endif // SUITGEO_EXCLUSION_MASK_HPP
