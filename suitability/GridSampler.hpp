// File: GridSampler.hpp
#ifndef SUITGEO_GRID_SAMPLER_HPP
#define SUITGEO_GRID_SAMPLER_HPP

#include "OverlayCommon.h"
#include <string>

namespace suitgeo {

    /**
     * @brief Samples a source raster at real-world coordinates using the nearest cell.
     *        The source may have a different extent and origin than the grid being filled,
     *        so every lookup goes through world coordinates.
     */
    struct GridSampler {
        const Raster& source;
        const double inv_cell_size; // Precomputed for efficiency

        /**
         * @throws std::invalid_argument If the source raster has invalid dimensions or cell size.
         */
        explicit GridSampler(const Raster& src)
            : source(src), inv_cell_size(src.isValid() ? 1.0 / src.cellSize() : 0.0)
        {
            if (!src.isValid()) {
                throw std::invalid_argument("GridSampler: Source raster must have positive dimensions and cell size. Got "
                    + std::to_string(src.width()) + "x" + std::to_string(src.height()));
            }
        }

        /**
         * @brief Returns the source cell covering (world_x, world_y). Points outside the
         *        source extent return a nodata cell.
         */
        GridCellData sampleAt(double world_x, double world_y) const {
            const GridFrame& f = source.frame();
            double col_f = (world_x - f.origin_x) * inv_cell_size;
            double row_f = (f.origin_y - world_y) * inv_cell_size;
            if (col_f < 0.0 || row_f < 0.0) {
                return nodataCell();
            }
            std::size_t col = static_cast<std::size_t>(col_f);
            std::size_t row = static_cast<std::size_t>(row_f);
            if (col >= f.width || row >= f.height) {
                return nodataCell();
            }
            return source.at(col, row);
        }
    };

    /**
     * @brief Builds the processing frame: the reference lattice (origin and cell size)
     *        clipped to the smallest whole-cell window that covers the bounding box.
     * @throws OverlayError(InvalidGeometry) if the box is empty.
     * @throws OverlayError(MisalignedGrid) if the reference frame has no usable cell size.
     */
    GridFrame windowFrame(const GridFrame& reference, const BoundingBox& box);

    /**
     * @brief Verifies that a contributing grid shares the reference cell size and that its
     *        origin sits on the reference lattice (snap).
     * @throws OverlayError(MisalignedGrid) naming the layer otherwise.
     */
    void checkAlignment(const GridFrame& reference, const GridFrame& contributing, const std::string& layerId);

    /**
     * @brief Copies a raster onto the target frame by sampling each target cell centre.
     *        Callers pass grids that passed checkAlignment, so this is a window on the same
     *        lattice. Cells outside the source extent become nodata. The source nodata sentinel is kept.
     */
    Raster alignToFrame(const Raster& source, const GridFrame& target);

} // namespace suitgeo

#endif // SUITGEO_GRID_SAMPLER_HPP
