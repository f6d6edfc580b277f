// File: PolygonRasterizer.hpp
#ifndef SUITGEO_POLYGON_RASTERIZER_HPP
#define SUITGEO_POLYGON_RASTERIZER_HPP

#include "OverlayCommon.h"
#include <set>

namespace suitgeo {

    /** @brief Controls how a polygon is burnt into a grid. */
    struct RasterizeOptions {
        bool include_boundary = false; // Also burn every cell crossed by a ring edge
        float inside_value = -1.0f;
        float outside_value = 0.0f;
    };

    /**
     * @brief Returns the cells of the frame covered by the polygon: a cell is covered when its
     *        centre lies inside the outer ring and outside every hole (even-odd rule). With
     *        include_boundary set, cells touched by the ring edges are added as well.
     */
    std::set<IntPoint> coveredCells(const Polygon& polygon, const GridFrame& frame, bool includeBoundary);

    /**
     * @brief Rasterizes a polygon onto the given frame. Covered cells receive
     *        options.inside_value, every other cell options.outside_value; no cell is nodata.
     */
    Raster rasterizePolygon(const Polygon& polygon, const GridFrame& frame, const RasterizeOptions& options = {});

} // namespace suitgeo

#endif // SUITGEO_POLYGON_RASTERIZER_HPP
