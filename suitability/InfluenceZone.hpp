// File: InfluenceZone.hpp
#ifndef SUITGEO_INFLUENCE_ZONE_HPP
#define SUITGEO_INFLUENCE_ZONE_HPP

#include "OverlayCommon.h"
#include "PolygonRasterizer.hpp"
#include <optional>
#include <string>

namespace suitgeo {

    /**
     * @brief Parses the polarity text ("Positive" or "Negative", case-insensitive,
     *        surrounding whitespace ignored).
     * @throws OverlayError(UnknownPolarity) for any other text. There is no default.
     */
    InfluencePolarity parsePolarity(const std::string& text);

    const char* toString(InfluencePolarity polarity);

    /** @brief Largest valid value of the grid, std::nullopt if every cell is nodata. */
    std::optional<float> maxValidValue(const Raster& grid);

    /** @brief Result of the influence stage. */
    struct InfluenceOutcome {
        Raster grid;
        InfluencePolarity polarity = InfluencePolarity::Negative;
        float pre_override_max = 0.0f;  // Max valid value before the override
        float override_value = 0.0f;    // Value written into the covered cells
        std::size_t covered_cells = 0;
    };

    /**
     * @brief Overrides the cells where the sentinel grid is negative with overrideValue
     *        (valid, FLAG_INFLUENCED). Other cells are copied unchanged.
     * @throws OverlayError(MisalignedGrid) if the frames differ.
     */
    Raster applyInfluence(const Raster& cost, const Raster& sentinel, float overrideValue);

    /**
     * @brief Rasterizes the influence boundary onto the cost grid's frame and applies the
     *        polarity override: Negative -> 1, Positive -> max valid value before the override.
     * @throws OverlayError UnknownPolarity, InvalidGeometry, DegenerateRange (Positive on a
     *         grid without valid cells).
     */
    InfluenceOutcome applyInfluenceZone(const Raster& cost, const InfluenceSpec& spec, const RasterizeOptions& options = {});

} // namespace suitgeo

#endif // SUITGEO_INFLUENCE_ZONE_HPP
