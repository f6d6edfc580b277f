// File: ExtentResolver.hpp
#ifndef SUITGEO_EXTENT_RESOLVER_HPP
#define SUITGEO_EXTENT_RESOLVER_HPP

#include "OverlayCommon.h"
#include <string>

namespace suitgeo {

    /**
     * @brief Minimal axis-aligned rectangle enclosing the outer ring. No padding is applied.
     * @throws OverlayError(InvalidGeometry) if the ring has fewer than 3 vertices or encloses no area.
     */
    BoundingBox resolveExtent(const Polygon& boundary);

    /** @brief Parses a WKT polygon and resolves its extent. */
    BoundingBox resolveExtent(const std::string& boundaryWkt);

} // namespace suitgeo

#endif // SUITGEO_EXTENT_RESOLVER_HPP
