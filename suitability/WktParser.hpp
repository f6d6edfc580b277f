// File: WktParser.hpp
#ifndef SUITGEO_WKT_PARSER_HPP
#define SUITGEO_WKT_PARSER_HPP

#include "OverlayCommon.h"
#include <string>

namespace suitgeo {

    /**
     * @brief Parses a WKT `POLYGON ((x y, ...), (hole...))` string.
     *        Keywords are case-insensitive; a trailing Z/M coordinate is ignored.
     *        Every ring must be explicitly closed and have at least 3 distinct vertices.
     * @return Polygon with rings stored without the closing vertex.
     * @throws OverlayError(InvalidGeometry) on any syntax or ring error.
     */
    Polygon parsePolygonWkt(const std::string& wkt);

} // namespace suitgeo

#endif // SUITGEO_WKT_PARSER_HPP
