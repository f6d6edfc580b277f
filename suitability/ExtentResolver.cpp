// File: ExtentResolver.cpp
#include "ExtentResolver.hpp"
#include "WktParser.hpp"

#include <limits>

namespace suitgeo {

    BoundingBox resolveExtent(const Polygon& boundary) {
        if (boundary.outer.size() < 3) {
            throw OverlayError(ErrorKind::InvalidGeometry, "boundary ring has fewer than 3 vertices");
        }

        BoundingBox box;
        box.xmin = std::numeric_limits<double>::max();
        box.ymin = std::numeric_limits<double>::max();
        box.xmax = std::numeric_limits<double>::lowest();
        box.ymax = std::numeric_limits<double>::lowest();
        for (const auto& p : boundary.outer) {
            box.xmin = std::min(box.xmin, p.x);
            box.ymin = std::min(box.ymin, p.y);
            box.xmax = std::max(box.xmax, p.x);
            box.ymax = std::max(box.ymax, p.y);
        }

        if (!box.isValid()) {
            throw OverlayError(ErrorKind::InvalidGeometry, "boundary encloses no area (collinear vertices)");
        }
        return box;
    }

    BoundingBox resolveExtent(const std::string& boundaryWkt) {
        return resolveExtent(parsePolygonWkt(boundaryWkt));
    }

} // namespace suitgeo
