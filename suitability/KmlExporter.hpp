// File: KmlExporter.hpp
#ifndef SUITGEO_KML_EXPORTER_HPP
#define SUITGEO_KML_EXPORTER_HPP

#include "OverlayCommon.h"
#include <optional>
#include <string>

namespace suitgeo {

    /** @brief Content of the KML document that accompanies the cost image. */
    struct KmlOverlayInfo {
        std::string name;
        std::string image_href;          // PNG path as referenced from the KML file
        GridFrame frame;                 // Georeference of the image
        std::optional<Polygon> extent;   // Processing boundary
        std::optional<Polygon> influence;
        std::string influence_description;
    };

    /**
     * @brief Writes a KML document with a GroundOverlay (LatLonBox from the frame) and one
     *        Placemark per optional polygon. Coordinates are written as stored; the run's
     *        reference system is expected to be geographic for viewers to place it.
     * @throws OverlayError(ExportFailed) if tinyxml2 cannot save the file.
     */
    void writeKmlOverlay(const KmlOverlayInfo& info, const std::string& filePath);

} // namespace suitgeo

#endif // SUITGEO_KML_EXPORTER_HPP
