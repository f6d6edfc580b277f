// File: PngExporter.hpp
#ifndef SUITGEO_PNG_EXPORTER_HPP
#define SUITGEO_PNG_EXPORTER_HPP

#include "OverlayCommon.h"
#include <string>

namespace suitgeo {

    /**
     * @brief Writes the grid as an 8-bit grey + alpha PNG, one pixel per cell, north up.
     *        Values are clamped to [0,255]; nodata cells are fully transparent.
     * @throws OverlayError(ExportFailed) if the file cannot be opened or libpng reports an error.
     */
    void writePng(const Raster& grid, const std::string& filePath);

} // namespace suitgeo

#endif // SUITGEO_PNG_EXPORTER_HPP
