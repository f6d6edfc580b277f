// File: AsciiGridIO.hpp
#ifndef SUITGEO_ASCII_GRID_IO_HPP
#define SUITGEO_ASCII_GRID_IO_HPP

#include "OverlayCommon.h"
#include <string>
#include <istream>

namespace suitgeo {

    // NODATA_value assumed when an ASCII grid header omits it
    inline constexpr float DEFAULT_ASCII_NODATA = -9999.0f;

    /**
     * @brief Parses an ESRI ASCII grid (ncols, nrows, xllcorner|xllcenter,
     *        yllcorner|yllcenter, cellsize, optional NODATA_value, then values top row first).
     *        Cells equal to NODATA_value are flagged FLAG_NODATA.
     * @param in Stream positioned at the start of the header.
     * @param sourceName Name used in error messages.
     * @throws OverlayError(InvalidInput) on malformed headers or value counts.
     */
    Raster parseAsciiGrid(std::istream& in, const std::string& sourceName);

    /** @brief Opens and parses an ESRI ASCII grid file. */
    Raster readAsciiGrid(const std::string& filePath);

    /**
     * @brief Writes a raster as an ESRI ASCII grid with corner registration.
     *        Nodata cells are written as the raster's nodata sentinel.
     * @throws OverlayError(ExportFailed) if the file cannot be written.
     */
    void writeAsciiGrid(const Raster& raster, const std::string& filePath);

} // namespace suitgeo

#endif // SUITGEO_ASCII_GRID_IO_HPP
