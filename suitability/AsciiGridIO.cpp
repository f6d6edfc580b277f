// File: AsciiGridIO.cpp
#include "AsciiGridIO.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <map>
#include <cctype>
#include <cstdlib>
#include <optional>

namespace suitgeo {

    namespace {

        std::string toLower(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        std::optional<double> parseNumber(const std::string& token) {
            if (token.empty()) return std::nullopt;
            char* end = nullptr;
            double v = std::strtod(token.c_str(), &end);
            if (end == token.c_str() || *end != '\0' || !std::isfinite(v)) return std::nullopt;
            return v;
        }

        [[noreturn]] void fail(const std::string& sourceName, const std::string& what) {
            throw OverlayError(ErrorKind::InvalidInput, "ASCII grid '" + sourceName + "': " + what);
        }

    } // anonymous namespace

    Raster parseAsciiGrid(std::istream& in, const std::string& sourceName) {
        std::map<std::string, double> header;
        std::string token;
        std::string firstValue;

        while (in >> token) {
            if (!std::isalpha(static_cast<unsigned char>(token[0]))) {
                firstValue = token; // Header finished, this is the first cell value
                break;
            }
            std::string valueText;
            if (!(in >> valueText)) fail(sourceName, "missing value for header key '" + token + "'");
            auto value = parseNumber(valueText);
            if (!value) fail(sourceName, "non-numeric value '" + valueText + "' for header key '" + token + "'");
            header[toLower(token)] = *value;
        }

        auto require = [&](const char* key) {
            auto it = header.find(key);
            if (it == header.end()) fail(sourceName, std::string("missing header key '") + key + "'");
            return it->second;
        };

        const double ncols = require("ncols");
        const double nrows = require("nrows");
        const double cellsize = require("cellsize");
        if (ncols < 1 || nrows < 1 || std::floor(ncols) != ncols || std::floor(nrows) != nrows) {
            fail(sourceName, "ncols/nrows must be positive integers");
        }
        if (!(cellsize > 0.0)) fail(sourceName, "cellsize must be positive");

        const bool xCenter = header.count("xllcenter") > 0;
        const bool yCenter = header.count("yllcenter") > 0;
        const double xll = xCenter ? header["xllcenter"] : require("xllcorner");
        const double yll = yCenter ? header["yllcenter"] : require("yllcorner");
        const float nodata = header.count("nodata_value") ? static_cast<float>(header["nodata_value"]) : DEFAULT_ASCII_NODATA;

        GridFrame frame;
        frame.cell_size = cellsize;
        frame.width = static_cast<std::size_t>(ncols);
        frame.height = static_cast<std::size_t>(nrows);
        frame.origin_x = xCenter ? xll - cellsize * 0.5 : xll;
        frame.origin_y = (yCenter ? yll - cellsize * 0.5 : yll) + cellsize * nrows;

        Raster raster(frame, GridCellData{}, nodata);
        const std::size_t expected = frame.width * frame.height;
        std::size_t read = 0;

        auto store = [&](const std::string& text) {
            auto v = parseNumber(text);
            if (!v) fail(sourceName, "non-numeric cell value '" + text + "' at cell " + std::to_string(read));
            GridCellData& cell = raster.data()[read];
            if (static_cast<float>(*v) == nodata) {
                cell = nodataCell();
            }
            else {
                cell.value = static_cast<float>(*v);
                cell.flags = FLAG_NONE;
            }
            ++read;
        };

        if (!firstValue.empty()) store(firstValue);
        while (read < expected && in >> token) store(token);

        if (read != expected) {
            fail(sourceName, "expected " + std::to_string(expected) + " cell values, found " + std::to_string(read));
        }
        if (in >> token) {
            std::cerr << "Warning (AsciiGridIO): Trailing data after " << expected << " cells in '" << sourceName << "' ignored." << std::endl;
        }
        return raster;
    }

    Raster readAsciiGrid(const std::string& filePath) {
        std::ifstream file(filePath);
        if (!file.is_open()) {
            throw OverlayError(ErrorKind::InvalidInput, "cannot open ASCII grid '" + filePath + "'");
        }
        return parseAsciiGrid(file, filePath);
    }

    void writeAsciiGrid(const Raster& raster, const std::string& filePath) {
        if (!raster.isValid()) {
            throw OverlayError(ErrorKind::ExportFailed, "cannot write invalid raster to '" + filePath + "'");
        }
        std::ofstream out(filePath);
        if (!out.is_open()) {
            throw OverlayError(ErrorKind::ExportFailed, "cannot open '" + filePath + "' for writing");
        }

        const GridFrame& f = raster.frame();
        out << std::setprecision(12);
        out << "ncols " << f.width << "\n"
            << "nrows " << f.height << "\n"
            << "xllcorner " << f.origin_x << "\n"
            << "yllcorner " << f.extent().ymin << "\n"
            << "cellsize " << f.cell_size << "\n"
            << "NODATA_value " << raster.nodataValue() << "\n";
        out << std::setprecision(9);

        for (std::size_t y = 0; y < f.height; ++y) {
            for (std::size_t x = 0; x < f.width; ++x) {
                const GridCellData& cell = raster.at(x, y);
                if (x > 0) out << ' ';
                out << (cell.isNodata() ? raster.nodataValue() : cell.value);
            }
            out << '\n';
        }

        out.close();
        if (!out) {
            throw OverlayError(ErrorKind::ExportFailed, "failed to write all data to '" + filePath + "'");
        }
    }

} // namespace suitgeo
