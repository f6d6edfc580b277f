// File: ArtifactExporter.cpp
#include "ArtifactExporter.hpp"
#include "AsciiGridIO.hpp"
#include "PngExporter.hpp"
#include "KmlExporter.hpp"
#include "DiagnosticsWriter.hpp"
#include "WktParser.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>

namespace suitgeo {

    std::string runTimestamp() {
        auto now = std::chrono::system_clock::now();
        auto now_c = std::chrono::system_clock::to_time_t(now);
        std::tm now_tm = *std::localtime(&now_c);
        std::stringstream ss_timestamp;
        ss_timestamp << std::put_time(&now_tm, "%Y%m%d_%H%M%S");
        return ss_timestamp.str();
    }

    ArtifactSet exportArtifacts(const OverlayResult& result, const OverlayRequest& request, const ExportConfig& config) {
        namespace fs = std::filesystem;

        ArtifactSet artifacts;
        artifacts.run_id = config.prefix + "_" + runTimestamp();

        const fs::path dir(config.directory.empty() ? std::string(".") : config.directory);
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            throw OverlayError(ErrorKind::ExportFailed, "cannot create output directory '" + dir.string() + "': " + ec.message());
        }
        const std::string base = (dir / artifacts.run_id).string();

        if (config.ascii) {
            const std::string path = base + "_cost.asc";
            writeAsciiGrid(result.cost, path);
            artifacts.files.push_back(path);
        }

        const std::string pngName = artifacts.run_id + "_cost.png";
        if (config.png) {
            const std::string path = base + "_cost.png";
            writePng(result.cost, path);
            artifacts.files.push_back(path);
        }

        if (config.kml) {
            KmlOverlayInfo info;
            info.name = artifacts.run_id;
            info.image_href = pngName; // Relative to the KML file, both live in the same directory
            info.frame = result.cost.frame();
            info.extent = parsePolygonWkt(request.boundary_wkt);
            if (request.influence) {
                info.influence = parsePolygonWkt(request.influence->boundary_wkt);
                info.influence_description = request.influence->description;
            }
            if (!config.png) {
                std::cerr << "Warning (ArtifactExporter): KML references " << pngName << " but PNG output is disabled." << std::endl;
            }
            const std::string path = base + "_cost.kml";
            writeKmlOverlay(info, path);
            artifacts.files.push_back(path);
        }

        if (config.json) {
            const std::string path = base + "_diagnostics.json";
            writeDiagnosticsJson(result.diagnostics, artifacts.run_id, path);
            artifacts.files.push_back(path);
        }

        for (const auto& f : artifacts.files) {
            std::cout << "Info (ArtifactExporter): Wrote " << f << std::endl;
        }
        return artifacts;
    }

} // namespace suitgeo
