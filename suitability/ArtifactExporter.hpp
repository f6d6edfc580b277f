// File: ArtifactExporter.hpp
#ifndef SUITGEO_ARTIFACT_EXPORTER_HPP
#define SUITGEO_ARTIFACT_EXPORTER_HPP

#include "OverlayPipeline.hpp"
#include "RunConfig.hpp"
#include <string>
#include <vector>

namespace suitgeo {

    /** @brief Files produced by one run. */
    struct ArtifactSet {
        std::string run_id;             // <prefix>_<timestamp>
        std::vector<std::string> files;
    };

    /** @brief Local time as YYYYmmdd_HHMMSS, used to keep runs apart. */
    std::string runTimestamp();

    /**
     * @brief Writes the enabled artifacts of a finished run under
     *        <directory>/<prefix>_<timestamp>_{cost.asc, cost.png, cost.kml, diagnostics.json}.
     *        The output directory is created if missing.
     * @throws OverlayError(ExportFailed) on any write failure.
     */
    ArtifactSet exportArtifacts(const OverlayResult& result, const OverlayRequest& request, const ExportConfig& config);

} // namespace suitgeo

#endif // SUITGEO_ARTIFACT_EXPORTER_HPP
