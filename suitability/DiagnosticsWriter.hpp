// File: DiagnosticsWriter.hpp
#ifndef SUITGEO_DIAGNOSTICS_WRITER_HPP
#define SUITGEO_DIAGNOSTICS_WRITER_HPP

#include "OverlayPipeline.hpp"
#include <string>

namespace suitgeo {

    /** @brief Serializes the diagnostics of a run as a JSON document (text). */
    std::string diagnosticsToJson(const OverlayDiagnostics& diagnostics, const std::string& runId);

    /**
     * @brief Writes the diagnostics JSON document consumed by report generation.
     * @throws OverlayError(ExportFailed) if the file cannot be written.
     */
    void writeDiagnosticsJson(const OverlayDiagnostics& diagnostics, const std::string& runId, const std::string& filePath);

} // namespace suitgeo

#endif // SUITGEO_DIAGNOSTICS_WRITER_HPP
