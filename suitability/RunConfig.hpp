// File: RunConfig.hpp
#ifndef SUITGEO_RUN_CONFIG_HPP
#define SUITGEO_RUN_CONFIG_HPP

#include "OverlayPipeline.hpp"
#include <string>

namespace suitgeo {

    /** @brief Which artifacts to write and where. */
    struct ExportConfig {
        std::string directory = "output";
        std::string prefix = "overlay";
        bool ascii = true;
        bool png = true;
        bool kml = true;
        bool json = true;
    };

    /** @brief Parsed <overlay_run> document. */
    struct RunDocument {
        std::string name;
        std::string catalog_path;     // Resolved against the run document's directory
        OverlayRequest request;
        ExportConfig output;
    };

    /**
     * @brief Loads an <overlay_run> XML document.
     * @throws OverlayError(InvalidInput) if the document cannot be read or a required
     *         element or attribute is missing or malformed.
     */
    RunDocument loadRunDocument(const std::string& xmlFilePath);

    /** @brief Same as loadRunDocument, from XML text. Relative paths resolve against baseDir. */
    RunDocument parseRunDocument(const std::string& xmlText, const std::string& baseDir);

} // namespace suitgeo

#endif // SUITGEO_RUN_CONFIG_HPP
