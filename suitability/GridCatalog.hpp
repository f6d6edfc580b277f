// File: GridCatalog.hpp
#ifndef SUITGEO_GRID_CATALOG_HPP
#define SUITGEO_GRID_CATALOG_HPP

#include <string>
#include <vector>
#include <map>
#include <optional>

namespace suitgeo {

    /** @brief One <layer> of the grid catalog. */
    struct CatalogLayer {
        std::string id;
        std::string label;
        std::string file_path;               // Resolved against the catalog's base directory
        // Cell values whose EXCLUSION attribute is true; nullopt when the layer has no <class> table
        std::optional<std::vector<float>> exclusion_values;
    };

    /** @brief Result of scanning a catalog document. */
    struct GridCatalog {
        std::string base_dir;
        std::vector<CatalogLayer> layers;

        /** @brief Layer id -> human label map, injected into reporting. */
        std::map<std::string, std::string> labels() const;
        const CatalogLayer* find(const std::string& id) const;
    };

    /**
     * @brief Reads a <grid_catalog> XML document listing the named input grids.
     *        Layers without an id or file are skipped with a warning.
     * @param xmlFilePath Path to the catalog XML file.
     * @return The catalog, or std::nullopt if the document cannot be loaded.
     */
    std::optional<GridCatalog> scanGridCatalog(const std::string& xmlFilePath);

} // namespace suitgeo

#endif // SUITGEO_GRID_CATALOG_HPP
