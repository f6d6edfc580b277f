/**
 * @file GridStore.hpp
 * @brief Named lookup of the input grids of an overlay run.
 */
#ifndef SUITGEO_GRID_STORE_HPP
#define SUITGEO_GRID_STORE_HPP

#include "OverlayCommon.h"
#include "GridCatalog.hpp"
#include <string>
#include <vector>
#include <map>
#include <optional>

namespace suitgeo {

    /**
     * @class GridStore
     * @brief Capability interface over a raster store queried by layer identifier.
     */
    class GridStore {
    public:
        virtual ~GridStore() = default;

        /** @brief True if the identifier resolves to a grid. */
        virtual bool contains(const std::string& id) const = 0;

        /**
         * @brief Returns the grid registered under the identifier.
         * @throws OverlayError(UnknownLayer) if the identifier does not resolve.
         */
        virtual const Raster& lookup(const std::string& id) = 0;

        /**
         * @brief Evaluates the boolean EXCLUSION attribute of a layer per cell.
         * @return Raster in the layer's own frame: value 1 where excluded, nodata elsewhere.
         * @throws OverlayError(UnknownLayer) if the identifier does not resolve.
         */
        virtual Raster exclusionAttribute(const std::string& id) = 0;

        /** @brief Human-readable label of a layer; the identifier itself if none is known. */
        virtual std::string label(const std::string& id) const = 0;
    };

    /**
     * @brief Builds the binary exclusion grid of a layer from its attribute table.
     * @param layer Source grid.
     * @param exclusionValues Cell values flagged EXCLUSION=true. An empty table excludes
     *        nothing; without a table (nullopt) every valid non-zero cell counts as excluded.
     */
    Raster extractExclusionCells(const Raster& layer, const std::optional<std::vector<float>>& exclusionValues);

    /**
     * @class InMemoryGridStore
     * @brief GridStore over grids registered programmatically.
     */
    class InMemoryGridStore : public GridStore {
    public:
        void addGrid(const std::string& id, Raster grid, const std::string& label = "",
            std::optional<std::vector<float>> exclusionValues = std::nullopt);

        bool contains(const std::string& id) const override;
        const Raster& lookup(const std::string& id) override;
        Raster exclusionAttribute(const std::string& id) override;
        std::string label(const std::string& id) const override;

    private:
        struct Entry {
            Raster grid;
            std::string label;
            std::optional<std::vector<float>> exclusion_values;
        };
        std::map<std::string, Entry> entries_;

        const Entry& entryOrThrow(const std::string& id) const;
    };

    /**
     * @class AsciiGridStore
     * @brief GridStore backed by a grid catalog of ESRI ASCII grid files.
     *        Grids are read on first lookup and cached for the lifetime of the store.
     */
    class AsciiGridStore : public GridStore {
    public:
        explicit AsciiGridStore(GridCatalog catalog);

        /**
         * @brief Loads the catalog document and builds a store over it.
         * @throws OverlayError(InvalidInput) if the catalog cannot be read.
         */
        static AsciiGridStore fromCatalogFile(const std::string& xmlFilePath);

        bool contains(const std::string& id) const override;
        const Raster& lookup(const std::string& id) override;
        Raster exclusionAttribute(const std::string& id) override;
        std::string label(const std::string& id) const override;

        const GridCatalog& catalog() const { return catalog_; }

    private:
        GridCatalog catalog_;
        std::map<std::string, Raster> cache_;

        const CatalogLayer& layerOrThrow(const std::string& id) const;
    };

} // namespace suitgeo

#endif // SUITGEO_GRID_STORE_HPP
