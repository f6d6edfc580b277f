// File: GridStore.cpp
#include "GridStore.hpp"
#include "AsciiGridIO.hpp"

#include <algorithm>
#include <iostream>

namespace suitgeo {

    Raster extractExclusionCells(const Raster& layer, const std::optional<std::vector<float>>& exclusionValues) {
        Raster mask(layer.frame(), nodataCell(), 0.0f);
        const std::size_t n = layer.data().size();
        for (std::size_t i = 0; i < n; ++i) {
            const GridCellData& src = layer.data()[i];
            if (src.isNodata()) continue;

            bool excluded = false;
            if (!exclusionValues) {
                excluded = !approx_equal_float(src.value, 0.0f);
            }
            else {
                excluded = std::any_of(exclusionValues->begin(), exclusionValues->end(),
                    [&](float v) { return approx_equal_float(src.value, v); });
            }
            if (excluded) {
                GridCellData& cell = mask.data()[i];
                cell.value = 1.0f;
                cell.flags = FLAG_NONE;
            }
        }
        return mask;
    }

    // =================== InMemoryGridStore ===================

    void InMemoryGridStore::addGrid(const std::string& id, Raster grid, const std::string& label,
        std::optional<std::vector<float>> exclusionValues) {
        entries_[id] = Entry{ std::move(grid), label, std::move(exclusionValues) };
    }

    const InMemoryGridStore::Entry& InMemoryGridStore::entryOrThrow(const std::string& id) const {
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            throw OverlayError(ErrorKind::UnknownLayer, "grid '" + id + "' is not in the store");
        }
        return it->second;
    }

    bool InMemoryGridStore::contains(const std::string& id) const {
        return entries_.count(id) > 0;
    }

    const Raster& InMemoryGridStore::lookup(const std::string& id) {
        return entryOrThrow(id).grid;
    }

    Raster InMemoryGridStore::exclusionAttribute(const std::string& id) {
        const Entry& e = entryOrThrow(id);
        return extractExclusionCells(e.grid, e.exclusion_values);
    }

    std::string InMemoryGridStore::label(const std::string& id) const {
        auto it = entries_.find(id);
        if (it == entries_.end() || it->second.label.empty()) return id;
        return it->second.label;
    }

    // =================== AsciiGridStore ===================

    AsciiGridStore::AsciiGridStore(GridCatalog catalog) : catalog_(std::move(catalog)) {}

    AsciiGridStore AsciiGridStore::fromCatalogFile(const std::string& xmlFilePath) {
        std::optional<GridCatalog> catalog = scanGridCatalog(xmlFilePath);
        if (!catalog) {
            throw OverlayError(ErrorKind::InvalidInput, "grid catalog '" + xmlFilePath + "' could not be read");
        }
        std::cout << "Info (GridStore): Catalog " << xmlFilePath << " lists " << catalog->layers.size() << " layers." << std::endl;
        return AsciiGridStore(std::move(*catalog));
    }

    const CatalogLayer& AsciiGridStore::layerOrThrow(const std::string& id) const {
        const CatalogLayer* layer = catalog_.find(id);
        if (!layer) {
            throw OverlayError(ErrorKind::UnknownLayer, "grid '" + id + "' is not in the catalog");
        }
        return *layer;
    }

    bool AsciiGridStore::contains(const std::string& id) const {
        return catalog_.find(id) != nullptr;
    }

    const Raster& AsciiGridStore::lookup(const std::string& id) {
        auto cached = cache_.find(id);
        if (cached != cache_.end()) {
            return cached->second;
        }
        const CatalogLayer& layer = layerOrThrow(id);
        Raster grid = readAsciiGrid(layer.file_path);
        std::cout << "Info (GridStore): Loaded '" << id << "' (" << grid.width() << "x" << grid.height()
            << ", cell " << grid.cellSize() << ") from " << layer.file_path << std::endl;
        return cache_.emplace(id, std::move(grid)).first->second;
    }

    Raster AsciiGridStore::exclusionAttribute(const std::string& id) {
        const CatalogLayer& layer = layerOrThrow(id);
        return extractExclusionCells(lookup(id), layer.exclusion_values);
    }

    std::string AsciiGridStore::label(const std::string& id) const {
        const CatalogLayer* layer = catalog_.find(id);
        if (!layer || layer->label.empty()) return id;
        return layer->label;
    }

} // namespace suitgeo
