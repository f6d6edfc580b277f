// File: GridCatalog.cpp

#include "GridCatalog.hpp"
#include <tinyxml2.h>

#include <iostream>
#include <filesystem>
#include <charconv>
#include <string_view>
#include <cstring>

namespace suitgeo {

    namespace {

        bool parseFloatAttr(const char* text, float& out) {
            if (!text) return false;
            std::string_view sv(text);
            auto res = std::from_chars(sv.data(), sv.data() + sv.size(), out);
            return res.ec == std::errc() && res.ptr == sv.data() + sv.size();
        }

        // Reads the <class value=".." exclusion="true|false"/> attribute table of a layer.
        // No <class> element at all means the layer has no table.
        std::optional<std::vector<float>> parseExclusionClasses(const tinyxml2::XMLElement* layerElement, const std::string& layerId) {
            if (!layerElement->FirstChildElement("class")) return std::nullopt;
            std::vector<float> values;
            for (const tinyxml2::XMLElement* cls = layerElement->FirstChildElement("class"); cls; cls = cls->NextSiblingElement("class")) {
                float value = 0.0f;
                if (!parseFloatAttr(cls->Attribute("value"), value)) {
                    std::cerr << "Warning (GridCatalog): Skipping <class> without numeric 'value' in layer '" << layerId << "'." << std::endl;
                    continue;
                }
                bool excluded = false;
                if (cls->QueryBoolAttribute("exclusion", &excluded) == tinyxml2::XML_SUCCESS && excluded) {
                    values.push_back(value);
                }
            }
            return values;
        }

    } // anonymous namespace

    std::map<std::string, std::string> GridCatalog::labels() const {
        std::map<std::string, std::string> result;
        for (const auto& layer : layers) {
            result[layer.id] = layer.label.empty() ? layer.id : layer.label;
        }
        return result;
    }

    const CatalogLayer* GridCatalog::find(const std::string& id) const {
        for (const auto& layer : layers) {
            if (layer.id == id) return &layer;
        }
        return nullptr;
    }

    std::optional<GridCatalog> scanGridCatalog(const std::string& xmlFilePath) {
        tinyxml2::XMLDocument doc;
        if (doc.LoadFile(xmlFilePath.c_str()) != tinyxml2::XML_SUCCESS) {
            std::cerr << "Error (GridCatalog): Failed to load catalog XML: " << xmlFilePath << " - " << doc.ErrorStr() << std::endl;
            return std::nullopt;
        }

        const tinyxml2::XMLElement* root = doc.FirstChildElement("grid_catalog");
        if (!root) {
            std::cerr << "Error (GridCatalog): No <grid_catalog> element in " << xmlFilePath << std::endl;
            return std::nullopt;
        }

        GridCatalog catalog;
        // Relative grid paths are resolved against base_dir, itself relative to the catalog file
        std::filesystem::path catalogDir = std::filesystem::path(xmlFilePath).parent_path();
        const char* baseAttr = root->Attribute("base_dir");
        std::filesystem::path baseDir = baseAttr ? catalogDir / baseAttr : catalogDir;
        catalog.base_dir = baseDir.string();

        for (const tinyxml2::XMLElement* el = root->FirstChildElement("layer"); el; el = el->NextSiblingElement("layer")) {
            const char* id = el->Attribute("id");
            const char* file = el->Attribute("file");
            if (!id || !file || std::strlen(id) == 0) {
                std::cerr << "Warning (GridCatalog): Skipping <layer> without 'id' or 'file' in " << xmlFilePath << std::endl;
                continue;
            }
            if (catalog.find(id)) {
                std::cerr << "Warning (GridCatalog): Duplicate layer id '" << id << "', keeping the first definition." << std::endl;
                continue;
            }

            CatalogLayer layer;
            layer.id = id;
            const char* label = el->Attribute("label");
            layer.label = label ? label : "";
            std::filesystem::path filePath(file);
            layer.file_path = filePath.is_absolute() ? filePath.string() : (baseDir / filePath).string();
            layer.exclusion_values = parseExclusionClasses(el, layer.id);
            catalog.layers.push_back(std::move(layer));
        }

        if (catalog.layers.empty()) {
            std::cerr << "Warning (GridCatalog): Catalog " << xmlFilePath << " lists no usable layers." << std::endl;
        }
        return catalog;
    }

} // namespace suitgeo
