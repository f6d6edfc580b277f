// File: RunConfig.cpp
#include "RunConfig.hpp"
#include <tinyxml2.h>

#include <filesystem>
#include <iostream>

namespace suitgeo {

    namespace {

        [[noreturn]] void fail(const std::string& what) {
            throw OverlayError(ErrorKind::InvalidInput, "run document: " + what);
        }

        std::string trimmed(const char* text) {
            if (!text) return {};
            std::string s(text);
            const char* ws = " \t\r\n";
            std::size_t b = s.find_first_not_of(ws);
            if (b == std::string::npos) return {};
            std::size_t e = s.find_last_not_of(ws);
            return s.substr(b, e - b + 1);
        }

        bool boolAttr(const tinyxml2::XMLElement* el, const char* name, bool fallback) {
            if (!el || !el->Attribute(name)) return fallback;
            bool value = fallback;
            if (el->QueryBoolAttribute(name, &value) != tinyxml2::XML_SUCCESS) {
                fail(std::string("attribute '") + name + "' of <" + el->Name() + "> is not a boolean");
            }
            return value;
        }

        int intAttr(const tinyxml2::XMLElement* el, const char* name, int fallback) {
            if (!el || !el->Attribute(name)) return fallback;
            int value = fallback;
            if (el->QueryIntAttribute(name, &value) != tinyxml2::XML_SUCCESS) {
                fail(std::string("attribute '") + name + "' of <" + el->Name() + "> is not an integer");
            }
            return value;
        }

        void readWeights(const tinyxml2::XMLElement* weights, OverlayRequest& request) {
            if (!weights) fail("missing <weights> element");
            const char* reference = weights->Attribute("reference");
            request.reference_id = reference ? reference : "";

            for (const tinyxml2::XMLElement* w = weights->FirstChildElement("weight"); w; w = w->NextSiblingElement("weight")) {
                const char* layer = w->Attribute("layer");
                if (!layer || !*layer) fail("<weight> without 'layer' attribute");
                WeightEntry entry;
                entry.layer_id = layer;
                const char* label = w->Attribute("label");
                entry.label = label ? label : "";
                if (w->QueryDoubleAttribute("value", &entry.weight) != tinyxml2::XML_SUCCESS) {
                    fail("<weight layer=\"" + entry.layer_id + "\"> has no numeric 'value'");
                }
                request.weights.push_back(std::move(entry));
            }
            // An empty table is left for the engine to reject as EmptyWeightTable
        }

        RunDocument readDocument(tinyxml2::XMLDocument& doc, const std::filesystem::path& baseDir) {
            const tinyxml2::XMLElement* root = doc.FirstChildElement("overlay_run");
            if (!root) fail("no <overlay_run> element");

            RunDocument run;
            const char* name = root->Attribute("name");
            run.name = name ? name : "";

            const tinyxml2::XMLElement* catalog = root->FirstChildElement("catalog");
            if (!catalog || !catalog->Attribute("file")) fail("missing <catalog file=\"...\"/>");
            std::filesystem::path catalogPath(catalog->Attribute("file"));
            run.catalog_path = catalogPath.is_absolute() ? catalogPath.string() : (baseDir / catalogPath).string();

            run.request.boundary_wkt = trimmed(root->FirstChildElement("extent") ? root->FirstChildElement("extent")->GetText() : nullptr);
            if (run.request.boundary_wkt.empty()) fail("missing or empty <extent> polygon");

            readWeights(root->FirstChildElement("weights"), run.request);

            if (const tinyxml2::XMLElement* exclusions = root->FirstChildElement("exclusions")) {
                for (const tinyxml2::XMLElement* l = exclusions->FirstChildElement("layer"); l; l = l->NextSiblingElement("layer")) {
                    const char* id = l->Attribute("id");
                    if (!id || !*id) fail("<exclusions><layer> without 'id' attribute");
                    run.request.exclusion_layers.emplace_back(id);
                }
            }

            if (const tinyxml2::XMLElement* influence = root->FirstChildElement("influence")) {
                InfluenceSpec spec;
                const char* polarity = influence->Attribute("polarity");
                if (!polarity) fail("<influence> without 'polarity' attribute");
                spec.polarity = polarity; // Validated by the influence stage
                const char* description = influence->Attribute("description");
                spec.description = description ? description : "";
                spec.boundary_wkt = trimmed(influence->GetText());
                if (spec.boundary_wkt.empty()) fail("<influence> has no polygon text");
                run.request.config.rasterize.include_boundary = boolAttr(influence, "include_boundary", false);
                run.request.influence = spec;
            }

            const tinyxml2::XMLElement* rescale = root->FirstChildElement("rescale");
            run.request.config.rescale_min = intAttr(rescale, "min", run.request.config.rescale_min);
            run.request.config.rescale_max = intAttr(rescale, "max", run.request.config.rescale_max);

            if (const tinyxml2::XMLElement* output = root->FirstChildElement("output")) {
                if (const char* dir = output->Attribute("directory")) run.output.directory = dir;
                if (const char* prefix = output->Attribute("prefix")) run.output.prefix = prefix;
                run.output.ascii = boolAttr(output, "ascii", run.output.ascii);
                run.output.png = boolAttr(output, "png", run.output.png);
                run.output.kml = boolAttr(output, "kml", run.output.kml);
                run.output.json = boolAttr(output, "json", run.output.json);
            }
            if (run.output.prefix.empty()) {
                run.output.prefix = run.name.empty() ? "overlay" : run.name;
            }
            return run;
        }

    } // anonymous namespace

    RunDocument parseRunDocument(const std::string& xmlText, const std::string& baseDir) {
        tinyxml2::XMLDocument doc;
        if (doc.Parse(xmlText.c_str(), xmlText.size()) != tinyxml2::XML_SUCCESS) {
            fail(std::string("XML parse error - ") + doc.ErrorStr());
        }
        return readDocument(doc, std::filesystem::path(baseDir));
    }

    RunDocument loadRunDocument(const std::string& xmlFilePath) {
        tinyxml2::XMLDocument doc;
        if (doc.LoadFile(xmlFilePath.c_str()) != tinyxml2::XML_SUCCESS) {
            fail("failed to load " + xmlFilePath + " - " + doc.ErrorStr());
        }
        RunDocument run = readDocument(doc, std::filesystem::path(xmlFilePath).parent_path());
        std::cout << "Info (RunConfig): Run '" << run.name << "' with " << run.request.weights.size() << " weights, "
            << run.request.exclusion_layers.size() << " exclusion layers"
            << (run.request.influence ? ", custom influence" : "") << "." << std::endl;
        return run;
    }

} // namespace suitgeo
