// File: DiagnosticsWriter.cpp
#include "DiagnosticsWriter.hpp"
#include "json.hpp"

#include <fstream>
#include <sstream>

namespace suitgeo {

    namespace {

        json::JSON frameToJson(const GridFrame& frame) {
            json::JSON obj = json::Object();
            obj["origin_x"] = frame.origin_x;
            obj["origin_y"] = frame.origin_y;
            obj["cell_size"] = frame.cell_size;
            obj["width"] = static_cast<long>(frame.width);   // The library uses long for integrals
            obj["height"] = static_cast<long>(frame.height);
            return obj;
        }

        json::JSON boxToJson(const BoundingBox& box) {
            json::JSON obj = json::Object();
            obj["xmin"] = box.xmin;
            obj["ymin"] = box.ymin;
            obj["xmax"] = box.xmax;
            obj["ymax"] = box.ymax;
            return obj;
        }

    } // anonymous namespace

    std::string diagnosticsToJson(const OverlayDiagnostics& d, const std::string& runId) {
        json::JSON doc = json::Object();
        doc["run_id"] = runId;

        json::JSON stages = json::Array();
        for (PipelineStage s : d.stages) stages.append(std::string(toString(s)));
        doc["stages"] = stages;

        doc["extent"] = boxToJson(d.extent);
        doc["frame"] = frameToJson(d.frame);
        doc["reference_layer"] = d.reference_id;

        doc["rescale"] = json::Object();
        doc["rescale"]["source_min"] = static_cast<long>(d.source_min);
        doc["rescale"]["source_max"] = static_cast<long>(d.source_max);
        doc["rescale"]["target_min"] = static_cast<long>(d.target_min);
        doc["rescale"]["target_max"] = static_cast<long>(d.target_max);

        doc["cells"] = json::Object();
        doc["cells"]["valid"] = static_cast<long>(d.valid_cells);
        doc["cells"]["clamped"] = static_cast<long>(d.clamped_cells);
        doc["cells"]["excluded"] = static_cast<long>(d.excluded_cells);
        doc["cells"]["influenced"] = static_cast<long>(d.influenced_cells);

        if (d.influence_value) {
            json::JSON influence = json::Object();
            influence["polarity"] = d.influence_polarity;
            influence["description"] = d.influence_description;
            influence["value"] = static_cast<double>(*d.influence_value);
            if (d.pre_override_max) influence["pre_override_max"] = static_cast<double>(*d.pre_override_max);
            doc["influence"] = influence;
        }
        else {
            doc["influence"] = nullptr;
        }

        json::JSON labels = json::Object();
        for (const auto& [id, label] : d.labels) labels[id] = label;
        doc["labels"] = labels;

        json::JSON messages = json::Array();
        for (const auto& m : d.messages) messages.append(m);
        doc["messages"] = messages;

        std::ostringstream ss;
        ss << doc;
        return ss.str();
    }

    void writeDiagnosticsJson(const OverlayDiagnostics& diagnostics, const std::string& runId, const std::string& filePath) {
        std::ofstream out(filePath);
        if (!out.is_open()) {
            throw OverlayError(ErrorKind::ExportFailed, "cannot open '" + filePath + "' for writing");
        }
        out << diagnosticsToJson(diagnostics, runId) << std::endl;
        out.close();
        if (!out) {
            throw OverlayError(ErrorKind::ExportFailed, "failed to write all data to '" + filePath + "'");
        }
    }

} // namespace suitgeo
