// File: OverlayPipeline.cpp
#include "OverlayPipeline.hpp"
#include "ExtentResolver.hpp"
#include "WeightedOverlay.hpp"
#include "Rescaler.hpp"
#include "ExclusionMask.hpp"
#include "InfluenceZone.hpp"

#include <iostream>
#include <sstream>
#include <chrono>

namespace suitgeo {

    const char* toString(PipelineStage stage) {
        switch (stage) {
        case PipelineStage::ExtentResolved:   return "ExtentResolved";
        case PipelineStage::Summed:           return "Summed";
        case PipelineStage::Rescaled:         return "Rescaled";
        case PipelineStage::ExclusionApplied: return "ExclusionApplied";
        case PipelineStage::InfluenceApplied: return "InfluenceApplied";
        case PipelineStage::Finalized:        return "Finalized";
        }
        return "Unknown";
    }

    bool OverlayDiagnostics::reached(PipelineStage stage) const {
        return std::find(stages.begin(), stages.end(), stage) != stages.end();
    }

    namespace {

        // Records a stage message and echoes it like every other component does
        class StageLog {
        public:
            StageLog(OverlayDiagnostics& diag, bool verbose) : diag_(diag), verbose_(verbose) {}

            void info(const std::string& msg) {
                diag_.messages.push_back(msg);
                if (verbose_) std::cout << "Info (OverlayPipeline): " << msg << std::endl;
            }

            void stage(PipelineStage s, const std::string& msg) {
                diag_.stages.push_back(s);
                info(std::string(toString(s)) + ": " + msg);
            }

        private:
            OverlayDiagnostics& diag_;
            bool verbose_;
        };

    } // anonymous namespace

    OverlayResult runOverlay(GridStore& store, const OverlayRequest& request) {
        auto t_start = std::chrono::high_resolution_clock::now();
        OverlayResult result;
        OverlayDiagnostics& diag = result.diagnostics;
        StageLog log(diag, request.config.verbose);

        // --- Extent ---
        diag.extent = resolveExtent(request.boundary_wkt);
        {
            std::ostringstream ss;
            ss << "extent [" << diag.extent.xmin << ", " << diag.extent.ymin << ", "
                << diag.extent.xmax << ", " << diag.extent.ymax << "]";
            log.stage(PipelineStage::ExtentResolved, ss.str());
        }

        // --- Weighted sum ---
        if (request.weights.empty()) {
            throw OverlayError(ErrorKind::EmptyWeightTable, "at least one weighted layer is required");
        }
        diag.reference_id = request.reference_id.empty() ? request.weights.front().layer_id : request.reference_id;
        for (const auto& w : request.weights) {
            diag.labels[w.layer_id] = w.label.empty() ? store.label(w.layer_id) : w.label;
        }
        for (const auto& id : request.exclusion_layers) {
            diag.labels.emplace(id, store.label(id));
        }

        Raster cost = weightedSum(store, diag.reference_id, request.weights, diag.extent);
        diag.frame = cost.frame();
        diag.clamped_cells = cost.countFlag(FLAG_CLAMPED);
        {
            std::ostringstream ss;
            ss << request.weights.size() << " layers summed on a " << diag.frame.width << "x" << diag.frame.height
                << " frame (cell " << diag.frame.cell_size << "), " << diag.clamped_cells << " cells clamped";
            log.stage(PipelineStage::Summed, ss.str());
        }

        // --- Rescale ---
        std::optional<ValueRange> range = observedRange(cost);
        if (!range) {
            throw OverlayError(ErrorKind::DegenerateRange, "weighted sum has no valid cell inside the extent");
        }
        diag.source_min = range->min;
        diag.source_max = range->max;
        diag.target_min = request.config.rescale_min;
        diag.target_max = request.config.rescale_max;
        cost = rescale(cost, *range, request.config.rescale_min, request.config.rescale_max);
        {
            std::ostringstream ss;
            ss << "[" << range->min << "," << range->max << "] -> [" << diag.target_min << "," << diag.target_max << "]";
            log.stage(PipelineStage::Rescaled, ss.str());
        }

        // --- Exclusions ---
        if (!request.exclusion_layers.empty()) {
            const Raster mask = buildExclusionMask(store, request.exclusion_layers, cost.frame());
            if (mask.validCount() == 0) {
                log.info("exclusion layers mark no cell inside the extent, cost grid unchanged");
            }
            else {
                cost = applyExclusionMask(cost, mask);
            }
            diag.excluded_cells = cost.countFlag(FLAG_EXCLUDED);
            log.stage(PipelineStage::ExclusionApplied, std::to_string(diag.excluded_cells) + " cells set to the lowest score");
        }

        // --- Custom influence ---
        if (request.influence) {
            InfluenceOutcome outcome = applyInfluenceZone(cost, *request.influence, request.config.rasterize);
            cost = std::move(outcome.grid);
            diag.influenced_cells = outcome.covered_cells;
            diag.pre_override_max = outcome.pre_override_max;
            diag.influence_value = outcome.override_value;
            diag.influence_polarity = toString(outcome.polarity);
            diag.influence_description = request.influence->description;
            std::ostringstream ss;
            ss << diag.influence_polarity << " zone over " << outcome.covered_cells << " cells set to " << outcome.override_value;
            log.stage(PipelineStage::InfluenceApplied, ss.str());
        }

        diag.valid_cells = cost.validCount();
        auto t_end = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double, std::milli> elapsed = t_end - t_start;
        {
            std::ostringstream ss;
            ss << diag.valid_cells << " valid cells, completed in " << elapsed.count() << " ms";
            log.stage(PipelineStage::Finalized, ss.str());
        }

        result.cost = std::move(cost);
        return result;
    }

} // namespace suitgeo
