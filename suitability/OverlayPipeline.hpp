// File: OverlayPipeline.hpp
#ifndef SUITGEO_OVERLAY_PIPELINE_HPP
#define SUITGEO_OVERLAY_PIPELINE_HPP

#include "OverlayCommon.h"
#include "GridStore.hpp"
#include "PolygonRasterizer.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace suitgeo {

    /** @brief Tunables of a run with their in-code defaults. */
    struct OverlayConfig {
        int rescale_min = 1;
        int rescale_max = 255;
        RasterizeOptions rasterize;   // Used for the influence polygon
        bool verbose = true;          // Echo stage messages to stdout
    };

    /** @brief Everything one overlay run needs besides the grid store. */
    struct OverlayRequest {
        std::string boundary_wkt;                 // Processing-extent polygon
        std::vector<WeightEntry> weights;
        std::string reference_id;                 // Empty: first weighted layer
        std::vector<std::string> exclusion_layers;
        std::optional<InfluenceSpec> influence;
        OverlayConfig config;
    };

    enum class PipelineStage {
        ExtentResolved,
        Summed,
        Rescaled,
        ExclusionApplied,
        InfluenceApplied,
        Finalized
    };

    const char* toString(PipelineStage stage);

    /** @brief Per-run record persisted next to the cost grid. */
    struct OverlayDiagnostics {
        std::vector<PipelineStage> stages;
        BoundingBox extent;
        GridFrame frame;
        std::string reference_id;
        int source_min = 0;
        int source_max = 0;
        int target_min = 0;
        int target_max = 0;
        std::size_t valid_cells = 0;
        std::size_t clamped_cells = 0;
        std::size_t excluded_cells = 0;
        std::size_t influenced_cells = 0;
        std::optional<float> pre_override_max;
        std::optional<float> influence_value;
        std::string influence_polarity;
        std::string influence_description;
        std::map<std::string, std::string> labels;   // Layer id -> label, from the store
        std::vector<std::string> messages;

        bool reached(PipelineStage stage) const;
    };

    struct OverlayResult {
        Raster cost;
        OverlayDiagnostics diagnostics;
    };

    /**
     * @brief Runs the overlay stages in fixed order:
     *        extent -> weighted sum -> rescale -> [exclusions] -> [influence] -> final.
     *        Any failure aborts the run with an OverlayError; no partial grid is returned.
     */
    OverlayResult runOverlay(GridStore& store, const OverlayRequest& request);

} // namespace suitgeo

#endif // SUITGEO_OVERLAY_PIPELINE_HPP
