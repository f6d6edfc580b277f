// File: WeightedOverlay.cpp
#include "WeightedOverlay.hpp"
#include "GridSampler.hpp"

#include <iostream>

namespace suitgeo {

    Raster sumAligned(const std::vector<Raster>& grids, const std::vector<double>& weights) {
        if (grids.empty() || grids.size() != weights.size()) {
            throw std::invalid_argument("sumAligned: grid and weight counts differ or are zero");
        }
        const GridFrame& frame = grids.front().frame();
        for (const auto& g : grids) {
            if (!g.frame().sameGeometry(frame)) {
                throw std::invalid_argument("sumAligned: grids do not share one frame");
            }
        }

        Raster out(frame, GridCellData{}, 0.0f);
        const long long rows = static_cast<long long>(frame.height);
        const std::size_t n = grids.size();

#pragma omp parallel for schedule(static)
        for (long long r = 0; r < rows; ++r) {
            const std::size_t y = static_cast<std::size_t>(r);
            for (std::size_t x = 0; x < frame.width; ++x) {
                double sum = 0.0;
                bool nodata = false;
                for (std::size_t i = 0; i < n; ++i) {
                    const GridCellData& in = grids[i].at(x, y);
                    if (in.isNodata()) {
                        nodata = true;
                        break;
                    }
                    sum += weights[i] * static_cast<double>(in.value);
                }

                GridCellData& cell = out.at(x, y);
                if (nodata) {
                    cell = nodataCell();
                    continue;
                }

                // Copy into unsigned 8-bit storage: truncate toward zero, then clamp
                double stored = std::trunc(sum);
                if (stored < BYTE_MIN) {
                    stored = BYTE_MIN;
                    cell.setFlag(FLAG_CLAMPED);
                }
                else if (stored > BYTE_MAX) {
                    stored = BYTE_MAX;
                    cell.setFlag(FLAG_CLAMPED);
                }
                cell.value = static_cast<float>(stored);
            }
        }
        return out;
    }

    Raster weightedSum(GridStore& store, const std::string& referenceId,
        const std::vector<WeightEntry>& weights, const BoundingBox& box) {
        if (weights.empty()) {
            throw OverlayError(ErrorKind::EmptyWeightTable, "at least one weighted layer is required");
        }

        const std::string refId = referenceId.empty() ? weights.front().layer_id : referenceId;
        const GridFrame referenceFrame = store.lookup(refId).frame();
        const GridFrame frame = windowFrame(referenceFrame, box);

        std::cout << "Info (WeightedOverlay): Reference '" << refId << "', cell " << frame.cell_size
            << ", window " << frame.width << "x" << frame.height << " cells, " << weights.size() << " layers." << std::endl;

        std::vector<Raster> aligned;
        std::vector<double> factors;
        aligned.reserve(weights.size());
        factors.reserve(weights.size());
        for (const auto& entry : weights) {
            const Raster& source = store.lookup(entry.layer_id);
            checkAlignment(referenceFrame, source.frame(), entry.layer_id);
            aligned.push_back(alignToFrame(source, frame));
            factors.push_back(entry.weight);

            std::size_t missing = aligned.back().data().size() - aligned.back().validCount();
            if (missing > 0) {
                std::cerr << "Warning (WeightedOverlay): Layer '" << entry.layer_id << "' has " << missing
                    << " nodata cells in the window; they propagate to the sum." << std::endl;
            }
        }

        Raster out = sumAligned(aligned, factors);
        const std::size_t clamped = out.countFlag(FLAG_CLAMPED);
        if (clamped > 0) {
            std::cerr << "Warning (WeightedOverlay): " << clamped << " cells clamped into [" << BYTE_MIN << "," << BYTE_MAX << "]." << std::endl;
        }
        return out;
    }

} // namespace suitgeo
