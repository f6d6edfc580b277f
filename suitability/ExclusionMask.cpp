// File: ExclusionMask.cpp
#include "ExclusionMask.hpp"
#include "GridSampler.hpp"

#include <omp.h>
#include <iostream>

namespace suitgeo {

    Raster buildExclusionMask(GridStore& store, const std::vector<std::string>& layerIds, const GridFrame& frame) {
        Raster combined(frame, nodataCell(), 0.0f);
        if (layerIds.empty()) return combined;

        // Store access is sequential; only the alignment and merge run in parallel
        std::vector<Raster> attributes;
        attributes.reserve(layerIds.size());
        for (const auto& id : layerIds) {
            Raster attribute = store.exclusionAttribute(id);
            checkAlignment(frame, attribute.frame(), id);
            attributes.push_back(std::move(attribute));
        }

        const long long count = static_cast<long long>(attributes.size());

#pragma omp parallel
        {
#pragma omp for schedule(dynamic)
            for (long long i = 0; i < count; ++i) {
                // Thread-local aligned copy of this layer
                const Raster aligned = alignToFrame(attributes[static_cast<std::size_t>(i)], frame);

#pragma omp critical (ExclusionMaskMerge)
                {
                    std::vector<GridCellData>& dst = combined.data();
                    const std::vector<GridCellData>& src = aligned.data();
                    for (std::size_t k = 0; k < dst.size(); ++k) {
                        if (!src[k].isNodata() && src[k].value != 0.0f) {
                            dst[k].value = 1.0f;
                            dst[k].flags = FLAG_NONE;
                        }
                    }
                }
            }
        }

        std::cout << "Info (ExclusionMask): " << layerIds.size() << " exclusion layers merged, "
            << combined.validCount() << " cells excluded (" << omp_get_max_threads() << " threads)." << std::endl;
        return combined;
    }

    Raster applyExclusionMask(const Raster& cost, const Raster& mask) {
        if (!cost.frame().sameGeometry(mask.frame())) {
            throw OverlayError(ErrorKind::MisalignedGrid, "exclusion mask frame differs from the cost grid frame");
        }

        Raster out = cost;
        if (mask.validCount() == 0) {
            std::cerr << "Warning (ExclusionMask): Combined exclusion grid is empty, cost grid left unchanged." << std::endl;
            return out;
        }

        const std::vector<GridCellData>& m = mask.data();
        std::vector<GridCellData>& dst = out.data();
        const long long n = static_cast<long long>(dst.size());

#pragma omp parallel for schedule(static)
        for (long long i = 0; i < n; ++i) {
            const std::size_t idx = static_cast<std::size_t>(i);
            if (m[idx].isNodata() || m[idx].value == 0.0f) continue;
            dst[idx].value = LOWEST_SCORE;
            dst[idx].clearFlag(FLAG_NODATA);
            dst[idx].setFlag(FLAG_EXCLUDED);
        }
        return out;
    }

    Raster applyExclusions(GridStore& store, const Raster& cost, const std::vector<std::string>& layerIds) {
        if (layerIds.empty()) return cost;
        const Raster mask = buildExclusionMask(store, layerIds, cost.frame());
        return applyExclusionMask(cost, mask);
    }

} // namespace suitgeo
