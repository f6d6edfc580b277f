// File: Rescaler.cpp
#include "Rescaler.hpp"

#include <climits>
#include <iostream>

namespace suitgeo {

    std::optional<ValueRange> observedRange(const Raster& grid) {
        const std::vector<GridCellData>& cells = grid.data();
        const long long n = static_cast<long long>(cells.size());
        int lo = INT_MAX;
        int hi = INT_MIN;
        long long valid = 0;

#pragma omp parallel for reduction(min:lo) reduction(max:hi) reduction(+:valid)
        for (long long i = 0; i < n; ++i) {
            const GridCellData& c = cells[static_cast<std::size_t>(i)];
            if (c.isNodata()) continue;
            const int v = static_cast<int>(std::trunc(c.value));
            if (v < lo) lo = v;
            if (v > hi) hi = v;
            ++valid;
        }

        if (valid == 0) return std::nullopt;
        return ValueRange{ lo, hi, static_cast<std::size_t>(valid) };
    }

    Raster rescale(const Raster& grid, const ValueRange& source, int targetMin, int targetMax) {
        if (targetMin < BYTE_MIN || targetMax > BYTE_MAX || targetMin >= targetMax) {
            throw OverlayError(ErrorKind::DegenerateRange, "target range [" + std::to_string(targetMin) + ","
                + std::to_string(targetMax) + "] must satisfy 0 <= min < max <= 255");
        }
        if (source.max == source.min) {
            throw OverlayError(ErrorKind::DegenerateRange, "source range collapses to the single value "
                + std::to_string(source.min));
        }

        // Multiply before dividing so integer endpoints map exactly
        const double targetSpan = static_cast<double>(targetMax - targetMin);
        const double sourceSpan = static_cast<double>(source.max) - static_cast<double>(source.min);
        Raster out(grid.frame(), nodataCell(), grid.nodataValue());
        const std::vector<GridCellData>& in = grid.data();
        std::vector<GridCellData>& dst = out.data();
        const long long n = static_cast<long long>(in.size());

#pragma omp parallel for schedule(static)
        for (long long i = 0; i < n; ++i) {
            const std::size_t idx = static_cast<std::size_t>(i);
            const GridCellData& c = in[idx];
            if (c.isNodata()) {
                dst[idx] = c;
                continue;
            }
            double v = (std::trunc(static_cast<double>(c.value)) - source.min) * targetSpan / sourceSpan + targetMin;
            v = std::trunc(v);
            v = std::max(static_cast<double>(BYTE_MIN), std::min(static_cast<double>(BYTE_MAX), v));
            dst[idx].value = static_cast<float>(v);
            dst[idx].flags = c.flags;
        }
        return out;
    }

    Raster rescale(const Raster& grid, int targetMin, int targetMax) {
        std::optional<ValueRange> range = observedRange(grid);
        if (!range) {
            throw OverlayError(ErrorKind::DegenerateRange, "grid has no valid cell to rescale");
        }
        std::cout << "Info (Rescaler): Observed range [" << range->min << "," << range->max << "] over "
            << range->valid_cells << " cells -> [" << targetMin << "," << targetMax << "]." << std::endl;
        return rescale(grid, *range, targetMin, targetMax);
    }

} // namespace suitgeo
