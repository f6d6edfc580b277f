// File: GridSampler.cpp
#include "GridSampler.hpp"

#include <cmath>
#include <sstream>

namespace suitgeo {

    namespace {
        // Tolerance (in cells) for box edges that fall on a lattice line
        constexpr double SNAP_EPSILON = 1e-9;
        // Largest origin offset, in cells, still treated as on the lattice
        constexpr double ALIGN_TOLERANCE = 1e-6;
    }

    GridFrame windowFrame(const GridFrame& reference, const BoundingBox& box) {
        if (!box.isValid()) {
            throw OverlayError(ErrorKind::InvalidGeometry, "processing extent has zero width or height");
        }
        if (!(reference.cell_size > 0.0) || !std::isfinite(reference.cell_size)) {
            throw OverlayError(ErrorKind::MisalignedGrid, "reference grid has no usable cell size");
        }

        const double cs = reference.cell_size;
        // Column and row indices relative to the reference origin; may be negative when the
        // box reaches beyond the reference grid.
        long long col0 = static_cast<long long>(std::floor((box.xmin - reference.origin_x) / cs + SNAP_EPSILON));
        long long col1 = static_cast<long long>(std::ceil((box.xmax - reference.origin_x) / cs - SNAP_EPSILON));
        long long row0 = static_cast<long long>(std::floor((reference.origin_y - box.ymax) / cs + SNAP_EPSILON));
        long long row1 = static_cast<long long>(std::ceil((reference.origin_y - box.ymin) / cs - SNAP_EPSILON));

        if (col1 <= col0) col1 = col0 + 1;
        if (row1 <= row0) row1 = row0 + 1;

        GridFrame frame;
        frame.cell_size = cs;
        frame.origin_x = reference.origin_x + static_cast<double>(col0) * cs;
        frame.origin_y = reference.origin_y - static_cast<double>(row0) * cs;
        frame.width = static_cast<std::size_t>(col1 - col0);
        frame.height = static_cast<std::size_t>(row1 - row0);
        return frame;
    }

    void checkAlignment(const GridFrame& reference, const GridFrame& contributing, const std::string& layerId) {
        const double tolerance = reference.cell_size * 1e-6;
        if (std::fabs(reference.cell_size - contributing.cell_size) > tolerance) {
            std::ostringstream msg;
            msg << "layer '" << layerId << "' has cell size " << contributing.cell_size
                << ", reference cell size is " << reference.cell_size;
            throw OverlayError(ErrorKind::MisalignedGrid, msg.str());
        }

        // Origins must differ by a whole number of cells in both directions
        const double dx = (contributing.origin_x - reference.origin_x) / reference.cell_size;
        const double dy = (reference.origin_y - contributing.origin_y) / reference.cell_size;
        const double offX = std::fabs(dx - std::round(dx));
        const double offY = std::fabs(dy - std::round(dy));
        if (offX > ALIGN_TOLERANCE || offY > ALIGN_TOLERANCE) {
            std::ostringstream msg;
            msg << "layer '" << layerId << "' origin (" << contributing.origin_x << ", " << contributing.origin_y
                << ") is off the reference lattice by (" << offX << ", " << offY << ") cells";
            throw OverlayError(ErrorKind::MisalignedGrid, msg.str());
        }
    }

    Raster alignToFrame(const Raster& source, const GridFrame& target) {
        Raster out(target, nodataCell(), source.nodataValue());
        if (!target.isValid()) {
            return out;
        }
        if (source.frame().sameGeometry(target)) {
            out.data() = source.data();
            return out;
        }

        const GridSampler sampler(source);
        const long long rows = static_cast<long long>(target.height);

#pragma omp parallel for schedule(static)
        for (long long r = 0; r < rows; ++r) {
            const std::size_t row = static_cast<std::size_t>(r);
            const double y = target.cellCenterY(row);
            for (std::size_t col = 0; col < target.width; ++col) {
                out.at(col, row) = sampler.sampleAt(target.cellCenterX(col), y);
            }
        }
        return out;
    }

} // namespace suitgeo
