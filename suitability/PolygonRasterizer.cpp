// File: PolygonRasterizer.cpp
#include "PolygonRasterizer.hpp"

#include <map>
#include <limits>
#include <iostream>

namespace suitgeo {

    namespace {

        constexpr double FP_EPSILON = 1e-9;

        // =================== Scanline Rasterizer (Internal Helper Class) ===================
        class ScanlineRasterizer {
            using IntPointSet = std::set<IntPoint>;

            // --- Edge structure for Scanline ---
            struct EdgeInfo {
                double ymax;       // Scanlines at or beyond this y no longer cross the edge
                double current_x;  // The current x-intersection with the scanline
                double inv_slope;  // Inverse slope (dx/dy)

                EdgeInfo(double ym, double cx, double is) : ymax(ym), current_x(cx), inv_slope(is) {}
            };

            // Keyed by first scanline crossed
            using EdgeTable = std::map<int, std::vector<EdgeInfo>>;

        public:
            explicit ScanlineRasterizer(const GridFrame& frame)
                : frame_(frame),
                grid_width_(frame.width),
                grid_height_(frame.height) {}

            IntPointSet getCoveredCells(const Polygon& polygon, bool includeBoundary) const {
                IntPointSet cells;
                if (polygon.outer.size() < 3 || grid_width_ == 0 || grid_height_ == 0) {
                    return cells;
                }

                cells = scanlineFillInternal(polygon);
                if (includeBoundary) {
                    drawBoundary(polygon.outer, cells);
                    for (const auto& hole : polygon.holes) drawBoundary(hole, cells);
                }
                return cells;
            }

        private:
            GridFrame frame_;
            size_t grid_width_;
            size_t grid_height_;

            inline bool inBounds(int x, int y) const {
                return static_cast<unsigned>(x) < grid_width_ && static_cast<unsigned>(y) < grid_height_;
            }

            /**
             * @brief Converts a ring to grid coordinates shifted by half a cell, so that the
             *        centre of cell (c, r) sits at integer position (c, r).
             */
            std::vector<PointXY> toCentreSpace(const std::vector<PointXY>& ring) const {
                std::vector<PointXY> out;
                out.reserve(ring.size());
                for (const auto& p : ring) {
                    out.push_back({ frame_.columnOf(p.x) - 0.5, frame_.rowOf(p.y) - 0.5 });
                }
                return out;
            }

            /**
             * @brief Fills the interior of a polygon (outer ring and holes) using a scanline
             *        algorithm with an Edge Table and Active Edge Table. Spans follow the
             *        ceil/ceil-1 rule, so each cell centre on a shared edge belongs to exactly
             *        one side.
             */
            IntPointSet scanlineFillInternal(const Polygon& polygon) const {
                IntPointSet filledInteriorPoints;

                EdgeTable edgeTable;
                double global_min_y = std::numeric_limits<double>::max();
                double global_max_y = std::numeric_limits<double>::lowest();

                auto buildEdgesForLoop = [&](const std::vector<PointXY>& loop) {
                    if (loop.size() < 3) return;
                    const std::vector<PointXY> pts = toCentreSpace(loop);
                    for (size_t i = 0; i < pts.size(); ++i) {
                        const PointXY& p1 = pts[i];
                        const PointXY& p2 = pts[(i + 1) % pts.size()];

                        if (std::abs(p1.y - p2.y) < FP_EPSILON) continue; // Skip horizontal

                        double ymin, ymax, x_at_ymin;
                        if (p1.y < p2.y) { ymin = p1.y; ymax = p2.y; x_at_ymin = p1.x; }
                        else { ymin = p2.y; ymax = p1.y; x_at_ymin = p2.x; }

                        global_min_y = std::min(global_min_y, ymin);
                        global_max_y = std::max(global_max_y, ymax);

                        const double inv_slope = (p2.x - p1.x) / (p2.y - p1.y);

                        // First scanline crossed, clipped to the grid; x is advanced to that scanline
                        int start_y = std::max(0, static_cast<int>(std::ceil(ymin)));
                        double start_x = x_at_ymin + (static_cast<double>(start_y) - ymin) * inv_slope;

                        edgeTable[start_y].emplace_back(ymax - FP_EPSILON * 10, start_x, inv_slope);
                    }
                };

                buildEdgesForLoop(polygon.outer);
                for (const auto& hole : polygon.holes) buildEdgesForLoop(hole);

                if (edgeTable.empty()) return filledInteriorPoints;

                std::vector<EdgeInfo> aet;
                int min_scanline_y = std::max(0, static_cast<int>(std::ceil(global_min_y)));
                double clamped_max = std::min(static_cast<double>(grid_height_ - 1), std::floor(global_max_y));
                if (clamped_max < static_cast<double>(min_scanline_y)) return filledInteriorPoints;
                int max_scanline_y = static_cast<int>(clamped_max);

                for (int y = min_scanline_y; y <= max_scanline_y; ++y) {
                    auto et_it = edgeTable.find(y);
                    if (et_it != edgeTable.end()) aet.insert(aet.end(), et_it->second.begin(), et_it->second.end());

                    aet.erase(std::remove_if(aet.begin(), aet.end(),
                        [&](const EdgeInfo& edge) { return edge.ymax < static_cast<double>(y); }),
                        aet.end());

                    if (aet.empty()) continue;

                    std::sort(aet.begin(), aet.end(), [](const EdgeInfo& a, const EdgeInfo& b) {
                        return a.current_x < b.current_x;
                    });

                    // Fill spans using sorted AET (odd/even pairs)
                    for (size_t i = 0; i + 1 < aet.size(); i += 2) {
                        double x_start = aet[i].current_x;
                        double x_end = aet[i + 1].current_x;
                        double lo = std::max(0.0, std::ceil(x_start));
                        double hi = std::min(static_cast<double>(grid_width_) - 1.0, std::ceil(x_end) - 1.0);
                        if (lo > hi) continue;
                        for (int x = static_cast<int>(lo); x <= static_cast<int>(hi); ++x) {
                            filledInteriorPoints.insert({ x, y });
                        }
                    }

                    for (EdgeInfo& edge : aet) {
                        edge.current_x += edge.inv_slope;
                    }
                }

                return filledInteriorPoints;
            }

            void drawBoundary(const std::vector<PointXY>& ring, IntPointSet& boundarySet) const {
                if (ring.size() < 2) return;

                auto toCell = [&](const PointXY& p) {
                    return IntPoint{ static_cast<int>(std::floor(frame_.columnOf(p.x))),
                                     static_cast<int>(std::floor(frame_.rowOf(p.y))) };
                };

                for (size_t i = 0; i < ring.size(); ++i) {
                    IntPoint a = toCell(ring[i]);
                    IntPoint b = toCell(ring[(i + 1) % ring.size()]); // Closing segment included
                    bresenhamLineToSet(a, b, boundarySet);
                }
            }

            void bresenhamLineToSet(IntPoint p1, IntPoint p2, IntPointSet& pointSet) const {
                int dx = std::abs(p2.x - p1.x), sx = (p1.x < p2.x) ? 1 : -1;
                int dy = -std::abs(p2.y - p1.y), sy = (p1.y < p2.y) ? 1 : -1;
                int err = dx + dy;

                while (true) {
                    if (inBounds(p1.x, p1.y)) {
                        pointSet.insert(p1);
                    }
                    if (p1.x == p2.x && p1.y == p2.y) break;

                    int e2 = 2 * err;
                    if (e2 >= dy) {
                        err += dy;
                        p1.x += sx;
                    }
                    if (e2 <= dx) {
                        err += dx;
                        p1.y += sy;
                    }
                }
            }
        }; // End class ScanlineRasterizer

    } // anonymous namespace

    std::set<IntPoint> coveredCells(const Polygon& polygon, const GridFrame& frame, bool includeBoundary) {
        if (!frame.isValid()) {
            throw std::invalid_argument("coveredCells: frame has no cells");
        }
        ScanlineRasterizer rasterizer(frame);
        return rasterizer.getCoveredCells(polygon, includeBoundary);
    }

    Raster rasterizePolygon(const Polygon& polygon, const GridFrame& frame, const RasterizeOptions& options) {
        GridCellData background;
        background.value = options.outside_value;
        Raster out(frame, background, options.outside_value);

        const std::set<IntPoint> cells = coveredCells(polygon, frame, options.include_boundary);
        for (const auto& p : cells) {
            out.at(static_cast<std::size_t>(p.x), static_cast<std::size_t>(p.y)).value = options.inside_value;
        }

        if (cells.empty()) {
            std::cerr << "Warning (PolygonRasterizer): Polygon covers no cell of the " << frame.width << "x" << frame.height << " frame." << std::endl;
        }
        return out;
    }

} // namespace suitgeo
