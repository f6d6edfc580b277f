#ifndef SUITGEO_OVERLAY_COMMON_H
#define SUITGEO_OVERLAY_COMMON_H

#include <vector>
#include <string>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <algorithm>
#include <type_traits>

namespace suitgeo { // Namespace for all suitability overlay code

    // =================== NUMERICAL PRIMITIVES & UTILS ===================

    /**
     * @brief Provides type-specific numerical properties, like epsilon for floats.
     * @tparam T The numeric type.
     */
    template<typename T>
    struct numeric_traits {
        static constexpr T epsilon = std::numeric_limits<T>::epsilon() * 100;
    };

    /**
     * @brief Compares two floating-point numbers for approximate equality.
     * @tparam T Floating-point type (float or double).
     * @return True if values are approximately equal within a relative tolerance.
     */
    template<typename T>
    inline bool approx_equal_float(T a, T b) {
        static_assert(std::is_floating_point<T>::value, "approx_equal_float requires a floating-point type");
        if (a == b) return true;
        if (std::fabs(a) < numeric_traits<T>::epsilon && std::fabs(b) < numeric_traits<T>::epsilon) return true;
        return std::abs(a - b) <= numeric_traits<T>::epsilon * std::max({ static_cast<T>(1.0), std::abs(a), std::abs(b) });
    }

    // Storage range of every cost grid produced by the engine (unsigned 8-bit).
    inline constexpr int BYTE_MIN = 0;
    inline constexpr int BYTE_MAX = 255;
    // Lowest meaningful suitability score, used by exclusion and negative influence.
    inline constexpr float LOWEST_SCORE = 1.0f;

    // =================== ERRORS ===================

    enum class ErrorKind {
        InvalidGeometry,
        UnknownLayer,
        EmptyWeightTable,
        DegenerateRange,
        UnknownPolarity,
        MisalignedGrid,
        InvalidInput,
        ExportFailed
    };

    inline const char* toString(ErrorKind kind) {
        switch (kind) {
        case ErrorKind::InvalidGeometry:  return "InvalidGeometry";
        case ErrorKind::UnknownLayer:     return "UnknownLayer";
        case ErrorKind::EmptyWeightTable: return "EmptyWeightTable";
        case ErrorKind::DegenerateRange:  return "DegenerateRange";
        case ErrorKind::UnknownPolarity:  return "UnknownPolarity";
        case ErrorKind::MisalignedGrid:   return "MisalignedGrid";
        case ErrorKind::InvalidInput:     return "InvalidInput";
        case ErrorKind::ExportFailed:     return "ExportFailed";
        }
        return "Unknown";
    }

    /**
     * @brief Unrecoverable failure of an overlay stage. Carries the error kind so callers
     *        can tell the failure classes apart; what() holds the kind and the detail.
     */
    class OverlayError : public std::runtime_error {
    public:
        OverlayError(ErrorKind kind, const std::string& detail)
            : std::runtime_error(std::string(toString(kind)) + ": " + detail), kind_(kind) {}

        ErrorKind kind() const { return kind_; }

    private:
        ErrorKind kind_;
    };

    // =================== GEOMETRIC PRIMITIVES ===================

    /** @brief A point in the (single) geographic reference system of the run. */
    struct PointXY {
        double x = 0.0;
        double y = 0.0;
    };

    /** @brief Axis-aligned rectangle in geographic coordinates. */
    struct BoundingBox {
        double xmin = 0.0;
        double ymin = 0.0;
        double xmax = 0.0;
        double ymax = 0.0;

        double width() const { return xmax - xmin; }
        double height() const { return ymax - ymin; }
        bool isValid() const { return xmax > xmin && ymax > ymin; }
    };

    /**
     * @brief Simple polygon with optional holes. Rings are stored without the
     *        repeated closing vertex.
     */
    struct Polygon {
        std::vector<PointXY> outer;
        std::vector<std::vector<PointXY>> holes;
    };

    /**
     * @brief Represents a point with integer coordinates, typically corresponding
     *        to grid cell indices (x = column, y = row).
     */
    struct IntPoint {
        int x = 0;
        int y = 0;

        bool operator==(const IntPoint& other) const {
            return x == other.x && y == other.y;
        }
        // Row-major ordering for use in std::set
        bool operator<(const IntPoint& other) const {
            return y < other.y || (y == other.y && x < other.x);
        }
    };

    // =================== GRID CELL & GRID STRUCTURES ===================

    /**
     * @brief Flags applied to grid cells. Nodata is a flag rather than a value so that
     *        every value of the 8-bit storage range stays usable as a score.
     */
    enum CellFlags : std::uint8_t {
        FLAG_NONE = 0,
        FLAG_NODATA = 1 << 0,      // Cell carries no valid value
        FLAG_EXCLUDED = 1 << 1,    // Cell was forced to the lowest score by an exclusion layer
        FLAG_INFLUENCED = 1 << 2,  // Cell was overridden by the custom influence zone
        FLAG_CLAMPED = 1 << 3      // Cell value was clamped into the 8-bit storage range
    };

    /**
     * @brief Data stored in each cell of a raster: the numeric value and a flag bitmask.
     */
    struct GridCellData {
        float value = 0.0f;
        std::uint8_t flags = FLAG_NONE;

        inline void setFlag(CellFlags f) { flags |= f; }
        inline void clearFlag(CellFlags f) { flags &= static_cast<std::uint8_t>(~f); }
        inline bool hasFlag(CellFlags f) const { return (flags & f) != 0; }
        inline bool isNodata() const { return hasFlag(FLAG_NODATA); }

        bool operator==(const GridCellData& o) const {
            return flags == o.flags && approx_equal_float(value, o.value);
        }
        bool operator!=(const GridCellData& o) const {
            return !(*this == o);
        }
    };

    /** @brief Cell template used for nodata cells. */
    inline GridCellData nodataCell() {
        GridCellData cell;
        cell.flags = FLAG_NODATA;
        return cell;
    }

    /**
     * @brief Raster geometry without data: upper-left origin, square cell size and
     *        dimensions. Rows run from north (row 0) to south.
     */
    struct GridFrame {
        double origin_x = 0.0;   // X of the western edge (xmin)
        double origin_y = 0.0;   // Y of the northern edge (ymax)
        double cell_size = 1.0;
        std::size_t width = 0;
        std::size_t height = 0;

        BoundingBox extent() const {
            return { origin_x, origin_y - cell_size * static_cast<double>(height),
                     origin_x + cell_size * static_cast<double>(width), origin_y };
        }
        double cellCenterX(std::size_t col) const { return origin_x + (static_cast<double>(col) + 0.5) * cell_size; }
        double cellCenterY(std::size_t row) const { return origin_y - (static_cast<double>(row) + 0.5) * cell_size; }
        /** @brief Fractional column coordinate of a world X (cell edges at integers). */
        double columnOf(double x) const { return (x - origin_x) / cell_size; }
        /** @brief Fractional row coordinate of a world Y (cell edges at integers). */
        double rowOf(double y) const { return (origin_y - y) / cell_size; }

        bool isValid() const { return width > 0 && height > 0 && cell_size > 0.0 && std::isfinite(cell_size); }

        bool sameGeometry(const GridFrame& o) const {
            return width == o.width && height == o.height &&
                approx_equal_float(cell_size, o.cell_size) &&
                std::fabs(origin_x - o.origin_x) < cell_size * 1e-6 &&
                std::fabs(origin_y - o.origin_y) < cell_size * 1e-6;
        }
    };

    /**
     * @class Raster
     * @brief Single-band georeferenced grid. Stores GridCellData row-major over a GridFrame
     *        and remembers the nodata sentinel used when the grid is read or written.
     */
    class Raster {
    public:
        Raster(const GridFrame& frame, GridCellData initialValue = GridCellData{}, float nodataValue = 0.0f)
            : frame_(frame), nodata_value_(nodataValue), data_(frame.width * frame.height, initialValue) {}
        Raster() = default;

        Raster(const Raster&) = default;
        Raster& operator=(const Raster&) = default;
        Raster(Raster&&) noexcept = default;
        Raster& operator=(Raster&&) noexcept = default;
        ~Raster() = default;

        inline bool inBounds(int x, int y) const {
            return static_cast<unsigned>(x) < frame_.width && static_cast<unsigned>(y) < frame_.height;
        }

        /**
         * @brief Mutable access to the cell at column x, row y.
         * @throws std::out_of_range if coordinates are out of bounds (in debug builds).
         */
        inline GridCellData& at(std::size_t x, std::size_t y) {
#ifndef NDEBUG
            if (!inBounds(static_cast<int>(x), static_cast<int>(y))) {
                throw std::out_of_range("Raster::at() access out of bounds");
            }
#endif
            return data_[y * frame_.width + x];
        }

        inline const GridCellData& at(std::size_t x, std::size_t y) const {
#ifndef NDEBUG
            if (!inBounds(static_cast<int>(x), static_cast<int>(y))) {
                throw std::out_of_range("Raster::at() const access out of bounds");
            }
#endif
            return data_[y * frame_.width + x];
        }

        std::size_t width() const { return frame_.width; }
        std::size_t height() const { return frame_.height; }
        const GridFrame& frame() const { return frame_; }
        double cellSize() const { return frame_.cell_size; }
        BoundingBox extent() const { return frame_.extent(); }

        float nodataValue() const { return nodata_value_; }
        void setNodataValue(float v) { nodata_value_ = v; }

        std::vector<GridCellData>& data() { return data_; }
        const std::vector<GridCellData>& data() const { return data_; }

        void reset(GridCellData value = GridCellData{}) {
            std::fill(data_.begin(), data_.end(), value);
        }

        bool isValid() const { return frame_.isValid(); }

        /** @brief Number of cells without FLAG_NODATA. */
        std::size_t validCount() const {
            return static_cast<std::size_t>(std::count_if(data_.begin(), data_.end(),
                [](const GridCellData& c) { return !c.isNodata(); }));
        }

        std::size_t countFlag(CellFlags f) const {
            return static_cast<std::size_t>(std::count_if(data_.begin(), data_.end(),
                [f](const GridCellData& c) { return c.hasFlag(f); }));
        }

    private:
        GridFrame frame_;
        float nodata_value_ = 0.0f;
        std::vector<GridCellData> data_;
    };

    // =================== OVERLAY INPUT STRUCTURES ===================

    /** @brief One row of the weight table. Weights are signed and need not sum to anything. */
    struct WeightEntry {
        std::string layer_id;
        std::string label;
        double weight = 0.0;
    };

    enum class InfluencePolarity {
        Positive,
        Negative
    };

    /**
     * @brief User-drawn influence area. The polarity is kept as text until the influence
     *        stage parses it, so an unrecognized value surfaces as UnknownPolarity there.
     */
    struct InfluenceSpec {
        std::string boundary_wkt;
        std::string polarity;
        std::string description;
    };

} // namespace suitgeo
#endif // SUITGEO_OVERLAY_COMMON_H
