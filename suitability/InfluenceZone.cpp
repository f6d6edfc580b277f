// File: InfluenceZone.cpp
#include "InfluenceZone.hpp"
#include "WktParser.hpp"

#include <iostream>
#include <cctype>

namespace suitgeo {

    namespace {
        std::string normalized(const std::string& text) {
            std::size_t b = 0, e = text.size();
            while (b < e && std::isspace(static_cast<unsigned char>(text[b]))) ++b;
            while (e > b && std::isspace(static_cast<unsigned char>(text[e - 1]))) --e;
            std::string out = text.substr(b, e - b);
            std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return out;
        }
    }

    InfluencePolarity parsePolarity(const std::string& text) {
        const std::string p = normalized(text);
        if (p == "positive") return InfluencePolarity::Positive;
        if (p == "negative") return InfluencePolarity::Negative;
        throw OverlayError(ErrorKind::UnknownPolarity, "'" + text + "' is neither Positive nor Negative");
    }

    const char* toString(InfluencePolarity polarity) {
        return polarity == InfluencePolarity::Positive ? "Positive" : "Negative";
    }

    std::optional<float> maxValidValue(const Raster& grid) {
        const std::vector<GridCellData>& cells = grid.data();
        const long long n = static_cast<long long>(cells.size());
        float hi = std::numeric_limits<float>::lowest();
        long long valid = 0;

#pragma omp parallel for reduction(max:hi) reduction(+:valid)
        for (long long i = 0; i < n; ++i) {
            const GridCellData& c = cells[static_cast<std::size_t>(i)];
            if (c.isNodata()) continue;
            if (c.value > hi) hi = c.value;
            ++valid;
        }

        if (valid == 0) return std::nullopt;
        return hi;
    }

    Raster applyInfluence(const Raster& cost, const Raster& sentinel, float overrideValue) {
        if (!cost.frame().sameGeometry(sentinel.frame())) {
            throw OverlayError(ErrorKind::MisalignedGrid, "influence sentinel frame differs from the cost grid frame");
        }

        Raster out = cost;
        const std::vector<GridCellData>& s = sentinel.data();
        std::vector<GridCellData>& dst = out.data();
        const long long n = static_cast<long long>(dst.size());

#pragma omp parallel for schedule(static)
        for (long long i = 0; i < n; ++i) {
            const std::size_t idx = static_cast<std::size_t>(i);
            // Nodata in the sentinel counts as 0
            if (s[idx].isNodata() || !(s[idx].value < 0.0f)) continue;
            dst[idx].value = overrideValue;
            dst[idx].clearFlag(FLAG_NODATA);
            dst[idx].setFlag(FLAG_INFLUENCED);
        }
        return out;
    }

    InfluenceOutcome applyInfluenceZone(const Raster& cost, const InfluenceSpec& spec, const RasterizeOptions& options) {
        InfluenceOutcome outcome;
        outcome.polarity = parsePolarity(spec.polarity);
        const Polygon boundary = parsePolygonWkt(spec.boundary_wkt);

        std::optional<float> currentMax = maxValidValue(cost);
        if (!currentMax) {
            if (outcome.polarity == InfluencePolarity::Positive) {
                throw OverlayError(ErrorKind::DegenerateRange, "positive influence needs at least one valid cost cell");
            }
            currentMax = 0.0f;
        }
        outcome.pre_override_max = *currentMax;
        outcome.override_value = outcome.polarity == InfluencePolarity::Positive ? *currentMax : LOWEST_SCORE;

        RasterizeOptions sentinelOptions = options;
        sentinelOptions.inside_value = -1.0f;
        sentinelOptions.outside_value = 0.0f;
        const Raster sentinel = rasterizePolygon(boundary, cost.frame(), sentinelOptions);
        outcome.covered_cells = static_cast<std::size_t>(std::count_if(sentinel.data().begin(), sentinel.data().end(),
            [](const GridCellData& c) { return c.value < 0.0f; }));

        outcome.grid = applyInfluence(cost, sentinel, outcome.override_value);

        std::cout << "Info (InfluenceZone): " << toString(outcome.polarity) << " influence"
            << (spec.description.empty() ? std::string() : " '" + spec.description + "'")
            << " set " << outcome.covered_cells << " cells to " << outcome.override_value << "." << std::endl;
        return outcome;
    }

} // namespace suitgeo
