// tests/test_influence.cpp (doctest)
#include <doctest/doctest.h>

#include "InfluenceZone.hpp"
#include "TestGrids.hpp"

using namespace suitgeo;
using suitgeo_test::errorKindOf;
using suitgeo_test::gridFrom;
using suitgeo_test::makeFrame;
using suitgeo_test::rectangleWkt;

namespace {

    const GridFrame kFrame = makeFrame(0.0, 4.0, 1.0, 4, 4);

    // Values 1..16, row-major
    Raster rampGrid() {
        return gridFrom(kFrame, [](std::size_t x, std::size_t y) { return static_cast<float>(y * 4 + x + 1); });
    }

    InfluenceSpec topLeft(const std::string& polarity) {
        InfluenceSpec spec;
        spec.boundary_wkt = rectangleWkt(0.0, 2.0, 2.0, 4.0);
        spec.polarity = polarity;
        spec.description = "test zone";
        return spec;
    }

    bool inTopLeft(std::size_t x, std::size_t y) { return x < 2 && y < 2; }

} // namespace

TEST_CASE("parsePolarity: accepts Positive and Negative in any case")
{
    CHECK(parsePolarity("Positive") == InfluencePolarity::Positive);
    CHECK(parsePolarity("NEGATIVE") == InfluencePolarity::Negative);
    CHECK(parsePolarity("  negative\n") == InfluencePolarity::Negative);

    CHECK(errorKindOf([] { parsePolarity("Neutral"); }) == ErrorKind::UnknownPolarity);
    CHECK(errorKindOf([] { parsePolarity(""); }) == ErrorKind::UnknownPolarity);
    CHECK(errorKindOf([] { parsePolarity("Pos"); }) == ErrorKind::UnknownPolarity);
}

TEST_CASE("applyInfluenceZone: negative polarity sets covered cells to 1")
{
    const Raster cost = rampGrid();
    const InfluenceOutcome outcome = applyInfluenceZone(cost, topLeft("Negative"));

    CHECK(outcome.polarity == InfluencePolarity::Negative);
    CHECK(outcome.covered_cells == 4);
    CHECK(outcome.override_value == doctest::Approx(1.0f));
    CHECK(outcome.pre_override_max == doctest::Approx(16.0f));

    for (std::size_t y = 0; y < 4; ++y) {
        for (std::size_t x = 0; x < 4; ++x) {
            const GridCellData& c = outcome.grid.at(x, y);
            if (inTopLeft(x, y)) {
                CHECK(c.value == doctest::Approx(1.0f));
                CHECK(c.hasFlag(FLAG_INFLUENCED));
            }
            else {
                CHECK(c.value == doctest::Approx(cost.at(x, y).value));
                CHECK_FALSE(c.hasFlag(FLAG_INFLUENCED));
            }
        }
    }
}

TEST_CASE("applyInfluenceZone: positive polarity sets covered cells to the pre-override max")
{
    const Raster cost = rampGrid();
    const InfluenceOutcome outcome = applyInfluenceZone(cost, topLeft("positive"));

    CHECK(outcome.override_value == doctest::Approx(16.0f));
    CHECK(outcome.grid.at(0, 0).value == doctest::Approx(16.0f));
    CHECK(outcome.grid.at(1, 1).value == doctest::Approx(16.0f));
    CHECK(outcome.grid.at(2, 0).value == doctest::Approx(3.0f));
    CHECK(outcome.grid.at(3, 3).value == doctest::Approx(16.0f));
}

TEST_CASE("applyInfluenceZone: unknown polarity is rejected before rasterizing")
{
    const Raster cost = rampGrid();
    InfluenceSpec spec = topLeft("Sideways");
    CHECK(errorKindOf([&] { applyInfluenceZone(cost, spec); }) == ErrorKind::UnknownPolarity);

    spec.boundary_wkt = "not a polygon";
    CHECK(errorKindOf([&] { applyInfluenceZone(cost, spec); }) == ErrorKind::UnknownPolarity);
}

TEST_CASE("applyInfluenceZone: invalid boundary fails with InvalidGeometry")
{
    InfluenceSpec spec = topLeft("Negative");
    spec.boundary_wkt = "POLYGON((0 0, 1 0, 1 1))";
    CHECK(errorKindOf([&] { applyInfluenceZone(rampGrid(), spec); }) == ErrorKind::InvalidGeometry);
}

TEST_CASE("applyInfluenceZone: polygon outside the frame changes nothing")
{
    const Raster cost = rampGrid();
    InfluenceSpec spec = topLeft("Negative");
    spec.boundary_wkt = rectangleWkt(100.0, 100.0, 110.0, 110.0);

    const InfluenceOutcome outcome = applyInfluenceZone(cost, spec);
    CHECK(outcome.covered_cells == 0);
    CHECK(outcome.grid.data() == cost.data());
}

TEST_CASE("applyInfluenceZone: positive polarity needs a valid cell")
{
    const Raster empty(kFrame, nodataCell(), 0.0f);
    CHECK(errorKindOf([&] { applyInfluenceZone(empty, topLeft("Positive")); }) == ErrorKind::DegenerateRange);

    // Negative polarity still overrides
    const InfluenceOutcome outcome = applyInfluenceZone(empty, topLeft("Negative"));
    CHECK(outcome.grid.validCount() == 4);
}

TEST_CASE("applyInfluence: nodata in the sentinel counts as outside")
{
    const Raster cost = rampGrid();
    Raster sentinel(kFrame, GridCellData{}, 0.0f);
    sentinel.at(0, 0).value = -1.0f;
    sentinel.at(1, 0) = nodataCell();
    sentinel.at(1, 0).value = -1.0f;

    const Raster out = applyInfluence(cost, sentinel, 200.0f);
    CHECK(out.at(0, 0).value == doctest::Approx(200.0f));
    CHECK(out.at(1, 0).value == doctest::Approx(2.0f));
    CHECK(out.countFlag(FLAG_INFLUENCED) == 1);
}

TEST_CASE("maxValidValue: ignores nodata")
{
    Raster grid = rampGrid();
    grid.at(3, 3) = nodataCell();
    grid.at(3, 3).value = 999.0f;
    REQUIRE(maxValidValue(grid).has_value());
    CHECK(*maxValidValue(grid) == doctest::Approx(15.0f));
}
