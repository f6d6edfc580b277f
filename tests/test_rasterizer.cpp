// tests/test_rasterizer.cpp (doctest)
#include <doctest/doctest.h>

#include "PolygonRasterizer.hpp"
#include "WktParser.hpp"
#include "TestGrids.hpp"

using namespace suitgeo;
using suitgeo_test::makeFrame;
using suitgeo_test::rectangleWkt;

namespace {
    const GridFrame kFrame = makeFrame(0.0, 4.0, 1.0, 4, 4);

    std::size_t burntCells(const Raster& r) {
        return static_cast<std::size_t>(std::count_if(r.data().begin(), r.data().end(),
            [](const GridCellData& c) { return c.value < 0.0f; }));
    }
}

TEST_CASE("rasterizePolygon: quadrant polygon covers exactly its four cells")
{
    const Raster r = rasterizePolygon(parsePolygonWkt(rectangleWkt(0.0, 2.0, 2.0, 4.0)), kFrame);
    CHECK(burntCells(r) == 4);
    CHECK(r.at(0, 0).value == doctest::Approx(-1.0f));
    CHECK(r.at(1, 1).value == doctest::Approx(-1.0f));
    CHECK(r.at(2, 0).value == doctest::Approx(0.0f));
    CHECK(r.at(0, 2).value == doctest::Approx(0.0f));
    CHECK(r.validCount() == 16); // no nodata in a sentinel grid
}

TEST_CASE("rasterizePolygon: cell-centre rule on a triangle")
{
    // Hypotenuse x + y = 4.2 keeps the centres with column <= row
    const Raster r = rasterizePolygon(parsePolygonWkt("POLYGON((0 0, 4.2 0, 0 4.2, 0 0))"), kFrame);
    CHECK(burntCells(r) == 10);
    for (std::size_t y = 0; y < 4; ++y) {
        for (std::size_t x = 0; x < 4; ++x) {
            CHECK((r.at(x, y).value < 0.0f) == (x <= y));
        }
    }
}

TEST_CASE("rasterizePolygon: holes are not covered")
{
    const Polygon p = parsePolygonWkt("POLYGON((0 0, 4 0, 4 4, 0 4, 0 0), (1 1, 3 1, 3 3, 1 3, 1 1))");
    const Raster r = rasterizePolygon(p, kFrame);
    CHECK(burntCells(r) == 12);
    CHECK(r.at(1, 1).value == doctest::Approx(0.0f));
    CHECK(r.at(2, 2).value == doctest::Approx(0.0f));
    CHECK(r.at(0, 1).value == doctest::Approx(-1.0f));
}

TEST_CASE("rasterizePolygon: polygon larger than the frame covers all cells")
{
    const Raster r = rasterizePolygon(parsePolygonWkt(rectangleWkt(-10.0, -10.0, 10.0, 10.0)), kFrame);
    CHECK(burntCells(r) == 16);
}

TEST_CASE("rasterizePolygon: polygons sharing an edge do not overlap")
{
    const auto left = coveredCells(parsePolygonWkt(rectangleWkt(0.0, 0.0, 2.0, 4.0)), kFrame, false);
    const auto right = coveredCells(parsePolygonWkt(rectangleWkt(2.0, 0.0, 4.0, 4.0)), kFrame, false);
    CHECK(left.size() == 8);
    CHECK(right.size() == 8);
    for (const auto& p : left) CHECK(right.count(p) == 0);

    // Edge through cell centres: each centre belongs to exactly one side
    const auto a = coveredCells(parsePolygonWkt(rectangleWkt(0.0, 0.0, 1.5, 4.0)), kFrame, false);
    const auto b = coveredCells(parsePolygonWkt(rectangleWkt(1.5, 0.0, 4.0, 4.0)), kFrame, false);
    CHECK(a.size() + b.size() == 16);
}

TEST_CASE("rasterizePolygon: boundary option adds cells touched by the outline")
{
    // Sliver inside cell (0,0) that misses the cell centre
    const Polygon sliver = parsePolygonWkt("POLYGON((0 3.6, 0.4 3.6, 0.4 4, 0 4, 0 3.6))");

    const Raster centreOnly = rasterizePolygon(sliver, kFrame);
    CHECK(burntCells(centreOnly) == 0);

    RasterizeOptions options;
    options.include_boundary = true;
    const Raster withBoundary = rasterizePolygon(sliver, kFrame, options);
    CHECK(burntCells(withBoundary) == 1);
    CHECK(withBoundary.at(0, 0).value == doctest::Approx(-1.0f));
}

TEST_CASE("rasterizePolygon: custom burn values")
{
    RasterizeOptions options;
    options.inside_value = 7.0f;
    options.outside_value = 2.0f;
    const Raster r = rasterizePolygon(parsePolygonWkt(rectangleWkt(0.0, 2.0, 2.0, 4.0)), kFrame, options);
    CHECK(r.at(0, 0).value == doctest::Approx(7.0f));
    CHECK(r.at(3, 3).value == doctest::Approx(2.0f));
}
