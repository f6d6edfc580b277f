// tests/test_weighted_overlay.cpp (doctest)
#include <doctest/doctest.h>

#include "WeightedOverlay.hpp"
#include "GridSampler.hpp"
#include "TestGrids.hpp"

using namespace suitgeo;
using suitgeo_test::constantGrid;
using suitgeo_test::errorKindOf;
using suitgeo_test::gridFrom;
using suitgeo_test::makeFrame;

namespace {

    const BoundingBox kFullBox{ 0.0, 0.0, 4.0, 4.0 };

    bool sameCells(const Raster& a, const Raster& b) {
        return a.frame().sameGeometry(b.frame()) && a.data() == b.data();
    }

} // namespace

TEST_CASE("weightedSum: 0.5*A + 0.5*B with A=2 and B=4 gives 3 everywhere")
{
    const GridFrame frame = makeFrame(0.0, 4.0, 1.0, 4, 4);
    InMemoryGridStore store;
    store.addGrid("A", constantGrid(frame, 2.0f), "A");
    store.addGrid("B", constantGrid(frame, 4.0f), "B");

    const Raster out = weightedSum(store, "", { {"A", "A", 0.5}, {"B", "B", 0.5} }, kFullBox);

    CHECK(out.width() == 4);
    CHECK(out.height() == 4);
    CHECK(out.validCount() == 16);
    for (const auto& c : out.data()) {
        CHECK(c.value == doctest::Approx(3.0f));
    }
}

TEST_CASE("weightedSum: result does not depend on the order of the weight table")
{
    const GridFrame frame = makeFrame(0.0, 4.0, 1.0, 4, 4);
    InMemoryGridStore store;
    store.addGrid("slope", gridFrom(frame, [](std::size_t x, std::size_t y) { return static_cast<float>(x * 7 + y); }));
    store.addGrid("roads", gridFrom(frame, [](std::size_t x, std::size_t y) { return static_cast<float>(3 * y + 1); }));
    store.addGrid("soil", gridFrom(frame, [](std::size_t x, std::size_t) { return static_cast<float>(x % 2 ? 9 : 4); }));

    const std::vector<WeightEntry> forward = { {"slope", "", 0.5}, {"roads", "", 0.25}, {"soil", "", 2.0} };
    const std::vector<WeightEntry> backward = { {"soil", "", 2.0}, {"roads", "", 0.25}, {"slope", "", 0.5} };

    // Same reference lattice in both runs
    const Raster a = weightedSum(store, "slope", forward, kFullBox);
    const Raster b = weightedSum(store, "slope", backward, kFullBox);
    CHECK(sameCells(a, b));
}

TEST_CASE("weightedSum: values are truncated and clamped into 8 bits")
{
    const GridFrame frame = makeFrame(0.0, 4.0, 1.0, 4, 4);
    InMemoryGridStore store;
    store.addGrid("A", constantGrid(frame, 5.0f));
    store.addGrid("Big", constantGrid(frame, 200.0f));

    SUBCASE("truncation") {
        const Raster out = weightedSum(store, "", { {"A", "", 0.5} }, kFullBox);
        CHECK(out.at(0, 0).value == doctest::Approx(2.0f));
        CHECK(out.countFlag(FLAG_CLAMPED) == 0);
    }
    SUBCASE("above 255") {
        const Raster out = weightedSum(store, "", { {"Big", "", 2.0} }, kFullBox);
        CHECK(out.at(3, 3).value == doctest::Approx(255.0f));
        CHECK(out.countFlag(FLAG_CLAMPED) == 16);
    }
    SUBCASE("negative weights") {
        const Raster out = weightedSum(store, "", { {"A", "", 1.0}, {"Big", "", -1.0} }, kFullBox);
        CHECK(out.at(1, 2).value == doctest::Approx(0.0f));
        CHECK(out.at(1, 2).hasFlag(FLAG_CLAMPED));
    }
}

TEST_CASE("weightedSum: nodata in any input propagates")
{
    const GridFrame frame = makeFrame(0.0, 4.0, 1.0, 4, 4);
    Raster a = constantGrid(frame, 2.0f);
    a.at(1, 1) = nodataCell();

    InMemoryGridStore store;
    store.addGrid("A", a);
    store.addGrid("B", constantGrid(frame, 4.0f));

    const Raster out = weightedSum(store, "", { {"A", "", 1.0}, {"B", "", 1.0} }, kFullBox);
    CHECK(out.validCount() == 15);
    CHECK(out.at(1, 1).isNodata());
    CHECK(out.at(1, 1).value == doctest::Approx(0.0f));
    CHECK(out.nodataValue() == doctest::Approx(0.0f));
    CHECK(out.at(2, 1).value == doctest::Approx(6.0f));
}

TEST_CASE("weightedSum: processing window snaps to the reference lattice")
{
    const GridFrame frame = makeFrame(0.0, 4.0, 1.0, 4, 4);
    InMemoryGridStore store;
    store.addGrid("A", gridFrom(frame, [](std::size_t x, std::size_t y) { return static_cast<float>(10 * y + x); }));

    SUBCASE("box on lattice lines") {
        const Raster out = weightedSum(store, "", { {"A", "", 1.0} }, BoundingBox{ 1.0, 1.0, 3.0, 3.0 });
        CHECK(out.width() == 2);
        CHECK(out.height() == 2);
        CHECK(out.frame().origin_x == doctest::Approx(1.0));
        CHECK(out.frame().origin_y == doctest::Approx(3.0));
        CHECK(out.at(0, 0).value == doctest::Approx(11.0f)); // column 1, row 1 of A
    }
    SUBCASE("box between lattice lines grows outward") {
        const Raster out = weightedSum(store, "", { {"A", "", 1.0} }, BoundingBox{ 0.5, 0.5, 2.5, 2.5 });
        CHECK(out.width() == 3);
        CHECK(out.height() == 3);
        CHECK(out.frame().origin_x == doctest::Approx(0.0));
        CHECK(out.frame().origin_y == doctest::Approx(3.0));
    }
}

TEST_CASE("weightedSum: inputs with a larger extent on the same lattice are windowed")
{
    const GridFrame ref = makeFrame(0.0, 4.0, 1.0, 4, 4);
    const GridFrame wide = makeFrame(-2.0, 6.0, 1.0, 8, 8);

    InMemoryGridStore store;
    store.addGrid("ref", constantGrid(ref, 0.0f));
    store.addGrid("wide", gridFrom(wide, [](std::size_t x, std::size_t) { return static_cast<float>(x); }));

    const Raster out = weightedSum(store, "", { {"ref", "", 1.0}, {"wide", "", 1.0} }, kFullBox);
    for (std::size_t x = 0; x < 4; ++x) {
        CHECK(out.at(x, 0).value == doctest::Approx(static_cast<float>(x + 2)));
    }
}

TEST_CASE("weightedSum: cells outside an input's extent are nodata")
{
    const GridFrame ref = makeFrame(0.0, 4.0, 1.0, 4, 4);
    const GridFrame small = makeFrame(0.0, 4.0, 1.0, 2, 2);

    InMemoryGridStore store;
    store.addGrid("ref", constantGrid(ref, 1.0f));
    store.addGrid("small", constantGrid(small, 1.0f));

    const Raster out = weightedSum(store, "", { {"ref", "", 1.0}, {"small", "", 1.0} }, kFullBox);
    CHECK(out.validCount() == 4);
    CHECK(out.at(0, 0).value == doctest::Approx(2.0f));
    CHECK(out.at(3, 3).isNodata());
}

TEST_CASE("weightedSum: failures")
{
    const GridFrame frame = makeFrame(0.0, 4.0, 1.0, 4, 4);

    SUBCASE("empty weight table is rejected before any lookup") {
        InMemoryGridStore empty;
        CHECK(errorKindOf([&] { weightedSum(empty, "missing", {}, kFullBox); }) == ErrorKind::EmptyWeightTable);
    }
    SUBCASE("unknown layer") {
        InMemoryGridStore store;
        store.addGrid("A", constantGrid(frame, 1.0f));
        CHECK(errorKindOf([&] { weightedSum(store, "", { {"A", "", 1.0}, {"nope", "", 1.0} }, kFullBox); }) == ErrorKind::UnknownLayer);
        CHECK(errorKindOf([&] { weightedSum(store, "nope", { {"A", "", 1.0} }, kFullBox); }) == ErrorKind::UnknownLayer);
    }
    SUBCASE("different cell size") {
        InMemoryGridStore store;
        store.addGrid("A", constantGrid(frame, 1.0f));
        store.addGrid("coarse", constantGrid(makeFrame(0.0, 4.0, 2.0, 2, 2), 1.0f));
        CHECK(errorKindOf([&] { weightedSum(store, "", { {"A", "", 1.0}, {"coarse", "", 1.0} }, kFullBox); }) == ErrorKind::MisalignedGrid);
    }
}

TEST_CASE("sumAligned: guards against mismatched inputs")
{
    const GridFrame frame = makeFrame(0.0, 4.0, 1.0, 4, 4);
    const std::vector<Raster> grids = { constantGrid(frame, 1.0f) };
    CHECK_THROWS_AS(sumAligned(grids, { 1.0, 2.0 }), std::invalid_argument);
    CHECK_THROWS_AS(sumAligned({}, {}), std::invalid_argument);
}

TEST_CASE("weightedSum: an input off the reference lattice is rejected")
{
    const GridFrame frame = makeFrame(0.0, 4.0, 1.0, 4, 4);
    InMemoryGridStore store;
    store.addGrid("A", constantGrid(frame, 10.0f));
    store.addGrid("quarter", constantGrid(makeFrame(0.25, 4.25, 1.0, 5, 5), 10.0f));
    store.addGrid("half", constantGrid(makeFrame(0.5, 4.5, 1.0, 4, 4), 10.0f));
    store.addGrid("north", constantGrid(makeFrame(0.0, 4.3, 1.0, 4, 4), 10.0f));

    CHECK(errorKindOf([&] { weightedSum(store, "", { {"A", "", 1.0}, {"quarter", "", 1.0} }, kFullBox); }) == ErrorKind::MisalignedGrid);
    CHECK(errorKindOf([&] { weightedSum(store, "", { {"A", "", 1.0}, {"half", "", 1.0} }, kFullBox); }) == ErrorKind::MisalignedGrid);
    CHECK(errorKindOf([&] { weightedSum(store, "", { {"A", "", 1.0}, {"north", "", 1.0} }, kFullBox); }) == ErrorKind::MisalignedGrid);
}

TEST_CASE("checkAlignment: whole-cell offsets are on the lattice")
{
    const GridFrame ref = makeFrame(100.0, 200.0, 0.5, 10, 10);
    CHECK_NOTHROW(checkAlignment(ref, makeFrame(98.5, 203.0, 0.5, 4, 4), "shifted"));
    CHECK_NOTHROW(checkAlignment(ref, makeFrame(100.0 + 0.5 * 1e-8, 200.0, 0.5, 4, 4), "rounding"));
    CHECK(errorKindOf([&] { checkAlignment(ref, makeFrame(100.125, 200.0, 0.5, 4, 4), "quarter"); }) == ErrorKind::MisalignedGrid);
}
