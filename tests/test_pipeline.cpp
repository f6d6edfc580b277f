// tests/test_pipeline.cpp (doctest)
#include <doctest/doctest.h>

#include "OverlayPipeline.hpp"
#include "TestGrids.hpp"

using namespace suitgeo;
using suitgeo_test::constantGrid;
using suitgeo_test::errorKindOf;
using suitgeo_test::gridFrom;
using suitgeo_test::makeFrame;
using suitgeo_test::rectangleWkt;

namespace {

    const GridFrame kFrame = makeFrame(0.0, 4.0, 1.0, 4, 4);

    // slope = 10 * column, roads = 4: the weighted sum is 10 * column + 2 -> {2, 12, 22, 32}
    InMemoryGridStore makeStore() {
        InMemoryGridStore store;
        store.addGrid("slope", gridFrom(kFrame, [](std::size_t x, std::size_t) { return static_cast<float>(10 * x); }), "Slope");
        store.addGrid("roads", constantGrid(kFrame, 4.0f), "Distance to roads");
        store.addGrid("wetlands", gridFrom(kFrame, [](std::size_t x, std::size_t y) { return (x < 2 && y < 2) ? 1.0f : 0.0f; }),
            "Wetlands", std::vector<float>{ 1.0f });
        store.addGrid("flat", constantGrid(kFrame, 7.0f));
        return store;
    }

    OverlayRequest baseRequest() {
        OverlayRequest request;
        request.boundary_wkt = rectangleWkt(0.0, 0.0, 4.0, 4.0);
        request.weights = { {"slope", "", 1.0}, {"roads", "Roads", 0.5} };
        request.config.verbose = false;
        return request;
    }

    InfluenceSpec bottomRight(const std::string& polarity) {
        InfluenceSpec spec;
        spec.boundary_wkt = rectangleWkt(2.0, 0.0, 4.0, 2.0);
        spec.polarity = polarity;
        spec.description = "Protected view";
        return spec;
    }

} // namespace

TEST_CASE("runOverlay: weighted sum and rescale only")
{
    InMemoryGridStore store = makeStore();
    const OverlayResult result = runOverlay(store, baseRequest());
    const OverlayDiagnostics& d = result.diagnostics;

    const std::vector<PipelineStage> expected = {
        PipelineStage::ExtentResolved, PipelineStage::Summed, PipelineStage::Rescaled, PipelineStage::Finalized };
    CHECK(d.stages == expected);
    CHECK_FALSE(d.reached(PipelineStage::ExclusionApplied));
    CHECK_FALSE(d.reached(PipelineStage::InfluenceApplied));

    CHECK(d.source_min == 2);
    CHECK(d.source_max == 32);
    CHECK(d.target_min == 1);
    CHECK(d.target_max == 255);

    // (v - 2) * 254 / 30 + 1, truncated
    CHECK(result.cost.at(0, 0).value == doctest::Approx(1.0f));
    CHECK(result.cost.at(1, 0).value == doctest::Approx(85.0f));
    CHECK(result.cost.at(2, 3).value == doctest::Approx(170.0f));
    CHECK(result.cost.at(3, 2).value == doctest::Approx(255.0f));
    CHECK(d.valid_cells == 16);
}

TEST_CASE("runOverlay: exclusions then negative influence")
{
    InMemoryGridStore store = makeStore();
    OverlayRequest request = baseRequest();
    request.exclusion_layers = { "wetlands" };
    request.influence = bottomRight("Negative");

    const OverlayResult result = runOverlay(store, request);
    const OverlayDiagnostics& d = result.diagnostics;

    CHECK(d.stages.size() == 6);
    CHECK(d.stages.back() == PipelineStage::Finalized);
    CHECK(d.excluded_cells == 4);
    CHECK(d.influenced_cells == 4);
    REQUIRE(d.pre_override_max.has_value());
    CHECK(*d.pre_override_max == doctest::Approx(255.0f));
    REQUIRE(d.influence_value.has_value());
    CHECK(*d.influence_value == doctest::Approx(1.0f));
    CHECK(d.influence_polarity == "Negative");

    const Raster& cost = result.cost;
    CHECK(cost.at(0, 0).value == doctest::Approx(1.0f));    // excluded
    CHECK(cost.at(0, 0).hasFlag(FLAG_EXCLUDED));
    CHECK(cost.at(2, 0).value == doctest::Approx(170.0f));  // untouched
    CHECK(cost.at(3, 1).value == doctest::Approx(255.0f));  // untouched
    CHECK(cost.at(3, 3).value == doctest::Approx(1.0f));    // negative influence
    CHECK(cost.at(3, 3).hasFlag(FLAG_INFLUENCED));
    CHECK(cost.at(1, 3).value == doctest::Approx(85.0f));   // untouched
}

TEST_CASE("runOverlay: positive influence uses the maximum before the override")
{
    InMemoryGridStore store = makeStore();
    OverlayRequest request = baseRequest();
    InfluenceSpec spec = bottomRight("Positive");
    spec.boundary_wkt = rectangleWkt(0.0, 0.0, 2.0, 2.0); // bottom-left quadrant
    request.influence = spec;

    const OverlayResult result = runOverlay(store, request);
    CHECK(result.cost.at(0, 3).value == doctest::Approx(255.0f));
    CHECK(result.cost.at(1, 2).value == doctest::Approx(255.0f));
    CHECK(result.cost.at(0, 0).value == doctest::Approx(1.0f));
    CHECK(result.diagnostics.influenced_cells == 4);
}

TEST_CASE("runOverlay: labels come from the weight table, then the store")
{
    InMemoryGridStore store = makeStore();
    OverlayRequest request = baseRequest();
    request.exclusion_layers = { "wetlands" };

    const OverlayResult result = runOverlay(store, request);
    const auto& labels = result.diagnostics.labels;
    CHECK(labels.at("slope") == "Slope");
    CHECK(labels.at("roads") == "Roads");
    CHECK(labels.at("wetlands") == "Wetlands");
    CHECK_FALSE(result.diagnostics.messages.empty());
}

TEST_CASE("runOverlay: extent smaller than the grids clips the frame")
{
    InMemoryGridStore store = makeStore();
    OverlayRequest request = baseRequest();
    request.boundary_wkt = "POLYGON((1 1, 3 1, 3 3, 1 1))";

    const OverlayResult result = runOverlay(store, request);
    CHECK(result.cost.width() == 2);
    CHECK(result.cost.height() == 2);
    CHECK(result.diagnostics.frame.origin_x == doctest::Approx(1.0));
    CHECK(result.diagnostics.source_min == 12);
    CHECK(result.diagnostics.source_max == 22);
}

TEST_CASE("runOverlay: fail-fast errors")
{
    InMemoryGridStore store = makeStore();

    SUBCASE("empty weight table") {
        OverlayRequest request = baseRequest();
        request.weights.clear();
        CHECK(errorKindOf([&] { runOverlay(store, request); }) == ErrorKind::EmptyWeightTable);
    }
    SUBCASE("invalid extent") {
        OverlayRequest request = baseRequest();
        request.boundary_wkt = "POLYGON((0 0, 1 0, 1 1, 0 1))";
        CHECK(errorKindOf([&] { runOverlay(store, request); }) == ErrorKind::InvalidGeometry);
    }
    SUBCASE("unknown weighted layer") {
        OverlayRequest request = baseRequest();
        request.weights.push_back({ "elevation", "", 1.0 });
        CHECK(errorKindOf([&] { runOverlay(store, request); }) == ErrorKind::UnknownLayer);
    }
    SUBCASE("unknown exclusion layer") {
        OverlayRequest request = baseRequest();
        request.exclusion_layers = { "glaciers" };
        CHECK(errorKindOf([&] { runOverlay(store, request); }) == ErrorKind::UnknownLayer);
    }
    SUBCASE("constant weighted sum") {
        OverlayRequest request = baseRequest();
        request.weights = { {"flat", "", 1.0} };
        CHECK(errorKindOf([&] { runOverlay(store, request); }) == ErrorKind::DegenerateRange);
    }
    SUBCASE("unknown polarity") {
        OverlayRequest request = baseRequest();
        request.influence = bottomRight("Upward");
        CHECK(errorKindOf([&] { runOverlay(store, request); }) == ErrorKind::UnknownPolarity);
    }
}
