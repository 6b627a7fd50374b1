#include <catch2/catch.hpp>

#include <chrono>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "cargopack/catalog.hpp"
#include "cargopack/cli_parse.hpp"
#include "cargopack/load_report.hpp"
#include "cargopack/manifest_csv.hpp"
#include "cargopack/pacing.hpp"
#include "cargopack/packer.hpp"

using namespace cargopack;

TEST_CASE("catalog lists the box types and trucks", "[catalog]") {
    REQUIRE(box_types().size() == 5);
    CHECK(box_types().front().key == "electronics");
    CHECK(box_types().front().fragile);
    for (std::size_t i = 1; i < box_types().size(); ++i) {
        CHECK_FALSE(box_types()[i].fragile);
    }

    REQUIRE(trucks().size() == 4);
    const Container medium = find_truck("medium").container;
    CHECK(medium.width == 100.0);
    CHECK(medium.height == 70.0);
    CHECK(medium.depth == 55.0);

    CHECK_THROWS_AS(find_truck("bicycle"), std::invalid_argument);
    CHECK_THROWS_AS(find_box_type("piano"), std::invalid_argument);
}

TEST_CASE("generated manifests are reproducible and within catalog ranges", "[catalog]") {
    const TypeCounts counts{{"industrial", 3}, {"electronics", 4}};
    const auto a = generate_items(counts, 99);
    const auto b = generate_items(counts, 99);
    REQUIRE(a.size() == 7);
    REQUIRE(b.size() == 7);

    for (std::size_t i = 0; i < a.size(); ++i) {
        CHECK(a[i].id == static_cast<int>(i));
        CHECK(a[i].dims.length == b[i].dims.length);
        CHECK(a[i].weight == b[i].weight);

        const BoxType& type = find_box_type(a[i].category);
        CHECK(a[i].fragile == type.fragile);
        CHECK(a[i].color == type.color);
        CHECK(a[i].dims.length == std::round(a[i].dims.length));
        CHECK(a[i].dims.length >= type.length.min);
        CHECK(a[i].dims.length <= type.length.max);
        CHECK(a[i].dims.width >= type.width.min);
        CHECK(a[i].dims.width <= type.width.max);
        CHECK(a[i].dims.height >= type.height.min);
        CHECK(a[i].dims.height <= type.height.max);
        CHECK(a[i].weight >= type.weight.min);
        CHECK(a[i].weight <= type.weight.max);
    }

    // Catalog order, not map order.
    for (std::size_t i = 0; i < 4; ++i) {
        CHECK(a[i].category == "electronics");
    }
    CHECK(a[4].category == "industrial");

    CHECK_THROWS_AS(generate_items({{"piano", 1}}, 1), std::invalid_argument);
}

TEST_CASE("max counts follow volume and layer limits", "[catalog]") {
    const TypeCounts small = max_counts(find_truck("small").container);
    CHECK(small.at("electronics") == 36);
    CHECK(small.at("furniture") == 2);
    CHECK(small.at("appliance") == 1);

    const TypeCounts xl = max_counts(find_truck("xl").container);
    CHECK(xl.at("electronics") == kMaxCountPerType);
}

TEST_CASE("capacity estimate uses average volumes", "[catalog]") {
    const Container small = find_truck("small").container;
    const CapacityEstimate ok = estimate_capacity({{"standard", 2}}, small);
    CHECK(ok.total_volume == Approx(15000.0));
    CHECK(ok.usable_volume == Approx(66000.0));
    CHECK(ok.usage_pct == Approx(15000.0 / 66000.0 * 100.0));
    CHECK(ok.fits);

    const CapacityEstimate too_many = estimate_capacity({{"appliance", 3}}, small);
    CHECK_FALSE(too_many.fits);
}

TEST_CASE("manifest CSV is parsed with header, blank lines and flags", "[csv]") {
    std::istringstream in(
        "id,category,length,width,height,weight,fragile,color\n"
        "3,standard,25,20,15,12.5,0,#22c55e\n"
        "\n"
        " 8 , electronics , 15 , 12 , 10 , 4.25 , true , #a855f7 \n");
    const auto items = read_manifest_csv(in);
    REQUIRE(items.size() == 2);
    CHECK(items[0].id == 3);
    CHECK(items[0].category == "standard");
    CHECK(items[0].dims.length == 25.0);
    CHECK(items[0].weight == 12.5);
    CHECK_FALSE(items[0].fragile);
    CHECK(items[1].id == 8);
    CHECK(items[1].category == "electronics");
    CHECK(items[1].dims.height == 10.0);
    CHECK(items[1].fragile);
    CHECK(items[1].color == "#a855f7");
}

TEST_CASE("manifest CSV errors name the line", "[csv]") {
    std::istringstream dup("1,a,1,1,1,1,0,x\n1,b,2,2,2,2,0,y\n");
    CHECK_THROWS_WITH(read_manifest_csv(dup), Catch::Contains("line 2") && Catch::Contains("duplicate"));

    std::istringstream short_row("1,a,1,1\n");
    CHECK_THROWS_WITH(read_manifest_csv(short_row), Catch::Contains("line 1"));

    std::istringstream bad_number("id,category,length,width,height,weight,fragile,color\n1,a,x,1,1,1,0,c\n");
    CHECK_THROWS_WITH(read_manifest_csv(bad_number), Catch::Contains("line 2") && Catch::Contains("length"));

    std::istringstream bad_flag("1,a,1,1,1,1,maybe,c\n");
    CHECK_THROWS_AS(read_manifest_csv(bad_flag), std::runtime_error);
}

TEST_CASE("written manifests read back unchanged", "[csv]") {
    const auto items = generate_items({{"standard", 2}, {"electronics", 1}}, 5);
    std::stringstream buf;
    write_manifest_csv(buf, items);
    const auto back = read_manifest_csv(buf);
    REQUIRE(back.size() == items.size());
    for (std::size_t i = 0; i < items.size(); ++i) {
        CHECK(back[i].id == items[i].id);
        CHECK(back[i].weight == items[i].weight);
        CHECK(back[i].fragile == items[i].fragile);
        CHECK(back[i].color == items[i].color);
    }
}

TEST_CASE("placements CSV has one row per placed item", "[csv]") {
    Item item;
    item.id = 4;
    item.category = "standard";
    item.dims = Dimensions{10, 10, 10};
    item.weight = 2.0;
    const PackResult r = pack(Container{50, 50, 50}, {item});

    std::ostringstream out;
    write_placements_csv(out, r.placed, 1);
    CHECK(out.str() ==
          "seq,id,category,dx,dy,dz,weight,x,y,z,orientation,phase,stability\n"
          "1,4,standard,10.0,10.0,10.0,2.0,0.0,0.0,0.0,0,greedy,1.0\n");

    CHECK_THROWS_AS(write_placements_csv(out, r.placed, 18), std::invalid_argument);
}

TEST_CASE("load report summarises a partial load", "[report]") {
    Item fits;
    fits.id = 1;
    fits.dims = Dimensions{10, 10, 10};
    fits.weight = 3.0;
    Item too_long = fits;
    too_long.id = 2;
    too_long.dims = Dimensions{30, 5, 5};

    const Container c{20, 20, 20};
    const PackResult r = pack(c, {fits, too_long});
    const LoadReport report = load_report(c, 2, r);
    CHECK(report.placed_count == 1);
    CHECK(report.item_count == 2);
    CHECK(report.greedy_count == 1);
    CHECK(report.fallback_count == 0);
    CHECK(report.used_volume == Approx(1000.0));
    CHECK(report.utilization_pct == Approx(12.5));
    CHECK(report.avg_stability == Approx(1.0));
    CHECK(report.total_weight == Approx(3.0));
    CHECK_FALSE(report.all_loaded);
    CHECK(status_line(report) == "1/2 loaded");

    const LoadReport full = load_report(c, 1, pack(c, {fits}));
    CHECK(full.all_loaded);
    CHECK(status_line(full) == "All 1 boxes loaded");
}

TEST_CASE("paced observer forwards every notification", "[pacing]") {
    int calls = 0;
    PackObserver inner = [&](const PlacedItem&, std::size_t, double) { calls++; };

    Item item;
    item.id = 1;
    item.dims = Dimensions{5, 5, 5};
    std::vector<Item> items(3, item);
    for (std::size_t i = 0; i < items.size(); ++i) {
        items[i].id = static_cast<int>(i);
    }

    pack(Container{20, 20, 20}, items, paced_observer(inner, std::chrono::milliseconds(1)));
    CHECK(calls == 3);

    pack(Container{20, 20, 20}, items, paced_observer(inner, std::chrono::milliseconds(0)));
    CHECK(calls == 6);

    CHECK_NOTHROW(pack(Container{20, 20, 20}, items, paced_observer(PackObserver{}, std::chrono::milliseconds(1))));
}

TEST_CASE("CLI helpers parse containers and counts", "[cli]") {
    const Container c = parse_container("60,50,40");
    CHECK(c.width == 60.0);
    CHECK(c.height == 50.0);
    CHECK(c.depth == 40.0);
    CHECK_THROWS_AS(parse_container("60,50"), std::runtime_error);

    const TypeCounts counts = parse_counts("electronics=3,standard=2,electronics=1");
    CHECK(counts.at("electronics") == 4);
    CHECK(counts.at("standard") == 2);
    CHECK_THROWS_AS(parse_counts("standard"), std::runtime_error);
    CHECK_THROWS_AS(parse_counts("standard=-1"), std::runtime_error);
}
