#include <catch2/catch.hpp>

#include <vector>

#include "cargopack/candidate_set.hpp"

using namespace cargopack;

namespace {

bool same_point(const Vec3& a, const Vec3& b) {
    return a.x == Approx(b.x) && a.y == Approx(b.y) && a.z == Approx(b.z);
}

void check_points(const CandidateSet& cs, const std::vector<Vec3>& expected) {
    REQUIRE(cs.points().size() == expected.size());
    for (std::size_t i = 0; i < expected.size(); ++i) {
        INFO("point " << i << " = (" << cs.points()[i].x << "," << cs.points()[i].y << "," << cs.points()[i].z
                      << ")");
        CHECK(same_point(cs.points()[i], expected[i]));
    }
}

}  // namespace

TEST_CASE("candidate set is seeded with the origin", "[candidates]") {
    CandidateSet cs(Container{100, 100, 100});
    check_points(cs, {Vec3{0, 0, 0}});
}

TEST_CASE("placement generates push/stack/diagonal points in bottom-left-front order", "[candidates]") {
    const Container c{100, 100, 100};
    CandidateSet cs(c);
    BoxIndex index(10.0);
    const Extents e{10, 20, 30};
    index.insert(box_at(Vec3{0, 0, 0}, e));

    cs.on_placed(Vec3{0, 0, 0}, e, index);

    check_points(cs,
                 {
                     Vec3{0, 0, 30.5},
                     Vec3{10.5, 0, 0},
                     Vec3{10.5, 0, 30.5},
                     Vec3{0, 20.5, 0},
                     Vec3{0, 20.5, 30.5},
                     Vec3{10.5, 20.5, 0},
                 });
}

TEST_CASE("simple variant generates three points at exact contact", "[candidates]") {
    CandidateSetOptions opt;
    opt.gap = 0.0;
    opt.diagonal_candidates = false;
    CandidateSet cs(Container{100, 100, 100}, opt);
    BoxIndex index(10.0);
    const Extents e{10, 20, 30};
    index.insert(box_at(Vec3{0, 0, 0}, e));

    cs.on_placed(Vec3{0, 0, 0}, e, index);

    check_points(cs, {Vec3{0, 0, 30}, Vec3{10, 0, 0}, Vec3{0, 20, 0}});
}

TEST_CASE("points outside the container are not added", "[candidates]") {
    CandidateSet cs(Container{20, 20, 20});
    CHECK_FALSE(cs.add(Vec3{20, 0, 0}));
    CHECK_FALSE(cs.add(Vec3{0, 20, 0}));
    CHECK_FALSE(cs.add(Vec3{0, 0, 25}));
    CHECK_FALSE(cs.add(Vec3{-1, 0, 0}));
    CHECK(cs.add(Vec3{19.5, 0, 0}));
    CHECK(cs.size() == 2);
}

TEST_CASE("near-duplicate points are suppressed", "[candidates]") {
    CandidateSet cs(Container{100, 100, 100});
    CHECK(cs.add(Vec3{5, 5, 5}));
    CHECK_FALSE(cs.add(Vec3{5.5, 5.9, 5.2}));
    CHECK(cs.add(Vec3{6.1, 5, 5}));
    CHECK(cs.size() == 3);
}

TEST_CASE("ordering treats y and x within tolerance as ties", "[candidates]") {
    CandidateSet cs(Container{100, 100, 100});
    cs.consume(Vec3{0, 0, 0});
    REQUIRE(cs.empty());

    cs.add(Vec3{10, 0, 0});
    cs.add(Vec3{2, 0.05, 0});
    cs.add(Vec3{4, 0.5, 0});
    cs.add(Vec3{2.05, 0.02, 7});

    // (2, 0.05, 0) and (2.05, 0.02, 7) tie on y and x, so z decides; y = 0.5 is a separate layer.
    check_points(cs, {Vec3{2, 0.05, 0}, Vec3{2.05, 0.02, 7}, Vec3{10, 0, 0}, Vec3{4, 0.5, 0}});

    CHECK(candidate_precedes(Vec3{2, 0.05, 0}, Vec3{10, 0, 0}, 0.1));
    CHECK_FALSE(candidate_precedes(Vec3{2, 0.05, 0}, Vec3{10, 0, 0}, 0.0));
}

TEST_CASE("consuming a point removes close neighbours", "[candidates]") {
    CandidateSetOptions opt;
    opt.dedupe_tolerance = 0.1;
    CandidateSet cs(Container{100, 100, 100}, opt);
    cs.add(Vec3{20, 0, 0});
    cs.add(Vec3{20.4, 0, 0});
    cs.add(Vec3{21, 0, 0});
    REQUIRE(cs.size() == 4);

    cs.consume(Vec3{20, 0, 0});
    check_points(cs, {Vec3{0, 0, 0}, Vec3{21, 0, 0}});
}

TEST_CASE("pruning drops points strictly inside placed boxes only", "[candidates]") {
    CandidateSet cs(Container{100, 100, 100});
    cs.add(Vec3{5, 5, 5});
    cs.add(Vec3{10, 5, 5});
    cs.add(Vec3{50, 50, 50});

    BoxIndex index(10.0);
    index.insert(box_at(Vec3{0, 0, 0}, Extents{10, 10, 10}));
    cs.prune(index);

    check_points(cs, {Vec3{0, 0, 0}, Vec3{10, 5, 5}, Vec3{50, 50, 50}});
}

TEST_CASE("no point stays strictly inside a placed box across a placement sequence", "[candidates]") {
    const Container c{40, 30, 40};
    CandidateSet cs(c);
    BoxIndex index(8.0);
    const std::vector<Extents> shapes{
        Extents{12, 6, 10}, Extents{7, 9, 15}, Extents{20, 4, 8}, Extents{5, 5, 5}, Extents{14, 10, 6},
    };

    int placed = 0;
    for (int step = 0; step < 30; ++step) {
        const Extents& e = shapes[static_cast<std::size_t>(step) % shapes.size()];
        bool found = false;
        Vec3 at;
        for (const auto& p : cs.points()) {
            const Box3 b = box_at(p, e);
            if (b.max.x <= c.width && b.max.y <= c.height && b.max.z <= c.depth && !index.overlaps_any(b, 1e-9)) {
                at = p;
                found = true;
                break;
            }
        }
        if (!found) {
            continue;
        }
        index.insert(box_at(at, e));
        cs.on_placed(at, e, index);
        ++placed;

        for (const auto& q : cs.points()) {
            for (int id = 0; id < index.size(); ++id) {
                INFO("after placement " << placed << ", point (" << q.x << "," << q.y << "," << q.z << ") vs box "
                                        << id);
                CHECK_FALSE(point_inside_strict(q, index.box(id), 1e-9));
            }
        }
    }
    CHECK(placed >= 5);
}

TEST_CASE("negative options are rejected", "[candidates]") {
    CandidateSetOptions opt;
    opt.gap = -0.5;
    CHECK_THROWS_AS(CandidateSet(Container{10, 10, 10}, opt), std::invalid_argument);

    CandidateSetOptions tol;
    tol.dedupe_tolerance = -1.0;
    CHECK_THROWS_AS(CandidateSet(Container{10, 10, 10}, tol), std::invalid_argument);
}
