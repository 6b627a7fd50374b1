#pragma once

#include <vector>

#include "cargopack/box_index.hpp"
#include "cargopack/cargo.hpp"
#include "cargopack/geometry.hpp"

namespace cargopack {

struct CandidateSetOptions {
    // Clearance added to every generated offset (0 reproduces exact face contact).
    double gap = 0.5;

    // Also generate the right+back, right+up and up+back corners of each placement.
    bool diagonal_candidates = true;

    // y and x differences at or below this count as ties when ordering.
    double order_tolerance = 0.1;

    // A new point within this distance of an existing one on every axis is dropped.
    double dedupe_tolerance = 1.0;

    // Consuming a point also removes neighbours within this distance on every axis.
    double consume_tolerance = 0.5;

    double eps = 1e-9;
};

// Bottom-left-front ordering: lowest y, then lowest x, then lowest z.
bool candidate_precedes(const Vec3& a, const Vec3& b, double tol);

// Frontier points where the next item may start. Kept in bottom-left-front order.
class CandidateSet {
public:
    explicit CandidateSet(const Container& container, const CandidateSetOptions& opt = {});

    // Ordered view; invalidated by any mutation.
    const std::vector<Vec3>& points() const { return points_; }
    int size() const { return static_cast<int>(points_.size()); }
    bool empty() const { return points_.empty(); }

    const CandidateSetOptions& options() const { return opt_; }

    // Adds `p` if it lies inside the container and is not a near-duplicate. Returns true if added.
    bool add(const Vec3& p);

    // Removes `p` and every point within consume_tolerance of it.
    void consume(const Vec3& p);

    // Generates the push-right / stack-up / push-back points (plus diagonals) for a placed box.
    void expand_from(const Vec3& p, const Extents& e);

    // Drops every point strictly inside a box of `placed`.
    void prune(const BoxIndex& placed);

    // consume + expand_from + prune, the bookkeeping done after each placement.
    void on_placed(const Vec3& p, const Extents& e, const BoxIndex& placed);

private:
    Container container_;
    CandidateSetOptions opt_;
    std::vector<Vec3> points_;

    bool within_container(const Vec3& p) const;
    void restore_order();
};

}  // namespace cargopack
