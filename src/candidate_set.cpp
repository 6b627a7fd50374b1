#include "cargopack/candidate_set.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "cargopack/stable_order.hpp"

namespace cargopack {
namespace {

bool near_on_every_axis(const Vec3& a, const Vec3& b, double tol) {
    return std::abs(a.x - b.x) < tol && std::abs(a.y - b.y) < tol && std::abs(a.z - b.z) < tol;
}

}  // namespace

bool candidate_precedes(const Vec3& a, const Vec3& b, double tol) {
    if (std::abs(a.y - b.y) > tol) {
        return a.y < b.y;
    }
    if (std::abs(a.x - b.x) > tol) {
        return a.x < b.x;
    }
    return a.z < b.z;
}

CandidateSet::CandidateSet(const Container& container, const CandidateSetOptions& opt)
    : container_(container), opt_(opt), points_{Vec3{0.0, 0.0, 0.0}} {
    if (!(opt_.gap >= 0.0)) {
        throw std::invalid_argument("CandidateSet: gap must be >= 0");
    }
    if (!(opt_.order_tolerance >= 0.0) || !(opt_.dedupe_tolerance >= 0.0) || !(opt_.consume_tolerance >= 0.0)) {
        throw std::invalid_argument("CandidateSet: tolerances must be >= 0");
    }
}

bool CandidateSet::within_container(const Vec3& p) const {
    return p.x >= 0.0 && p.y >= 0.0 && p.z >= 0.0 && p.x < container_.width && p.y < container_.height &&
           p.z < container_.depth;
}

void CandidateSet::restore_order() {
    const double tol = opt_.order_tolerance;
    stable_insertion_sort(points_, [tol](const Vec3& a, const Vec3& b) { return candidate_precedes(a, b, tol); });
}

bool CandidateSet::add(const Vec3& p) {
    if (!within_container(p)) {
        return false;
    }
    for (const auto& q : points_) {
        if (near_on_every_axis(p, q, opt_.dedupe_tolerance)) {
            return false;
        }
    }
    points_.push_back(p);
    restore_order();
    return true;
}

void CandidateSet::consume(const Vec3& p) {
    const double tol = opt_.consume_tolerance;
    points_.erase(std::remove_if(points_.begin(),
                                 points_.end(),
                                 [&](const Vec3& q) {
                                     return std::abs(p.x - q.x) <= tol && std::abs(p.y - q.y) <= tol &&
                                            std::abs(p.z - q.z) <= tol;
                                 }),
                  points_.end());
}

void CandidateSet::expand_from(const Vec3& p, const Extents& e) {
    const double rx = e.dx + opt_.gap;
    const double uy = e.dy + opt_.gap;
    const double bz = e.dz + opt_.gap;

    add(Vec3{p.x + rx, p.y, p.z});
    add(Vec3{p.x, p.y + uy, p.z});
    add(Vec3{p.x, p.y, p.z + bz});
    if (opt_.diagonal_candidates) {
        add(Vec3{p.x + rx, p.y, p.z + bz});
        add(Vec3{p.x + rx, p.y + uy, p.z});
        add(Vec3{p.x, p.y + uy, p.z + bz});
    }
}

void CandidateSet::prune(const BoxIndex& placed) {
    const double eps = opt_.eps;
    points_.erase(std::remove_if(points_.begin(),
                                 points_.end(),
                                 [&](const Vec3& q) { return placed.contains_point_strict(q, eps); }),
                  points_.end());
}

void CandidateSet::on_placed(const Vec3& p, const Extents& e, const BoxIndex& placed) {
    consume(p);
    expand_from(p, e);
    prune(placed);
}

}  // namespace cargopack
