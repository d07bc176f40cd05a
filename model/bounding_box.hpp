#ifndef INDOORGML_MODEL_BOUNDING_BOX_HPP
#define INDOORGML_MODEL_BOUNDING_BOX_HPP

#include <math/vec3.hpp>
#include <cstddef>

namespace indoorgml {

// How the min/max accumulators start out.
//
// Zero reproduces the historical viewer: all six accumulators begin at 0, so
// a building lying entirely at positive coordinates keeps min at 0 instead of
// its real lower corner. The recentering origin (center_x, center_y, min_z)
// depends on this, so anchored output only matches older tooling in Zero mode.
enum class BoundsSeeding {
    Zero,
    FirstObservation
};

// Running axis-aligned bounds over every coordinate seen during extraction
class BoundingBox {
public:
    explicit BoundingBox(BoundsSeeding seeding = BoundsSeeding::Zero)
        : seeding_(seeding) {}

    void observe(double x, double y, double z);
    void observe(const Vec3& p) { observe(p.x, p.y, p.z); }

    double min_x() const { return min_.x; }
    double min_y() const { return min_.y; }
    double min_z() const { return min_.z; }
    double max_x() const { return max_.x; }
    double max_y() const { return max_.y; }
    double max_z() const { return max_.z; }

    const Vec3& min() const { return min_; }
    const Vec3& max() const { return max_; }

    double center_x() const { return (min_.x + max_.x) / 2.0; }
    double center_y() const { return (min_.y + max_.y) / 2.0; }

    size_t observed_count() const { return observed_count_; }
    BoundsSeeding seeding() const { return seeding_; }

private:
    BoundsSeeding seeding_;
    Vec3 min_ = vec3::zero();
    Vec3 max_ = vec3::zero();
    size_t observed_count_ = 0;
};

}  // namespace indoorgml

#endif // INDOORGML_MODEL_BOUNDING_BOX_HPP
