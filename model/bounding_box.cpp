#include "bounding_box.hpp"

namespace indoorgml {

namespace {

// Max is tested first; min only when the value did not raise the max.
void update_axis(double value, double& min_value, double& max_value) {
    if (value > max_value) {
        max_value = value;
    } else if (value < min_value) {
        min_value = value;
    }
}

}  // namespace

void BoundingBox::observe(double x, double y, double z) {
    if (observed_count_ == 0 && seeding_ == BoundsSeeding::FirstObservation) {
        min_ = Vec3(x, y, z);
        max_ = min_;
        ++observed_count_;
        return;
    }

    update_axis(x, min_.x, max_.x);
    update_axis(y, min_.y, max_.y);
    update_axis(z, min_.z, max_.z);
    ++observed_count_;
}

}  // namespace indoorgml
