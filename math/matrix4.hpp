#ifndef INDOORGML_MATH_MATRIX4_HPP
#define INDOORGML_MATH_MATRIX4_HPP

#include "vec3.hpp"
#include <array>

namespace indoorgml {

// 4x4 matrix stored column-major: element (row, col) lives at m[col * 4 + row].
// Only affine transforms are expected; the bottom row is kept but
// multiply_by_point ignores it, the same way a rigid frame is applied.
class Matrix4 {
public:
    // Identity
    Matrix4();

    // Row-major argument order so literals read like the written matrix.
    Matrix4(double c0r0, double c1r0, double c2r0, double c3r0,
            double c0r1, double c1r1, double c2r1, double c3r1,
            double c0r2, double c1r2, double c2r2, double c3r2,
            double c0r3, double c1r3, double c2r3, double c3r3);

    static Matrix4 identity() { return Matrix4(); }

    // Rotation by `radians` about +z, counter-clockwise seen from above.
    static Matrix4 rotation_z(double radians);

    static Matrix4 translation(const Vec3& offset);

    // Frame whose columns are the given axes and origin.
    static Matrix4 from_axes(const Vec3& x_axis, const Vec3& y_axis,
                             const Vec3& z_axis, const Vec3& origin);

    double at(int row, int col) const { return m_[col * 4 + row]; }
    double& at(int row, int col) { return m_[col * 4 + row]; }

    Vec3 column(int col) const {
        return {at(0, col), at(1, col), at(2, col)};
    }

    // Applies the transform to the point (x, y, z, 1) and drops w.
    Vec3 multiply_by_point(const Vec3& point) const;

    // Applies only the upper-left 3x3 block.
    Vec3 multiply_by_vector(const Vec3& vector) const;

    Matrix4 operator*(const Matrix4& other) const;

    // Inverse of a rotation+translation matrix (transpose the rotation,
    // rotate back the translation). Not valid for scaled or sheared input.
    Matrix4 inverse_transformation() const;

    bool operator==(const Matrix4& other) const { return m_ == other.m_; }
    bool operator!=(const Matrix4& other) const { return !(*this == other); }

private:
    std::array<double, 16> m_;
};

}  // namespace indoorgml

#endif // INDOORGML_MATH_MATRIX4_HPP
