#include "matrix4.hpp"
#include <cmath>

namespace indoorgml {

Matrix4::Matrix4()
    : m_{1.0, 0.0, 0.0, 0.0,
         0.0, 1.0, 0.0, 0.0,
         0.0, 0.0, 1.0, 0.0,
         0.0, 0.0, 0.0, 1.0} {
}

Matrix4::Matrix4(double c0r0, double c1r0, double c2r0, double c3r0,
                 double c0r1, double c1r1, double c2r1, double c3r1,
                 double c0r2, double c1r2, double c2r2, double c3r2,
                 double c0r3, double c1r3, double c2r3, double c3r3)
    : m_{c0r0, c0r1, c0r2, c0r3,
         c1r0, c1r1, c1r2, c1r3,
         c2r0, c2r1, c2r2, c2r3,
         c3r0, c3r1, c3r2, c3r3} {
}

Matrix4 Matrix4::rotation_z(double radians) {
    double c = std::cos(radians);
    double s = std::sin(radians);
    return Matrix4(c,  -s,  0.0, 0.0,
                   s,   c,  0.0, 0.0,
                   0.0, 0.0, 1.0, 0.0,
                   0.0, 0.0, 0.0, 1.0);
}

Matrix4 Matrix4::translation(const Vec3& offset) {
    return Matrix4(1.0, 0.0, 0.0, offset.x,
                   0.0, 1.0, 0.0, offset.y,
                   0.0, 0.0, 1.0, offset.z,
                   0.0, 0.0, 0.0, 1.0);
}

Matrix4 Matrix4::from_axes(const Vec3& x_axis, const Vec3& y_axis,
                           const Vec3& z_axis, const Vec3& origin) {
    return Matrix4(x_axis.x, y_axis.x, z_axis.x, origin.x,
                   x_axis.y, y_axis.y, z_axis.y, origin.y,
                   x_axis.z, y_axis.z, z_axis.z, origin.z,
                   0.0,      0.0,      0.0,      1.0);
}

Vec3 Matrix4::multiply_by_point(const Vec3& point) const {
    return {
        at(0, 0) * point.x + at(0, 1) * point.y + at(0, 2) * point.z + at(0, 3),
        at(1, 0) * point.x + at(1, 1) * point.y + at(1, 2) * point.z + at(1, 3),
        at(2, 0) * point.x + at(2, 1) * point.y + at(2, 2) * point.z + at(2, 3)
    };
}

Vec3 Matrix4::multiply_by_vector(const Vec3& vector) const {
    return {
        at(0, 0) * vector.x + at(0, 1) * vector.y + at(0, 2) * vector.z,
        at(1, 0) * vector.x + at(1, 1) * vector.y + at(1, 2) * vector.z,
        at(2, 0) * vector.x + at(2, 1) * vector.y + at(2, 2) * vector.z
    };
}

Matrix4 Matrix4::operator*(const Matrix4& other) const {
    Matrix4 result;
    for (int row = 0; row < 4; ++row) {
        for (int col = 0; col < 4; ++col) {
            double sum = 0.0;
            for (int k = 0; k < 4; ++k) {
                sum += at(row, k) * other.at(k, col);
            }
            result.at(row, col) = sum;
        }
    }
    return result;
}

Matrix4 Matrix4::inverse_transformation() const {
    Matrix4 result;
    // R^T
    for (int row = 0; row < 3; ++row) {
        for (int col = 0; col < 3; ++col) {
            result.at(row, col) = at(col, row);
        }
    }
    // -R^T * t
    Vec3 t = column(3);
    Vec3 inv_t = -result.multiply_by_vector(t);
    result.at(0, 3) = inv_t.x;
    result.at(1, 3) = inv_t.y;
    result.at(2, 3) = inv_t.z;
    return result;
}

}  // namespace indoorgml
