#include "utils/Matrix3.hpp"

#include <cmath>
#include <stdexcept>

Matrix3::Matrix3() : m_elements_ {1, 0, 0, 0, 1, 0, 0, 0, 1} {}

Matrix3::Matrix3(const Elements& elements) : m_elements_(elements) {}

Matrix3 Matrix3::Identity()
{
    return Matrix3();
}

Matrix3 Matrix3::Orthographic(double width, double height)
{
    if (width == 0 || height == 0) {
        throw std::invalid_argument("Matrix3::Orthographic: width and height must be non-zero");
    }
    // clang-format off
    return Matrix3({
        2 / width, 0, 0,
        0, -2 / height, 0,
        -1, 1, 1,
    });
    // clang-format on
}

Matrix3 Matrix3::Translation(double x, double y)
{
    return Matrix3({1, 0, 0, 0, 1, 0, x, y, 1});
}

Matrix3 Matrix3::Scaling(double x, double y)
{
    return Matrix3({x, 0, 0, 0, y, 0, 0, 0, 1});
}

Matrix3 Matrix3::Rotation(double radians)
{
    double const c = std::cos(radians);
    double const s = std::sin(radians);
    return Matrix3({c, -s, 0, s, c, 0, 0, 0, 1});
}

std::array<float, 9> Matrix3::ToFloatArray() const
{
    std::array<float, 9> out {};
    for (size_t i = 0; i < out.size(); ++i) {
        out[i] = static_cast<float>(m_elements_[i]);
    }
    return out;
}

Vec2 Matrix3::Transform(const Vec2& vec) const
{
    const Elements& e = m_elements_;
    double const x = (vec.x_ax * e[0]) + (vec.y_ax * e[3]) + e[6];
    double const y = (vec.x_ax * e[1]) + (vec.y_ax * e[4]) + e[7];
    return {x, y};
}

std::vector<Vec2> Matrix3::TransformAll(const std::vector<Vec2>& vecs) const
{
    std::vector<Vec2> out;
    out.reserve(vecs.size());
    for (const Vec2& v : vecs) {
        out.push_back(Transform(v));
    }
    return out;
}

Matrix3& Matrix3::MultiplySelf(const Matrix3& b)
{
    const Elements a = m_elements_;
    const Elements& be = b.m_elements_;

    for (int row = 0; row < 3; ++row) {
        for (int col = 0; col < 3; ++col) {
            m_elements_[(row * 3) + col] = (be[(row * 3) + 0] * a[0 + col]) + (be[(row * 3) + 1] * a[3 + col]) + (be[(row * 3) + 2] * a[6 + col]);
        }
    }
    return *this;
}

Matrix3 Matrix3::Multiply(const Matrix3& b) const
{
    Matrix3 copy(*this);
    copy.MultiplySelf(b);
    return copy;
}

Matrix3 Matrix3::Inverse() const
{
    const Elements& e = m_elements_;
    double const a00 = e[0], a01 = e[1], a02 = e[2];
    double const a10 = e[3], a11 = e[4], a12 = e[5];
    double const a20 = e[6], a21 = e[7], a22 = e[8];

    double const b01 = (a22 * a11) - (a12 * a21);
    double const b11 = (-a22 * a10) + (a12 * a20);
    double const b21 = (a21 * a10) - (a11 * a20);

    double const det = (a00 * b01) + (a01 * b11) + (a02 * b21);
    if (det == 0.0) {
        throw std::domain_error("Matrix3::Inverse: matrix is singular");
    }
    double const inv_det = 1.0 / det;

    return Matrix3({
        b01 * inv_det,
        ((-a22 * a01) + (a02 * a21)) * inv_det,
        ((a12 * a01) - (a02 * a11)) * inv_det,
        b11 * inv_det,
        ((a22 * a00) - (a02 * a20)) * inv_det,
        ((-a12 * a00) + (a02 * a10)) * inv_det,
        b21 * inv_det,
        ((-a21 * a00) + (a01 * a20)) * inv_det,
        ((a11 * a00) - (a01 * a10)) * inv_det,
    });
}

Matrix3& Matrix3::TranslateSelf(double x, double y)
{
    return MultiplySelf(Translation(x, y));
}

Matrix3 Matrix3::Translate(double x, double y) const
{
    return Multiply(Translation(x, y));
}

Matrix3& Matrix3::ScaleSelf(double x, double y)
{
    return MultiplySelf(Scaling(x, y));
}

Matrix3 Matrix3::Scale(double x, double y) const
{
    return Multiply(Scaling(x, y));
}

Matrix3& Matrix3::RotateSelf(double radians)
{
    return MultiplySelf(Rotation(radians));
}

Matrix3 Matrix3::Rotate(double radians) const
{
    return Multiply(Rotation(radians));
}

Vec2 Matrix3::AbsoluteTranslation() const
{
    return Transform(Vec2(0, 0));
}

Angle Matrix3::AbsoluteRotation() const
{
    Vec2 const p0 = Transform(Vec2(0, 0));
    Vec2 const p1 = Transform(Vec2(1, 0));
    return Angle((p1 - p0).AngleOf()).Normalize();
}
