#pragma once

#include <array>
#include <vector>

#include "utils/Angle.hpp"
#include "utils/Vec2.hpp"

// 3x3 affine transform, stored row by row and applied to row vectors:
// [x y 1] * M. The translation lives in elements 6 and 7.
class Matrix3
{
public:
    using Elements = std::array<double, 9>;

    Matrix3();  // identity
    explicit Matrix3(const Elements& elements);

    static Matrix3 Identity();
    // Maps logical pixel space (origin top-left, y down) to normalized device coordinates.
    static Matrix3 Orthographic(double width, double height);
    static Matrix3 Translation(double x, double y);
    static Matrix3 Scaling(double x, double y);
    static Matrix3 Rotation(double radians);
    static Matrix3 Rotation(const Angle& angle) { return Rotation(angle.Radians()); }

    [[nodiscard]] const Elements& GetElements() const { return m_elements_; }
    [[nodiscard]] std::array<float, 9> ToFloatArray() const;

    [[nodiscard]] Vec2 Transform(const Vec2& vec) const;
    [[nodiscard]] std::vector<Vec2> TransformAll(const std::vector<Vec2>& vecs) const;

    // this = b * this, so b is applied before the existing transform.
    Matrix3& MultiplySelf(const Matrix3& b);
    [[nodiscard]] Matrix3 Multiply(const Matrix3& b) const;

    [[nodiscard]] Matrix3 Inverse() const;

    Matrix3& TranslateSelf(double x, double y);
    [[nodiscard]] Matrix3 Translate(double x, double y) const;
    Matrix3& ScaleSelf(double x, double y);
    [[nodiscard]] Matrix3 Scale(double x, double y) const;
    Matrix3& RotateSelf(double radians);
    [[nodiscard]] Matrix3 Rotate(double radians) const;

    [[nodiscard]] Vec2 AbsoluteTranslation() const;
    [[nodiscard]] Angle AbsoluteRotation() const;

    bool operator==(const Matrix3& other) const { return m_elements_ == other.m_elements_; }
    bool operator!=(const Matrix3& other) const { return !(*this == other); }

private:
    Elements m_elements_;
};
