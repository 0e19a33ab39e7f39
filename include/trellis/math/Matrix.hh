#pragma once

#include "trellis/utils/ErrorHandling.hh"
#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include <glm/glm.hpp>

namespace trellis::math {

// Rotation axis for the single-axis rotation builders
enum class Axis : uint8_t { X, Y, Z };

std::string_view axisToString(Axis axis);

// Default absolute per-cell tolerance for approximate comparison
inline constexpr double kDefaultTolerance = 1e-6;

/**
 * @brief Structured 4x4 homogeneous transform of 64-bit floats
 *
 * Cells are addressed as (col, row) in math terms: translation lives in
 * column 3 and the product is the textbook one. Storage is a flat array of
 * four lanes, elements[row * 4 + col], which is also the packed byte order.
 *
 * Immutable: every operation that looks like a mutation returns a new value.
 */
class Matrix {
  public:
    static constexpr int kDimension = 4;
    static constexpr size_t kCellCount = 16;

    // Identity matrix by default
    Matrix();

    explicit Matrix(const std::array<double, kCellCount>& data) : elements_(data) {}

    static const Matrix& zero();
    static const Matrix& identity();

    // Builders from 2, 3 or 4 lane vectors; lane k receives vector k and
    // everything not supplied keeps its identity value.
    static Matrix build(const glm::dvec2& v0, const glm::dvec2& v1);
    static Matrix build(const glm::dvec3& v0, const glm::dvec3& v1, const glm::dvec3& v2);
    static Matrix build(const glm::dvec4& v0, const glm::dvec4& v1, const glm::dvec4& v2, const glm::dvec4& v3);

    static Matrix translation(double x, double y, double z);
    static Matrix scaling(double x, double y, double z);

    // X and Z place +sin above the diagonal, Y below it. Renderers depend on
    // this exact layout; do not flip it to the textbook form.
    static Matrix rotation(double radians, Axis axis);

    // translate(-point) * rotate * translate(point)
    static Matrix rotationAround(double radians, const glm::dvec3& point, Axis axis);

    // Element access, col and row in [0, 3]. Throws on anything else.
    double get(int col, int row) const;
    Matrix put(int col, int row, double value) const;

    const std::array<double, kCellCount>& elements() const { return elements_; }

    Matrix operator*(const Matrix& other) const;
    Matrix operator*(double scalar) const;
    Matrix operator/(double scalar) const;
    Matrix operator+(const Matrix& other) const;
    Matrix operator-(const Matrix& other) const;

    bool operator==(const Matrix& other) const = default;

    Matrix transpose() const;

    // Full 24-term cofactor expansion
    double determinant() const;

    // Transpose of the cofactor matrix
    Matrix adjugate() const;

    // Fails with ErrorCode::SingularMatrix when the determinant is exactly 0.0
    Result<Matrix> inverse() const;

    bool isApprox(const Matrix& other, double tolerance = kDefaultTolerance) const;

  private:
    static size_t indexOf(int col, int row);

    std::array<double, kCellCount> elements_;
};

// glm stores m[col][row]; the transform is preserved, not the byte layout.
glm::dmat4 toGlm(const Matrix& m);
Matrix fromGlm(const glm::dmat4& m);

} // namespace trellis::math
