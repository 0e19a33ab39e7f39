#include "trellis/math/Matrix.hh"
#include "trellis/core/Log.hh"

#include <cmath>
#include <string>

namespace trellis::math {

namespace {

constexpr std::array<double, Matrix::kCellCount> kIdentityCells = {
    1.0, 0.0, 0.0, 0.0, //
    0.0, 1.0, 0.0, 0.0, //
    0.0, 0.0, 1.0, 0.0, //
    0.0, 0.0, 0.0, 1.0,
};

} // namespace

std::string_view axisToString(Axis axis) {
    switch (axis) {
    case Axis::X:
        return "X";
    case Axis::Y:
        return "Y";
    case Axis::Z:
        return "Z";
    }
    return "Unknown";
}

Matrix::Matrix() : elements_(kIdentityCells) {}

const Matrix& Matrix::zero() {
    static const Matrix kZero(std::array<double, kCellCount>{});
    return kZero;
}

const Matrix& Matrix::identity() {
    static const Matrix kIdentity;
    return kIdentity;
}

Matrix Matrix::build(const glm::dvec2& v0, const glm::dvec2& v1) {
    return Matrix({
        v0.x, v0.y, 0.0, 0.0, //
        v1.x, v1.y, 0.0, 0.0, //
        0.0, 0.0, 1.0, 0.0,   //
        0.0, 0.0, 0.0, 1.0,
    });
}

Matrix Matrix::build(const glm::dvec3& v0, const glm::dvec3& v1, const glm::dvec3& v2) {
    return Matrix({
        v0.x, v0.y, v0.z, 0.0, //
        v1.x, v1.y, v1.z, 0.0, //
        v2.x, v2.y, v2.z, 0.0, //
        0.0, 0.0, 0.0, 1.0,
    });
}

Matrix Matrix::build(const glm::dvec4& v0, const glm::dvec4& v1, const glm::dvec4& v2, const glm::dvec4& v3) {
    return Matrix({
        v0.x, v0.y, v0.z, v0.w, //
        v1.x, v1.y, v1.z, v1.w, //
        v2.x, v2.y, v2.z, v2.w, //
        v3.x, v3.y, v3.z, v3.w,
    });
}

Matrix Matrix::translation(double x, double y, double z) {
    return Matrix({
        1.0, 0.0, 0.0, x, //
        0.0, 1.0, 0.0, y, //
        0.0, 0.0, 1.0, z, //
        0.0, 0.0, 0.0, 1.0,
    });
}

Matrix Matrix::scaling(double x, double y, double z) {
    return Matrix({
        x, 0.0, 0.0, 0.0, //
        0.0, y, 0.0, 0.0, //
        0.0, 0.0, z, 0.0, //
        0.0, 0.0, 0.0, 1.0,
    });
}

Matrix Matrix::rotation(double radians, Axis axis) {
    const double c = std::cos(radians);
    const double s = std::sin(radians);

    switch (axis) {
    case Axis::X:
        return Matrix({
            1.0, 0.0, 0.0, 0.0, //
            0.0, c, s, 0.0,     //
            0.0, -s, c, 0.0,    //
            0.0, 0.0, 0.0, 1.0,
        });
    case Axis::Y:
        return Matrix({
            c, 0.0, s, 0.0,     //
            0.0, 1.0, 0.0, 0.0, //
            -s, 0.0, c, 0.0,    //
            0.0, 0.0, 0.0, 1.0,
        });
    case Axis::Z:
        return Matrix({
            c, s, 0.0, 0.0,     //
            -s, c, 0.0, 0.0,    //
            0.0, 0.0, 1.0, 0.0, //
            0.0, 0.0, 0.0, 1.0,
        });
    }
    throwError("Unknown rotation axis: " + std::to_string(static_cast<int>(axis)));
}

Matrix Matrix::rotationAround(double radians, const glm::dvec3& point, Axis axis) {
    return translation(-point.x, -point.y, -point.z) * rotation(radians, axis) *
           translation(point.x, point.y, point.z);
}

size_t Matrix::indexOf(int col, int row) {
    if (col < 0 || col >= kDimension || row < 0 || row >= kDimension) {
        throwError("Matrix cell out of range: col " + std::to_string(col) + ", row " + std::to_string(row));
    }
    return static_cast<size_t>(row * kDimension + col);
}

double Matrix::get(int col, int row) const {
    return elements_[indexOf(col, row)];
}

Matrix Matrix::put(int col, int row, double value) const {
    Matrix result(*this);
    result.elements_[indexOf(col, row)] = value;
    return result;
}

Matrix Matrix::operator*(const Matrix& other) const {
    std::array<double, kCellCount> out{};

    for (int row = 0; row < kDimension; ++row) {
        for (int col = 0; col < kDimension; ++col) {
            double sum = elements_[row * 4] * other.elements_[col];
            for (int k = 1; k < kDimension; ++k) {
                sum += elements_[row * 4 + k] * other.elements_[k * 4 + col];
            }
            out[row * 4 + col] = sum;
        }
    }

    return Matrix(out);
}

Matrix Matrix::operator*(double scalar) const {
    std::array<double, kCellCount> out;
    for (size_t i = 0; i < kCellCount; ++i)
        out[i] = elements_[i] * scalar;
    return Matrix(out);
}

Matrix Matrix::operator/(double scalar) const {
    std::array<double, kCellCount> out;
    for (size_t i = 0; i < kCellCount; ++i)
        out[i] = elements_[i] / scalar;
    return Matrix(out);
}

Matrix Matrix::operator+(const Matrix& other) const {
    std::array<double, kCellCount> out;
    for (size_t i = 0; i < kCellCount; ++i)
        out[i] = elements_[i] + other.elements_[i];
    return Matrix(out);
}

Matrix Matrix::operator-(const Matrix& other) const {
    std::array<double, kCellCount> out;
    for (size_t i = 0; i < kCellCount; ++i)
        out[i] = elements_[i] - other.elements_[i];
    return Matrix(out);
}

Matrix Matrix::transpose() const {
    std::array<double, kCellCount> out;
    for (int row = 0; row < kDimension; ++row) {
        for (int col = 0; col < kDimension; ++col) {
            out[col * 4 + row] = elements_[row * 4 + col];
        }
    }
    return Matrix(out);
}

// aCR names the cell at column C, row R.
double Matrix::determinant() const {
    const auto& e = elements_;
    const double a00 = e[0], a10 = e[1], a20 = e[2], a30 = e[3];
    const double a01 = e[4], a11 = e[5], a21 = e[6], a31 = e[7];
    const double a02 = e[8], a12 = e[9], a22 = e[10], a32 = e[11];
    const double a03 = e[12], a13 = e[13], a23 = e[14], a33 = e[15];

    return (a00 * a11 * a22 * a33) + (a00 * a12 * a23 * a31) + (a00 * a13 * a21 * a32) +
           (a01 * a10 * a23 * a32) + (a01 * a12 * a20 * a33) + (a01 * a13 * a22 * a30) +
           (a02 * a10 * a21 * a33) + (a02 * a11 * a23 * a30) + (a02 * a13 * a20 * a31) +
           (a03 * a10 * a22 * a31) + (a03 * a11 * a20 * a32) + (a03 * a12 * a21 * a30) -
           (a00 * a11 * a23 * a32) - (a00 * a12 * a21 * a33) - (a00 * a13 * a22 * a31) -
           (a01 * a10 * a22 * a33) - (a01 * a12 * a23 * a30) - (a01 * a13 * a20 * a32) -
           (a02 * a10 * a23 * a31) - (a02 * a11 * a20 * a33) - (a02 * a13 * a21 * a30) -
           (a03 * a10 * a21 * a32) - (a03 * a11 * a22 * a30) - (a03 * a12 * a20 * a31);
}

Matrix Matrix::adjugate() const {
    const auto& e = elements_;
    const double a00 = e[0], a10 = e[1], a20 = e[2], a30 = e[3];
    const double a01 = e[4], a11 = e[5], a21 = e[6], a31 = e[7];
    const double a02 = e[8], a12 = e[9], a22 = e[10], a32 = e[11];
    const double a03 = e[12], a13 = e[13], a23 = e[14], a33 = e[15];

    // Cofactor matrix, laid out in storage order, then transposed.
    const Matrix cofactors({
        (a11 * a22 * a33) + (a12 * a23 * a31) + (a13 * a21 * a32) - (a11 * a23 * a32) - (a12 * a21 * a33) -
            (a13 * a22 * a31),
        (a01 * a23 * a32) + (a02 * a21 * a33) + (a03 * a22 * a31) - (a01 * a22 * a33) - (a02 * a23 * a31) -
            (a03 * a21 * a32),
        (a01 * a12 * a33) + (a02 * a13 * a31) + (a03 * a11 * a32) - (a01 * a13 * a32) - (a02 * a11 * a33) -
            (a03 * a12 * a31),
        (a01 * a13 * a22) + (a02 * a11 * a23) + (a03 * a12 * a21) - (a01 * a12 * a23) - (a02 * a13 * a21) -
            (a03 * a11 * a22),

        (a10 * a23 * a32) + (a12 * a20 * a33) + (a13 * a22 * a30) - (a10 * a22 * a33) - (a12 * a23 * a30) -
            (a13 * a20 * a32),
        (a00 * a22 * a33) + (a02 * a23 * a30) + (a03 * a20 * a32) - (a00 * a23 * a32) - (a02 * a20 * a33) -
            (a03 * a22 * a30),
        (a00 * a13 * a32) + (a02 * a10 * a33) + (a03 * a12 * a30) - (a00 * a12 * a33) - (a02 * a13 * a30) -
            (a03 * a10 * a32),
        (a00 * a12 * a23) + (a02 * a13 * a20) + (a03 * a10 * a22) - (a00 * a13 * a22) - (a02 * a10 * a23) -
            (a03 * a12 * a20),

        (a10 * a21 * a33) + (a11 * a23 * a30) + (a13 * a20 * a31) - (a10 * a23 * a31) - (a11 * a20 * a33) -
            (a13 * a21 * a30),
        (a00 * a23 * a31) + (a01 * a20 * a33) + (a03 * a21 * a30) - (a00 * a21 * a33) - (a01 * a23 * a30) -
            (a03 * a20 * a31),
        (a00 * a11 * a33) + (a01 * a13 * a30) + (a03 * a10 * a31) - (a00 * a13 * a31) - (a01 * a10 * a33) -
            (a03 * a11 * a30),
        (a00 * a13 * a21) + (a01 * a10 * a23) + (a03 * a11 * a20) - (a00 * a11 * a23) - (a01 * a13 * a20) -
            (a03 * a10 * a21),

        (a10 * a22 * a31) + (a11 * a20 * a32) + (a12 * a21 * a30) - (a10 * a21 * a32) - (a11 * a22 * a30) -
            (a12 * a20 * a31),
        (a00 * a21 * a32) + (a01 * a22 * a30) + (a02 * a20 * a31) - (a00 * a22 * a31) - (a01 * a20 * a32) -
            (a02 * a21 * a30),
        (a00 * a12 * a31) + (a01 * a10 * a32) + (a02 * a11 * a30) - (a00 * a11 * a32) - (a01 * a12 * a30) -
            (a02 * a10 * a31),
        (a00 * a11 * a22) + (a01 * a12 * a20) + (a02 * a10 * a21) - (a00 * a12 * a21) - (a01 * a10 * a22) -
            (a02 * a11 * a20),
    });

    return cofactors.transpose();
}

Result<Matrix> Matrix::inverse() const {
    const double det = determinant();
    if (det == 0.0) {
        TRELLIS_MATH_LOG_DEBUG("Refusing to invert singular matrix");
        return Result<Matrix>::error(ErrorCode::SingularMatrix, "Matrix has zero determinant");
    }
    return Result<Matrix>::ok(adjugate() * (1.0 / det));
}

bool Matrix::isApprox(const Matrix& other, double tolerance) const {
    for (size_t i = 0; i < kCellCount; ++i) {
        if (!(std::abs(elements_[i] - other.elements_[i]) < tolerance))
            return false;
    }
    return true;
}

glm::dmat4 toGlm(const Matrix& m) {
    glm::dmat4 out(1.0);
    for (int col = 0; col < Matrix::kDimension; ++col) {
        for (int row = 0; row < Matrix::kDimension; ++row) {
            out[col][row] = m.get(col, row);
        }
    }
    return out;
}

Matrix fromGlm(const glm::dmat4& m) {
    std::array<double, Matrix::kCellCount> out;
    for (int col = 0; col < Matrix::kDimension; ++col) {
        for (int row = 0; row < Matrix::kDimension; ++row) {
            out[row * 4 + col] = m[col][row];
        }
    }
    return Matrix(out);
}

} // namespace trellis::math
