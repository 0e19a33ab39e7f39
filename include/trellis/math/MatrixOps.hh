#pragma once

// Transform engine over both matrix representations.
//
// Every operation is implemented once on the structured Matrix. Calls made
// with a PackedMatrix decode, compute and re-encode; queries that return a
// scalar (determinant, get, approxEqual) skip the re-encode. Builders and
// constants take the output representation as a template argument and
// produce PackedMatrix unless asked otherwise:
//
//   auto gpu = buildTranslation(10.0, 20.0);               // PackedMatrix
//   auto cpu = buildTranslation<Matrix>(10.0, 20.0);       // Matrix
//   auto m   = rotate(translate(gpu, 1.0, 2.0), 0.5);      // PackedMatrix

#include "trellis/math/Matrix.hh"
#include "trellis/math/PackedMatrix.hh"
#include "trellis/utils/ErrorHandling.hh"

#include <initializer_list>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

namespace trellis::math {

namespace detail {

template <typename M>
inline constexpr bool kIsRepresentation = std::is_same_v<M, Matrix> || std::is_same_v<M, PackedMatrix>;

inline const Matrix& decode(const Matrix& m) {
    return m;
}

inline Matrix decode(const PackedMatrix& m) {
    return toStructured(m);
}

template <typename Out> Out encode(const Matrix& m) {
    static_assert(kIsRepresentation<Out>, "output must be Matrix or PackedMatrix");
    if constexpr (std::is_same_v<Out, PackedMatrix>) {
        return toPacked(m);
    } else {
        return m;
    }
}

} // namespace detail

// --- Constants ---

template <typename Out = PackedMatrix> const Out& zero() {
    static_assert(detail::kIsRepresentation<Out>, "output must be Matrix or PackedMatrix");
    return Out::zero();
}

template <typename Out = PackedMatrix> const Out& identity() {
    static_assert(detail::kIsRepresentation<Out>, "output must be Matrix or PackedMatrix");
    return Out::identity();
}

// --- Builders ---

template <typename Out = PackedMatrix> Out build(const glm::dvec2& v0, const glm::dvec2& v1) {
    return detail::encode<Out>(Matrix::build(v0, v1));
}

template <typename Out = PackedMatrix> Out build(const glm::dvec3& v0, const glm::dvec3& v1, const glm::dvec3& v2) {
    return detail::encode<Out>(Matrix::build(v0, v1, v2));
}

template <typename Out = PackedMatrix>
Out build(const glm::dvec4& v0, const glm::dvec4& v1, const glm::dvec4& v2, const glm::dvec4& v3) {
    return detail::encode<Out>(Matrix::build(v0, v1, v2, v3));
}

template <typename Out = PackedMatrix> Out buildTranslation(double x, double y, double z = 0.0) {
    return detail::encode<Out>(Matrix::translation(x, y, z));
}

template <typename Out = PackedMatrix> Out buildTranslation(const glm::dvec2& v) {
    return buildTranslation<Out>(v.x, v.y, 0.0);
}

template <typename Out = PackedMatrix> Out buildTranslation(const glm::dvec3& v) {
    return buildTranslation<Out>(v.x, v.y, v.z);
}

// Uniform scale
template <typename Out = PackedMatrix> Out buildScale(double s) {
    return detail::encode<Out>(Matrix::scaling(s, s, s));
}

template <typename Out = PackedMatrix> Out buildScale(double x, double y, double z = 1.0) {
    return detail::encode<Out>(Matrix::scaling(x, y, z));
}

template <typename Out = PackedMatrix> Out buildScale(const glm::dvec2& v) {
    return buildScale<Out>(v.x, v.y, 1.0);
}

template <typename Out = PackedMatrix> Out buildScale(const glm::dvec3& v) {
    return buildScale<Out>(v.x, v.y, v.z);
}

template <typename Out = PackedMatrix> Out buildRotation(double radians, Axis axis = Axis::Z) {
    return detail::encode<Out>(Matrix::rotation(radians, axis));
}

template <typename Out = PackedMatrix> Out buildRotation(const std::pair<double, Axis>& rotation) {
    return buildRotation<Out>(rotation.first, rotation.second);
}

template <typename Out = PackedMatrix>
Out buildRotateAround(double radians, const glm::dvec3& point, Axis axis = Axis::Z) {
    return detail::encode<Out>(Matrix::rotationAround(radians, point, axis));
}

template <typename Out = PackedMatrix>
Out buildRotateAround(double radians, const glm::dvec2& point, Axis axis = Axis::Z) {
    return buildRotateAround<Out>(radians, glm::dvec3(point.x, point.y, 0.0), axis);
}

// --- Composition ---

template <typename M> M multiply(const M& a, const M& b) {
    static_assert(detail::kIsRepresentation<M>, "operand must be Matrix or PackedMatrix");
    return detail::encode<M>(detail::decode(a) * detail::decode(b));
}

template <typename M> M multiply(const M& a, double scalar) {
    static_assert(detail::kIsRepresentation<M>, "operand must be Matrix or PackedMatrix");
    return detail::encode<M>(detail::decode(a) * scalar);
}

// Left fold from identity; an empty list yields identity
template <typename M> M multiply(const std::vector<M>& matrices) {
    static_assert(detail::kIsRepresentation<M>, "operand must be Matrix or PackedMatrix");
    Matrix acc = Matrix::identity();
    for (const auto& m : matrices)
        acc = acc * detail::decode(m);
    return detail::encode<M>(acc);
}

template <typename M> M multiply(std::initializer_list<M> matrices) {
    static_assert(detail::kIsRepresentation<M>, "operand must be Matrix or PackedMatrix");
    return multiply(std::vector<M>(matrices));
}

template <typename M> M add(const M& a, const M& b) {
    static_assert(detail::kIsRepresentation<M>, "operand must be Matrix or PackedMatrix");
    return detail::encode<M>(detail::decode(a) + detail::decode(b));
}

template <typename M> M subtract(const M& a, const M& b) {
    static_assert(detail::kIsRepresentation<M>, "operand must be Matrix or PackedMatrix");
    return detail::encode<M>(detail::decode(a) - detail::decode(b));
}

// IEEE semantics: dividing by 0.0 yields infinities or NaN, not an error
template <typename M> M divide(const M& a, double scalar) {
    static_assert(detail::kIsRepresentation<M>, "operand must be Matrix or PackedMatrix");
    return detail::encode<M>(detail::decode(a) / scalar);
}

// --- Transform shorthands: m * build...(...) ---

template <typename M> M rotate(const M& m, std::optional<double> radians, Axis axis = Axis::Z) {
    static_assert(detail::kIsRepresentation<M>, "operand must be Matrix or PackedMatrix");
    if (!radians)
        return m;
    return detail::encode<M>(detail::decode(m) * Matrix::rotation(*radians, axis));
}

template <typename M> M rotate(const M& m, const std::pair<double, Axis>& rotation) {
    static_assert(detail::kIsRepresentation<M>, "operand must be Matrix or PackedMatrix");
    return rotate(m, std::optional<double>(rotation.first), rotation.second);
}

template <typename M> M translate(const M& m, double x, double y, double z = 0.0) {
    static_assert(detail::kIsRepresentation<M>, "operand must be Matrix or PackedMatrix");
    return detail::encode<M>(detail::decode(m) * Matrix::translation(x, y, z));
}

template <typename M> M translate(const M& m, const glm::dvec2& v) {
    static_assert(detail::kIsRepresentation<M>, "operand must be Matrix or PackedMatrix");
    return translate(m, v.x, v.y, 0.0);
}

template <typename M> M translate(const M& m, const glm::dvec3& v) {
    static_assert(detail::kIsRepresentation<M>, "operand must be Matrix or PackedMatrix");
    return translate(m, v.x, v.y, v.z);
}

template <typename M> M translate(const M& m, const std::optional<glm::dvec3>& v) {
    static_assert(detail::kIsRepresentation<M>, "operand must be Matrix or PackedMatrix");
    if (!v)
        return m;
    return translate(m, v->x, v->y, v->z);
}

template <typename M> M scale(const M& m, double s) {
    static_assert(detail::kIsRepresentation<M>, "operand must be Matrix or PackedMatrix");
    return detail::encode<M>(detail::decode(m) * Matrix::scaling(s, s, s));
}

template <typename M> M scale(const M& m, double x, double y, double z = 1.0) {
    static_assert(detail::kIsRepresentation<M>, "operand must be Matrix or PackedMatrix");
    return detail::encode<M>(detail::decode(m) * Matrix::scaling(x, y, z));
}

template <typename M> M scale(const M& m, const glm::dvec2& v) {
    static_assert(detail::kIsRepresentation<M>, "operand must be Matrix or PackedMatrix");
    return scale(m, v.x, v.y, 1.0);
}

template <typename M> M scale(const M& m, const glm::dvec3& v) {
    static_assert(detail::kIsRepresentation<M>, "operand must be Matrix or PackedMatrix");
    return scale(m, v.x, v.y, v.z);
}

template <typename M> M scale(const M& m, const std::optional<glm::dvec3>& v) {
    static_assert(detail::kIsRepresentation<M>, "operand must be Matrix or PackedMatrix");
    if (!v)
        return m;
    return scale(m, v->x, v->y, v->z);
}

// Uniform factor; pass a typed optional, a bare std::nullopt is ambiguous here
template <typename M> M scale(const M& m, std::optional<double> s) {
    static_assert(detail::kIsRepresentation<M>, "operand must be Matrix or PackedMatrix");
    if (!s)
        return m;
    return scale(m, *s);
}

// --- Queries ---

template <typename M> double get(const M& m, int col, int row) {
    static_assert(detail::kIsRepresentation<M>, "operand must be Matrix or PackedMatrix");
    return detail::decode(m).get(col, row);
}

template <typename M> glm::dvec2 getTranslationXY(const M& m) {
    static_assert(detail::kIsRepresentation<M>, "operand must be Matrix or PackedMatrix");
    const Matrix& s = detail::decode(m);
    return glm::dvec2(s.get(3, 0), s.get(3, 1));
}

template <typename M> glm::dvec3 getTranslationXYZ(const M& m) {
    static_assert(detail::kIsRepresentation<M>, "operand must be Matrix or PackedMatrix");
    const Matrix& s = detail::decode(m);
    return glm::dvec3(s.get(3, 0), s.get(3, 1), s.get(3, 2));
}

template <typename M> M put(const M& m, int col, int row, double value) {
    static_assert(detail::kIsRepresentation<M>, "operand must be Matrix or PackedMatrix");
    return detail::encode<M>(detail::decode(m).put(col, row, value));
}

template <typename M> M transpose(const M& m) {
    static_assert(detail::kIsRepresentation<M>, "operand must be Matrix or PackedMatrix");
    return detail::encode<M>(detail::decode(m).transpose());
}

// True iff every cell differs by strictly less than tolerance
template <typename M> bool approxEqual(const M& a, const M& b, double tolerance = kDefaultTolerance) {
    static_assert(detail::kIsRepresentation<M>, "operand must be Matrix or PackedMatrix");
    return detail::decode(a).isApprox(detail::decode(b), tolerance);
}

// --- Inversion ---

template <typename M> double determinant(const M& m) {
    static_assert(detail::kIsRepresentation<M>, "operand must be Matrix or PackedMatrix");
    return detail::decode(m).determinant();
}

template <typename M> M adjugate(const M& m) {
    static_assert(detail::kIsRepresentation<M>, "operand must be Matrix or PackedMatrix");
    return detail::encode<M>(detail::decode(m).adjugate());
}

template <typename M> Result<M> invert(const M& m) {
    static_assert(detail::kIsRepresentation<M>, "operand must be Matrix or PackedMatrix");
    auto inverse = detail::decode(m).inverse();
    if (inverse.isError())
        return Result<M>::error(inverse.code(), inverse.message());
    return Result<M>::ok(detail::encode<M>(inverse.value()));
}

extern template Matrix multiply<Matrix>(const Matrix&, const Matrix&);
extern template PackedMatrix multiply<PackedMatrix>(const PackedMatrix&, const PackedMatrix&);
extern template Result<Matrix> invert<Matrix>(const Matrix&);
extern template Result<PackedMatrix> invert<PackedMatrix>(const PackedMatrix&);

} // namespace trellis::math
