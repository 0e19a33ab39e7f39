#include "trellis/math/PackedMatrix.hh"
#include "trellis/codec/Codec.hh"

#include <algorithm>
#include <string>

namespace trellis::math {

namespace {

void requirePackedSize(size_t size) {
    if (size != PackedMatrix::kByteSize) {
        throwError("Packed matrix must be " + std::to_string(PackedMatrix::kByteSize) + " bytes, got " +
                   std::to_string(size));
    }
}

} // namespace

PackedMatrix::PackedMatrix() : bytes_(identity().bytes_) {}

PackedMatrix PackedMatrix::fromBytes(std::span<const uint8_t> bytes) {
    requirePackedSize(bytes.size());
    std::array<uint8_t, kByteSize> out;
    std::copy(bytes.begin(), bytes.end(), out.begin());
    return PackedMatrix(out);
}

const PackedMatrix& PackedMatrix::zero() {
    static const PackedMatrix kZero = toPacked(Matrix::zero());
    return kZero;
}

const PackedMatrix& PackedMatrix::identity() {
    static const PackedMatrix kIdentity = toPacked(Matrix::identity());
    return kIdentity;
}

PackedMatrix toPacked(const Matrix& m) {
    codec::ByteWriter writer(PackedMatrix::kByteSize);
    for (double cell : m.elements())
        writer.writeF64LE(cell);
    return PackedMatrix::fromBytes(writer.data());
}

Matrix toStructured(const PackedMatrix& packed) {
    codec::ByteReader reader(packed.span());
    std::array<double, Matrix::kCellCount> cells;
    for (auto& cell : cells)
        cell = reader.readF64LE();
    return Matrix(cells);
}

Matrix toStructured(std::span<const uint8_t> bytes) {
    return toStructured(PackedMatrix::fromBytes(bytes));
}

} // namespace trellis::math
