#pragma once

#include "trellis/math/Matrix.hh"
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace trellis::math {

/**
 * @brief Fixed 128-byte wire form of a Matrix
 *
 * Sixteen little-endian IEEE-754 binary64 values in Matrix storage order.
 * The buffer can be handed to a uniform upload as-is.
 */
class PackedMatrix {
  public:
    static constexpr size_t kByteSize = Matrix::kCellCount * sizeof(double);

    // Packed identity by default
    PackedMatrix();

    // Throws TrellisException unless bytes.size() == kByteSize
    static PackedMatrix fromBytes(std::span<const uint8_t> bytes);

    static const PackedMatrix& zero();
    static const PackedMatrix& identity();

    const uint8_t* data() const { return bytes_.data(); }
    size_t size() const { return bytes_.size(); }
    std::span<const uint8_t> span() const { return {bytes_.data(), bytes_.size()}; }
    const std::array<uint8_t, kByteSize>& bytes() const { return bytes_; }

    bool operator==(const PackedMatrix& other) const = default;

  private:
    explicit PackedMatrix(const std::array<uint8_t, kByteSize>& bytes) : bytes_(bytes) {}

    std::array<uint8_t, kByteSize> bytes_;
};

static_assert(PackedMatrix::kByteSize == 128, "packed matrix must be 128 bytes");

PackedMatrix toPacked(const Matrix& m);
Matrix toStructured(const PackedMatrix& packed);

// Decodes a raw buffer; throws TrellisException unless it is exactly 128 bytes
Matrix toStructured(std::span<const uint8_t> bytes);

} // namespace trellis::math
