#include "trellis/math/PackedMatrix.hh"
#include "trellis/codec/Codec.hh"
#include "trellis/utils/ErrorHandling.hh"
#include <gtest/gtest.h>
#include <bit>
#include <cmath>
#include <cstdint>
#include <limits>
#include <random>
#include <string>
#include <vector>

using namespace trellis;
using namespace trellis::math;

namespace {

Matrix randomMatrix(std::mt19937_64& rng) {
    std::uniform_real_distribution<double> dist(-1.0e6, 1.0e6);
    std::array<double, Matrix::kCellCount> cells;
    for (auto& cell : cells)
        cell = dist(rng);
    return Matrix(cells);
}

bool bitwiseEqual(const Matrix& a, const Matrix& b) {
    for (size_t i = 0; i < Matrix::kCellCount; ++i) {
        if (std::bit_cast<uint64_t>(a.elements()[i]) != std::bit_cast<uint64_t>(b.elements()[i]))
            return false;
    }
    return true;
}

} // namespace

TEST(PackedMatrixTest, Is128Bytes) {
    PackedMatrix p;
    EXPECT_EQ(p.size(), 128u);
    EXPECT_EQ(p.span().size(), 128u);
    EXPECT_EQ(sizeof(p.bytes()), 128u);
}

TEST(PackedMatrixTest, DefaultIsPackedIdentity) {
    PackedMatrix p;
    EXPECT_EQ(p, PackedMatrix::identity());
    EXPECT_EQ(toStructured(p), Matrix::identity());
}

TEST(PackedMatrixTest, ZeroIsAllZeroBytes) {
    for (uint8_t b : PackedMatrix::zero().bytes())
        EXPECT_EQ(b, 0u);
    EXPECT_EQ(toStructured(PackedMatrix::zero()), Matrix::zero());
}

TEST(PackedMatrixTest, CellsFollowStorageOrderLittleEndian) {
    PackedMatrix p = toPacked(Matrix::translation(10.0, 20.0, 30.0));

    // Cell k occupies bytes [8k, 8k + 8): translation x is cell 3.
    codec::ByteReader reader(p.span());
    std::vector<double> cells;
    while (reader.remaining() > 0)
        cells.push_back(reader.readF64LE());

    ASSERT_EQ(cells.size(), 16u);
    EXPECT_EQ(cells[0], 1.0);
    EXPECT_EQ(cells[3], 10.0);
    EXPECT_EQ(cells[7], 20.0);
    EXPECT_EQ(cells[11], 30.0);
    EXPECT_EQ(cells[15], 1.0);

    // 1.0 at cell 0: 0x3FF0000000000000 little-endian
    EXPECT_EQ(p.data()[6], 0xF0);
    EXPECT_EQ(p.data()[7], 0x3F);
}

TEST(PackedMatrixTest, RoundTripIsBitwiseExact) {
    std::mt19937_64 rng(0xC0FFEE);
    for (int i = 0; i < 64; ++i) {
        Matrix m = randomMatrix(rng);
        EXPECT_TRUE(bitwiseEqual(toStructured(toPacked(m)), m));
    }
}

TEST(PackedMatrixTest, NonFiniteBitPatternsSurvive) {
    const double quietNaN = std::bit_cast<double>(0x7FF8000000001234ULL);
    Matrix m = Matrix()
                   .put(0, 0, quietNaN)
                   .put(1, 0, std::numeric_limits<double>::infinity())
                   .put(2, 0, -std::numeric_limits<double>::infinity())
                   .put(3, 0, -0.0)
                   .put(0, 1, std::numeric_limits<double>::denorm_min());

    Matrix back = toStructured(toPacked(m));
    EXPECT_TRUE(bitwiseEqual(back, m));
    EXPECT_TRUE(std::signbit(back.get(3, 0)));
}

TEST(PackedMatrixTest, FromBytesRoundTrip) {
    PackedMatrix p = toPacked(Matrix::scaling(2.0, 3.0, 4.0));
    std::vector<uint8_t> raw(p.data(), p.data() + p.size());

    PackedMatrix copy = PackedMatrix::fromBytes(raw);
    EXPECT_EQ(copy, p);
    EXPECT_EQ(toStructured(std::span<const uint8_t>(raw)), Matrix::scaling(2.0, 3.0, 4.0));
}

TEST(PackedMatrixTest, WrongLengthThrows) {
    std::vector<uint8_t> tooShort(127, 0);
    std::vector<uint8_t> tooLong(129, 0);
    std::vector<uint8_t> empty;

    EXPECT_THROW(PackedMatrix::fromBytes(tooShort), TrellisException);
    EXPECT_THROW(PackedMatrix::fromBytes(tooLong), TrellisException);
    EXPECT_THROW(toStructured(std::span<const uint8_t>(empty)), TrellisException);
}

TEST(PackedMatrixTest, WrongLengthMessageNamesSize) {
    std::vector<uint8_t> tooShort(127, 0);
    try {
        toStructured(std::span<const uint8_t>(tooShort));
        FAIL() << "Expected TrellisException";
    } catch (const TrellisException& e) {
        EXPECT_NE(std::string(e.what()).find("got 127"), std::string::npos);
    }
}

TEST(PackedMatrixTest, EqualityIsByteEquality) {
    PackedMatrix a = toPacked(Matrix().put(0, 0, 0.0));
    PackedMatrix b = toPacked(Matrix().put(0, 0, -0.0));
    // Equal as doubles, different on the wire
    EXPECT_NE(a, b);
    EXPECT_EQ(toStructured(a), toStructured(b));
}

TEST(PackedMatrixTest, BackToBackStreaming) {
    PackedMatrix first = toPacked(Matrix::translation(1.0, 2.0, 3.0));
    PackedMatrix second = toPacked(Matrix::scaling(4.0, 5.0, 6.0));

    codec::ByteWriter block(2 * PackedMatrix::kByteSize);
    block.writeBytes(first.span());
    block.writeBytes(second.span());
    ASSERT_EQ(block.size(), 256u);

    codec::ByteReader reader(block.data().data(), block.size());
    EXPECT_EQ(PackedMatrix::fromBytes(reader.readBytes(PackedMatrix::kByteSize)), first);
    EXPECT_EQ(PackedMatrix::fromBytes(reader.readBytes(PackedMatrix::kByteSize)), second);
    EXPECT_EQ(reader.remaining(), 0u);
}
