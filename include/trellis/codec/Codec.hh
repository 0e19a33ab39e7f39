#pragma once

#include "trellis/utils/ErrorHandling.hh"
#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace trellis::codec {

// Binary reader over a contiguous byte span. Tracks a cursor and
// throws TrellisException on any out-of-bounds read.
class ByteReader {
  public:
    ByteReader(const uint8_t* data, size_t size) : buf_(data), size_(size), pos_(0) {}

    explicit ByteReader(std::span<const uint8_t> span) : buf_(span.data()), size_(span.size()), pos_(0) {}

    uint64_t readU64LE() {
        auto b = readRaw(8);
        uint64_t v = 0;
        for (int i = 7; i >= 0; --i)
            v = (v << 8) | b[i];
        return v;
    }

    // IEEE-754 binary64, bit pattern preserved (NaN payloads included)
    double readF64LE() { return std::bit_cast<double>(readU64LE()); }

    std::span<const uint8_t> readBytes(size_t n) {
        auto ptr = readRaw(n);
        return {ptr, n};
    }

    size_t remaining() const { return size_ - pos_; }
    size_t position() const { return pos_; }

  private:
    const uint8_t* readRaw(size_t n) {
        if (pos_ + n > size_) {
            throwError("ByteReader overrun: requested " + std::to_string(n) + " bytes at offset " +
                       std::to_string(pos_) + " with " + std::to_string(size_ - pos_) + " remaining");
        }
        const uint8_t* ptr = buf_ + pos_;
        pos_ += n;
        return ptr;
    }

    const uint8_t* buf_;
    size_t size_;
    size_t pos_;
};

// Binary writer to an internal byte vector.
class ByteWriter {
  public:
    ByteWriter() = default;
    explicit ByteWriter(size_t reserveBytes) { buf_.reserve(reserveBytes); }

    void writeU64LE(uint64_t v) {
        for (int i = 0; i < 8; ++i) {
            buf_.push_back(static_cast<uint8_t>(v & 0xFF));
            v >>= 8;
        }
    }

    void writeF64LE(double v) { writeU64LE(std::bit_cast<uint64_t>(v)); }

    void writeBytes(std::span<const uint8_t> data) { buf_.insert(buf_.end(), data.begin(), data.end()); }

    const std::vector<uint8_t>& data() const { return buf_; }
    size_t size() const { return buf_.size(); }
    void clear() { buf_.clear(); }

  private:
    std::vector<uint8_t> buf_;
};

} // namespace trellis::codec
