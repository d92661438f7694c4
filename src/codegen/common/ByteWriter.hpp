//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/common/ByteWriter.hpp
// Purpose: Little-endian append and patch helpers over a byte vector, shared
//          by the ELF, PE and NVM writers.
// Key invariants: All multi-byte values are written least significant byte
//                 first regardless of the host byte order.
// Ownership/Lifetime: ByteWriter borrows the vector it writes to.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace perc::codegen::common
{

/// \brief Round @p value up to a multiple of @p align (a power of two).
constexpr uint64_t alignUp(uint64_t value, uint64_t align)
{
    return (value + (align - 1)) & ~(align - 1);
}

class ByteWriter
{
  public:
    explicit ByteWriter(std::vector<uint8_t> &out) : out_(out) {}

    [[nodiscard]] size_t size() const
    {
        return out_.size();
    }

    void u8(uint8_t v)
    {
        out_.push_back(v);
    }

    void u16(uint16_t v)
    {
        put(v, 2);
    }

    void u32(uint32_t v)
    {
        put(v, 4);
    }

    void u64(uint64_t v)
    {
        put(v, 8);
    }

    void i64(int64_t v)
    {
        put(static_cast<uint64_t>(v), 8);
    }

    void bytes(const uint8_t *data, size_t n)
    {
        out_.insert(out_.end(), data, data + n);
    }

    void bytes(const std::vector<uint8_t> &data)
    {
        out_.insert(out_.end(), data.begin(), data.end());
    }

    void text(std::string_view s)
    {
        out_.insert(out_.end(), s.begin(), s.end());
    }

    /// \brief Write @p s into a fixed field of @p width bytes, zero padded.
    void fixedText(std::string_view s, size_t width)
    {
        for (size_t i = 0; i < width; ++i)
            out_.push_back(i < s.size() ? static_cast<uint8_t>(s[i]) : 0);
    }

    void zeros(size_t n)
    {
        out_.insert(out_.end(), n, 0);
    }

    /// \brief Zero-pad until the size is a multiple of @p align.
    void padTo(size_t align)
    {
        out_.resize(static_cast<size_t>(alignUp(out_.size(), align)), 0);
    }

    /// \brief Zero-pad until the size is exactly @p offset.
    void padToOffset(size_t offset)
    {
        if (out_.size() < offset)
            out_.resize(offset, 0);
    }

    void patch32(size_t at, uint32_t v)
    {
        for (int i = 0; i < 4; ++i)
            out_[at + i] = static_cast<uint8_t>(v >> (8 * i));
    }

    void patch64(size_t at, uint64_t v)
    {
        for (int i = 0; i < 8; ++i)
            out_[at + i] = static_cast<uint8_t>(v >> (8 * i));
    }

  private:
    void put(uint64_t v, int n)
    {
        for (int i = 0; i < n; ++i)
            out_.push_back(static_cast<uint8_t>(v >> (8 * i)));
    }

    std::vector<uint8_t> &out_;
};

/// \brief Read a little-endian value of @p n bytes at @p at.
inline uint64_t readLE(const std::vector<uint8_t> &in, size_t at, int n)
{
    uint64_t v = 0;
    for (int i = 0; i < n; ++i)
        v |= static_cast<uint64_t>(in[at + i]) << (8 * i);
    return v;
}

} // namespace perc::codegen::common
