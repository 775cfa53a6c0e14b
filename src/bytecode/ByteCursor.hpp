//===----------------------------------------------------------------------===//
//
// Part of the ClassLens project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/ByteCursor.hpp
// Purpose: Declare the bounds-checked big-endian reader over a code buffer.
// Key invariants: The position never decreases and never exceeds the buffer
//                 length; a failed read leaves the position unchanged.
// Ownership/Lifetime: Views a byte buffer owned by the caller; no allocations.
// Links: Decoder.cpp, OperandCodec.cpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Defines the cursor shared by the stream driver and operand codecs.
/// @details Every read is checked against the declared code length.  Readers
///          return false instead of advancing when fewer bytes remain than the
///          read needs, so a truncated operand is detected before any of its
///          bytes are consumed.

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace classlens::bytecode
{

/// @brief Forward-only reader over a JVM code array.
class ByteCursor
{
  public:
    /// @brief Construct a cursor over @p code positioned at offset zero.
    explicit ByteCursor(std::span<const uint8_t> code) noexcept;

    /// @brief Current byte offset relative to the start of the code buffer.
    [[nodiscard]] uint32_t offset() const noexcept
    {
        return static_cast<uint32_t>(index_);
    }

    /// @brief Total number of bytes in the buffer.
    [[nodiscard]] std::size_t size() const noexcept
    {
        return code_.size();
    }

    /// @brief Bytes left between the position and the end of the buffer.
    [[nodiscard]] std::size_t remaining() const noexcept
    {
        return code_.size() - index_;
    }

    /// @brief Query whether every byte has been consumed.
    [[nodiscard]] bool atEnd() const noexcept
    {
        return index_ >= code_.size();
    }

    /// @brief Read an unsigned byte.
    [[nodiscard]] bool readU1(uint8_t &out) noexcept;

    /// @brief Read a signed byte.
    [[nodiscard]] bool readS1(int8_t &out) noexcept;

    /// @brief Read a big-endian unsigned 16-bit value.
    [[nodiscard]] bool readU2(uint16_t &out) noexcept;

    /// @brief Read a big-endian signed 16-bit value.
    [[nodiscard]] bool readS2(int16_t &out) noexcept;

    /// @brief Read a big-endian signed 32-bit value.
    [[nodiscard]] bool readS4(int32_t &out) noexcept;

    /// @brief Skip @p count bytes without interpreting them.
    [[nodiscard]] bool skip(std::size_t count) noexcept;

    /// @brief Skip padding up to the next offset that is a multiple of four.
    /// @details Alignment is relative to the start of the code buffer, as the
    ///          switch instructions require.
    [[nodiscard]] bool alignTo4() noexcept;

  private:
    [[nodiscard]] bool has(std::size_t count) const noexcept
    {
        return remaining() >= count;
    }

    std::span<const uint8_t> code_;
    std::size_t index_ = 0;
};

} // namespace classlens::bytecode
