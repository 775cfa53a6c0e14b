//===----------------------------------------------------------------------===//
//
// Part of the ClassLens project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the bounds-checked big-endian reads used by the instruction
// decoder.  Class files store every multi-byte quantity most significant byte
// first, independent of the host byte order, so values are assembled byte by
// byte.
//
//===----------------------------------------------------------------------===//

#include "bytecode/ByteCursor.hpp"

namespace classlens::bytecode
{

ByteCursor::ByteCursor(std::span<const uint8_t> code) noexcept : code_(code) {}

bool ByteCursor::readU1(uint8_t &out) noexcept
{
    if (!has(1))
        return false;
    out = code_[index_++];
    return true;
}

bool ByteCursor::readS1(int8_t &out) noexcept
{
    uint8_t raw = 0;
    if (!readU1(raw))
        return false;
    out = static_cast<int8_t>(raw);
    return true;
}

bool ByteCursor::readU2(uint16_t &out) noexcept
{
    if (!has(2))
        return false;
    out = static_cast<uint16_t>((static_cast<uint16_t>(code_[index_]) << 8) | code_[index_ + 1]);
    index_ += 2;
    return true;
}

bool ByteCursor::readS2(int16_t &out) noexcept
{
    uint16_t raw = 0;
    if (!readU2(raw))
        return false;
    out = static_cast<int16_t>(raw);
    return true;
}

bool ByteCursor::readS4(int32_t &out) noexcept
{
    if (!has(4))
        return false;
    const uint32_t raw = (static_cast<uint32_t>(code_[index_]) << 24) |
                         (static_cast<uint32_t>(code_[index_ + 1]) << 16) |
                         (static_cast<uint32_t>(code_[index_ + 2]) << 8) |
                         static_cast<uint32_t>(code_[index_ + 3]);
    index_ += 4;
    out = static_cast<int32_t>(raw);
    return true;
}

bool ByteCursor::skip(std::size_t count) noexcept
{
    if (!has(count))
        return false;
    index_ += count;
    return true;
}

bool ByteCursor::alignTo4() noexcept
{
    const std::size_t misalign = index_ % 4;
    if (misalign == 0)
        return true;
    return skip(4 - misalign);
}

} // namespace classlens::bytecode
