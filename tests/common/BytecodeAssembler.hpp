// File: tests/common/BytecodeAssembler.hpp
// Purpose: Build JVM code arrays for decoder tests without hand-counting bytes.
// Key invariants: All multi-byte operands are emitted big-endian; switch padding
//                 is computed from the current offset in the array.
// Ownership/Lifetime: Owns the byte buffer under construction.
// Links: src/bytecode/OperandCodec.hpp, src/bytecode/SwitchTable.hpp

#pragma once

#include "bytecode/Opcode.hpp"

#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace classlens::tests
{

/// @brief Reference encoder producing code arrays byte by byte.
class BytecodeAssembler
{
  public:
    BytecodeAssembler &op(bytecode::Opcode opcode);
    BytecodeAssembler &u1(uint8_t value);
    BytecodeAssembler &u2(uint16_t value);
    BytecodeAssembler &s2(int16_t value);
    BytecodeAssembler &s4(int32_t value);

    /// @brief Emit zero bytes until the offset is a multiple of four.
    BytecodeAssembler &pad4();

    /// @brief Emit a complete tableswitch covering low..low+offsets.size()-1.
    BytecodeAssembler &tableswitch(int32_t defaultOffset,
                                   int32_t low,
                                   const std::vector<int32_t> &offsets);

    /// @brief Emit a complete lookupswitch with @p pairs in the given order.
    BytecodeAssembler &lookupswitch(int32_t defaultOffset,
                                    const std::vector<std::pair<int32_t, int32_t>> &pairs);

    [[nodiscard]] uint32_t offset() const
    {
        return static_cast<uint32_t>(bytes_.size());
    }

    [[nodiscard]] const std::vector<uint8_t> &bytes() const
    {
        return bytes_;
    }

    [[nodiscard]] std::span<const uint8_t> span() const
    {
        return bytes_;
    }

  private:
    std::vector<uint8_t> bytes_;
};

} // namespace classlens::tests
