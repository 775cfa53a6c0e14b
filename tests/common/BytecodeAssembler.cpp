// File: tests/common/BytecodeAssembler.cpp
// Purpose: Implement the test-side code array encoder.
// Key invariants: Emits exactly the bytes each helper documents.
// Ownership/Lifetime: See BytecodeAssembler.hpp.
// Links: tests/common/BytecodeAssembler.hpp

#include "common/BytecodeAssembler.hpp"

namespace classlens::tests
{

BytecodeAssembler &BytecodeAssembler::op(bytecode::Opcode opcode)
{
    return u1(bytecode::opcodeByte(opcode));
}

BytecodeAssembler &BytecodeAssembler::u1(uint8_t value)
{
    bytes_.push_back(value);
    return *this;
}

BytecodeAssembler &BytecodeAssembler::u2(uint16_t value)
{
    bytes_.push_back(static_cast<uint8_t>(value >> 8));
    bytes_.push_back(static_cast<uint8_t>(value & 0xFF));
    return *this;
}

BytecodeAssembler &BytecodeAssembler::s2(int16_t value)
{
    return u2(static_cast<uint16_t>(value));
}

BytecodeAssembler &BytecodeAssembler::s4(int32_t value)
{
    const auto raw = static_cast<uint32_t>(value);
    bytes_.push_back(static_cast<uint8_t>(raw >> 24));
    bytes_.push_back(static_cast<uint8_t>((raw >> 16) & 0xFF));
    bytes_.push_back(static_cast<uint8_t>((raw >> 8) & 0xFF));
    bytes_.push_back(static_cast<uint8_t>(raw & 0xFF));
    return *this;
}

BytecodeAssembler &BytecodeAssembler::pad4()
{
    while (bytes_.size() % 4 != 0)
        bytes_.push_back(0);
    return *this;
}

BytecodeAssembler &BytecodeAssembler::tableswitch(int32_t defaultOffset,
                                                  int32_t low,
                                                  const std::vector<int32_t> &offsets)
{
    op(bytecode::Opcode::Tableswitch).pad4();
    s4(defaultOffset).s4(low).s4(low + static_cast<int32_t>(offsets.size()) - 1);
    for (int32_t jump : offsets)
        s4(jump);
    return *this;
}

BytecodeAssembler &BytecodeAssembler::lookupswitch(
    int32_t defaultOffset, const std::vector<std::pair<int32_t, int32_t>> &pairs)
{
    op(bytecode::Opcode::Lookupswitch).pad4();
    s4(defaultOffset).s4(static_cast<int32_t>(pairs.size()));
    for (const auto &[match, jump] : pairs)
        s4(match).s4(jump);
    return *this;
}

} // namespace classlens::tests
