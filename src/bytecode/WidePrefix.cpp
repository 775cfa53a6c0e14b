//===----------------------------------------------------------------------===//
//
// Part of the ClassLens project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements decoding of `wide`.  The prefix widens the local-variable index of
// the following load, store or ret to 16 bits; for iinc both the index and the
// increment become 16 bits.  An illegal target consumes only its opcode byte.
//
//===----------------------------------------------------------------------===//

#include "bytecode/WidePrefix.hpp"

#include "bytecode/InstructionCatalog.hpp"

#include <string>

namespace classlens::bytecode
{

bool isWidenable(uint8_t opcode) noexcept
{
    switch (static_cast<Opcode>(opcode))
    {
        case Opcode::Iload:
        case Opcode::Lload:
        case Opcode::Fload:
        case Opcode::Dload:
        case Opcode::Aload:
        case Opcode::Istore:
        case Opcode::Lstore:
        case Opcode::Fstore:
        case Opcode::Dstore:
        case Opcode::Astore:
        case Opcode::Ret:
        case Opcode::Iinc:
            return true;
        default:
            return false;
    }
}

support::Expected<DecodedOperands> decodeWide(ByteCursor &cursor, uint32_t instrOffset)
{
    uint8_t target = 0;
    if (!cursor.readU1(target))
        return detail::truncated(instrOffset, "wide", 1, cursor);

    DecodedOperands out;
    if (!isWidenable(target))
    {
        out.text = "wide " + std::string(kUnknownOpcodeText);
        out.issue = DecodeErrorKind::UnknownWideOpcode;
        return out;
    }

    const InstructionDef &def = lookup(static_cast<Opcode>(target));
    uint16_t index = 0;
    if (!cursor.readU2(index))
        return detail::truncated(instrOffset, "wide index", 2, cursor);

    if (def.op() == Opcode::Iinc)
    {
        int16_t delta = 0;
        if (!cursor.readS2(delta))
            return detail::truncated(instrOffset, "wide iinc constant", 2, cursor);
        out.text = "wide iinc index = " + std::to_string(index) +
                   " const = " + std::to_string(delta);
        return out;
    }

    out.text = std::string("wide ") + def.mnemonic + " " + std::to_string(index);
    return out;
}

} // namespace classlens::bytecode
