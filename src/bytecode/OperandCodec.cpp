//===----------------------------------------------------------------------===//
//
// Part of the ClassLens project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements operand decoding for every operand shape in the catalog.  Each
// shape consumes a fixed number of bytes except the two switches (padding plus
// a counted payload) and `wide` (width depends on the widened opcode).
//
//===----------------------------------------------------------------------===//

#include "bytecode/OperandCodec.hpp"

#include "bytecode/SwitchTable.hpp"
#include "bytecode/WidePrefix.hpp"

#include <sstream>

namespace classlens::bytecode
{

namespace detail
{
support::Diag truncated(uint32_t instrOffset,
                        std::string_view what,
                        std::size_t needed,
                        const ByteCursor &cursor)
{
    std::ostringstream os;
    os << "truncated " << what << ": need " << needed << " byte"
       << (needed == 1 ? "" : "s") << " at offset " << cursor.offset() << ", "
       << cursor.remaining() << " available";
    return support::makeError(support::CodeLoc::at(instrOffset), os.str());
}
} // namespace detail

namespace
{

std::string withOperand(const InstructionDef &def, long long value)
{
    return std::string(def.mnemonic) + " " + std::to_string(value);
}

support::Expected<DecodedOperands> decodeIinc(const InstructionDef &def,
                                              ByteCursor &cursor,
                                              uint32_t instrOffset)
{
    uint8_t index = 0;
    int8_t delta = 0;
    if (!cursor.readU1(index) || !cursor.readS1(delta))
        return detail::truncated(instrOffset, def.mnemonic, 2, cursor);

    DecodedOperands out;
    out.text = std::string(def.mnemonic) + " index = " + std::to_string(index) +
               " const = " + std::to_string(delta);
    return out;
}

support::Expected<DecodedOperands> decodeNewArray(const InstructionDef &def,
                                                  ByteCursor &cursor,
                                                  uint32_t instrOffset)
{
    uint8_t atype = 0;
    if (!cursor.readU1(atype))
        return detail::truncated(instrOffset, def.mnemonic, 1, cursor);

    DecodedOperands out;
    out.text = std::string(def.mnemonic) + " ";
    if (auto name = arrayTypeName(atype))
    {
        out.text += *name;
    }
    else
    {
        out.text += kUnknownArrayTypeText;
        out.issue = DecodeErrorKind::UnknownArrayType;
    }
    return out;
}

} // namespace

support::Expected<DecodedOperands> decodeOperands(const InstructionDef &def,
                                                  ByteCursor &cursor,
                                                  uint32_t instrOffset)
{
    DecodedOperands out;
    switch (def.shape)
    {
        case OperandShape::None:
            out.text = displayName(def);
            return out;

        case OperandShape::U8Immediate:
        {
            uint8_t value = 0;
            if (!cursor.readU1(value))
                return detail::truncated(instrOffset, def.mnemonic, 1, cursor);
            out.text = withOperand(def, value);
            return out;
        }

        case OperandShape::U16Immediate:
        {
            uint16_t value = 0;
            if (!cursor.readU2(value))
                return detail::truncated(instrOffset, def.mnemonic, 2, cursor);
            out.text = withOperand(def, value);
            return out;
        }

        case OperandShape::S16Branch:
        {
            int16_t branch = 0;
            if (!cursor.readS2(branch))
                return detail::truncated(instrOffset, def.mnemonic, 2, cursor);
            out.text = withOperand(def, branch);
            return out;
        }

        case OperandShape::S32Branch:
        {
            int32_t branch = 0;
            if (!cursor.readS4(branch))
                return detail::truncated(instrOffset, def.mnemonic, 4, cursor);
            out.text = withOperand(def, branch);
            return out;
        }

        case OperandShape::LocalIndexConst:
            return decodeIinc(def, cursor, instrOffset);

        case OperandShape::ConstPoolU8:
        {
            uint8_t index = 0;
            if (!cursor.readU1(index))
                return detail::truncated(instrOffset, def.mnemonic, 1, cursor);
            out.text = def.mnemonic;
            out.constantPoolIndex = index;
            return out;
        }

        case OperandShape::ConstPoolU16:
        {
            uint16_t index = 0;
            if (!cursor.readU2(index))
                return detail::truncated(instrOffset, def.mnemonic, 2, cursor);
            out.text = def.mnemonic;
            out.constantPoolIndex = index;
            return out;
        }

        case OperandShape::InvokeInterface:
        {
            uint16_t index = 0;
            uint8_t nargs = 0;
            if (!cursor.readU2(index) || !cursor.readU1(nargs) || !cursor.skip(1))
                return detail::truncated(instrOffset, def.mnemonic, 4, cursor);
            out.text = std::string(def.mnemonic) + " interface=" + std::to_string(index) +
                       ", nargs=" + std::to_string(nargs);
            out.constantPoolIndex = index;
            return out;
        }

        case OperandShape::InvokeDynamic:
        {
            uint16_t index = 0;
            if (!cursor.readU2(index) || !cursor.skip(2))
                return detail::truncated(instrOffset, def.mnemonic, 4, cursor);
            out.text = def.mnemonic;
            out.constantPoolIndex = index;
            return out;
        }

        case OperandShape::NewArrayPrimitive:
            return decodeNewArray(def, cursor, instrOffset);

        case OperandShape::MultiArray:
        {
            uint16_t index = 0;
            uint8_t dims = 0;
            if (!cursor.readU2(index) || !cursor.readU1(dims))
                return detail::truncated(instrOffset, def.mnemonic, 3, cursor);
            out.text = std::string(def.mnemonic) + " type=" + std::to_string(index) +
                       " dimensions=" + std::to_string(dims);
            out.constantPoolIndex = index;
            return out;
        }

        case OperandShape::TableSwitch:
        {
            auto table = readTableSwitch(cursor, instrOffset);
            if (!table)
                return table.error();
            out.text = renderTableSwitch(table.value());
            return out;
        }

        case OperandShape::LookupSwitch:
        {
            auto table = readLookupSwitch(cursor, instrOffset);
            if (!table)
                return table.error();
            out.text = renderLookupSwitch(table.value());
            return out;
        }

        case OperandShape::WidePrefix:
            return decodeWide(cursor, instrOffset);
    }
    out.text = displayName(def);
    return out;
}

} // namespace classlens::bytecode
