//===----------------------------------------------------------------------===//
//
// Part of the ClassLens project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Defines the JVM instruction catalog.  The entries are generated from
// Opcode.def so the enumeration, the mnemonic table and the operand shapes can
// never drift apart.  A 256-slot index built at compile time turns every
// lookup into a single array access.
//
//===----------------------------------------------------------------------===//

#include "bytecode/InstructionCatalog.hpp"

#include <array>

namespace classlens::bytecode
{

namespace
{
constexpr std::array<InstructionDef, kNumDefinedOpcodes> kCatalog = {{
#define JVM_OPCODE(NAME, CODE, MNEMONIC, SHAPE, RESERVED)                                          \
    {CODE, MNEMONIC, RESERVED, OperandShape::SHAPE},
#include "bytecode/Opcode.def"
#undef JVM_OPCODE
}};

/// @brief Marker stored in the index for undefined opcode bytes.
constexpr uint8_t kNoSlot = 0xFF;

/// @brief Build the byte -> catalog slot index.
///
/// The catalog holds fewer than 255 entries, so a slot always fits in a byte
/// and 0xFF is free to mark holes.
constexpr std::array<uint8_t, 256> buildSlotIndex()
{
    std::array<uint8_t, 256> index{};
    for (auto &slot : index)
        slot = kNoSlot;
    for (size_t i = 0; i < kCatalog.size(); ++i)
        index[kCatalog[i].opcode] = static_cast<uint8_t>(i);
    return index;
}

constexpr std::array<uint8_t, 256> kSlotIndex = buildSlotIndex();

constexpr bool catalogIsSorted()
{
    for (size_t i = 1; i < kCatalog.size(); ++i)
    {
        if (kCatalog[i - 1].opcode >= kCatalog[i].opcode)
            return false;
    }
    return true;
}

static_assert(kCatalog.size() < kNoSlot, "slot index must fit in a byte");
static_assert(catalogIsSorted(), "Opcode.def rows must be unique and ascending");

struct ArrayType
{
    uint8_t code;
    std::string_view name;
};

/// Type codes as listed for newarray in JVMS 6.5.
constexpr std::array<ArrayType, 8> kArrayTypes = {{
    {4, "T_BOOLEAN"},
    {5, "T_CHAR"},
    {6, "T_FLOAT"},
    {7, "T_DOUBLE"},
    {8, "T_BYTE"},
    {9, "T_SHORT"},
    {10, "T_INT"},
    {11, "T_LONG"},
}};
} // namespace

const InstructionDef *lookup(uint8_t opcode) noexcept
{
    const uint8_t slot = kSlotIndex[opcode];
    if (slot == kNoSlot)
        return nullptr;
    return &kCatalog[slot];
}

const InstructionDef &lookup(Opcode op) noexcept
{
    return kCatalog[kSlotIndex[opcodeByte(op)]];
}

std::span<const InstructionDef> allInstructions() noexcept
{
    return kCatalog;
}

std::string displayName(const InstructionDef &def)
{
    if (!def.reserved)
        return def.mnemonic;
    std::string name(kReservedPrefix);
    name += def.mnemonic;
    return name;
}

std::optional<std::string_view> arrayTypeName(uint8_t code) noexcept
{
    for (const auto &type : kArrayTypes)
    {
        if (type.code == code)
            return type.name;
    }
    return std::nullopt;
}

const char *toString(OperandShape shape) noexcept
{
    switch (shape)
    {
        case OperandShape::None:
            return "none";
        case OperandShape::U8Immediate:
            return "u8";
        case OperandShape::U16Immediate:
            return "u16";
        case OperandShape::S16Branch:
            return "branch16";
        case OperandShape::S32Branch:
            return "branch32";
        case OperandShape::LocalIndexConst:
            return "local-const";
        case OperandShape::ConstPoolU8:
            return "cp8";
        case OperandShape::ConstPoolU16:
            return "cp16";
        case OperandShape::InvokeInterface:
            return "invokeinterface";
        case OperandShape::InvokeDynamic:
            return "invokedynamic";
        case OperandShape::NewArrayPrimitive:
            return "atype";
        case OperandShape::MultiArray:
            return "multiarray";
        case OperandShape::TableSwitch:
            return "tableswitch";
        case OperandShape::LookupSwitch:
            return "lookupswitch";
        case OperandShape::WidePrefix:
            return "wide";
    }
    return "";
}

} // namespace classlens::bytecode
