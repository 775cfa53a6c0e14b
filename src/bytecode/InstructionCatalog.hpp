//===----------------------------------------------------------------------===//
//
// Part of the ClassLens project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/InstructionCatalog.hpp
// Purpose: Static metadata describing each JVM opcode and its operand layout.
// Key invariants: Table entries cover every Opcode enumerator exactly once and
//                 are sorted by opcode byte.
// Ownership/Lifetime: Metadata has static storage duration and is read-only;
//                     safe for unsynchronised concurrent reads.
// Links: Opcode.def, OperandCodec.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bytecode/Opcode.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace classlens::bytecode
{

/// @brief Layout of the operand bytes that follow an opcode.
/// @details Every catalog entry has exactly one shape; the operand codec
///          dispatches on it to decide how many bytes to consume and how to
///          render them.
enum class OperandShape : uint8_t
{
    None,              ///< Mnemonic only.
    U8Immediate,       ///< One unsigned byte (push value or local index).
    U16Immediate,      ///< One unsigned 16-bit value.
    S16Branch,         ///< Signed 16-bit branch offset.
    S32Branch,         ///< Signed 32-bit branch offset.
    LocalIndexConst,   ///< iinc: unsigned 8-bit index, signed 8-bit constant.
    ConstPoolU8,       ///< One-byte constant-pool index.
    ConstPoolU16,      ///< Two-byte constant-pool index.
    InvokeInterface,   ///< Pool index, argument count, one zero byte.
    InvokeDynamic,     ///< Pool index followed by two zero bytes.
    NewArrayPrimitive, ///< Primitive array type code.
    MultiArray,        ///< Pool index and dimension count.
    TableSwitch,       ///< Padded indexed jump table.
    LookupSwitch,      ///< Padded match/offset jump table.
    WidePrefix         ///< Index-widening prefix for the following opcode.
};

/// @brief Immutable catalog entry for one defined opcode.
struct InstructionDef
{
    uint8_t opcode;       ///< Raw opcode byte.
    const char *mnemonic; ///< Canonical JVM mnemonic.
    bool reserved;        ///< True for breakpoint/impdep1/impdep2.
    OperandShape shape;   ///< Operand layout following the opcode.

    /// @brief Typed view of @ref opcode.
    [[nodiscard]] constexpr Opcode op() const
    {
        return static_cast<Opcode>(opcode);
    }
};

/// @brief Prefix marking reserved/implementation-specific instructions.
inline constexpr std::string_view kReservedPrefix = "[Reserved] ";

/// @brief Placeholder text for bytes that have no catalog entry.
inline constexpr std::string_view kUnknownOpcodeText = "[Unknown opcode]";

/// @brief Placeholder text for newarray type codes outside 4..11.
inline constexpr std::string_view kUnknownArrayTypeText = "[ERROR: Unknown type]";

/// @brief Look up the catalog entry for raw opcode byte @p opcode.
/// @return Pointer to the entry, or nullptr when the byte is undefined.
[[nodiscard]] const InstructionDef *lookup(uint8_t opcode) noexcept;

/// @brief Catalog entry for a defined opcode.
[[nodiscard]] const InstructionDef &lookup(Opcode op) noexcept;

/// @brief Every catalog entry in ascending opcode order.
[[nodiscard]] std::span<const InstructionDef> allInstructions() noexcept;

/// @brief Mnemonic as shown in listings, with the reserved prefix applied.
[[nodiscard]] std::string displayName(const InstructionDef &def);

/// @brief Name of the newarray primitive element type @p code (T_INT, ...).
/// @return The type name for codes 4 through 11; std::nullopt otherwise.
[[nodiscard]] std::optional<std::string_view> arrayTypeName(uint8_t code) noexcept;

/// @brief Lowercase name of @p shape, used by the catalog dump.
[[nodiscard]] const char *toString(OperandShape shape) noexcept;

} // namespace classlens::bytecode
