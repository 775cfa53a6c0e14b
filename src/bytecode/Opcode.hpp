//===----------------------------------------------------------------------===//
//
// Part of the ClassLens project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/Opcode.hpp
// Purpose: Enumerates the JVM instruction opcodes by their numeric value.
// Key invariants: Enumerator values equal the JVM opcode bytes.
// Ownership/Lifetime: Not applicable.
// Links: Opcode.def, InstructionCatalog.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>

namespace classlens::bytecode
{

/// @brief Every defined JVM instruction opcode, including the reserved ones.
/// @details The values are the raw opcode bytes, so a byte read from a code
///          array can be compared against an enumerator after a cast.  Bytes
///          with no enumerator are undefined opcodes.
enum class Opcode : uint8_t
{
#define JVM_OPCODE(NAME, CODE, MNEMONIC, SHAPE, RESERVED) NAME = CODE,
#include "bytecode/Opcode.def"
#undef JVM_OPCODE
};

/// @brief Number of opcodes defined by the catalog (including reserved ones).
inline constexpr size_t kNumDefinedOpcodes = 0
#define JVM_OPCODE(NAME, CODE, MNEMONIC, SHAPE, RESERVED) +1
#include "bytecode/Opcode.def"
#undef JVM_OPCODE
    ;

static_assert(kNumDefinedOpcodes == 205, "JVM catalog must define 205 opcodes");

/// @brief Raw byte value of opcode @p op.
inline constexpr uint8_t opcodeByte(Opcode op)
{
    return static_cast<uint8_t>(op);
}

} // namespace classlens::bytecode
