//===----------------------------------------------------------------------===//
//
// Part of the ClassLens project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/WidePrefix.hpp
// Purpose: Decode the instruction modified by a `wide` prefix.
// Key invariants: Only the eleven local-variable opcodes and iinc may follow
//                 `wide`; anything else is reported, never guessed.
// Ownership/Lifetime: Stateless.
// Links: OperandCodec.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bytecode/ByteCursor.hpp"
#include "bytecode/OperandCodec.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>

namespace classlens::bytecode
{

/// @brief Test whether @p opcode may legally follow `wide`.
[[nodiscard]] bool isWidenable(uint8_t opcode) noexcept;

/// @brief Decode the widened instruction following a `wide` opcode.
/// @param cursor Cursor positioned just past the `wide` byte.
/// @param instrOffset Offset of the `wide` byte.
/// @return "wide <mnemonic> <index>", "wide iinc index = I const = C" or the
///         unknown-opcode placeholder flagged with UnknownWideOpcode.
support::Expected<DecodedOperands> decodeWide(ByteCursor &cursor, uint32_t instrOffset);

} // namespace classlens::bytecode
