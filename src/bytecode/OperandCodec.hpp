//===----------------------------------------------------------------------===//
//
// Part of the ClassLens project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/OperandCodec.hpp
// Purpose: Read and render the operands of one instruction.
// Key invariants: A successful decode consumes exactly the bytes the operand
//                 shape declares; a failed decode is always a truncation.
// Ownership/Lifetime: Stateless free functions; results are returned by value.
// Links: InstructionCatalog.hpp, SwitchTable.hpp, WidePrefix.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bytecode/ByteCursor.hpp"
#include "bytecode/InstructionCatalog.hpp"
#include "classlens/bytecode/Decoder.hpp"
#include "support/diag_expected.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace classlens::bytecode
{

/// @brief Rendered operands of one instruction.
struct DecodedOperands
{
    /// @brief Mnemonic followed by the rendered operands.
    std::string text;

    /// @brief Constant-pool index referenced by the instruction, if any.
    std::optional<uint32_t> constantPoolIndex;

    /// @brief Non-fatal problem encountered while decoding, if any.
    std::optional<DecodeErrorKind> issue;
};

/// @brief Decode the operands of the instruction described by @p def.
/// @param def Catalog entry selected by the opcode byte (already consumed).
/// @param cursor Cursor positioned just past the opcode byte.
/// @param instrOffset Offset of the opcode byte, used for diagnostics.
/// @return Rendered operands, or a truncation diagnostic.
support::Expected<DecodedOperands> decodeOperands(const InstructionDef &def,
                                                  ByteCursor &cursor,
                                                  uint32_t instrOffset);

namespace detail
{
/// @brief Build the diagnostic for an operand that runs past the buffer end.
/// @param instrOffset Offset of the instruction's opcode byte.
/// @param what Name of the instruction or operand being read.
/// @param needed Number of bytes the read required.
/// @param cursor Cursor at the point of failure.
support::Diag truncated(uint32_t instrOffset,
                        std::string_view what,
                        std::size_t needed,
                        const ByteCursor &cursor);
} // namespace detail

} // namespace classlens::bytecode
