//===----------------------------------------------------------------------===//
//
// Part of the ClassLens project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/code_location.hpp
// Purpose: Declares the byte-offset location attached to decoder diagnostics.
// Key invariants: An unknown location never reports an offset.
// Ownership/Lifetime: Value type with no dynamic ownership.
// Links: src/support/diagnostics.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace classlens::support
{

/// @brief Position of an instruction inside a method's code buffer.
/// @invariant @ref offset is meaningful only when @ref known is true.
/// @ownership Value type with no owned resources.
struct CodeLoc
{
    /// @brief Zero-based byte offset of the instruction's opcode.
    uint32_t offset = 0;

    /// @brief False for diagnostics that are not tied to a code position.
    bool known = false;

    /// @brief Build a location referring to byte @p off.
    [[nodiscard]] static CodeLoc at(uint32_t off)
    {
        return CodeLoc{off, true};
    }

    /// @brief Check whether the location refers to a concrete offset.
    [[nodiscard]] bool isValid() const;
};

} // namespace classlens::support
