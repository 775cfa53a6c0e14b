//===----------------------------------------------------------------------===//
//
// Part of the ClassLens project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/SwitchTable.hpp
// Purpose: Decode the variable-length payloads of tableswitch and lookupswitch.
// Key invariants: Padding is computed relative to the start of the code
//                 buffer; entry counts never go negative.
// Ownership/Lifetime: Stateless; the parsed tables are returned by value.
// Links: OperandCodec.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bytecode/ByteCursor.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace classlens::bytecode
{

/// @brief Parsed tableswitch payload.
struct TableSwitch
{
    int32_t defaultOffset = 0;
    int32_t low = 0;
    int32_t high = 0;
    std::vector<int32_t> offsets; ///< One per case value low..high, ascending.
};

/// @brief Parsed lookupswitch payload.
struct LookupSwitch
{
    int32_t defaultOffset = 0;
    std::vector<std::pair<int32_t, int32_t>> pairs; ///< (match, offset) in stream order.
};

/// @brief Read a tableswitch payload; the cursor sits just past the opcode.
support::Expected<TableSwitch> readTableSwitch(ByteCursor &cursor, uint32_t instrOffset);

/// @brief Read a lookupswitch payload; the cursor sits just past the opcode.
support::Expected<LookupSwitch> readLookupSwitch(ByteCursor &cursor, uint32_t instrOffset);

/// @brief Render a tableswitch, one jump target per line.
std::string renderTableSwitch(const TableSwitch &table);

/// @brief Render a lookupswitch, one case per line.
std::string renderLookupSwitch(const LookupSwitch &table);

} // namespace classlens::bytecode
