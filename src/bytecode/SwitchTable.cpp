//===----------------------------------------------------------------------===//
//
// Part of the ClassLens project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the decoder for the two jump-table instructions.  Both start with
// zero to three padding bytes so that the 32-bit payload begins at an offset
// that is a multiple of four from the start of the code array.  The payload is
// transcribed exactly as stored: offsets stay relative to the switch
// instruction and lookupswitch match values are not checked for ordering.
//
//===----------------------------------------------------------------------===//

#include "bytecode/SwitchTable.hpp"

#include "bytecode/OperandCodec.hpp"

#include <sstream>

namespace classlens::bytecode
{

namespace
{
constexpr const char *kIndent = "    ";

/// @brief Number of tableswitch entries, clamped at zero when high < low.
///
/// Computed in 64 bits: high - low + 1 overflows int32 for extreme bounds.
int64_t tableLength(int32_t low, int32_t high)
{
    const int64_t count = static_cast<int64_t>(high) - static_cast<int64_t>(low) + 1;
    return count > 0 ? count : 0;
}
} // namespace

support::Expected<TableSwitch> readTableSwitch(ByteCursor &cursor, uint32_t instrOffset)
{
    if (!cursor.alignTo4())
        return detail::truncated(instrOffset, "tableswitch padding", 4 - cursor.offset() % 4, cursor);

    TableSwitch table;
    if (!cursor.readS4(table.defaultOffset) || !cursor.readS4(table.low) ||
        !cursor.readS4(table.high))
    {
        return detail::truncated(instrOffset, "tableswitch header", 12, cursor);
    }

    const int64_t count = tableLength(table.low, table.high);
    const uint64_t needed = static_cast<uint64_t>(count) * 4;
    if (needed > cursor.remaining())
        return detail::truncated(instrOffset, "tableswitch offsets", needed, cursor);

    table.offsets.reserve(static_cast<size_t>(count));
    for (int64_t i = 0; i < count; ++i)
    {
        int32_t jump = 0;
        if (!cursor.readS4(jump))
            return detail::truncated(instrOffset, "tableswitch offsets", 4, cursor);
        table.offsets.push_back(jump);
    }
    return table;
}

support::Expected<LookupSwitch> readLookupSwitch(ByteCursor &cursor, uint32_t instrOffset)
{
    if (!cursor.alignTo4())
        return detail::truncated(instrOffset, "lookupswitch padding", 4 - cursor.offset() % 4, cursor);

    LookupSwitch table;
    int32_t npairs = 0;
    if (!cursor.readS4(table.defaultOffset) || !cursor.readS4(npairs))
        return detail::truncated(instrOffset, "lookupswitch header", 8, cursor);

    const uint64_t count = npairs > 0 ? static_cast<uint64_t>(npairs) : 0;
    const uint64_t needed = count * 8;
    if (needed > cursor.remaining())
        return detail::truncated(instrOffset, "lookupswitch pairs", needed, cursor);

    table.pairs.reserve(static_cast<size_t>(count));
    for (uint64_t i = 0; i < count; ++i)
    {
        int32_t match = 0;
        int32_t jump = 0;
        if (!cursor.readS4(match) || !cursor.readS4(jump))
            return detail::truncated(instrOffset, "lookupswitch pairs", 8, cursor);
        table.pairs.emplace_back(match, jump);
    }
    return table;
}

std::string renderTableSwitch(const TableSwitch &table)
{
    std::ostringstream os;
    os << "tableswitch " << table.low << " to " << table.high
       << ": default=" << table.defaultOffset;
    for (int32_t jump : table.offsets)
        os << '\n' << kIndent << jump;
    return os.str();
}

std::string renderLookupSwitch(const LookupSwitch &table)
{
    std::ostringstream os;
    os << "lookupswitch: default=" << table.defaultOffset;
    for (const auto &[match, jump] : table.pairs)
        os << '\n' << kIndent << "case " << match << ": " << jump;
    return os.str();
}

} // namespace classlens::bytecode
