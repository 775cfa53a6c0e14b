//===----------------------------------------------------------------------===//
//
// Part of the ClassLens project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements listing output for decoded instructions.
//
//===----------------------------------------------------------------------===//

#include "classlens/bytecode/Listing.hpp"

#include <cstdio>
#include <utility>

namespace classlens::bytecode
{

MapConstantPoolResolver::MapConstantPoolResolver(std::map<uint32_t, std::string> entries)
    : entries_(std::move(entries))
{
}

void MapConstantPoolResolver::set(uint32_t index, std::string description)
{
    entries_[index] = std::move(description);
}

std::optional<std::string> MapConstantPoolResolver::describe(uint32_t index) const
{
    auto it = entries_.find(index);
    if (it == entries_.end())
        return std::nullopt;
    return it->second;
}

std::string formatInstruction(const DecodedInstruction &instr,
                              const ConstantPoolResolver *resolver)
{
    char head[40];
    std::snprintf(head,
                  sizeof(head),
                  "Offset %04u: opcode [%02X] ",
                  static_cast<unsigned>(instr.offset),
                  static_cast<unsigned>(instr.opcode));
    std::string line = head;
    line += instr.text;

    if (!instr.constantPoolIndex)
        return line;
    line += ' ';
    line += std::to_string(*instr.constantPoolIndex);

    if (!resolver)
        return line;
    if (auto desc = resolver->describe(*instr.constantPoolIndex))
    {
        if (desc->size() > kMaxDescriptionLength)
            desc->resize(kMaxDescriptionLength);
        line += " - ";
        line += *desc;
    }
    return line;
}

void writeListing(std::ostream &os, const DecodeResult &result, const ConstantPoolResolver *resolver)
{
    for (const auto &instr : result.instructions)
        os << formatInstruction(instr, resolver) << '\n';
}

} // namespace classlens::bytecode
