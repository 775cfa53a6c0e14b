//===----------------------------------------------------------------------===//
//
// Part of the ClassLens project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/classlens/bytecode/Listing.hpp
// Purpose: Render decoded instructions as a human-readable listing.
// Key invariants: One line per instruction; descriptions never exceed
//                 kMaxDescriptionLength characters.
// Ownership/Lifetime: Resolvers are borrowed for the duration of a call.
// Links: include/classlens/bytecode/Decoder.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "classlens/bytecode/Decoder.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <string>

namespace classlens::bytecode
{

/// @brief Longest constant-pool description shown in a listing line.
inline constexpr std::size_t kMaxDescriptionLength = 1000;

/// @brief Source of human-readable constant-pool entry descriptions.
class ConstantPoolResolver
{
  public:
    virtual ~ConstantPoolResolver() = default;

    /// @brief Describe pool entry @p index, or nullopt when it is unknown.
    virtual std::optional<std::string> describe(uint32_t index) const = 0;
};

/// @brief Resolver backed by an in-memory index-to-description map.
class MapConstantPoolResolver final : public ConstantPoolResolver
{
  public:
    MapConstantPoolResolver() = default;

    explicit MapConstantPoolResolver(std::map<uint32_t, std::string> entries);

    /// @brief Add or replace the description of entry @p index.
    void set(uint32_t index, std::string description);

    [[nodiscard]] std::size_t size() const
    {
        return entries_.size();
    }

    std::optional<std::string> describe(uint32_t index) const override;

  private:
    std::map<uint32_t, std::string> entries_;
};

/// @brief Format @p instr as "Offset NNNN: opcode [XX] text".
/// @details When the instruction references the constant pool the index is
///          appended; if @p resolver describes it, " - description" follows,
///          cut to its first kMaxDescriptionLength characters.
std::string formatInstruction(const DecodedInstruction &instr,
                              const ConstantPoolResolver *resolver = nullptr);

/// @brief Write every instruction of @p result to @p os, one line each.
void writeListing(std::ostream &os,
                  const DecodeResult &result,
                  const ConstantPoolResolver *resolver = nullptr);

} // namespace classlens::bytecode
