//===----------------------------------------------------------------------===//
//
// Part of the ClassLens project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/classlens-dis/input.hpp
// Purpose: Load code arrays and constant-pool descriptions for classlens-dis.
// Key invariants: Loaders either return the complete payload or a single
//                 error diagnostic; partial input is never returned.
// Ownership/Lifetime: Returned buffers and resolvers are owned by the caller.
// Links: src/tools/classlens-dis/driver.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Input loaders used by the disassembler front end.
/// @details Code arrays come either as raw bytes or as hex text in which
///          whitespace separates byte groups and '#' starts a comment that runs
///          to the end of the line.  Constant-pool descriptions are text files
///          with one "INDEX: DESCRIPTION" entry per line.

#pragma once

#include "classlens/bytecode/Listing.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace classlens::tools::dis
{

/// @brief Parse hex text into bytes.
/// @param text Hex digit pairs; whitespace and '#' comments are ignored.
/// @return Decoded bytes, or an error naming the offending line.
support::Expected<std::vector<uint8_t>> parseHexText(std::string_view text);

/// @brief Read @p path as raw bytes, or as hex text when @p hex is true.
support::Expected<std::vector<uint8_t>> loadCodeFile(const std::string &path, bool hex);

/// @brief Parse "INDEX: DESCRIPTION" lines into a resolver.
support::Expected<bytecode::MapConstantPoolResolver> parsePoolText(std::string_view text);

/// @brief Read and parse the constant-pool description file at @p path.
support::Expected<bytecode::MapConstantPoolResolver> loadPoolFile(const std::string &path);

} // namespace classlens::tools::dis
