//===----------------------------------------------------------------------===//
//
// Part of the ClassLens project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Declares the pipeline powering the standalone `classlens-dis` CLI.  The
// entry point is factored into a separate unit so tests can run the whole tool
// with injected streams and in-memory inputs.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "classlens/bytecode/Listing.hpp"
#include "tools/classlens-dis/cli.hpp"

#include <cstdint>
#include <iosfwd>
#include <span>

namespace classlens::tools::dis
{

/// @brief Exit status for a successful run.
inline constexpr int kExitOk = 0;
/// @brief Exit status for decode failures and unreadable input.
inline constexpr int kExitFailure = 1;
/// @brief Exit status for malformed command lines.
inline constexpr int kExitUsage = 2;

/// @brief Decode @p code and write its listing.
///
/// @param opts Decode options and the diagnostic origin label.
/// @param code Code array to decode.
/// @param resolver Optional constant-pool description source.
/// @param out Stream receiving the listing.
/// @param err Stream receiving diagnostics and trace output.
/// @return kExitOk when the whole array decoded, otherwise kExitFailure.
int runDisassembly(const DisOptions &opts,
                   std::span<const uint8_t> code,
                   const bytecode::ConstantPoolResolver *resolver,
                   std::ostream &out,
                   std::ostream &err);

/// @brief Print the instruction catalog, one entry per line.
void listOpcodes(std::ostream &out);

/// @brief Execute the classlens-dis CLI workflow with injectable streams.
/// @return kExitOk, kExitFailure or kExitUsage.
int runCLI(int argc, char **argv, std::ostream &out, std::ostream &err);

} // namespace classlens::tools::dis
