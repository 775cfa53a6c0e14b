//===----------------------------------------------------------------------===//
//
// Part of the ClassLens project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/classlens-dis/cli.hpp
// Purpose: Command-line option model and parser for classlens-dis.
// Key invariants: Parsing never touches the filesystem; it only records what
//                 the user asked for.
// Ownership/Lifetime: Options own copies of every string they keep.
// Links: src/tools/classlens-dis/driver.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "classlens/bytecode/Decoder.hpp"

#include <iosfwd>
#include <string>

namespace classlens::tools::dis
{

/// @brief Options recognised by classlens-dis.
struct DisOptions
{
    std::string codePath;   ///< Code array to disassemble.
    std::string poolPath;   ///< Optional constant-pool description file.
    std::string origin;     ///< Label for diagnostics; defaults to codePath.
    bool hexInput = false;  ///< Input is hex text rather than raw bytes.
    bool listOpcodes = false;
    bool showVersion = false;
    bool showHelp = false;
    bytecode::DecodeOptions decode{};
};

/// @brief Outcome of parsing a single command-line option.
enum class OptionParseResult
{
    NotMatched, ///< Argument is not a recognised option.
    Parsed,     ///< Argument consumed and reflected in the options.
    Error       ///< Argument looked like an option but was malformed.
};

/// @brief Parse the option at @p index, advancing it past any consumed value.
OptionParseResult parseOption(int &index, int argc, char **argv, DisOptions &opts);

/// @brief Parse the full argument vector (argv[0] is the program name).
/// @return True when the arguments form a valid invocation; on failure a
///         message has been written to @p err.
bool parseArgs(int argc, char **argv, DisOptions &opts, std::ostream &err);

/// @brief Print the usage text.
void printUsage(std::ostream &os);

} // namespace classlens::tools::dis
