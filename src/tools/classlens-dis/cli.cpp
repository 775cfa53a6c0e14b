//===----------------------------------------------------------------------===//
//
// Part of the ClassLens project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements option parsing for classlens-dis.  Flags may appear before or
// after the positional code path; options taking a value consume the next
// argument.
//
//===----------------------------------------------------------------------===//

#include "tools/classlens-dis/cli.hpp"

#include <ostream>
#include <string_view>

namespace classlens::tools::dis
{

namespace
{
/// @brief Fetch the value following option @p name, advancing @p index.
bool takeValue(int &index, int argc, char **argv, std::string &out)
{
    if (index + 1 >= argc)
        return false;
    out = argv[++index];
    return !out.empty();
}
} // namespace

OptionParseResult parseOption(int &index, int argc, char **argv, DisOptions &opts)
{
    const std::string_view arg = argv[index];
    if (arg == "--hex")
    {
        opts.hexInput = true;
        return OptionParseResult::Parsed;
    }
    if (arg == "--strict")
    {
        opts.decode.unknownOpcodes = bytecode::UnknownOpcodePolicy::Strict;
        return OptionParseResult::Parsed;
    }
    if (arg == "--trace")
    {
        opts.decode.trace.enabled = true;
        return OptionParseResult::Parsed;
    }
    if (arg == "--list-opcodes")
    {
        opts.listOpcodes = true;
        return OptionParseResult::Parsed;
    }
    if (arg == "--version")
    {
        opts.showVersion = true;
        return OptionParseResult::Parsed;
    }
    if (arg == "-h" || arg == "--help")
    {
        opts.showHelp = true;
        return OptionParseResult::Parsed;
    }
    if (arg == "--pool")
    {
        return takeValue(index, argc, argv, opts.poolPath) ? OptionParseResult::Parsed
                                                           : OptionParseResult::Error;
    }
    if (arg == "--origin")
    {
        return takeValue(index, argc, argv, opts.origin) ? OptionParseResult::Parsed
                                                         : OptionParseResult::Error;
    }
    return OptionParseResult::NotMatched;
}

bool parseArgs(int argc, char **argv, DisOptions &opts, std::ostream &err)
{
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];
        switch (parseOption(i, argc, argv, opts))
        {
            case OptionParseResult::Parsed:
                continue;
            case OptionParseResult::Error:
                err << "error: missing value for " << arg << "\n";
                return false;
            case OptionParseResult::NotMatched:
                break;
        }
        if (arg.size() > 1 && arg.front() == '-')
        {
            err << "error: unknown option " << arg << "\n";
            return false;
        }
        if (!opts.codePath.empty())
        {
            err << "error: more than one input file given\n";
            return false;
        }
        opts.codePath = std::string(arg);
    }

    if (opts.showHelp || opts.showVersion || opts.listOpcodes)
        return true;
    if (opts.codePath.empty())
    {
        err << "error: no input file\n";
        return false;
    }
    if (opts.origin.empty())
        opts.origin = opts.codePath;
    return true;
}

void printUsage(std::ostream &os)
{
    os << "Usage: classlens-dis [options] <code-file>\n"
          "\n"
          "Disassemble a JVM method code array.\n"
          "\n"
          "Options:\n"
          "  --hex            Read the input as hex text ('#' starts a comment)\n"
          "  --pool FILE      Describe constant-pool entries from FILE (INDEX: TEXT)\n"
          "  --origin NAME    Label used in diagnostics (default: the input path)\n"
          "  --strict         Stop at the first undefined opcode\n"
          "  --trace          Echo each decoded instruction to stderr\n"
          "  --list-opcodes   Print the instruction catalog and exit\n"
          "  --version        Print the version and exit\n"
          "  -h, --help       Show this help\n";
}

} // namespace classlens::tools::dis
