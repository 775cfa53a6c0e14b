//===----------------------------------------------------------------------===//
//
// Part of the ClassLens project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the classlens-dis pipeline: parse arguments, load the code array
// and optional pool descriptions, decode, then print the listing followed by
// any diagnostics.  Instructions decoded before a truncation are still listed.
//
//===----------------------------------------------------------------------===//

#include "tools/classlens-dis/driver.hpp"

#include "bytecode/InstructionCatalog.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "tools/classlens-dis/input.hpp"

#include <cstdio>
#include <optional>
#include <ostream>
#include <utility>

namespace classlens::tools::dis
{

namespace
{
constexpr const char *kVersion = "classlens-dis 0.1.0";
} // namespace

int runDisassembly(const DisOptions &opts,
                   std::span<const uint8_t> code,
                   const bytecode::ConstantPoolResolver *resolver,
                   std::ostream &out,
                   std::ostream &err)
{
    bytecode::DecodeOptions decodeOpts = opts.decode;
    if (decodeOpts.trace.enabled && !decodeOpts.trace.os)
        decodeOpts.trace.os = &err;

    support::DiagnosticEngine diags;
    const bytecode::DecodeResult result = bytecode::decode(code, decodeOpts, &diags);
    bytecode::writeListing(out, result, resolver);
    diags.printAll(err, opts.origin);
    return result.complete() ? kExitOk : kExitFailure;
}

void listOpcodes(std::ostream &out)
{
    for (const auto &def : bytecode::allInstructions())
    {
        char code[8];
        std::snprintf(code, sizeof(code), "0x%02X", static_cast<unsigned>(def.opcode));
        out << code << ' ' << bytecode::displayName(def) << ' ' << bytecode::toString(def.shape)
            << '\n';
    }
}

int runCLI(int argc, char **argv, std::ostream &out, std::ostream &err)
{
    DisOptions opts;
    if (!parseArgs(argc, argv, opts, err))
    {
        printUsage(err);
        return kExitUsage;
    }
    if (opts.showHelp)
    {
        printUsage(out);
        return kExitOk;
    }
    if (opts.showVersion)
    {
        out << kVersion << '\n';
        return kExitOk;
    }
    if (opts.listOpcodes)
    {
        listOpcodes(out);
        return kExitOk;
    }

    auto code = loadCodeFile(opts.codePath, opts.hexInput);
    if (!code)
    {
        support::printDiag(code.error(), err, opts.origin);
        return kExitFailure;
    }

    std::optional<bytecode::MapConstantPoolResolver> pool;
    if (!opts.poolPath.empty())
    {
        auto loaded = loadPoolFile(opts.poolPath);
        if (!loaded)
        {
            support::printDiag(loaded.error(), err, opts.poolPath);
            return kExitFailure;
        }
        pool = std::move(loaded.value());
    }

    return runDisassembly(opts, code.value(), pool ? &*pool : nullptr, out, err);
}

} // namespace classlens::tools::dis
