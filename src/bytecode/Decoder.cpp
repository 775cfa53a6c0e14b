//===----------------------------------------------------------------------===//
//
// Part of the ClassLens project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the instruction stream driver.  The driver owns the cursor for
// the duration of one call, dispatches each opcode through the catalog and the
// operand codec, and translates codec outcomes into decoded instructions,
// warnings and the terminating failure.
//
//===----------------------------------------------------------------------===//

#include "classlens/bytecode/Decoder.hpp"

#include "bytecode/ByteCursor.hpp"
#include "bytecode/DecodeTrace.hpp"
#include "bytecode/InstructionCatalog.hpp"
#include "bytecode/OperandCodec.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"

#include <cstdio>
#include <iostream>
#include <span>
#include <string>
#include <utility>

namespace classlens::bytecode
{

const char *toString(DecodeErrorKind kind)
{
    switch (kind)
    {
        case DecodeErrorKind::TruncatedStream:
            return "truncated-stream";
        case DecodeErrorKind::UnknownOpcode:
            return "unknown-opcode";
        case DecodeErrorKind::UnknownWideOpcode:
            return "unknown-wide-opcode";
        case DecodeErrorKind::UnknownArrayType:
            return "unknown-array-type";
    }
    return "unknown";
}

namespace
{

std::string hexByte(uint8_t value)
{
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%02X", static_cast<unsigned>(value));
    return buf;
}

/// @brief Message attached to a non-fatal issue found at @p offset.
std::string issueMessage(DecodeErrorKind kind, const ByteCursor &cursor, uint32_t offset,
                         std::span<const uint8_t> code)
{
    switch (kind)
    {
        case DecodeErrorKind::UnknownOpcode:
            return "unknown opcode " + hexByte(code[offset]);
        case DecodeErrorKind::UnknownWideOpcode:
            return "opcode " + hexByte(code[offset + 1]) + " cannot follow wide";
        case DecodeErrorKind::UnknownArrayType:
            return "unknown newarray type code " + std::to_string(code[cursor.offset() - 1]);
        case DecodeErrorKind::TruncatedStream:
            break;
    }
    return toString(kind);
}

/// @brief Per-call decoding state.
class StreamDecoder
{
  public:
    StreamDecoder(std::span<const uint8_t> code,
                  const DecodeOptions &opts,
                  support::DiagnosticEngine *diags)
        : code_(code), cursor_(code), opts_(opts), diags_(diags), trace_(opts.trace)
    {
    }

    DecodeResult run()
    {
        while (!cursor_.atEnd() && !result_.failure)
            step();
        return std::move(result_);
    }

  private:
    void step()
    {
        const uint32_t offset = cursor_.offset();
        uint8_t byte = 0;
        if (!cursor_.readU1(byte))
            return;

        const InstructionDef *def = lookup(byte);
        if (!def)
        {
            if (opts_.unknownOpcodes == UnknownOpcodePolicy::Strict)
            {
                fail(DecodeErrorKind::UnknownOpcode,
                     support::makeError(support::CodeLoc::at(offset),
                                        issueMessage(DecodeErrorKind::UnknownOpcode, cursor_,
                                                     offset, code_)));
                return;
            }
            warn(DecodeErrorKind::UnknownOpcode, offset);
            append(DecodedInstruction{offset, byte, std::string(kUnknownOpcodeText), std::nullopt},
                   offset);
            return;
        }

        auto operands = decodeOperands(*def, cursor_, offset);
        if (!operands)
        {
            fail(DecodeErrorKind::TruncatedStream, operands.error());
            return;
        }

        DecodedOperands &ops = operands.value();
        if (ops.issue)
            warn(*ops.issue, offset);
        append(DecodedInstruction{offset, byte, std::move(ops.text), ops.constantPoolIndex},
               offset);
    }

    void append(DecodedInstruction instr, uint32_t offset)
    {
        trace_.onInstruction(instr, cursor_.offset() - offset);
        result_.instructions.push_back(std::move(instr));
    }

    void warn(DecodeErrorKind kind, uint32_t offset)
    {
        if (!diags_)
            return;
        diags_->report(support::makeWarning(support::CodeLoc::at(offset),
                                            issueMessage(kind, cursor_, offset, code_)));
    }

    void fail(DecodeErrorKind kind, const support::Diag &diag)
    {
        result_.failure = DecodeFailure{kind, diag.loc.offset, diag.message};
        if (diags_)
            diags_->report(diag);
        else
            support::printDiag(diag, std::cerr);
    }

    std::span<const uint8_t> code_;
    ByteCursor cursor_;
    const DecodeOptions &opts_;
    support::DiagnosticEngine *diags_;
    DecodeTraceSink trace_;
    DecodeResult result_;
};

} // namespace

DecodeResult decode(std::span<const uint8_t> code)
{
    return decode(code, DecodeOptions{});
}

DecodeResult decode(std::span<const uint8_t> code,
                    const DecodeOptions &opts,
                    support::DiagnosticEngine *diags)
{
    StreamDecoder decoder(code, opts, diags);
    return decoder.run();
}

} // namespace classlens::bytecode
