//===----------------------------------------------------------------------===//
//
// Part of the ClassLens project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/classlens/bytecode/Decoder.hpp
// Purpose: Public entry point turning a JVM code array into decoded instructions.
// Key invariants: Instructions are returned in stream order with strictly
//                 increasing offsets; a truncated instruction is never returned.
// Ownership/Lifetime: Results are owned by the caller; the decoder keeps no
//                     state between calls and is safe to run concurrently.
// Links: src/bytecode/Decoder.cpp, include/classlens/bytecode/Listing.hpp
//
//===----------------------------------------------------------------------===//
//
// The decoder walks the code array one instruction at a time.  Each opcode is
// looked up in the instruction catalog, its operands are read according to the
// entry's operand shape, and the result is recorded as a DecodedInstruction
// holding the opcode offset, the raw opcode byte, a human-readable rendering
// and, for instructions that reference the constant pool, the pool index.
//
// Malformed input is handled in two tiers.  Undefined opcodes, illegal opcodes
// after `wide` and unknown `newarray` type codes are rendered as placeholder
// text and decoding continues.  Running out of bytes in the middle of an
// instruction ends decoding: everything decoded before the truncation point is
// returned and the failure is reported separately.

#pragma once

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace classlens::support
{
class DiagnosticEngine;
} // namespace classlens::support

namespace classlens::bytecode
{

/// @brief One decoded instruction.
struct DecodedInstruction
{
    uint32_t offset = 0; ///< Byte position of the opcode within the code array.
    uint8_t opcode = 0;  ///< Raw opcode byte.
    std::string text;    ///< Mnemonic plus operands; multi-line for switches.

    /// @brief Constant-pool index referenced by the instruction, if any.
    std::optional<uint32_t> constantPoolIndex;

    bool operator==(const DecodedInstruction &) const = default;
};

/// @brief Categories of malformed input the decoder recognises.
enum class DecodeErrorKind : uint8_t
{
    TruncatedStream,   ///< An operand runs past the end of the buffer (fatal).
    UnknownOpcode,     ///< The opcode byte has no catalog entry.
    UnknownWideOpcode, ///< The byte after `wide` is not a widenable opcode.
    UnknownArrayType   ///< `newarray` type code outside 4..11.
};

/// @brief Stable lowercase name of @p kind for diagnostics.
const char *toString(DecodeErrorKind kind);

/// @brief Fatal failure that ended a decode early.
struct DecodeFailure
{
    DecodeErrorKind kind; ///< What went wrong.
    uint32_t offset;      ///< Offset of the instruction being decoded.
    std::string message;  ///< Human-readable explanation.
};

/// @brief Ordered decode output plus the fatal failure, if any.
struct DecodeResult
{
    std::vector<DecodedInstruction> instructions;
    std::optional<DecodeFailure> failure;

    /// @brief True when the whole buffer was decoded.
    [[nodiscard]] bool complete() const
    {
        return !failure.has_value();
    }
};

/// @brief Reaction to an opcode byte with no catalog entry.
enum class UnknownOpcodePolicy : uint8_t
{
    /// Emit an "[Unknown opcode]" placeholder and resume at the next byte.
    /// The true operand width is unknowable, so later offsets may be skewed.
    BestEffort,
    /// Stop decoding and report an UnknownOpcode failure.
    Strict
};

/// @brief Configuration for instruction tracing.
struct TraceConfig
{
    /// @brief Emit one trace line per decoded instruction when true.
    bool enabled = false;

    /// @brief Destination stream; std::cerr when null.
    std::ostream *os = nullptr;
};

/// @brief Options controlling a decode run.
struct DecodeOptions
{
    UnknownOpcodePolicy unknownOpcodes = UnknownOpcodePolicy::BestEffort;
    TraceConfig trace{};
};

/// @brief Decode @p code with default options.
/// @details Truncation is reported on std::cerr in addition to the returned
///          failure record.  Empty input yields an empty, complete result.
DecodeResult decode(std::span<const uint8_t> code);

/// @brief Decode @p code using @p opts.
/// @param code Code array exactly as long as its declared length.
/// @param opts Unknown-opcode policy and tracing.
/// @param diags Optional engine receiving a warning per non-fatal problem and
///        an error for the failure that ended decoding.  When null, the fatal
///        failure is printed to std::cerr instead.
DecodeResult decode(std::span<const uint8_t> code,
                    const DecodeOptions &opts,
                    support::DiagnosticEngine *diags = nullptr);

} // namespace classlens::bytecode
