//===----------------------------------------------------------------------===//
//
// Part of the ClassLens project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/DecodeTrace.hpp
// Purpose: Declare the sink that echoes decoded instructions when tracing.
// Key invariants: Trace output is deterministic and line-oriented; exactly one
//                 line per decoded instruction.
// Ownership/Lifetime: Sink holds configuration by value; the target stream is
//                     borrowed and must outlive the sink.
// Links: include/classlens/bytecode/Decoder.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "classlens/bytecode/Decoder.hpp"

#include <cstddef>
#include <ostream>

namespace classlens::bytecode
{

/// @brief Sink that formats and emits one trace line per instruction.
class DecodeTraceSink
{
  public:
    /// @brief Create sink with configuration @p cfg.
    explicit DecodeTraceSink(TraceConfig cfg = {});

    /// @brief Record that @p instr was decoded from @p length bytes.
    void onInstruction(const DecodedInstruction &instr, std::size_t length);

  private:
    std::ostream &stream() const;

    TraceConfig cfg; ///< Active configuration
};

} // namespace classlens::bytecode
