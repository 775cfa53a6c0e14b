//===----------------------------------------------------------------------===//
//
// Part of the ClassLens project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements instruction tracing for the decoder.  Lines have the form
//
//   [BC] off=0012 op=0xaa len=28 tableswitch 0 to 2: default=40 | 28 | 32 | 36
//
// Multi-line renderings are folded onto a single line so each instruction
// produces exactly one flushed line regardless of its shape.
//
//===----------------------------------------------------------------------===//

#include "bytecode/DecodeTrace.hpp"

#include <cstdio>
#include <iostream>
#include <locale>
#include <string>

namespace classlens::bytecode
{

namespace
{
/// @brief Temporarily force the classic locale on a stream.
class LocaleGuard
{
    std::ostream &os;
    std::locale oldLoc;

  public:
    explicit LocaleGuard(std::ostream &s) : os(s), oldLoc(s.getloc())
    {
        os.imbue(std::locale::classic());
    }

    ~LocaleGuard()
    {
        os.imbue(oldLoc);
    }
};

/// @brief Join the lines of a rendering with " | ", dropping switch indentation.
std::string foldLines(const std::string &text)
{
    std::string folded;
    folded.reserve(text.size());
    size_t i = 0;
    while (i < text.size())
    {
        if (text[i] == '\n')
        {
            folded += " | ";
            ++i;
            while (i < text.size() && text[i] == ' ')
                ++i;
            continue;
        }
        folded += text[i++];
    }
    return folded;
}
} // namespace

DecodeTraceSink::DecodeTraceSink(TraceConfig cfg) : cfg(cfg) {}

std::ostream &DecodeTraceSink::stream() const
{
    return cfg.os ? *cfg.os : std::cerr;
}

void DecodeTraceSink::onInstruction(const DecodedInstruction &instr, std::size_t length)
{
    if (!cfg.enabled)
        return;
    std::ostream &os = stream();
    LocaleGuard lg(os);
    char head[48];
    std::snprintf(head,
                  sizeof(head),
                  "[BC] off=%04u op=0x%02x len=%zu ",
                  static_cast<unsigned>(instr.offset),
                  static_cast<unsigned>(instr.opcode),
                  length);
    os << head << foldLines(instr.text);
    if (instr.constantPoolIndex)
        os << " #" << *instr.constantPoolIndex;
    os << '\n';
    os.flush();
}

} // namespace classlens::bytecode
