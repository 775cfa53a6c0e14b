//===----------------------------------------------------------------------===//
//
// Part of the ClassLens project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the file loaders behind classlens-dis.  Syntax errors are
// reported with the 1-based line number since the byte offset of a hex digit
// in the text has no relation to offsets in the decoded code array.
//
//===----------------------------------------------------------------------===//

#include "tools/classlens-dis/input.hpp"

#include <charconv>
#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>

namespace classlens::tools::dis
{

namespace
{

support::Diag lineError(size_t line, const std::string &message)
{
    return support::makeError({}, "line " + std::to_string(line) + ": " + message);
}

int hexValue(char ch)
{
    if (ch >= '0' && ch <= '9')
        return ch - '0';
    if (ch >= 'a' && ch <= 'f')
        return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F')
        return ch - 'A' + 10;
    return -1;
}

bool isSpace(char ch)
{
    return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\v' || ch == '\f';
}

std::string_view trim(std::string_view text)
{
    while (!text.empty() && isSpace(text.front()))
        text.remove_prefix(1);
    while (!text.empty() && isSpace(text.back()))
        text.remove_suffix(1);
    return text;
}

/// @brief Split @p text at newlines, calling @p fn(lineNumber, line) until it
///        returns false.
template <class Fn> void forEachLine(std::string_view text, Fn &&fn)
{
    size_t lineNo = 1;
    while (!text.empty())
    {
        const size_t nl = text.find('\n');
        const std::string_view line = text.substr(0, nl);
        if (!fn(lineNo, line) || nl == std::string_view::npos)
            return;
        text.remove_prefix(nl + 1);
        ++lineNo;
    }
}

support::Expected<std::string> readFile(const std::string &path, bool binary)
{
    std::ifstream in(path, binary ? std::ios::in | std::ios::binary : std::ios::in);
    if (!in)
        return support::makeError({}, "cannot open " + path);
    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad())
        return support::makeError({}, "cannot read " + path);
    return buf.str();
}

} // namespace

support::Expected<std::vector<uint8_t>> parseHexText(std::string_view text)
{
    std::vector<uint8_t> bytes;
    std::optional<support::Diag> error;
    forEachLine(text, [&](size_t lineNo, std::string_view line) {
        line = line.substr(0, line.find('#'));
        int pending = -1;
        for (char ch : line)
        {
            if (isSpace(ch))
            {
                if (pending >= 0)
                {
                    error = lineError(lineNo, "odd number of hex digits");
                    return false;
                }
                continue;
            }
            const int digit = hexValue(ch);
            if (digit < 0)
            {
                error = lineError(lineNo, std::string("invalid hex digit '") + ch + "'");
                return false;
            }
            if (pending < 0)
            {
                pending = digit;
                continue;
            }
            bytes.push_back(static_cast<uint8_t>((pending << 4) | digit));
            pending = -1;
        }
        if (pending >= 0)
        {
            error = lineError(lineNo, "odd number of hex digits");
            return false;
        }
        return true;
    });
    if (error)
        return *error;
    return bytes;
}

support::Expected<std::vector<uint8_t>> loadCodeFile(const std::string &path, bool hex)
{
    auto contents = readFile(path, !hex);
    if (!contents)
        return contents.error();
    if (hex)
        return parseHexText(contents.value());
    const std::string &raw = contents.value();
    return std::vector<uint8_t>(raw.begin(), raw.end());
}

support::Expected<bytecode::MapConstantPoolResolver> parsePoolText(std::string_view text)
{
    bytecode::MapConstantPoolResolver resolver;
    std::optional<support::Diag> error;
    forEachLine(text, [&](size_t lineNo, std::string_view line) {
        const std::string_view body = trim(line);
        if (body.empty() || body.front() == '#')
            return true;

        const size_t colon = body.find(':');
        if (colon == std::string_view::npos)
        {
            error = lineError(lineNo, "expected 'INDEX: DESCRIPTION'");
            return false;
        }
        const std::string_view digits = trim(body.substr(0, colon));
        uint32_t index = 0;
        auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), index);
        if (digits.empty() || ec != std::errc{} || end != digits.data() + digits.size())
        {
            error = lineError(lineNo, "invalid constant-pool index '" + std::string(digits) + "'");
            return false;
        }
        resolver.set(index, std::string(trim(body.substr(colon + 1))));
        return true;
    });
    if (error)
        return *error;
    return resolver;
}

support::Expected<bytecode::MapConstantPoolResolver> loadPoolFile(const std::string &path)
{
    auto contents = readFile(path, false);
    if (!contents)
        return contents.error();
    return parsePoolText(contents.value());
}

} // namespace classlens::tools::dis
