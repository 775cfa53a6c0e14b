//===----------------------------------------------------------------------===//
//
// Part of the ClassLens project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic-oriented Expected helpers used across the support
// library.  The utilities defined here wrap structured diagnostics around an
// Expected<void> type, provide consistent severity-to-string mapping, and
// print diagnostics with optional code-offset context so every subsystem
// reports errors in a uniform format.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Supplies the `Expected<void>` helpers specialized for diagnostics.

#include "support/diag_expected.hpp"

#include <cstdio>

namespace classlens::support
{
/// @brief Construct an Expected<void> that stores a diagnostic error state.
///
/// @details A default-constructed `Expected` contains no diagnostic payload and
///          represents success.
///
/// @param diag Diagnostic to transfer into the error payload.
Expected<void>::Expected(Diag diag) : error_(std::move(diag))
{
}

/// @brief Report whether the Expected<void> represents a successful outcome.
///
/// @return True if the instance holds no diagnostic (success), otherwise false.
bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

/// @brief Allow Expected<void> to participate directly in boolean tests.
Expected<void>::operator bool() const
{
    return hasValue();
}

/// @brief Access the diagnostic that describes the recorded failure.
///
/// @details Callers must ensure the `Expected` represents an error before
///          invoking this accessor.
///
/// @return Reference to the stored diagnostic payload.
const Diag &Expected<void>::error() const &
{
    return *error_;
}

namespace detail
{
/// @brief Map a diagnostic severity to a lowercase string used for printing.
///
/// @param severity Severity enumeration value to translate.
/// @return Null-terminated string naming the severity level.
const char *diagSeverityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}
} // namespace detail

/// @brief Build an error diagnostic with the provided location and message.
///
/// @param loc Code location that triggered the diagnostic, or unknown.
/// @param msg Human-readable description of the problem.
/// @return Diagnostic populated with error severity and provided context.
Diag makeError(CodeLoc loc, std::string msg)
{
    return Diag{Severity::Error, std::move(msg), loc};
}

/// @brief Build a warning diagnostic with the provided location and message.
Diag makeWarning(CodeLoc loc, std::string msg)
{
    return Diag{Severity::Warning, std::move(msg), loc};
}

/// @brief Print a diagnostic to the provided output stream.
///
/// @details The line reads "<origin>:offset NNNN: <severity>: <message>".  The
///          origin is omitted when empty and the offset part is omitted when
///          the diagnostic has no code location, leaving the familiar
///          "<severity>: <message>" form.  Offsets use the same four-digit
///          decimal padding as the instruction listing so the two can be
///          cross-referenced by eye.  A trailing newline is always emitted.
///
/// @param diag Diagnostic to render.
/// @param os Output stream receiving the textual representation.
/// @param origin Optional label such as the input file path.
void printDiag(const Diag &diag, std::ostream &os, std::string_view origin)
{
    if (!origin.empty())
    {
        os << origin << ':';
        if (!diag.loc.isValid())
            os << ' ';
    }
    if (diag.loc.isValid())
    {
        char buf[24];
        std::snprintf(buf, sizeof(buf), "offset %04u", static_cast<unsigned>(diag.loc.offset));
        os << buf << ": ";
    }
    os << detail::diagSeverityToString(diag.severity) << ": " << diag.message << '\n';
}
} // namespace classlens::support
