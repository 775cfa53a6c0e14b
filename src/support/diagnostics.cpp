/**
 * @file diagnostics.cpp
 * @brief Implements the diagnostic engine responsible for collecting messages.
 * @copyright
 *     GNU GPL v3. See the LICENSE file in the project root for full terms.
 * @details
 *     The diagnostic engine aggregates messages emitted while decoding a code
 *     buffer and keeps track of severity counts.  Diagnostics are stored until
 *     callers explicitly print or inspect them.
 */

#include "support/diagnostics.hpp"
#include "support/diag_expected.hpp"

namespace classlens::support
{
/**
 * @brief Adds a diagnostic to the engine and updates severity counters.
 *
 * The diagnostic is appended to the internal vector for later inspection.  The
 * method increments the error or warning counter depending on the diagnostic's
 * severity, leaving notes uncounted.
 *
 * @param d Diagnostic to record; moved into the engine's storage.
 */
void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    else if (d.severity == Severity::Warning)
        ++warnings_;
    diags_.push_back(std::move(d));
}

/**
 * @brief Writes all stored diagnostics to the provided output stream.
 *
 * Formatting is delegated to `printDiag` so the engine and the ad-hoc error
 * paths of the tools produce identical lines.
 *
 * @param os Output stream that receives the formatted diagnostics.
 * @param origin Optional label printed before each location.
 */
void DiagnosticEngine::printAll(std::ostream &os, std::string_view origin) const
{
    for (const auto &d : diags_)
    {
        printDiag(d, os, origin);
    }
}

/**
 * @brief Returns the number of error-severity diagnostics recorded so far.
 *
 * @return Number of stored diagnostics with severity `Error`.
 */
size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

/**
 * @brief Returns the number of warning-severity diagnostics recorded so far.
 *
 * @return Number of stored diagnostics with severity `Warning`.
 */
size_t DiagnosticEngine::warningCount() const
{
    return warnings_;
}
} // namespace classlens::support
