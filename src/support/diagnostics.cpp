//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/**
 * @file diagnostics.cpp
 * @brief Implements the diagnostic engine responsible for collecting messages.
 * @details
 *     The engine aggregates messages emitted by passes and the verifier and
 *     keeps track of severity counts.  Diagnostics are stored until callers
 *     explicitly print or inspect them.
 */

#include "diagnostics.hpp"
#include "diag_expected.hpp"

namespace sentinel::support
{
/**
 * @brief Adds a diagnostic to the engine and updates severity counters.
 *
 * Notes are stored but do not affect either counter.
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
 * Formatting is delegated to `printDiag` so single diagnostics and batches
 * share the same layout.
 *
 * @param os Output stream that receives the formatted diagnostics.
 */
void DiagnosticEngine::printAll(std::ostream &os) const
{
    for (const auto &d : diags_)
    {
        printDiag(d, os);
    }
}

/**
 * @brief Returns the number of error-severity diagnostics recorded so far.
 */
size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

/**
 * @brief Returns the number of warning-severity diagnostics recorded so far.
 */
size_t DiagnosticEngine::warningCount() const
{
    return warnings_;
}
} // namespace sentinel::support
