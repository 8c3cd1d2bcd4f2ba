/**
 * @file diagnostics.cpp
 * @brief Implements the diagnostic engine responsible for collecting messages.
 * @copyright
 *     MIT License. See the LICENSE file in the project root for full terms.
 * @details
 *     The engine aggregates messages emitted while a manifest is parsed and
 *     planned, and keeps track of severity counts. Diagnostics are stored until
 *     the generator driver prints or inspects them.
 */

#include "support/diagnostics.hpp"
#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

namespace tether::support
{
/**
 * @brief Adds a diagnostic to the engine and updates severity counters.
 *
 * When warnings are being treated as errors the diagnostic is upgraded before
 * it is counted, so a `--werror` run fails on the first fast-path fallback.
 *
 * @param d Diagnostic to record; moved into the engine's storage.
 */
void DiagnosticEngine::report(Diagnostic d)
{
    if (warningsAreErrors_ && d.severity == Severity::Warning)
        d.severity = Severity::Error;

    if (d.severity == Severity::Error)
        ++errors_;
    else if (d.severity == Severity::Warning)
        ++warnings_;
    diags_.push_back(std::move(d));
}

/**
 * @brief Writes all stored diagnostics to the provided output stream.
 *
 * Formatting is delegated to `printDiag` so single diagnostics and batches use
 * identical wording.
 *
 * @param os Output stream that receives the formatted diagnostics.
 * @param sm Optional source manager used to translate file identifiers.
 */
void DiagnosticEngine::printAll(std::ostream &os, const SourceManager *sm) const
{
    for (const auto &d : diags_)
    {
        printDiag(d, os, sm);
    }
}

/**
 * @brief Upgrade warnings to errors, both those already stored and any that
 *        arrive later.
 */
void DiagnosticEngine::promoteWarningsToErrors()
{
    warningsAreErrors_ = true;
    for (auto &d : diags_)
    {
        if (d.severity != Severity::Warning)
            continue;
        d.severity = Severity::Error;
        --warnings_;
        ++errors_;
    }
}

/// @return Number of stored diagnostics with severity `Error`.
size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

/// @return Number of stored diagnostics with severity `Warning`.
size_t DiagnosticEngine::warningCount() const
{
    return warnings_;
}

const std::vector<Diagnostic> &DiagnosticEngine::diagnostics() const
{
    return diags_;
}
} // namespace tether::support
