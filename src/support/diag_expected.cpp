//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic-oriented Expected helpers. The utilities here wrap
// structured diagnostics around an Expected<void> type, provide the
// severity-to-string mapping, and print diagnostics with optional manifest
// location context so every stage of the generator reports errors alike.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Supplies the `Expected<void>` helpers specialized for diagnostics.

#include "support/diag_expected.hpp"

namespace tether::support
{
/// @brief Construct an Expected<void> that stores a diagnostic error state.
/// @param diag Diagnostic to transfer into the error payload.
Expected<void>::Expected(Diag diag) : error_(std::move(diag))
{
}

/// @brief Success is indicated by the absence of a stored diagnostic.
bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

Expected<void>::operator bool() const
{
    return hasValue();
}

/// @brief Access the diagnostic that describes the recorded failure.
/// @details Callers must check hasValue() first.
const Diag &Expected<void>::error() const &
{
    return *error_;
}

namespace detail
{
/// @brief Map a diagnostic severity to a lowercase string used for printing.
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

Diag makeError(SourceLoc loc, std::string msg, DiagKind kind)
{
    return Diag{Severity::Error, std::move(msg), loc, kind};
}

Diag makeWarning(SourceLoc loc, std::string msg, DiagKind kind)
{
    return Diag{Severity::Warning, std::move(msg), loc, kind};
}

Diag makeConfigError(SourceLoc loc, std::string msg)
{
    return makeError(loc, std::move(msg), DiagKind::Configuration);
}

/// @brief Print a diagnostic to the provided output stream.
///
/// @details When a source manager is supplied and the location names a
///          registered manifest, the message is prefixed with
///          "<path>:<line>:<column>:" in the usual compiler style. A trailing
///          newline is always written so batches print as a contiguous block.
///
/// @param diag Diagnostic to render.
/// @param os Output stream receiving the textual representation.
/// @param sm Optional source manager for mapping file identifiers to paths.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm)
{
    if (sm && diag.loc.file_id != 0)
    {
        auto path = sm->getPath(diag.loc.file_id);
        if (!path.empty())
        {
            os << path;
            if (diag.loc.line != 0)
            {
                os << ':' << diag.loc.line;
                if (diag.loc.column != 0)
                {
                    os << ':' << diag.loc.column;
                }
            }
            os << ": ";
        }
    }
    os << detail::diagSeverityToString(diag.severity) << ": " << diag.message << '\n';
}
} // namespace tether::support
