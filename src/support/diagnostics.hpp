//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Declares diagnostic engine for build-time errors and warnings.
// Key invariants: Counts reflect reported diagnostics.
// Ownership/Lifetime: Engine owns collected diagnostics.
// Links: docs/manifest-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace tether::support
{

class SourceManager;

/// @brief Severity levels for diagnostics.
enum class Severity
{
    Note,
    Warning,
    Error
};

/// @brief Build-time category of a diagnostic.
/// @details Lets callers and tests tell a manifest syntax problem from a
///          configuration error or a fast-path fallback without matching on
///          message text.
enum class DiagKind
{
    General,          ///< Uncategorised (I/O, internal).
    Syntax,           ///< Malformed manifest text.
    Configuration,    ///< Invalid binding configuration; always fatal.
    FastPathFallback, ///< Fast path requested but an eligibility gate failed.
};

/// @brief Single diagnostic message with location.
struct Diagnostic
{
    Severity severity;                 ///< Message severity
    std::string message;               ///< Human-readable text
    SourceLoc loc;                     ///< Optional source location
    DiagKind kind = DiagKind::General; ///< Category used for filtering
};

/// @brief Collects diagnostics and prints them in order.
class DiagnosticEngine
{
  public:
    /// @brief Record diagnostic @p d.
    void report(Diagnostic d);

    /// @brief Print all recorded diagnostics to stream @p os.
    /// @param sm Optional source manager for location info.
    void printAll(std::ostream &os, const SourceManager *sm = nullptr) const;

    /// @brief Re-label every recorded and future warning as an error.
    void promoteWarningsToErrors();

    /// @brief Number of errors reported.
    size_t errorCount() const;

    /// @brief Number of warnings reported.
    size_t warningCount() const;

    /// @brief Recorded diagnostics in report order.
    const std::vector<Diagnostic> &diagnostics() const;

  private:
    std::vector<Diagnostic> diags_;
    size_t errors_ = 0;
    size_t warnings_ = 0;
    bool warningsAreErrors_ = false;
};
} // namespace tether::support
