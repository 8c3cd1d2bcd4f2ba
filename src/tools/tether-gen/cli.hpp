//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/tether-gen/cli.hpp
// Purpose: Option parsing and the generation pipeline behind tether-gen.
// Key invariants: runGenerator() writes nothing when any error diagnostic was
//                 reported.
// Ownership/Lifetime: Callers own the streams passed in.
// Links: docs/manifest-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <ostream>
#include <string>

namespace tether::tools
{

/// @brief Exit statuses reported by tether-gen.
enum ExitCode : int
{
    kExitOk = 0,
    kExitDiagnostics = 1,
    kExitIo = 2,
};

struct CliOptions
{
    /// @brief Path of the `.tether` manifest.
    std::string input{};

    /// @brief Output stem; `<stem>.hpp` and `<stem>.cpp` are written.
    std::string outStem{};

    /// @brief Overrides the manifest's `namespace` item.
    std::optional<std::string> cppNamespace{};

    /// @brief Print generation plans instead of writing files.
    bool printPlan = false;

    /// @brief Log planning decisions to stderr.
    bool trace = false;

    /// @brief Treat fast-path fallback warnings as errors.
    bool werror = false;

    bool showVersion = false;
    bool showHelp = false;
};

/// @brief Result of parsing the command line.
enum class CliParseResult
{
    Ok,
    Error, ///< A message was written to the error stream; exit with kExitDiagnostics.
};

/// @brief Parse tether-gen arguments.
/// @param argc Argument count including the program name.
/// @param argv Argument vector.
/// @param opts Receives the parsed options.
/// @param err Stream for usage errors.
CliParseResult parseCli(int argc, char **argv, CliOptions &opts, std::ostream &err);

/// @brief Output stem for @p input: the path with a trailing `.tether` removed.
std::string defaultStem(const std::string &input);

/// @brief C++ namespace derived from a path's file stem.
/// @details Characters outside `[A-Za-z0-9_]` become `_`, and a leading digit
///          is prefixed with `_`.
std::string namespaceFromStem(const std::string &path);

/// @brief Run the full pipeline: read, parse, plan and emit.
/// @param opts Parsed options.
/// @param out Receives `--plan` output.
/// @param err Receives diagnostics and trace lines.
/// @return One of the ExitCode values.
int runGenerator(const CliOptions &opts, std::ostream &out, std::ostream &err);

void usage(std::ostream &os);
void printVersion(std::ostream &os);

} // namespace tether::tools
