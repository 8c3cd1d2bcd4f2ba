//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: bind/Emitter.hpp
// Purpose: Assemble the generated header/source pair of a binding module.
// Key invariants:
//   - Every plan contributes its native prototype and slow wrapper.
//   - DualPath plans add the fast entry point and descriptors; plans with a
//     template helper add it; SlowOnly plans whose fast path was requested
//     carry a comment naming the failed gate.
//   - The binding table lists plans in manifest order.
// Ownership/Lifetime: Returns owned strings; inputs are only read.
// Links: bind/SlowPathEmitter.hpp, bind/FastPathEmitter.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bind/GenerationPlan.hpp"

#include <string>
#include <vector>

namespace tether::bind
{

/// @brief Everything emitted for one manifest.
struct BindingModule
{
    std::string moduleName;   ///< Manifest stem; names the binding table.
    std::string cppNamespace; ///< `a::b`; empty emits at global scope.
    std::string sourceName;   ///< Manifest file name, for the banner.
    std::vector<std::string> includes;
    std::vector<GenerationPlan> plans;
};

/// @brief Declarations and definitions emitted for one function.
struct FunctionArtifacts
{
    std::string declarations;
    std::string definitions;
};

struct GeneratedFiles
{
    std::string header;
    std::string source;
};

/// @brief Emit the artifacts of a single plan, without namespace wrapping.
FunctionArtifacts emitFunction(const GenerationPlan &plan);

/// @brief `scenarios` -> `kScenariosBindings`.
std::string bindingTableName(const std::string &moduleName);

/// @brief Emit the header and source of @p module.
/// @param headerName File name the source includes the header by.
GeneratedFiles emitModule(const BindingModule &module, const std::string &headerName);

} // namespace tether::bind
