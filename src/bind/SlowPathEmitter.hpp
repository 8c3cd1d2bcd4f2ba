//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: bind/SlowPathEmitter.hpp
// Purpose: Emit the interpreted-calling-convention wrapper of a function.
// Key invariants:
//   - State is extracted before any argument is read.
//   - Every failed extraction throws and returns before the native call; the
//     return sink is left untouched.
//   - Promise-wrapped calls set the return sink to the deferred's promise
//     before the native function runs.
// Links: bind/GenerationPlan.hpp, include/tether/host/Scope.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bind/CodeWriter.hpp"
#include "bind/GenerationPlan.hpp"

namespace tether::bind
{

/// @brief Write the definition of `<name>_callback` for @p plan.
void emitSlowPath(const GenerationPlan &plan, CodeWriter &out);

} // namespace tether::bind
