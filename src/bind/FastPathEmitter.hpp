//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: bind/FastPathEmitter.hpp
// Purpose: Emit the direct-call pair (entry point plus ABI descriptor) and
//          the registration helper of a function.
// Key invariants:
//   - emitFastPath() is only valid for DualPath plans.
//   - Descriptors list the receiver first, then one slot per Value parameter,
//     then a CallbackOptions slot when state travels in a capsule.
//   - The 64-bit representation of every descriptor is BigInt.
// Links: include/tether/host/FastApi.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bind/CodeWriter.hpp"
#include "bind/GenerationPlan.hpp"
#include "tether/host/FastApi.hpp"

#include <string>
#include <vector>

namespace tether::bind
{

/// @brief Descriptor slots of a DualPath plan, receiver first.
std::vector<host::CType> fastArgumentTypes(const GenerationPlan &plan);

/// @brief Descriptor return slot of a DualPath plan.
host::CType fastReturnType(const GenerationPlan &plan);

/// @brief Prototype of `<name>_fast`.
std::string fastPrototype(const GenerationPlan &plan);

/// @brief Write `<name>_fast` and its descriptor constants.
/// @pre plan.hasFastPair()
void emitFastPath(const GenerationPlan &plan, CodeWriter &out);

/// @brief Write `<name>_template`.
/// @pre plan.hasTemplateHelper()
void emitTemplateHelper(const GenerationPlan &plan, CodeWriter &out);

/// @brief Enumerator spelling, e.g. `tether::host::CType::Float64`.
std::string ctypeEnumerator(host::CType type);

} // namespace tether::bind
