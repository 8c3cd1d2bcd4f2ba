//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tether/runtime/Binding.hpp
// Purpose: Per-module binding table emitted by tether-gen, and a helper that
//          installs its entries on an engine object.
// Key invariants: Entries that need a state capsule are never installed by
//                 installBindings(); they must go through their generated
//                 `<name>_template` helper, which receives the owning handle.
// Ownership/Lifetime: Tables are static data; names view string literals.
// Links: docs/manifest-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tether/Result.hpp"
#include "tether/host/FastApi.hpp"
#include "tether/host/Scope.hpp"

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tether::runtime
{

/// @brief One generated binding.
struct BindingEntry
{
    /// Script-visible name.
    std::string_view name;

    /// Slow-path wrapper; always present.
    host::FunctionCallback callback;

    /// Direct-call descriptor, or nullptr for slow-only bindings.
    const host::CFunction *fastCall;

    /// True when the callable reads its state from a capsule.
    bool needsCapsule;
};

/// @brief Install every capsule-free entry of @p entries as a property of
///        @p target.
/// @return Names of the skipped capsule entries, or an error naming the
///         first property the engine refused to store.
Result<std::vector<std::string_view>, std::string> installBindings(
    host::Scope &scope, host::Local<host::Object> target, std::span<const BindingEntry> entries);

} // namespace tether::runtime
