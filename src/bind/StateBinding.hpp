//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: bind/StateBinding.hpp
// Purpose: Decide how shared application state reaches a callback.
//
// Modes:
//   SharedSlot     State lives in the execution context's type-keyed slot
//                  table. It is populated once by the embedder and shared by
//                  every callable of that context. The slow path reads it
//                  before any argument and raises an internal error if the
//                  slot is empty.
//
//   PinnedCapsule  State is pinned at registration time: the registration
//                  helper stores a raw pointer to it in an External capsule
//                  used as the callable's associated data. Both paths rebuild
//                  a non-owning handle from the capsule. Required whenever a
//                  stateful function gets a direct-call entry point, since
//                  that entry point cannot reach the context.
//
// Resolution:
//   `slot<T>` and `capsule<T>` select a mode explicitly. An unwrapped type
//   selects PinnedCapsule when the fast path is requested and SharedSlot
//   otherwise. One level of shared-ownership wrapper is then removed to find
//   the slot key; its presence also decides whether the native function
//   receives `const std::shared_ptr<T> &` or `T &`.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bind/TypeRef.hpp"
#include "support/diag_expected.hpp"
#include "support/source_location.hpp"

#include <string>

namespace tether::bind
{

enum class StateMode
{
    SharedSlot,
    PinnedCapsule,
};

struct StateSpec
{
    TypeRef declared;          ///< Type as written, without a mode wrapper.
    TypeRef inner;             ///< Slot key / capsule pointee.
    bool sharedWrapper = false; ///< declared is shared<inner>.
    StateMode mode = StateMode::SharedSlot;
    bool explicitMode = false; ///< Mode chosen by slot<> or capsule<>.

    /// @brief Parameter type in the native prototype.
    [[nodiscard]] std::string paramCppType() const;

    /// @brief C++ spelling of the slot key / capsule pointee.
    [[nodiscard]] std::string innerCpp() const;

    /// @brief Argument expression passing local `state` to the native function.
    [[nodiscard]] std::string callArgument() const;
};

/// @brief Resolve the state option of a function.
/// @param stateType Value of the `state` option, possibly mode-wrapped.
/// @param fastRequested Whether the `fast` option is set.
/// @return The resolved spec, or a Configuration error for malformed types.
support::Expected<StateSpec> resolveStateSpec(const TypeRef &stateType,
                                              bool fastRequested,
                                              support::SourceLoc loc);

const char *stateModeName(StateMode mode);

} // namespace tether::bind
