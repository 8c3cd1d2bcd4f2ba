//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tether/runtime/Borrow.hpp
// Purpose: Non-owning state capsules for bindings that carry state on the
//          direct-call path.
// Key invariants:
//   - capsulePointer() never changes the owner's reference count.
//   - borrowCapsule() returns a shared_ptr with an empty control block; copying
//     or destroying it never touches the owner and never deletes the object.
// Ownership/Lifetime: The embedder keeps the owning shared_ptr alive for as
//          long as any callable holding the capsule can be invoked. Nothing
//          here can check that.
// Links: include/tether/host/Scope.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tether/host/Value.hpp"

#include <memory>

namespace tether::runtime
{

/// @brief Raw capsule pointer for @p owner; the reference count is untouched.
template <class T> [[nodiscard]] void *capsulePointer(const std::shared_ptr<T> &owner) noexcept
{
    return const_cast<void *>(static_cast<const void *>(owner.get()));
}

/// @brief Rebuild a non-owning handle from a capsule pointer.
/// @details Uses the aliasing constructor with an empty owner, so use_count()
///          of the result is 0 and no deleter ever runs.
template <class T> [[nodiscard]] std::shared_ptr<T> borrowCapsule(void *pointer) noexcept
{
    return std::shared_ptr<T>(std::shared_ptr<T>(), static_cast<T *>(pointer));
}

/// @brief Pointer carried by an External capsule, or nullptr when @p data is
///        empty or not a capsule.
[[nodiscard]] inline void *capsuleData(const host::Local<host::Value> &data)
{
    if (data.isEmpty() || !data->isExternal())
        return nullptr;
    return data.as<host::External>()->value();
}

} // namespace tether::runtime
