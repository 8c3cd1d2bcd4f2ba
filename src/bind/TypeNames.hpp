//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: bind/TypeNames.hpp
// Purpose: Spelling tables shared by the classifier and the C++ renderer.
// Key invariants: Every predicate matches on the last path segment, so
//                 `optional<T>`, `std::optional<T>` and `Option<T>` all
//                 classify alike.
// Links: docs/manifest-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bind/TypeClass.hpp"
#include "bind/TypeRef.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace tether::bind::names
{

/// @brief Primitive named by @p name (`f64`, `double`, `int32_t`, ...).
std::optional<PrimitiveKind> primitiveFromName(std::string_view name);

/// @brief C++ spelling of a primitive (`double`, `int32_t`, `void`, ...).
const char *primitiveCpp(PrimitiveKind kind);

/// @brief `optional<T>` family with exactly one argument.
bool isOptional(const TypeRef &type);

/// @brief `Local<K>` family with exactly one argument.
bool isHandle(const TypeRef &type);

/// @brief `shared<T>`, `shared_ptr<T>`, `Rc<T>` with exactly one argument.
bool isShared(const TypeRef &type);

/// @brief `Result<T>` or `Result<T, E>`.
bool isResult(const TypeRef &type);

/// @brief `Vec<T>`, `vector<T>` with exactly one argument.
bool isVector(const TypeRef &type);

/// @brief `String`, `string`, `str` without arguments.
bool isString(const TypeRef &type);

/// @brief Handle kind for the inner name of `Local<K>`; Generic when unknown.
HandleKind handleKindFromName(std::string_view inner);

/// @brief Host-contract spelling of the K in `Local<K>`: known and
///        unqualified names resolve to `tether::host::K`.
std::string handleTargetCpp(const TypeRef &inner);

/// @brief Explicit state-mode wrapper: `slot<T>` or `capsule<T>`.
enum class ModeWrapper
{
    None,
    Slot,
    Capsule,
};

ModeWrapper modeWrapper(const TypeRef &type);

} // namespace tether::bind::names
