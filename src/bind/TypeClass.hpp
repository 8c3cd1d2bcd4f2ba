//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: bind/TypeClass.hpp
// Purpose: Semantic classification of declared parameter and return types.
// Key invariants:
//   - Classification is a pure function of the TypeRef (and the context it is
//     classified in); it never consults options or other parameters.
//   - Optional nests exactly one level; Optional<Optional<T>> classifies its
//     inner Optional<T> as Opaque.
//   - Only Primitive classes can be fast-eligible.
// Ownership/Lifetime: TypeClass is an immutable value; copies share the inner
//                     class of an Optional.
// Links: docs/manifest-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bind/TypeRef.hpp"
#include "tether/host/FastApi.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace tether::bind
{

enum class PrimitiveKind : uint8_t
{
    Bool,
    Int32,
    Uint32,
    Int64,
    Uint64,
    Float32,
    Float64,
    Void,
};

/// @brief Engine value categories a parameter may be declared as.
enum class HandleKind : uint8_t
{
    Function,
    Object,
    Array,
    TypedBuffer, ///< Uint8Array
    RawBuffer,   ///< ArrayBuffer
    String,
    Number,
    AnyValue, ///< Value; accepted without a check.
    Generic,  ///< Any other inner name; checked by a runtime cast.
};

/// @brief Whether a type is classified as a callable's value or as its state.
/// @details Only state resolution unwraps the shared-ownership wrapper.
enum class ClassifyContext : uint8_t
{
    Value,
    State,
};

/// @brief Tagged classification result.
class TypeClass
{
  public:
    enum class Tag : uint8_t
    {
        Primitive,
        Optional,
        EngineHandle,
        Opaque,
    };

    static TypeClass primitive(PrimitiveKind kind);
    static TypeClass optional(TypeClass inner);
    static TypeClass handle(HandleKind kind);
    static TypeClass opaque();

    [[nodiscard]] Tag tag() const
    {
        return tag_;
    }

    /// @pre tag() == Tag::Primitive
    [[nodiscard]] PrimitiveKind primitiveKind() const
    {
        return primitive_;
    }

    /// @pre tag() == Tag::EngineHandle
    [[nodiscard]] HandleKind handleKind() const
    {
        return handle_;
    }

    /// @pre tag() == Tag::Optional
    [[nodiscard]] const TypeClass &inner() const
    {
        return *inner_;
    }

    /// @brief True for the primitives the direct-call ABI can carry.
    [[nodiscard]] bool isFastEligible() const;

    /// @brief Direct-call slot type; std::nullopt when not fast-eligible.
    [[nodiscard]] std::optional<host::CType> fastCType() const;

    /// @brief Debug rendering such as `Optional(Primitive(float64))`.
    [[nodiscard]] std::string describe() const;

    bool operator==(const TypeClass &other) const;

  private:
    TypeClass() = default;

    Tag tag_ = Tag::Opaque;
    PrimitiveKind primitive_ = PrimitiveKind::Void;
    HandleKind handle_ = HandleKind::AnyValue;
    std::shared_ptr<const TypeClass> inner_;
};

/// @brief Classify @p type.
/// @details Rules are tried in order: one level of Optional, the engine handle
///          wrapper, the shared-ownership wrapper (ClassifyContext::State only),
///          the primitive spellings, and finally Opaque.
TypeClass classify(const TypeRef &type, ClassifyContext context = ClassifyContext::Value);

/// @brief Lowercase primitive name (`float64`, `void`, ...).
const char *primitiveName(PrimitiveKind kind);

/// @brief Script-facing kind name used in "must be a <Kind>" errors.
const char *handleKindName(HandleKind kind);

/// @brief Name of the Value predicate for @p kind (`isFunction`, ...).
/// @return nullptr for AnyValue and Generic, which have no predicate.
const char *handlePredicate(HandleKind kind);

} // namespace tether::bind
