//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the type classifier. The classifier is deliberately table
// driven: all spelling knowledge lives in TypeNames.cpp and this file only
// fixes the order in which the wrapper families are tried.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Classification of manifest types into TypeClass values.

#include "bind/TypeClass.hpp"

#include "bind/TypeNames.hpp"

namespace tether::bind
{
namespace
{

/// @brief Classification below the Optional layer.
TypeClass classifyInner(const TypeRef &type, ClassifyContext context)
{
    if (names::isHandle(type))
        return TypeClass::handle(names::handleKindFromName(type.args.front().lastSegment()));
    if (context == ClassifyContext::State && names::isShared(type))
        return classifyInner(type.args.front(), ClassifyContext::Value);
    if (type.isUnit())
        return TypeClass::primitive(PrimitiveKind::Void);
    if (type.args.empty())
    {
        if (auto prim = names::primitiveFromName(type.lastSegment()))
            return TypeClass::primitive(*prim);
    }
    return TypeClass::opaque();
}

} // namespace

TypeClass TypeClass::primitive(PrimitiveKind kind)
{
    TypeClass tc;
    tc.tag_ = Tag::Primitive;
    tc.primitive_ = kind;
    return tc;
}

TypeClass TypeClass::optional(TypeClass inner)
{
    TypeClass tc;
    tc.tag_ = Tag::Optional;
    tc.inner_ = std::make_shared<const TypeClass>(std::move(inner));
    return tc;
}

TypeClass TypeClass::handle(HandleKind kind)
{
    TypeClass tc;
    tc.tag_ = Tag::EngineHandle;
    tc.handle_ = kind;
    return tc;
}

TypeClass TypeClass::opaque()
{
    return TypeClass();
}

bool TypeClass::isFastEligible() const
{
    return tag_ == Tag::Primitive;
}

std::optional<host::CType> TypeClass::fastCType() const
{
    if (tag_ != Tag::Primitive)
        return std::nullopt;
    switch (primitive_)
    {
        case PrimitiveKind::Bool:
            return host::CType::Bool;
        case PrimitiveKind::Int32:
            return host::CType::Int32;
        case PrimitiveKind::Uint32:
            return host::CType::Uint32;
        case PrimitiveKind::Int64:
            return host::CType::Int64;
        case PrimitiveKind::Uint64:
            return host::CType::Uint64;
        case PrimitiveKind::Float32:
            return host::CType::Float32;
        case PrimitiveKind::Float64:
            return host::CType::Float64;
        case PrimitiveKind::Void:
            return host::CType::Void;
    }
    return std::nullopt;
}

std::string TypeClass::describe() const
{
    switch (tag_)
    {
        case Tag::Primitive:
            return std::string("Primitive(") + primitiveName(primitive_) + ")";
        case Tag::Optional:
            return "Optional(" + inner_->describe() + ")";
        case Tag::EngineHandle:
            return std::string("EngineHandle(") + handleKindName(handle_) + ")";
        case Tag::Opaque:
            return "Opaque";
    }
    return "Opaque";
}

bool TypeClass::operator==(const TypeClass &other) const
{
    if (tag_ != other.tag_)
        return false;
    switch (tag_)
    {
        case Tag::Primitive:
            return primitive_ == other.primitive_;
        case Tag::Optional:
            return *inner_ == *other.inner_;
        case Tag::EngineHandle:
            return handle_ == other.handle_;
        case Tag::Opaque:
            return true;
    }
    return false;
}

TypeClass classify(const TypeRef &type, ClassifyContext context)
{
    if (names::isOptional(type))
    {
        const TypeRef &inner = type.args.front();
        // Only one level is unwrapped; a nested Optional is serialized as a whole.
        if (names::isOptional(inner))
            return TypeClass::optional(TypeClass::opaque());
        return TypeClass::optional(classifyInner(inner, ClassifyContext::Value));
    }
    return classifyInner(type, context);
}

const char *primitiveName(PrimitiveKind kind)
{
    switch (kind)
    {
        case PrimitiveKind::Bool:
            return "bool";
        case PrimitiveKind::Int32:
            return "int32";
        case PrimitiveKind::Uint32:
            return "uint32";
        case PrimitiveKind::Int64:
            return "int64";
        case PrimitiveKind::Uint64:
            return "uint64";
        case PrimitiveKind::Float32:
            return "float32";
        case PrimitiveKind::Float64:
            return "float64";
        case PrimitiveKind::Void:
            return "void";
    }
    return "void";
}

const char *handleKindName(HandleKind kind)
{
    switch (kind)
    {
        case HandleKind::Function:
            return "Function";
        case HandleKind::Object:
            return "Object";
        case HandleKind::Array:
            return "Array";
        case HandleKind::TypedBuffer:
            return "Uint8Array";
        case HandleKind::RawBuffer:
            return "ArrayBuffer";
        case HandleKind::String:
            return "String";
        case HandleKind::Number:
            return "Number";
        case HandleKind::AnyValue:
            return "Value";
        case HandleKind::Generic:
            return "Generic";
    }
    return "Generic";
}

const char *handlePredicate(HandleKind kind)
{
    switch (kind)
    {
        case HandleKind::Function:
            return "isFunction";
        case HandleKind::Object:
            return "isObject";
        case HandleKind::Array:
            return "isArray";
        case HandleKind::TypedBuffer:
            return "isUint8Array";
        case HandleKind::RawBuffer:
            return "isArrayBuffer";
        case HandleKind::String:
            return "isString";
        case HandleKind::Number:
            return "isNumber";
        case HandleKind::AnyValue:
        case HandleKind::Generic:
            return nullptr;
    }
    return nullptr;
}

} // namespace tether::bind
