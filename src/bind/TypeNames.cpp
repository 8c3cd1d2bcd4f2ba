//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Spelling tables for manifest types. Manifests may use the short Rust-like
// spellings (`f64`, `Option<T>`, `Rc<T>`), the C++ spellings (`double`,
// `std::optional<T>`, `std::shared_ptr<T>`) or a mix of both; all of them
// resolve through the predicates below.
//
//===----------------------------------------------------------------------===//

#include "bind/TypeNames.hpp"

#include <initializer_list>

namespace tether::bind::names
{
namespace
{

bool singleArgNamed(const TypeRef &type, std::initializer_list<std::string_view> names)
{
    if (type.args.size() != 1)
        return false;
    const auto last = type.lastSegment();
    for (auto n : names)
    {
        if (last == n)
            return true;
    }
    return false;
}

} // namespace

std::optional<PrimitiveKind> primitiveFromName(std::string_view name)
{
    if (name == "bool")
        return PrimitiveKind::Bool;
    if (name == "i32" || name == "int32_t")
        return PrimitiveKind::Int32;
    if (name == "u32" || name == "uint32_t")
        return PrimitiveKind::Uint32;
    if (name == "i64" || name == "int64_t")
        return PrimitiveKind::Int64;
    if (name == "u64" || name == "uint64_t")
        return PrimitiveKind::Uint64;
    if (name == "f32" || name == "float")
        return PrimitiveKind::Float32;
    if (name == "f64" || name == "double")
        return PrimitiveKind::Float64;
    if (name == "void")
        return PrimitiveKind::Void;
    return std::nullopt;
}

const char *primitiveCpp(PrimitiveKind kind)
{
    switch (kind)
    {
        case PrimitiveKind::Bool:
            return "bool";
        case PrimitiveKind::Int32:
            return "int32_t";
        case PrimitiveKind::Uint32:
            return "uint32_t";
        case PrimitiveKind::Int64:
            return "int64_t";
        case PrimitiveKind::Uint64:
            return "uint64_t";
        case PrimitiveKind::Float32:
            return "float";
        case PrimitiveKind::Float64:
            return "double";
        case PrimitiveKind::Void:
            return "void";
    }
    return "void";
}

bool isOptional(const TypeRef &type)
{
    return singleArgNamed(type, {"optional", "Option"});
}

bool isHandle(const TypeRef &type)
{
    return singleArgNamed(type, {"Local"});
}

bool isShared(const TypeRef &type)
{
    return singleArgNamed(type, {"shared", "shared_ptr", "Rc"});
}

bool isResult(const TypeRef &type)
{
    return type.lastSegment() == "Result" && (type.args.size() == 1 || type.args.size() == 2);
}

bool isVector(const TypeRef &type)
{
    return singleArgNamed(type, {"Vec", "vector"});
}

bool isString(const TypeRef &type)
{
    if (!type.args.empty())
        return false;
    const auto last = type.lastSegment();
    return last == "String" || last == "string" || last == "str";
}

HandleKind handleKindFromName(std::string_view inner)
{
    if (inner == "Function")
        return HandleKind::Function;
    if (inner == "Object")
        return HandleKind::Object;
    if (inner == "Array")
        return HandleKind::Array;
    if (inner == "Uint8Array")
        return HandleKind::TypedBuffer;
    if (inner == "ArrayBuffer")
        return HandleKind::RawBuffer;
    if (inner == "String")
        return HandleKind::String;
    if (inner == "Number")
        return HandleKind::Number;
    if (inner == "Value")
        return HandleKind::AnyValue;
    return HandleKind::Generic;
}

ModeWrapper modeWrapper(const TypeRef &type)
{
    if (type.path.size() != 1 || type.args.size() != 1)
        return ModeWrapper::None;
    if (type.path.front() == "slot")
        return ModeWrapper::Slot;
    if (type.path.front() == "capsule")
        return ModeWrapper::Capsule;
    return ModeWrapper::None;
}

} // namespace tether::bind::names
