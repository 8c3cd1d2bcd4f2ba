//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tether/host/FastApi.hpp
//
// Purpose:
//   Direct-call ("fast") ABI descriptors. An optimizing engine may call a
//   native function through its C ABI instead of the generic callback when
//   every argument and the result are primitives. The engine learns the
//   native signature from a CFunctionInfo and the entry point from a
//   CFunction.
//
// Argument layout:
//   Slot 0 is always the receiver. Primitive parameters follow in order. A
//   trailing CallbackOptions slot, when present, receives a FastCallOptions*
//   carrying the callable's associated data.
//
// Notes: The descriptors are constexpr-friendly so generated bindings can
//        define them as namespace-scope constants.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tether/host/Value.hpp"

#include <cstddef>
#include <cstdint>
#include <span>

namespace tether::host
{

/// @brief Native type of one slot in a direct call.
enum class CType : uint8_t
{
    Void,
    Bool,
    Int32,
    Uint32,
    Int64,
    Uint64,
    Float32,
    Float64,
    Receiver,        ///< Local<Value> receiver placeholder (slot 0).
    CallbackOptions, ///< Trailing FastCallOptions* slot.
};

/// @brief How 64-bit integers cross the boundary on the script side.
enum class Int64Representation : uint8_t
{
    Number,
    BigInt,
};

struct CTypeInfo
{
    CType type;
};

/// @brief Native signature of a direct-call entry point.
class CFunctionInfo
{
  public:
    constexpr CFunctionInfo(CTypeInfo returnInfo,
                            std::span<const CTypeInfo> argInfo,
                            Int64Representation repr) noexcept
        : return_(returnInfo), args_(argInfo), repr_(repr)
    {
    }

    [[nodiscard]] constexpr const CTypeInfo &returnInfo() const noexcept
    {
        return return_;
    }

    /// @brief Number of slots including the receiver and any options slot.
    [[nodiscard]] constexpr std::size_t argumentCount() const noexcept
    {
        return args_.size();
    }

    [[nodiscard]] constexpr const CTypeInfo &argumentInfo(std::size_t index) const noexcept
    {
        return args_[index];
    }

    /// @brief True when the last slot is CType::CallbackOptions.
    [[nodiscard]] constexpr bool hasOptions() const noexcept
    {
        return !args_.empty() && args_.back().type == CType::CallbackOptions;
    }

    [[nodiscard]] constexpr Int64Representation int64Representation() const noexcept
    {
        return repr_;
    }

  private:
    CTypeInfo return_;
    std::span<const CTypeInfo> args_;
    Int64Representation repr_;
};

/// @brief Entry point plus signature handed to the engine.
class CFunction
{
  public:
    CFunction(const void *address, const CFunctionInfo *info) noexcept
        : address_(address), info_(info)
    {
    }

    [[nodiscard]] const void *address() const noexcept
    {
        return address_;
    }

    [[nodiscard]] const CFunctionInfo *info() const noexcept
    {
        return info_;
    }

  private:
    const void *address_;
    const CFunctionInfo *info_;
};

/// @brief Per-call data the engine passes to direct calls that ask for it.
struct FastCallOptions
{
    /// @brief The callable's associated data (its state capsule).
    Local<Value> data;

    /// @brief Set by the callee to request a re-run through the slow path.
    bool fallback = false;
};

/// @brief Lowercase name of @p type, used in plan dumps and tests.
[[nodiscard]] constexpr const char *ctypeName(CType type) noexcept
{
    switch (type)
    {
        case CType::Void:
            return "void";
        case CType::Bool:
            return "bool";
        case CType::Int32:
            return "int32";
        case CType::Uint32:
            return "uint32";
        case CType::Int64:
            return "int64";
        case CType::Uint64:
            return "uint64";
        case CType::Float32:
            return "float32";
        case CType::Float64:
            return "float64";
        case CType::Receiver:
            return "receiver";
        case CType::CallbackOptions:
            return "options";
    }
    return "?";
}

} // namespace tether::host
