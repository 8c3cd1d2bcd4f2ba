//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tether/host/Scope.hpp
//
// Purpose:
//   Callback contract of the host script engine. Every generated slow-path
//   wrapper has the fixed shape
//
//     void f_callback(Scope &scope, const CallbackArgs &args, ReturnValue &rv);
//
//   The scope is the execution-scope handle of the active call, args is the
//   positional argument accessor, and rv is the return-value sink.
//
// State:
//   Application state reaches callbacks in one of two ways.
//
//   1. CONTEXT SLOTS: Context::slots() is a type-keyed table of
//      std::shared_ptr<T> populated once by the embedder and shared by every
//      callable bound to that context. Its lifetime is the context's.
//
//   2. CAPSULES: a FunctionTemplate carries per-registration associated data.
//      Bindings that need state on the fast path store an External capsule
//      holding a raw, non-owning pointer there. The owner must outlive every
//      call the callable can receive.
//
// Threading:
//   Single-threaded. All calls happen on the thread that owns the scope; no
//   type in this header is synchronized.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tether/host/FastApi.hpp"
#include "tether/host/Value.hpp"

#include <memory>
#include <span>
#include <string_view>
#include <typeindex>
#include <unordered_map>

namespace tether::host
{

class Context;
class FunctionTemplate;

/// @brief Positional argument accessor for one call.
class CallbackArgs
{
  public:
    virtual ~CallbackArgs() = default;

    /// @brief Number of arguments supplied at the call site.
    [[nodiscard]] virtual int length() const = 0;

    /// @brief Argument @p index; undefined when index >= length().
    [[nodiscard]] virtual Local<Value> get(int index) const = 0;

    /// @brief The callable's associated data; undefined when none was set.
    [[nodiscard]] virtual Local<Value> data() const = 0;

    [[nodiscard]] virtual Local<Value> receiver() const = 0;
};

/// @brief Return-value sink; holds undefined until set.
class ReturnValue
{
  public:
    virtual ~ReturnValue() = default;

    virtual void set(Local<Value> value) = 0;

    [[nodiscard]] virtual Local<Value> get() const = 0;
};

/// @brief Interpreted-calling-convention entry point.
using FunctionCallback = void (*)(Scope &scope, const CallbackArgs &args, ReturnValue &rv);

/// @brief Type-keyed table of per-context extension slots.
class ContextSlots
{
  public:
    /// @brief Store @p value in the slot for @p T, replacing any previous value.
    template <class T> void set(std::shared_ptr<T> value)
    {
        slots_[std::type_index(typeid(T))] = std::move(value);
    }

    /// @brief Slot for @p T, or null when it was never populated.
    template <class T> [[nodiscard]] std::shared_ptr<T> get() const
    {
        auto it = slots_.find(std::type_index(typeid(T)));
        if (it == slots_.end())
            return nullptr;
        return std::static_pointer_cast<T>(it->second);
    }

    /// @return True when a slot was removed.
    template <class T> bool remove()
    {
        return slots_.erase(std::type_index(typeid(T))) != 0;
    }

  private:
    std::unordered_map<std::type_index, std::shared_ptr<void>> slots_;
};

/// @brief Execution context (a realm with its own globals and slots).
class Context
{
  public:
    virtual ~Context() = default;

    [[nodiscard]] virtual ContextSlots &slots() = 0;

    [[nodiscard]] virtual Local<Object> global() = 0;
};

/// @brief Recipe for a callable: slow callback, associated data, optional
///        direct-call entry point.
class FunctionTemplate
{
  public:
    virtual ~FunctionTemplate() = default;

    [[nodiscard]] virtual FunctionCallback callback() const = 0;

    [[nodiscard]] virtual Local<Value> data() const = 0;

    /// @brief Direct-call descriptor, or nullptr for slow-only callables.
    [[nodiscard]] virtual const CFunction *fastCall() const = 0;

    /// @brief Instantiate the callable in the current context.
    virtual Local<Function> getFunction(Scope &scope) = 0;
};

/// @brief Execution-scope handle passed to every callback.
/// @details Values created through a scope live as long as the scope.
class Scope
{
  public:
    virtual ~Scope() = default;

    [[nodiscard]] virtual Context &currentContext() = 0;

    virtual Local<Value> undefined() = 0;
    virtual Local<Value> null() = 0;
    virtual Local<Boolean> newBoolean(bool value) = 0;
    virtual Local<Number> newNumber(double value) = 0;
    virtual Local<String> newString(std::string_view utf8) = 0;
    virtual Local<Array> newArray(std::span<const Local<Value>> elements) = 0;
    virtual Local<Object> newObject() = 0;

    /// @brief Wrap @p pointer in an opaque capsule. The engine never frees it.
    virtual Local<External> newExternal(void *pointer) = 0;

    /// @brief The engine's standard type-error value.
    virtual Local<Value> newTypeError(std::string_view message) = 0;

    /// @brief A generic engine error value.
    virtual Local<Value> newError(std::string_view message) = 0;

    /// @brief Schedule @p exception to be thrown when the callback returns.
    virtual void throwException(Local<Value> exception) = 0;

    /// @brief Create a pending promise together with its resolver.
    virtual Local<Deferred> newDeferred() = 0;

    /// @param data Associated data; undefined when empty.
    /// @param fastCall Optional direct-call descriptor; must outlive the template.
    virtual Local<FunctionTemplate> newFunctionTemplate(FunctionCallback callback,
                                                        Local<Value> data,
                                                        const CFunction *fastCall) = 0;
};

} // namespace tether::host
