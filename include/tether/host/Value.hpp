//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tether/host/Value.hpp
//
// Purpose:
//   Value model of the host script engine as seen by generated bindings.
//
// Handles:
//   Engine values are owned by the engine (typically by the active handle
//   scope). Native code refers to them through Local<T>, a non-owning typed
//   handle. A Local never extends the lifetime of the value it names and must
//   not be stored beyond the callback that received it.
//
// Type tests:
//   Value exposes one predicate per category the generator can check
//   directly. Each typed sub-interface answers its own predicate, so an engine
//   adapter only has to derive its concrete value classes from the matching
//   interface. Local<Value>::as<T>() is an unchecked reinterpretation that is
//   valid only after the matching predicate returned true; tryAs<T>() performs
//   a checked cast and yields an empty handle on mismatch.
//
// Notes: Header-only; the engine adapter supplies every implementation.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>

namespace tether::host
{

class Scope;

/// @brief Non-owning typed handle to an engine value.
template <class T> class Local
{
  public:
    Local() = default;

    explicit Local(T *ptr) noexcept : ptr_(ptr) {}

    /// @brief Widen a handle to a base interface (e.g. Function -> Value).
    template <class U, class = std::enable_if_t<std::is_convertible_v<U *, T *>>>
    Local(Local<U> other) noexcept : ptr_(other.get())
    {
    }

    /// @brief Reinterpret as @p U; the caller has already tested the type.
    template <class U> [[nodiscard]] Local<U> as() const noexcept
    {
        return Local<U>(static_cast<U *>(ptr_));
    }

    /// @brief Checked cast; empty when the value is not a @p U.
    template <class U> [[nodiscard]] Local<U> tryAs() const noexcept
    {
        return Local<U>(dynamic_cast<U *>(ptr_));
    }

    [[nodiscard]] T *get() const noexcept
    {
        return ptr_;
    }

    [[nodiscard]] bool isEmpty() const noexcept
    {
        return ptr_ == nullptr;
    }

    explicit operator bool() const noexcept
    {
        return ptr_ != nullptr;
    }

    T *operator->() const noexcept
    {
        return ptr_;
    }

    T &operator*() const noexcept
    {
        return *ptr_;
    }

    template <class U> bool operator==(const Local<U> &other) const noexcept
    {
        return static_cast<const void *>(ptr_) == static_cast<const void *>(other.get());
    }

  private:
    T *ptr_ = nullptr;
};

/// @brief Root of the engine value hierarchy.
class Value
{
  public:
    virtual ~Value() = default;

    [[nodiscard]] virtual bool isUndefined() const
    {
        return false;
    }

    [[nodiscard]] virtual bool isNull() const
    {
        return false;
    }

    [[nodiscard]] virtual bool isBoolean() const
    {
        return false;
    }

    [[nodiscard]] virtual bool isNumber() const
    {
        return false;
    }

    [[nodiscard]] virtual bool isString() const
    {
        return false;
    }

    [[nodiscard]] virtual bool isObject() const
    {
        return false;
    }

    [[nodiscard]] virtual bool isFunction() const
    {
        return false;
    }

    [[nodiscard]] virtual bool isArray() const
    {
        return false;
    }

    [[nodiscard]] virtual bool isUint8Array() const
    {
        return false;
    }

    [[nodiscard]] virtual bool isArrayBuffer() const
    {
        return false;
    }

    [[nodiscard]] virtual bool isExternal() const
    {
        return false;
    }

    [[nodiscard]] virtual bool isPromise() const
    {
        return false;
    }

    [[nodiscard]] bool isNullOrUndefined() const
    {
        return isNull() || isUndefined();
    }

    /// @brief Short category name used in conversion errors ("number", ...).
    [[nodiscard]] virtual std::string typeName() const = 0;

    /// @brief Script-level string conversion of the value.
    [[nodiscard]] virtual std::string toDisplayString() const = 0;
};

class Boolean : public Value
{
  public:
    [[nodiscard]] bool isBoolean() const final
    {
        return true;
    }

    [[nodiscard]] virtual bool value() const = 0;
};

class Number : public Value
{
  public:
    [[nodiscard]] bool isNumber() const final
    {
        return true;
    }

    [[nodiscard]] virtual double value() const = 0;
};

class String : public Value
{
  public:
    [[nodiscard]] bool isString() const final
    {
        return true;
    }

    /// @brief UTF-8 contents of the string.
    [[nodiscard]] virtual std::string value() const = 0;
};

/// @brief Opaque pointer capsule; the engine never dereferences the pointer.
class External : public Value
{
  public:
    [[nodiscard]] bool isExternal() const final
    {
        return true;
    }

    [[nodiscard]] virtual void *value() const = 0;
};

class Object : public Value
{
  public:
    [[nodiscard]] bool isObject() const final
    {
        return true;
    }

    /// @brief Read property @p key; undefined when absent.
    virtual Local<Value> get(Scope &scope, std::string_view key) = 0;

    /// @brief Write property @p key.
    /// @return False when the engine refused the store.
    virtual bool set(Scope &scope, std::string_view key, Local<Value> value) = 0;
};

class Array : public Object
{
  public:
    [[nodiscard]] bool isArray() const final
    {
        return true;
    }

    [[nodiscard]] virtual uint32_t length() const = 0;

    /// @brief Element at @p index; undefined past the end.
    [[nodiscard]] virtual Local<Value> at(uint32_t index) const = 0;
};

class Function : public Object
{
  public:
    [[nodiscard]] bool isFunction() const final
    {
        return true;
    }

    /// @brief Invoke the function.
    /// @return Result value, or an empty handle when the callee threw.
    virtual Local<Value> call(Scope &scope,
                              Local<Value> receiver,
                              std::span<const Local<Value>> args) = 0;
};

class ArrayBuffer : public Object
{
  public:
    [[nodiscard]] bool isArrayBuffer() const final
    {
        return true;
    }

    [[nodiscard]] virtual std::size_t byteLength() const = 0;

    [[nodiscard]] virtual std::span<std::byte> bytes() = 0;
};

class Uint8Array : public Object
{
  public:
    [[nodiscard]] bool isUint8Array() const final
    {
        return true;
    }

    [[nodiscard]] virtual std::size_t byteLength() const = 0;

    /// @brief Copy up to out.size() bytes of the view into @p out.
    /// @return Number of bytes copied.
    virtual std::size_t copyContents(std::span<uint8_t> out) const = 0;
};

class Promise : public Object
{
  public:
    enum class State
    {
        Pending,
        Fulfilled,
        Rejected
    };

    [[nodiscard]] bool isPromise() const final
    {
        return true;
    }

    [[nodiscard]] virtual State state() const = 0;

    /// @brief Settled value or rejection reason; undefined while pending.
    [[nodiscard]] virtual Local<Value> result() const = 0;
};

/// @brief One-shot resolver paired with a Promise.
/// @invariant Only the first resolve or reject settles the promise.
class Deferred : public Value
{
  public:
    [[nodiscard]] virtual Local<Promise> promise() const = 0;

    /// @return True when this call settled the promise.
    virtual bool resolve(Scope &scope, Local<Value> value) = 0;

    /// @return True when this call settled the promise.
    virtual bool reject(Scope &scope, Local<Value> reason) = 0;
};

} // namespace tether::host
