/* Tailor
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#pragma once

#include "tailor/util/traits.hpp"
#include "tailor/log/log.hpp"
#include <boost/core/demangle.hpp>
#include <functional>
#include <typeinfo>
#include <utility>

namespace tailor::util
{

// Types.

/**
 * CRTP mixin giving `Value` the reference-semantics form of the builder idiom: `value.with(configure)` invokes
 * `configure(value)` -- with an immutable view of the receiver itself, no copy -- and returns the receiver
 * (a copy of the handle, hence the same identity).
 *
 * This is meant for handle types: classes whose copies share one implementation object, typically held by
 * `boost::shared_ptr`, with setters that are `const` since they modify the shared state rather than the handle.
 * For such a type, anyone holding another handle to the same object observes what `configure` did:
 *
 *   ~~~
 *   class Table_view : public tailor::util::Builder<Table_view>
 *   {
 *   public:
 *     void set_allows_multiple_selection(bool yes) const;
 *     // ...
 *   };
 *
 *   const auto view = Table_view().with([](const Table_view& view)
 *   {
 *     view.set_allows_multiple_selection(true);
 *   });
 *   ~~~
 *
 * For a plain value type (fields modified directly, non-`const` setters) this form is useless by construction:
 * a procedure that tries to mutate the receiver does not compile, since it is handed a `const Value&`.  Nor does
 * one that takes `Value` by copy (see is_configure_by_copy_v).
 * That is intentional; use Better_builder for value types.
 *
 * The member with() returns `Value`, the class that named itself in `Builder<Value>`.  A subclass of it inherits
 * that member, which therefore returns (a slice of the subclass as) the base class.  To keep the subclass's type,
 * use the free util::with(), which deduces it: `util::with(table_view, ...)` is a `Table_view`.
 *
 * If `configure` throws, the exception propagates unchanged; whatever it had changed in the shared state before
 * throwing stays changed.
 *
 * ### Thread safety ###
 * None is provided; `configure` runs synchronously in the calling thread.  If other threads hold handles to the same
 * object, it is up to the caller to avoid concurrent access during configuration.
 *
 * @tparam Value
 *         The deriving class.
 */
template<typename Value>
class Builder :
  public Reference_builder_tag
{
public:
  // Methods.

  /**
   * Invokes `configure(*this)`, with `*this` seen as `const Value&`; then returns `*this` by value.
   *
   * @tparam Configure
   *         Procedure invocable as `configure(const Value&)`.  Its result, if any, is ignored.
   * @param configure
   *        Configuration procedure; invoked exactly once, synchronously.
   * @return Copy of `*this` after `configure` ran.
   */
  template<typename Configure>
  Value with(Configure&& configure) const;

protected:
  // Constructors/destructor.

  /// Only the deriving class constructs us.
  Builder() = default;
  /// Boring copy constructor.
  Builder(const Builder&) = default;
  /// Boring move constructor.
  Builder(Builder&&) = default;
  /// Not deleted via pointer-to-mixin; hence `protected`, non-`virtual`.
  ~Builder() = default;

  // Methods.

  /**
   * Boring copy assignment.
   * @return `*this`.
   */
  Builder& operator=(const Builder&) = default;
  /**
   * Boring move assignment.
   * @return `*this`.
   */
  Builder& operator=(Builder&&) = default;
}; // class Builder

/**
 * CRTP mixin giving `Value` the value-semantics form of the builder idiom: `value.with(configure)` copies the
 * receiver, invokes `configure(copy)` with a *mutable* reference to that copy, and returns the copy.  The receiver
 * itself is never modified; the returned object shares nothing with it (beyond whatever `Value`'s own copy
 * constructor chooses to share).
 *
 *   ~~~
 *   struct Edge_insets : tailor::util::Better_builder<Edge_insets>
 *   {
 *     int m_top = 0;
 *     int m_left = 0;
 *   };
 *
 *   const auto insets = Edge_insets().with([](Edge_insets& insets) { insets.m_left = 16; });
 *   ~~~
 *
 * The same form also works for handle types (see Builder): the copy is then another handle to the same
 * implementation object, so the configuration remains visible to all holders.
 *
 * When the receiver is an rvalue (as in the example: a temporary that exists only to be configured), it is moved
 * into the result instead of copied.
 *
 * If `configure` throws, the exception propagates unchanged; the partially configured copy is destroyed, and the
 * receiver is as it was.
 *
 * As with Builder, the member with() of a subclass returns the base `Value`; use util::with() to keep the subclass.
 *
 * `configure` should take `Value&`.  A non-generic procedure taking `Value` by copy is rejected at compile time,
 * as whatever it changed would be lost with its parameter.
 *
 * @tparam Value
 *         The deriving class.  Must be copy-constructible (move-constructible suffices for rvalue receivers).
 */
template<typename Value>
class Better_builder :
  public Value_builder_tag
{
public:
  // Methods.

  /**
   * Copies `*this`, invokes `configure(copy)` with `Value&` to the copy, and returns the copy.
   *
   * @tparam Configure
   *         Procedure invocable as `configure(Value&)`.  Its result, if any, is ignored.
   * @param configure
   *        Configuration procedure; invoked exactly once, synchronously.
   * @return The configured copy.
   */
  template<typename Configure>
  Value with(Configure&& configure) const &;

  /**
   * Moves `*this` into a new `Value`, invokes `configure()` on the latter as in the other overload, and returns it.
   *
   * @tparam Configure
   *         See other overload.
   * @param configure
   *        See other overload.
   * @return See other overload.
   */
  template<typename Configure>
  Value with(Configure&& configure) &&;

protected:
  // Constructors/destructor.

  /// Only the deriving class constructs us.
  Better_builder() = default;
  /// Boring copy constructor.
  Better_builder(const Better_builder&) = default;
  /// Boring move constructor.
  Better_builder(Better_builder&&) = default;
  /// Not deleted via pointer-to-mixin; hence `protected`, non-`virtual`.
  ~Better_builder() = default;

  // Methods.

  /**
   * Boring copy assignment.
   * @return `*this`.
   */
  Better_builder& operator=(const Better_builder&) = default;
  /**
   * Boring move assignment.
   * @return `*this`.
   */
  Better_builder& operator=(Better_builder&&) = default;
}; // class Better_builder

// Free functions: in *_fwd.hpp.

/**
 * Identical to the 2-arg util::with() but logs, at Sev::S_TRACE under Tailor_log_component::S_UTIL, the type and
 * Builder_semantics involved before invoking `configure`, and once more after it returns.  If `configure` throws,
 * the latter message is not logged.
 *
 * @tparam Value
 *         See 2-arg util::with().
 * @tparam Configure
 *         See 2-arg util::with().
 * @param logger_ptr
 *        Logger to use; null to not log.
 * @param value
 *        See 2-arg util::with().
 * @param configure
 *        See 2-arg util::with().
 * @return See 2-arg util::with().
 */
template<typename Value, typename Configure>
Value with(log::Logger* logger_ptr, Value value, Configure&& configure);

// Template implementations.

template<typename Value>
template<typename Configure>
Value Builder<Value>::with(Configure&& configure) const
{
  static_assert(std::is_base_of_v<Builder<Value>, Value>,
                "Builder<Value> must be mixed into Value itself (CRTP).");
  static_assert(std::is_invocable_v<Configure, const Value&>,
                "The configuration procedure of a reference-semantics builder is handed `const Value&`.  "
                "To configure a value type through `Value&`, derive from Better_builder<Value> instead.");
  static_assert(!is_configure_by_copy_v<Configure>,
                "The configuration procedure takes its parameter by copy; take `const Value&` instead.");

  const auto& self = static_cast<const Value&>(*this);
  std::invoke(std::forward<Configure>(configure), self);
  return self;
}

template<typename Value>
template<typename Configure>
Value Better_builder<Value>::with(Configure&& configure) const &
{
  static_assert(std::is_base_of_v<Better_builder<Value>, Value>,
                "Better_builder<Value> must be mixed into Value itself (CRTP).");
  static_assert(std::is_invocable_v<Configure, Value&>,
                "The configuration procedure of a value-semantics builder must accept `Value&`.");
  static_assert(!is_configure_by_copy_v<Configure>,
                "The configuration procedure takes its parameter by copy, so its changes would be lost; "
                "take `Value&` instead.");

  Value configured(static_cast<const Value&>(*this));
  std::invoke(std::forward<Configure>(configure), configured);
  return configured;
}

template<typename Value>
template<typename Configure>
Value Better_builder<Value>::with(Configure&& configure) &&
{
  static_assert(std::is_base_of_v<Better_builder<Value>, Value>,
                "Better_builder<Value> must be mixed into Value itself (CRTP).");
  static_assert(std::is_invocable_v<Configure, Value&>,
                "The configuration procedure of a value-semantics builder must accept `Value&`.");
  static_assert(!is_configure_by_copy_v<Configure>,
                "The configuration procedure takes its parameter by copy, so its changes would be lost; "
                "take `Value&` instead.");

  Value configured(std::move(static_cast<Value&>(*this)));
  std::invoke(std::forward<Configure>(configure), configured);
  return configured;
}

template<typename Value, typename Configure>
Value with(Value value, Configure&& configure)
{
  static_assert(Builder_traits<Value>::S_SEMANTICS != Builder_semantics::S_NONE,
                "Value did not opt into the builder idiom.  Derive from Better_builder<Value> or Builder<Value>, "
                "or specialize Builder_traits<Value>.");
  static_assert(!is_configure_by_copy_v<Configure>,
                "The configuration procedure takes its parameter by copy, so its changes would be lost.");
  static_assert(is_builder_configurable_v<Value, Configure>,
                "The configuration procedure cannot accept what this Value's builder semantics hand out: "
                "`Value&` (value semantics) or `const Value&` (reference semantics).");

  /* `value` is already our own object: for value semantics it is the copy we configure and return; for reference
   * semantics it is another handle to the caller's object, which configure() sees (only) as const. */
  std::invoke(std::forward<Configure>(configure), static_cast<Builder_configured_ref<Value>>(value));
  return value;
}

template<typename Value, typename Configure>
Value with(log::Logger* logger_ptr, Value value, Configure&& configure)
{
  using boost::core::demangle;

  TAILOR_LOG_SET_CONTEXT(logger_ptr, Tailor_log_component::S_UTIL);

  constexpr Builder_semantics SEMANTICS = Builder_traits<Value>::S_SEMANTICS;

  TAILOR_LOG_TRACE("Configuring object of type [" << demangle(typeid(Value).name()) << "] "
                   "(semantics [" << SEMANTICS << "]).");

  Value configured = with(std::move(value), std::forward<Configure>(configure));

  TAILOR_LOG_TRACE("Configured object of type [" << demangle(typeid(Value).name()) << "] "
                   "(semantics [" << SEMANTICS << "]).");
  return configured;
}

} // namespace tailor::util
