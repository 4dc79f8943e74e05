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

#include "tailor/util/util_fwd.hpp"
#include <boost/shared_ptr.hpp>
#include <memory>
#include <type_traits>

namespace tailor::util
{

/* Builder_traits is not forward-declared-then-defined-elsewhere beyond the bare `class` line in util_fwd.hpp; it is a
 * bunch of sizeof=0 types storing constants only, so it's all here. */

/**
 * Non-template base of every Builder<> instantiation.  Builder_traits detects reference-semantics opt-in through it,
 * so that a class deriving (at any depth) from a class deriving from Builder<Base> is itself recognized.
 */
class Reference_builder_tag
{
protected:
  /// Only Builder<> constructs us.
  Reference_builder_tag() = default;
};

/// Like Reference_builder_tag but for Better_builder<> (value semantics).
class Value_builder_tag
{
protected:
  /// Only Better_builder<> constructs us.
  Value_builder_tag() = default;
};

/**
 * The capability marker of the builder idiom: states whether and how `Value` takes part in it.  util::with() and the
 * is_builder_configurable_v check consult it.
 *
 * A class opts in by deriving from Better_builder<Value> (value semantics) or Builder<Value> (reference
 * semantics); the primary template detects that.  Opt-in is inherited: if `Table_view` derives from `View`, which
 * derives from `Builder<View>`, then `Builder_traits<Table_view>` reports reference semantics, and
 * `util::with(table_view, ...)` returns a `Table_view`.  A type one cannot (or would rather not) modify -- a
 * third-party class, a smart pointer -- opts in retroactively by specializing this template, as done below for
 * `boost::shared_ptr` and `std::shared_ptr`:
 *
 *   ~~~
 *   namespace tailor::util
 *   {
 *   template<>
 *   class Builder_traits<third_party::Rect>
 *   {
 *   public:
 *     static constexpr Builder_semantics S_SEMANTICS = Builder_semantics::S_VALUE;
 *   private:
 *     Builder_traits() = delete;
 *   };
 *   }
 *   ~~~
 *
 * A type deriving from both mixins is treated as value-semantics.
 *
 * @tparam Value
 *         The type being described.
 */
template<typename Value>
class Builder_traits
{
public:
  // Constants.

  /// How `Value` takes part in the builder idiom; Builder_semantics::S_NONE if it does not.
  static constexpr Builder_semantics S_SEMANTICS
    = std::is_base_of_v<Value_builder_tag, Value>
        ? Builder_semantics::S_VALUE
        : (std::is_base_of_v<Reference_builder_tag, Value>
             ? Builder_semantics::S_REFERENCE
             : Builder_semantics::S_NONE);

private:
  // Constructors/destructor.

  /// Forbid all instantion.
  Builder_traits() = delete;
}; // class Builder_traits<>

/**
 * Traits of `boost::shared_ptr`: reference semantics.  The configuration procedure receives the pointer itself
 * (`const` view) and mutates the pointee through it; the very same pointer is returned.
 *
 * @tparam T
 *         Pointee type.
 */
template<typename T>
class Builder_traits<boost::shared_ptr<T>>
{
public:
  // Constants.

  /// See Builder_traits.
  static constexpr Builder_semantics S_SEMANTICS = Builder_semantics::S_REFERENCE;

private:
  // Constructors/destructor.

  /// Forbid all instantion.
  Builder_traits() = delete;
}; // class Builder_traits<boost::shared_ptr>

/**
 * Traits of `std::shared_ptr`: reference semantics.  Same as for `boost::shared_ptr`.
 *
 * @tparam T
 *         Pointee type.
 */
template<typename T>
class Builder_traits<std::shared_ptr<T>>
{
public:
  // Constants.

  /// See Builder_traits.
  static constexpr Builder_semantics S_SEMANTICS = Builder_semantics::S_REFERENCE;

private:
  // Constructors/destructor.

  /// Forbid all instantion.
  Builder_traits() = delete;
}; // class Builder_traits<std::shared_ptr>

/**
 * The parameter type through which a configuration procedure sees a `Value` in the builder idiom:
 * `Value&` (to a copy) for value semantics; `const Value&` (to the receiver itself) otherwise.
 *
 * @tparam Value
 *         See Builder_traits.
 */
template<typename Value>
using Builder_configured_ref = std::conditional_t<Builder_traits<Value>::S_SEMANTICS == Builder_semantics::S_VALUE,
                                                  Value&, const Value&>;

namespace detail
{

/**
 * Parameter-type inspection of a configuration procedure.  `S_KNOWN` is `true` if and only if `Configure` has exactly
 * one, non-overloaded, non-template call signature of arity 1; then `S_TAKES_COPY` says whether that parameter is
 * a non-reference.  Generic lambdas (`auto&` parameter) and overloaded functors are not inspected.
 *
 * @tparam Configure
 *         Procedure type, already decayed.
 */
template<typename Configure, typename = void>
class Configure_param_traits
{
public:
  // Constants.

  /// See class doc header.
  static constexpr bool S_KNOWN = false;
  /// See class doc header.
  static constexpr bool S_TAKES_COPY = false;
};

/// Function pointer.
template<typename Result, typename Param>
class Configure_param_traits<Result (*)(Param), void>
{
public:
  // Constants.

  /// See primary template.
  static constexpr bool S_KNOWN = true;
  /// See primary template.
  static constexpr bool S_TAKES_COPY = !std::is_reference_v<Param>;
};

/// `noexcept` function pointer.
template<typename Result, typename Param>
class Configure_param_traits<Result (*)(Param) noexcept, void> :
  public Configure_param_traits<Result (*)(Param), void>
{
};

/// Member `operator()`: `const`, non-`const`, and `noexcept` forms.
template<typename Result, typename Functor, typename Param>
class Configure_param_traits<Result (Functor::*)(Param), void> :
  public Configure_param_traits<Result (*)(Param), void>
{
};

/// See above.
template<typename Result, typename Functor, typename Param>
class Configure_param_traits<Result (Functor::*)(Param) const, void> :
  public Configure_param_traits<Result (*)(Param), void>
{
};

/// See above.
template<typename Result, typename Functor, typename Param>
class Configure_param_traits<Result (Functor::*)(Param) noexcept, void> :
  public Configure_param_traits<Result (*)(Param), void>
{
};

/// See above.
template<typename Result, typename Functor, typename Param>
class Configure_param_traits<Result (Functor::*)(Param) const noexcept, void> :
  public Configure_param_traits<Result (*)(Param), void>
{
};

/// Lambda or other functor with a single non-template `operator()`: inspect that.
template<typename Configure>
class Configure_param_traits<Configure, std::void_t<decltype(&Configure::operator())>> :
  public Configure_param_traits<decltype(&Configure::operator()), void>
{
};

} // namespace detail

/**
 * `true` if and only if `Configure` is known to take its one parameter by copy, e.g.,
 * `[](Edge_insets insets) { insets.m_left = 16; }`.  Such a procedure would compile against the idiom and then
 * configure only its own parameter, which is discarded; so util::with() and the mixins reject it.
 *
 * @tparam Configure
 *         Procedure type.
 */
template<typename Configure>
constexpr bool is_configure_by_copy_v = detail::Configure_param_traits<std::decay_t<Configure>>::S_TAKES_COPY;

/**
 * `true` if and only if `Value` opted into the builder idiom, and `Configure` can be invoked with the
 * Builder_configured_ref the idiom would hand it, and it does not take that by copy (is_configure_by_copy_v).
 * This is the compile-time gate of util::with(): a mutating procedure (taking `Value&`) over a
 * reference-semantics `Value` yields `false`, as the idiom only hands out `const Value&` there.
 *
 * @tparam Value
 *         See Builder_traits.
 * @tparam Configure
 *         Configuration procedure type.
 */
template<typename Value, typename Configure>
constexpr bool is_builder_configurable_v
  = (Builder_traits<Value>::S_SEMANTICS != Builder_semantics::S_NONE)
    && std::is_invocable_v<Configure, Builder_configured_ref<Value>>
    && (!is_configure_by_copy_v<Configure>);

} // namespace tailor::util
