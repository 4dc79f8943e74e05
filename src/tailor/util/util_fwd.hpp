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

#include "tailor/common.hpp"
#include <boost/thread.hpp>
#include <ostream>
#include <string>
#include <string_view>

/**
 * Tailor module containing the inline-configuration ("builder") idiom, plus miscellaneous general-use facilities
 * the other modules build on.
 *
 * The builder idiom: construct a value and configure it in the same expression:
 *
 *   ~~~
 *   const auto inset = Edge_insets().with([](Edge_insets& insets) { insets.m_left = 16; });
 *   const auto view = Table_view().with([](const Table_view& view) { view.set_separator_color("green"); });
 *   ~~~
 *
 * See Better_builder (value semantics), Builder (reference semantics), Builder_traits (opting in, including
 * retroactively for types one does not own), and the free function util::with().
 */
namespace tailor::util
{

// Types.

/// Short-hand for standard thread class (boost.thread; provides thread IDs for log metadata).
using Thread = boost::thread;
/// Short-hand for the thread ID type.
using Thread_id = Thread::id;
/// Short-hand for non-reentrant, exclusive mutex.
using Mutex_non_recursive = boost::mutex;
/**
 * Short-hand for an RAII lock guard of any mutex type.
 *
 * @tparam Mutex
 *         Non-recursive or recursive mutex type.
 */
template<typename Mutex>
using Lock_guard = boost::unique_lock<Mutex>;

/// Short-hand for a non-owning view of a contiguous `char` sequence.
using String_view = std::string_view;

/**
 * The semantics with which a type takes part in the builder idiom; see Builder_traits::S_SEMANTICS.
 *
 * @see `ostream<<` for this type.
 */
enum class Builder_semantics
{
  /// The type did not opt into the builder idiom; util::with() refuses to compile for it.
  S_NONE = 0,
  /**
   * Reference semantics: the configuration procedure receives an immutable view of the receiver itself, not a copy.
   * Mutation is possible only through state shared among copies (a smart pointer's pointee; a handle's
   * implementation object), so the returned value has the same identity as the receiver.
   */
  S_REFERENCE,
  /**
   * Value semantics: the configuration procedure receives a mutable reference to a copy of the receiver; the copy
   * is returned, and the receiver is untouched.
   */
  S_VALUE
}; // enum class Builder_semantics

class Reference_builder_tag;
class Value_builder_tag;
template<typename Value>
class Builder;
template<typename Value>
class Better_builder;
template<typename Value>
class Builder_traits;

// Free functions.

/**
 * Applies `configure` to `value` according to `Builder_traits<Value>::S_SEMANTICS` and returns the configured
 * value.  See builder.hpp for details.
 *
 * @tparam Value
 *         A type that opted into the builder idiom.
 * @tparam Configure
 *         Procedure invocable with the view the semantics hand out.
 * @param value
 *         Value to configure; copied (or moved) in.
 * @param configure
 *         Configuration procedure; invoked exactly once.
 * @return The configured value.
 */
template<typename Value, typename Configure>
Value with(Value value, Configure&& configure);

/**
 * Writes `"ref"`, `"val"`, or `"none"` to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Builder_semantics val);

/**
 * Helper for TAILOR_UTIL_WHERE_AM_I_STR(): `"<file>:<function>(<line>)"`.
 *
 * @param file
 *        File name, or its last path segment.
 * @param function
 *        Function name.
 * @param line
 *        Line number.
 * @return See above.
 */
std::string get_where_am_i_str(String_view file, String_view function, unsigned int line);

/**
 * Returns the part of `full_path` past the right-most directory separator; or all of it, if there is none.
 * `constexpr`, so that at log call sites `__FILE__` is trimmed at compile time.
 *
 * @param full_path
 *        Path, typically from `__FILE__`.
 * @return See above.
 */
constexpr String_view get_last_path_segment(String_view full_path);

} // namespace tailor::util

// Macros.

/**
 * Evaluates to an `std::string` `"<file>:<function>(<line>)"` describing the macro invocation's context.
 * Suitable as the `context` argument of error::Runtime_error.
 */
#define TAILOR_UTIL_WHERE_AM_I_STR() \
  ::tailor::util::get_where_am_i_str(::tailor::util::get_last_path_segment \
                                       (::tailor::util::String_view(__FILE__, sizeof(__FILE__) - 1)), \
                                     ::tailor::util::String_view(__FUNCTION__, sizeof(__FUNCTION__) - 1), \
                                     __LINE__)

/**
 * Wraps the statements of a statement-like macro in `do { ... } while (false)`, so that the macro invocation plus
 * `;` is one statement (safe in an unbraced `if`), and `break;` leaves the macro early.
 *
 * @param ARG_func_macro_definition
 *        The statements; no trailing `;` needed.
 */
#define TAILOR_UTIL_SEMICOLON_SAFE(ARG_func_macro_definition) \
  do \
  { \
    ARG_func_macro_definition \
  } \
  while (false)

// Template and constexpr implementations.

namespace tailor::util
{

constexpr String_view get_last_path_segment(String_view full_path)
{
  String_view path(full_path);
  constexpr char SEP = '/';

  const auto sep_pos = path.rfind(SEP);
  if (sep_pos != String_view::npos)
  {
    path.remove_prefix(sep_pos + 1);
  }
  // else { Nothing to do. }

  return path;
} // get_last_path_segment()

} // namespace tailor::util
