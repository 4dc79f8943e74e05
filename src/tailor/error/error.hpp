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

#include "tailor/error/error_fwd.hpp"
#include <boost/system/system_error.hpp>

namespace tailor::error
{

// Types.

/**
 * Thrown by a Tailor API that failed when its `err_code` argument was null.  code() is the #Error_code that would
 * have been stored in `*err_code`; what() is the context string followed by the code's description.
 */
class Runtime_error :
  public boost::system::system_error
{
public:
  // Constructors/destructor.

  /**
   * Constructs the exception.
   *
   * @param err_code
   *        The failure; truthy.
   * @param context
   *        Where it happened; typically TAILOR_UTIL_WHERE_AM_I_STR() of the failing API.
   */
  explicit Runtime_error(const Error_code& err_code, util::String_view context);
}; // class Runtime_error

// Template implementations.

template<typename Func, typename Ret>
bool exec_and_throw_on_error(const Func& func, Ret* ret, Error_code* err_code, util::String_view context)
{
  if (err_code)
  {
    return false;
  }
  // else

  Error_code local_err_code;
  *ret = func(&local_err_code);
  if (local_err_code)
  {
    throw Runtime_error(local_err_code, context);
  }
  return true;
}

} // namespace tailor::error

// Macros.

/**
 * First statement of an API `Ret f(..., Error_code* err_code = 0)` that follows the #Error_code convention.  If
 * `err_code` is null, re-invokes `f` with a local code, and either returns its result or throws
 * error::Runtime_error.  Otherwise falls through, and the rest of `f` may assume `err_code` is non-null.
 *
 *   ~~~
 *   int parse_positive(util::String_view str, Error_code* err_code)
 *   {
 *     TAILOR_ERROR_EXEC_AND_THROW_ON_ERROR(int, parse_positive, str, _1);
 *     ...
 *   }
 *   ~~~
 *
 * @param ARG_ret_type
 *        `Ret`: default-constructible, not `void`, not a reference.
 * @param ARG_function_name
 *        `f`.
 * @param ...
 *        `f`'s arguments, with `_1` in place of `err_code`.
 */
#define TAILOR_ERROR_EXEC_AND_THROW_ON_ERROR(ARG_ret_type, ARG_function_name, ...) \
  TAILOR_UTIL_SEMICOLON_SAFE \
  ( \
    ARG_ret_type TAILOR_ERROR_result; \
    if (::tailor::error::exec_and_throw_on_error \
          ([&](::tailor::Error_code* _1) -> ARG_ret_type { return ARG_function_name(__VA_ARGS__); }, \
           &TAILOR_ERROR_result, err_code, TAILOR_UTIL_WHERE_AM_I_STR())) \
    { \
      return TAILOR_ERROR_result; \
    } \
  )
