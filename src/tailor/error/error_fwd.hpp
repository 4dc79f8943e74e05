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
#include "tailor/common.hpp"

/**
 * Tailor module for the #Error_code convention: the exception thrown when the caller passed no `Error_code*`
 * (Runtime_error) and the macro that throws it (TAILOR_ERROR_EXEC_AND_THROW_ON_ERROR()).
 *
 * The builder idiom itself has no error codes; whatever a configuration procedure throws reaches the caller
 * unchanged.  log::Config::configure_verbosity() is the user of this module.
 */
namespace tailor::error
{

// Types.

class Runtime_error;

// Free functions.

/**
 * The function behind TAILOR_ERROR_EXEC_AND_THROW_ON_ERROR().  With non-null `err_code` it does nothing and returns
 * `false`.  With null `err_code` it calls `func` with a local #Error_code, stores the result in `*ret`, throws
 * Runtime_error if the code came back set, and otherwise returns `true`.
 *
 * @tparam Func
 *         `Ret (Error_code*)`.
 * @tparam Ret
 *         Result type.
 * @param func
 *        The caller, re-invoked with a non-null `Error_code*`.
 * @param ret
 *        Receives `func()`'s result.
 * @param err_code
 *        The caller's `err_code`.
 * @param context
 *        Passed to Runtime_error.
 * @return `true` if and only if `*ret` now holds the caller's result.
 */
template<typename Func, typename Ret>
bool exec_and_throw_on_error(const Func& func, Ret* ret, Error_code* err_code, util::String_view context);

} // namespace tailor::error
