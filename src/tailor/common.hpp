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

#include <boost/system/error_code.hpp>
#include <boost/unordered_map.hpp>
#include <string>

/* We build in C++17 mode ourselves; and the builder API (`std::is_invocable_v`, `std::invoke()`, nested namespace
 * definitions) needs it in the user's translation unit too, since it is all templates. */
#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any tailor/ API headers, use C++17 compile mode or later."
#endif

/**
 * Everything Tailor provides.  The point of it is util::Builder, util::Better_builder and util::with(): configuring
 * a value in the same expression that creates it.  tailor::log and tailor::error support that with diagnostics and
 * error reporting.
 */
namespace tailor
{

// Types.

/**
 * Error code type of every Tailor API that can fail; a boost.system `error_code`.
 *
 * Such an API takes a trailing `Error_code* err_code = 0`.  Given a non-null `err_code`, it reports the outcome by
 * setting `*err_code` (cleared on success) and does not throw.  Given null, it throws error::Runtime_error on
 * failure.  TAILOR_ERROR_EXEC_AND_THROW_ON_ERROR() provides the null-pointer half.
 */
using Error_code = boost::system::error_code;

/**
 * Log components of Tailor's own log call sites.  Pass #S_TAILOR_LOG_COMPONENT_NAME_MAP to
 * log::Config::init_component_names() to see them by name and to set their verbosity by name.
 */
enum class Tailor_log_component : unsigned int
{
  /// tailor::util; i.e., the logging util::with().
  S_UTIL = 0,
  /// Unit tests and the demo program.
  S_TEST,
  /// Not a component: one past the last one.
  S_END_SENTINEL
}; // enum class Tailor_log_component

// Data.

/// Tailor_log_component value to name: the member name without `S_`, e.g., `"UTIL"`.
extern const boost::unordered_multimap<Tailor_log_component, std::string> S_TAILOR_LOG_COMPONENT_NAME_MAP;

} // namespace tailor
