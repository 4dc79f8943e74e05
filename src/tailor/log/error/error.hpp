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
#include <boost/system/error_code.hpp>

/// Error codes of tailor::log, in boost.system category `"tailor/log"`.
namespace tailor::log::error
{

// Types.

/// Failures of Config::configure_verbosity().  Starts at 1, since 0 means success to boost.system.
enum class Code
{
  /// Severity is neither a Sev name nor a Sev number.
  S_INVALID_SEVERITY = 1,
  /// Component name was never passed to Config::init_component_names().
  S_UNKNOWN_COMPONENT,
  /// Token is not `sev` or `name:sev`; e.g., `UTIL:`, `:info`, `a:b:c`.
  S_MALFORMED_VERBOSITY_SPEC
}; // enum class Code

// Free functions.

/**
 * Wraps `err_code` into a tailor::Error_code of the `"tailor/log"` category.  Found by ADL when a Code is assigned
 * to an #Error_code.
 *
 * @param err_code
 *        Code.
 * @return See above.
 */
Error_code make_error_code(Code err_code);

} // namespace tailor::log::error

namespace boost::system
{

/// Lets a log::error::Code convert implicitly to tailor::Error_code.
template<>
struct is_error_code_enum<::tailor::log::error::Code>
{
  /// Yes.
  static const bool value = true;
};

} // namespace boost::system
