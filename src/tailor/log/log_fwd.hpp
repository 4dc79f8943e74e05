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
#include <cstddef>
#include <istream>
#include <ostream>

/**
 * Tailor module providing logging: the Logger interface and the `TAILOR_LOG_*()` call-site macros, per-component
 * verbosity configuration (Config), and an out-of-the-box console Logger (Simple_ostream_logger).
 *
 * A class that logs typically derives from Log_context, constructed with a `Logger*` and a component `enum` value;
 * then, in its methods:
 *
 *   ~~~
 *   TAILOR_LOG_INFO("Configured [" << n << "] views.");
 *   ~~~
 *
 * A free function (or `static` method) instead invokes TAILOR_LOG_SET_CONTEXT() near its top.
 */
namespace tailor::log
{

// Types.

class Component;
class Config;
class Logger;
class Log_context;
struct Msg_metadata;
class Simple_ostream_logger;

/**
 * Message severity.  Lower values are more severe; a Config verbosity of `S` lets through every message whose
 * severity is `S` or lower (Sev::S_NONE lets through nothing).
 *
 * `ostream<<` writes the member name without its `S_` prefix, e.g., `"TRACE"`.  `istream>>` reads that name in any
 * case, or the integer value; this is what Config::configure_verbosity() accepts for a severity.
 */
enum class Sev : size_t
{
  /// Filter-only value: nothing is logged with it, and as a verbosity it silences everything.
  S_NONE = 0,
  /// The program cannot continue.
  S_FATAL,
  /// An operation failed.
  S_ERROR,
  /// Something unexpected happened, but the operation went on; e.g., a bad command-line value replaced by a default.
  S_WARNING,
  /// Rare, high-level events, such as startup parameters.
  S_INFO,
  /// Like Sev::S_INFO but mostly of interest while debugging.
  S_DEBUG,
  /// Per-operation detail, e.g., each util::with() configuration; can be voluminous.
  S_TRACE,
  /// Like Sev::S_TRACE, with bulky payloads in the message.
  S_DATA,
  /// Not a severity: one past the last one.
  S_END_SENTINEL
}; // enum class Sev

// Free functions.

/**
 * Writes the name of `val`, e.g., `"WARNING"`; or `"UNKNOWN_SEV_<n>"` for an out-of-range value.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Value to write.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Sev val);

/**
 * Reads one whitespace-delimited token and parses it as a Sev; see Sev doc header for the accepted forms.
 * On failure `failbit` is set, and `val` is left alone.
 *
 * @param is
 *        Stream from which to read.
 * @param val
 *        Result.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Sev& val);

} // namespace tailor::log
