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

#include "tailor/log/log.hpp"
#include "tailor/util/util_fwd.hpp"
#include <iostream>

namespace tailor::log
{

// Types.

/**
 * Logger that writes each message as one line to a standard `ostream`: warnings and worse to one stream (`cerr` by
 * default), everything else to another (`cout` by default).  The line:
 *
 *   ~~~
 *   2024-05-01 12:00:00.123456 [trce]: T140213: TAILOR-UTIL: builder.hpp:with(322): Configuring object ...
 *   ~~~
 *
 * That is: time stamp (UTC, or seconds since the epoch; see Config::m_use_human_friendly_time_stamps), 4-letter
 * severity, thread ID, component (left out if the message has none; see Config::output_component_to_ostream()),
 * source location, message.
 *
 * ### Thread safety ###
 * do_log() may be called concurrently; whole lines are written under one mutex, shared by both streams.  The Config
 * must not be modified meanwhile.
 */
class Simple_ostream_logger :
  public Logger
{
public:
  // Constructors/destructor.

  /**
   * Constructs the logger.  `os` and `os_for_err` may be the same stream.
   *
   * @param config
   *        Verbosity and output format.  Must outlive `*this`.
   * @param os
   *        Destination of messages less severe than Sev::S_WARNING.
   * @param os_for_err
   *        Destination of the others.
   */
  explicit Simple_ostream_logger(Config* config,
                                 std::ostream& os = std::cout, std::ostream& os_for_err = std::cerr);

  // Methods.

  /**
   * Defers to Config::output_whether_should_log().
   *
   * @param sev
   *        See Logger.
   * @param component
   *        See Logger.
   * @return See above.
   */
  bool should_log(Sev sev, const Component& component) const override;

  /**
   * Formats the line (see class doc header) and writes it, flushed, to the appropriate stream.
   *
   * @param metadata
   *        See Logger.
   * @param msg
   *        See Logger.
   */
  void do_log(Msg_metadata* metadata, util::String_view msg) override;

private:
  // Methods.

  /**
   * The line's time stamp, with a trailing space.
   *
   * @param metadata
   *        Source of the time.
   * @return See above.
   */
  std::string time_stamp_str(const Msg_metadata& metadata) const;

  // Data.

  /// See constructor.
  Config* const m_config;
  /// See constructor.
  std::ostream& m_os;
  /// See constructor.
  std::ostream& m_os_for_err;
  /// Serializes do_log() output.
  util::Mutex_non_recursive m_log_mutex;
}; // class Simple_ostream_logger

} // namespace tailor::log
