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
#include "tailor/log/simple_ostream_logger.hpp"
#include "tailor/log/config.hpp"
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <cassert>
#include <iterator>
#include <sstream>

namespace tailor::log
{

namespace
{

/// Sev as printed in a line, indexed by Sev value.
const util::String_view S_SEV_STRS[] = { "null", "fatl", "eror", "warn", "info", "debg", "trce", "data" };

static_assert(std::size(S_SEV_STRS) == size_t(Sev::S_END_SENTINEL), "One abbreviation per Sev, please.");

} // namespace (anon)

// Implementations.

Simple_ostream_logger::Simple_ostream_logger(Config* config,
                                             std::ostream& os, std::ostream& os_for_err) :
  m_config(config),
  m_os(os),
  m_os_for_err(os_for_err)
{
  assert(m_config);
}

bool Simple_ostream_logger::should_log(Sev sev, const Component& component) const // Virtual.
{
  return m_config->output_whether_should_log(sev, component);
}

void Simple_ostream_logger::do_log(Msg_metadata* metadata, util::String_view msg) // Virtual.
{
  using std::flush;

  assert(metadata->m_msg_sev != Sev::S_NONE);

  // Format without the lock held.
  std::ostringstream line_os;
  line_os << time_stamp_str(*metadata)
          << '[' << S_SEV_STRS[size_t(metadata->m_msg_sev)] << "]: T" << metadata->m_call_thread_id << ": ";
  if (m_config->output_component_to_ostream(&line_os, metadata->m_msg_component))
  {
    line_os << ": ";
  }
  line_os << util::get_where_am_i_str(metadata->m_msg_src_file, metadata->m_msg_src_function,
                                      metadata->m_msg_src_line)
          << ": " << msg << '\n';

  // One mutex for both streams: they may well be the same file descriptor (2>&1).
  util::Lock_guard<decltype(m_log_mutex)> lock(m_log_mutex);
  ((metadata->m_msg_sev > Sev::S_WARNING) ? m_os : m_os_for_err) << line_os.str() << flush;
}

std::string Simple_ostream_logger::time_stamp_str(const Msg_metadata& metadata) const
{
  using std::chrono::duration_cast;
  using std::chrono::microseconds;
  using std::chrono::seconds;
  using std::chrono::system_clock;
  using std::chrono::time_point_cast;

  const auto rounded_time_stamp = time_point_cast<seconds>(metadata.m_called_when);
  const auto usec = duration_cast<microseconds>(metadata.m_called_when - rounded_time_stamp).count();

  if (m_config->m_use_human_friendly_time_stamps)
  {
    return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:06} ",
                       fmt::gmtime(system_clock::to_time_t(rounded_time_stamp)), usec);
  }
  // else
  return fmt::format("{}.{:06} ", rounded_time_stamp.time_since_epoch().count(), usec);
}

} // namespace tailor::log
