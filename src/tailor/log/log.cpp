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
#include "tailor/log/log.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>
#include <iterator>

namespace tailor::log
{

namespace
{

/// Sev names, indexed by Sev value.
const util::String_view S_SEV_NAMES[] = { "NONE", "FATAL", "ERROR", "WARNING", "INFO", "DEBUG", "TRACE", "DATA" };

static_assert(std::size(S_SEV_NAMES) == size_t(Sev::S_END_SENTINEL), "One name per Sev, please.");

} // namespace (anon)

// Implementations.

Logger::~Logger() = default;

Component::Component() :
  m_payload_type_or_null(nullptr),
  m_payload_enum_raw_value(0)
{
  // Nothing.
}

bool Component::empty() const
{
  return !m_payload_type_or_null;
}

std::type_index Component::payload_type_index() const
{
  return std::type_index(*m_payload_type_or_null);
}

Component::enum_raw_t Component::payload_enum_raw_value() const
{
  return m_payload_enum_raw_value;
}

Log_context::Log_context(Logger* logger) :
  m_logger(logger)
{
  // Nothing.
}

Logger* Log_context::get_logger() const
{
  return m_logger;
}

const Component& Log_context::get_log_component() const
{
  return m_component;
}

std::ostream& operator<<(std::ostream& os, Sev val)
{
  const auto idx = size_t(val);
  if (idx < size_t(Sev::S_END_SENTINEL))
  {
    return os << S_SEV_NAMES[idx];
  }
  return os << "UNKNOWN_SEV_" << idx;
}

std::istream& operator>>(std::istream& is, Sev& val)
{
  std::string token;
  if (!(is >> token))
  {
    return is;
  }
  // else

  size_t idx = 0;
  for (const auto name : S_SEV_NAMES)
  {
    if (boost::algorithm::iequals(token, name))
    {
      val = Sev(idx);
      return is;
    }
    ++idx;
  }

  // Not a name; perhaps the integer form.
  if (boost::conversion::try_lexical_convert(token, idx) && (idx < size_t(Sev::S_END_SENTINEL)))
  {
    val = Sev(idx);
  }
  else
  {
    is.setstate(std::ios_base::failbit);
  }
  return is;
} // istream>>Sev

} // namespace tailor::log
