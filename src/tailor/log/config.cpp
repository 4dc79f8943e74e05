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
#include "tailor/log/config.hpp"
#include "tailor/log/error/error.hpp"
#include "tailor/error/error.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <optional>
#include <vector>

namespace tailor::log
{

// Static initializations.

const Sev Config::S_MOST_VERBOSE_SEV_DEFAULT = Sev::S_INFO;
const std::string Config::S_ALL_COMPONENT_NAME_ALIAS = "ALL";
const char Config::S_TOKEN_SEPARATOR = ';';
const char Config::S_PAIR_SEPARATOR = ':';

// Implementations.

Config::Config(Sev most_verbose_sev_default) :
  m_use_human_friendly_time_stamps(true),
  m_verbosity_default(most_verbose_sev_default)
{
  // Nothing.
}

Config::Config(const Config& src) = default;

Config& Config::operator=(const Config& src) = default;

bool Config::output_whether_should_log(Sev sev, const Component& component) const
{
  auto most_verbose_sev = m_verbosity_default;
  if (!component.empty())
  {
    const auto it = m_verbosities_by_component.find(Component_key(component.payload_type_index(),
                                                                  component.payload_enum_raw_value()));
    if (it != m_verbosities_by_component.end())
    {
      most_verbose_sev = it->second;
    }
  }

  // Sev::S_NONE as the limit lets nothing through, since every real severity is above it.
  return (sev != Sev::S_NONE) && (sev <= most_verbose_sev);
}

bool Config::output_component_to_ostream(std::ostream* os, const Component& component) const
{
  if (component.empty())
  {
    return false;
  }
  // else

  const auto it = m_component_names.find(Component_key(component.payload_type_index(),
                                                       component.payload_enum_raw_value()));
  if (it == m_component_names.end())
  {
    *os << component.payload_enum_raw_value();
  }
  else
  {
    *os << it->second;
  }
  return true;
}

void Config::configure_default_verbosity(Sev most_verbose_sev_default, bool reset)
{
  m_verbosity_default = most_verbose_sev_default;
  if (reset)
  {
    m_verbosities_by_component.clear();
  }
}

bool Config::configure_component_verbosity_by_name(Sev most_verbose_sev, util::String_view component_name)
{
  const auto it = m_component_keys_by_name.find(normalized_component_name(component_name));
  if (it == m_component_keys_by_name.end())
  {
    return false;
  }
  // else

  m_verbosities_by_component[it->second] = most_verbose_sev;
  return true;
}

bool Config::configure_verbosity(util::String_view spec, Error_code* err_code)
{
  using boost::algorithm::split;
  using boost::algorithm::trim_copy;
  using boost::conversion::try_lexical_convert;
  using std::optional;
  using std::string;
  using std::vector;

  TAILOR_ERROR_EXEC_AND_THROW_ON_ERROR(bool, configure_verbosity, spec, _1);
  // If got here, err_code is not null.

  /* Validate and parse the whole thing first; only then touch *this.  Each parsed pair: (component or none
   * meaning the default, severity). */
  vector<std::pair<optional<Component_key>, Sev>> settings;

  const string spec_str(spec);
  vector<string> tokens;
  split(tokens, spec_str, [](char ch) { return ch == S_TOKEN_SEPARATOR; });
  for (const auto& raw_token : tokens)
  {
    const auto token = trim_copy(raw_token);
    if (token.empty())
    {
      continue; // E.g., "INFO;" or "".
    }
    // else

    string component_name;
    string sev_str;
    const auto sep_pos = token.find(S_PAIR_SEPARATOR);
    if (sep_pos == string::npos)
    {
      sev_str = token;
    }
    else
    {
      if (token.find(S_PAIR_SEPARATOR, sep_pos + 1) != string::npos)
      {
        *err_code = error::Code::S_MALFORMED_VERBOSITY_SPEC;
        return false;
      }
      // else
      component_name = normalized_component_name(util::String_view(token).substr(0, sep_pos));
      sev_str = trim_copy(token.substr(sep_pos + 1));
      if (component_name.empty() || sev_str.empty())
      {
        *err_code = error::Code::S_MALFORMED_VERBOSITY_SPEC;
        return false;
      }
    }

    Sev sev;
    if (!try_lexical_convert(sev_str, sev))
    {
      *err_code = error::Code::S_INVALID_SEVERITY;
      return false;
    }
    // else

    if ((sep_pos == string::npos) || (component_name == S_ALL_COMPONENT_NAME_ALIAS))
    {
      settings.emplace_back(std::nullopt, sev);
      continue;
    }
    // else

    const auto key_it = m_component_keys_by_name.find(component_name);
    if (key_it == m_component_keys_by_name.end())
    {
      *err_code = error::Code::S_UNKNOWN_COMPONENT;
      return false;
    }
    // else
    settings.emplace_back(key_it->second, sev);
  } // for (raw_token : tokens)

  // Valid.  Reset, then apply in order.
  configure_default_verbosity(S_MOST_VERBOSE_SEV_DEFAULT, true);
  for (const auto& setting : settings)
  {
    if (setting.first)
    {
      m_verbosities_by_component[*setting.first] = setting.second;
    }
    else
    {
      m_verbosity_default = setting.second;
    }
  }

  err_code->clear();
  return true;
} // Config::configure_verbosity()

std::string Config::normalized_component_name(util::String_view name)
{
  return boost::algorithm::to_upper_copy(boost::algorithm::trim_copy(std::string(name)));
}

void Config::store_component_name(const Component_key& key, const std::string& name)
{
  const auto key_it = m_component_keys_by_name.find(name);
  if ((key_it != m_component_keys_by_name.end()) && (key_it->second == key))
  {
    return; // Already registered (e.g., init_component_names() invoked twice).
  }
  // else

  auto& names = m_component_names[key];
  if (!names.empty())
  {
    names += ',';
  }
  names += name;

  m_component_keys_by_name.insert_or_assign(name, key);
}

} // namespace tailor::log
