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
#include <boost/unordered_map.hpp>
#include <map>
#include <string>
#include <typeindex>
#include <utility>

namespace tailor::log
{

// Types.

/**
 * Class used to configure the filtering and output behavior of Logger implementations such as
 * Simple_ostream_logger.  It controls:
 *   - Verbosity: for each message (severity and Component), whether it passes (should_log()).  There is a default
 *     most-verbose severity, and optionally an override per component.
 *   - Component names: after `init_component_names<E>()`, the components of `enum` type `E` are output by name,
 *     and their verbosity can be configured by name, including via a verbosity spec (configure_verbosity()).
 *   - Time stamp format in the output (#m_use_human_friendly_time_stamps).
 *
 * Typical setup:
 *
 *   ~~~
 *   tailor::log::Config config;
 *   config.init_component_names<tailor::Tailor_log_component>(tailor::S_TAILOR_LOG_COMPONENT_NAME_MAP, "tailor-");
 *   config.configure_verbosity("INFO;tailor-UTIL:TRACE");
 *   tailor::log::Simple_ostream_logger logger(&config);
 *   ~~~
 *
 * ### Thread safety ###
 * Non-`const` methods are not safe to call concurrently with anything else on the same Config, including
 * logging through a Logger that uses it.  Configure first; then log.
 */
class Config
{
public:
  // Constants.

  /// Recommended default verbosity: message with this severity or more severe pass; others do not.
  static const Sev S_MOST_VERBOSE_SEV_DEFAULT;

  /// Component name that configure_verbosity() treats as the default/catch-all verbosity's specifier.
  static const std::string S_ALL_COMPONENT_NAME_ALIAS;

  /// Separates component/severity pairs in a configure_verbosity() spec.
  static const char S_TOKEN_SEPARATOR;

  /// Separates component and severity within each pair in a configure_verbosity() spec.
  static const char S_PAIR_SEPARATOR;

  // Constructors/destructor.

  /**
   * Constructs a Config with the given default verbosity, no per-component overrides, and no component names.
   *
   * @param most_verbose_sev_default
   *        Default verbosity; see configure_default_verbosity().
   */
  explicit Config(Sev most_verbose_sev_default = S_MOST_VERBOSE_SEV_DEFAULT);

  /**
   * Copy constructor.  The copy may then be configured independently.
   *
   * @param src
   *        Source object.
   */
  Config(const Config& src);

  // Methods.

  /**
   * Copy assignment.
   *
   * @param src
   *        Source object.
   * @return `*this`.
   */
  Config& operator=(const Config& src);

  /**
   * Returns whether a message with the given severity and component should be logged:
   * `true` if and only if `sev` is at least as severe as the verbosity configured for `component` (if any; else the
   * default).
   *
   * @param sev
   *        Severity of the message.  Must not be Sev::S_NONE.
   * @param component
   *        Component of the message; may be empty.
   * @return See above.
   */
  bool output_whether_should_log(Sev sev, const Component& component) const;

  /**
   * Writes the component's registered name (see init_component_names()), or its integer value if none, to `*os`.
   *
   * @param os
   *        Stream to which to write.
   * @param component
   *        Component; may be empty.
   * @return `false` if `component.empty()`, in which case nothing is written; `true` otherwise.
   */
  bool output_component_to_ostream(std::ostream* os, const Component& component) const;

  /**
   * Registers the names of the members of the given component `enum`, for output and for by-name verbosity
   * configuration.  Names are case-insensitive; they are stored upper-cased.  A value with 2+ names is output as a
   * comma-separated list of them; any of them can be used in configuration.
   *
   * @tparam Component_payload
   *         `enum class` type (see Component).
   * @param component_names
   *        Value-to-name map, e.g., #S_TAILOR_LOG_COMPONENT_NAME_MAP.
   * @param payload_type_prefix_or_empty
   *        Prefix prepended to each name (e.g., `"tailor-"`), so that names of different `enum`s do not clash.
   */
  template<typename Component_payload>
  void init_component_names(const boost::unordered_multimap<Component_payload, std::string>& component_names,
                            util::String_view payload_type_prefix_or_empty = "");

  /**
   * Sets the default verbosity, applied to components without an override.
   *
   * @param most_verbose_sev_default
   *        Most verbose severity that passes.  Sev::S_NONE: nothing passes.
   * @param reset
   *        If `true`, all per-component overrides are removed too.
   */
  void configure_default_verbosity(Sev most_verbose_sev_default, bool reset);

  /**
   * Sets the verbosity for the given component, overriding the default.
   *
   * @tparam Component_payload
   *         `enum class` type (see Component).
   * @param most_verbose_sev
   *        Most verbose severity that passes for this component.
   * @param component_payload
   *        The component.
   */
  template<typename Component_payload>
  void configure_component_verbosity(Sev most_verbose_sev, Component_payload component_payload);

  /**
   * Like configure_component_verbosity() but identifies the component by its registered name (with prefix).
   *
   * @param most_verbose_sev
   *        Most verbose severity that passes for this component.
   * @param component_name
   *        Name, case-insensitive.
   * @return `false` if no component by that name was registered (nothing changes then); `true` otherwise.
   */
  bool configure_component_verbosity_by_name(Sev most_verbose_sev, util::String_view component_name);

  /**
   * Replaces the entire verbosity configuration with the one given in concise string form:
   * #S_TOKEN_SEPARATOR-separated tokens, each one of:
   *   - `sev`: default verbosity;
   *   - `ALL:sev` (#S_ALL_COMPONENT_NAME_ALIAS, #S_PAIR_SEPARATOR): same;
   *   - `name:sev`: verbosity of the component registered as `name`.
   *
   * `sev` is anything `istream>>Sev` accepts, e.g., `INFO`, `trace`, `4`.  Example: `"INFO;tailor-UTIL:TRACE"`.
   * Whitespace around tokens and around names and severities is ignored; empty tokens are skipped.
   *
   * The configuration is reset first: the default becomes #S_MOST_VERBOSE_SEV_DEFAULT unless the spec sets it,
   * and all per-component overrides are removed; then the tokens are applied in order.  The spec is validated in
   * its entirety before anything is changed, so on error `*this` is untouched.  A pair missing either side
   * (`UTIL:`, `:info`) is malformed.
   *
   * @param spec
   *        See above.
   * @param err_code
   *        See tailor::Error_code docs for error reporting semantics.  log::error::Code generated:
   *        log::error::Code::S_INVALID_SEVERITY, log::error::Code::S_UNKNOWN_COMPONENT,
   *        log::error::Code::S_MALFORMED_VERBOSITY_SPEC.
   * @return `true` on success; `false` on error (if `err_code` is not null).
   */
  bool configure_verbosity(util::String_view spec, Error_code* err_code = 0);

  // Data.  (Public!)

  /**
   * If `true`, Logger output shows local-agnostic calendar time stamps (UTC) `YYYY-MM-DD HH:MM:SS.uuuuuu`;
   * else seconds.microseconds since the POSIX epoch.
   */
  bool m_use_human_friendly_time_stamps;

private:
  // Types.

  /// Identifies a component regardless of `enum` type: (`typeid` of the `enum`, value).
  using Component_key = std::pair<std::type_index, Component::enum_raw_t>;

  // Methods.

  /**
   * Returns `name` upper-cased (and trimmed).
   *
   * @param name
   *        Name.
   * @return See above.
   */
  static std::string normalized_component_name(util::String_view name);

  /**
   * Records `name` (already normalized) as a name of the component `key`.
   *
   * @param key
   *        Component.
   * @param name
   *        Name.
   */
  void store_component_name(const Component_key& key, const std::string& name);

  // Data.

  /// Verbosity for components not in #m_verbosities_by_component (and for empty components).
  Sev m_verbosity_default;

  /// Per-component verbosity overrides.
  std::map<Component_key, Sev> m_verbosities_by_component;

  /// For output: each named component's name(s), comma-separated.
  std::map<Component_key, std::string> m_component_names;

  /// For by-name configuration: inverse of #m_component_names, with each of 2+ names separately.
  std::map<std::string, Component_key> m_component_keys_by_name;
}; // class Config

// Template implementations.

template<typename Component_payload>
void Config::init_component_names(const boost::unordered_multimap<Component_payload, std::string>& component_names,
                                  util::String_view payload_type_prefix_or_empty)
{
  using std::string;

  const string prefix(payload_type_prefix_or_empty);
  for (const auto& enum_val_and_name : component_names)
  {
    const Component component(enum_val_and_name.first);
    store_component_name(Component_key(component.payload_type_index(), component.payload_enum_raw_value()),
                         normalized_component_name(prefix + enum_val_and_name.second));
  }
}

template<typename Component_payload>
void Config::configure_component_verbosity(Sev most_verbose_sev, Component_payload component_payload)
{
  const Component component(component_payload);
  m_verbosities_by_component[Component_key(component.payload_type_index(), component.payload_enum_raw_value())]
    = most_verbose_sev;
}

} // namespace tailor::log
