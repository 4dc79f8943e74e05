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

#include "tailor/log/log_fwd.hpp"
#include "tailor/util/util_fwd.hpp"
#include <boost/noncopyable.hpp>
#include <chrono>
#include <sstream>
#include <type_traits>
#include <typeindex>
#include <typeinfo>

// Macros.

/**
 * Logs a Sev::S_WARNING message built from `ARG_stream_fragment`, through `get_logger()`, tagged with
 * `get_log_component()`.  Both names must be visible at the call site: as members of a Log_context base, or as
 * locals declared by TAILOR_LOG_SET_CONTEXT().
 *
 * Nothing is evaluated, not even `ARG_stream_fragment`, unless the Logger is non-null and its
 * Logger::should_log() accepts the severity and component.
 *
 * @param ARG_stream_fragment
 *        Right-hand side of `ostream << ...`, e.g., `"Ignoring [" << name << "]."`.  No trailing newline.
 */
#define TAILOR_LOG_WARNING(ARG_stream_fragment) \
  TAILOR_LOG_WITH_CHECKING(::tailor::log::Sev::S_WARNING, ARG_stream_fragment)

/**
 * Like TAILOR_LOG_WARNING() at Sev::S_INFO.
 * @param ARG_stream_fragment
 *        See TAILOR_LOG_WARNING().
 */
#define TAILOR_LOG_INFO(ARG_stream_fragment) \
  TAILOR_LOG_WITH_CHECKING(::tailor::log::Sev::S_INFO, ARG_stream_fragment)

/**
 * Like TAILOR_LOG_WARNING() at Sev::S_DEBUG.
 * @param ARG_stream_fragment
 *        See TAILOR_LOG_WARNING().
 */
#define TAILOR_LOG_DEBUG(ARG_stream_fragment) \
  TAILOR_LOG_WITH_CHECKING(::tailor::log::Sev::S_DEBUG, ARG_stream_fragment)

/**
 * Like TAILOR_LOG_WARNING() at Sev::S_TRACE.
 * @param ARG_stream_fragment
 *        See TAILOR_LOG_WARNING().
 */
#define TAILOR_LOG_TRACE(ARG_stream_fragment) \
  TAILOR_LOG_WITH_CHECKING(::tailor::log::Sev::S_TRACE, ARG_stream_fragment)

/**
 * Declares locals `get_logger` and `get_log_component` for the rest of the enclosing block, so that
 * `TAILOR_LOG_*()` works there without a Log_context; e.g., in the logging form of util::with().  They shadow any
 * Log_context members of the same names.
 *
 * @param ARG_logger_ptr
 *        `Logger*` to log through; null turns the block's log calls into no-ops.
 * @param ARG_component_payload
 *        Component `enum` value to tag messages with.
 */
#define TAILOR_LOG_SET_CONTEXT(ARG_logger_ptr, ARG_component_payload) \
  [[maybe_unused]] \
    const auto get_logger \
      = [TAILOR_LOG_SET_CTX_logger = static_cast<::tailor::log::Logger*>(ARG_logger_ptr)] \
          () -> ::tailor::log::Logger* { return TAILOR_LOG_SET_CTX_logger; }; \
  [[maybe_unused]] \
    const auto get_log_component \
      = [TAILOR_LOG_SET_CTX_component = ::tailor::log::Component(ARG_component_payload)] \
          () -> const ::tailor::log::Component& { return TAILOR_LOG_SET_CTX_component; }

/**
 * The macro behind TAILOR_LOG_WARNING() and the rest, with the severity as an argument.  Checks
 * Logger::should_log(); if it passes, builds the message and its Msg_metadata and hands both to Logger::do_log().
 *
 * @param ARG_sev
 *        log::Sev of the message.
 * @param ARG_stream_fragment
 *        See TAILOR_LOG_WARNING().
 */
#define TAILOR_LOG_WITH_CHECKING(ARG_sev, ARG_stream_fragment) \
  TAILOR_UTIL_SEMICOLON_SAFE \
  ( \
    ::tailor::log::Logger* const TAILOR_LOG_logger = get_logger(); \
    if ((!TAILOR_LOG_logger) || (!TAILOR_LOG_logger->should_log(ARG_sev, get_log_component()))) \
    { \
      break; \
    } \
    /* else */ \
    /* Both views point into static storage (string literals), trimmed at compile time. */ \
    constexpr ::tailor::util::String_view TAILOR_LOG_file \
      = ::tailor::util::get_last_path_segment(::tailor::util::String_view(__FILE__, sizeof(__FILE__) - 1)); \
    constexpr ::tailor::util::String_view TAILOR_LOG_func(__FUNCTION__, sizeof(__FUNCTION__) - 1); \
    ::std::ostringstream TAILOR_LOG_os; \
    TAILOR_LOG_os << ARG_stream_fragment; \
    ::tailor::log::Msg_metadata TAILOR_LOG_metadata; \
    /* Parenthesized: the commas would otherwise split the TAILOR_UTIL_SEMICOLON_SAFE() argument. */ \
    (TAILOR_LOG_metadata \
       = { get_log_component(), ARG_sev, TAILOR_LOG_file, __LINE__, TAILOR_LOG_func, \
           ::std::chrono::system_clock::now(), ::boost::this_thread::get_id() }); \
    TAILOR_LOG_logger->do_log(&TAILOR_LOG_metadata, TAILOR_LOG_os.str()); \
  )

namespace tailor::log
{

// Types.

/**
 * Identifies the part of the program a message came from: a value of some component `enum class` (such as
 * tailor::Tailor_log_component), remembered as the `enum` type plus its integer value.  Thus the values of
 * different applications' component `enum`s never collide, even when their integers do.
 *
 * A default-constructed Component is empty: it names no component, and Config applies the default verbosity to it.
 */
class Component
{
public:
  // Types.

  /// Required underlying type of every component `enum class`.
  using enum_raw_t = unsigned int;

  // Constructors/destructor.

  /// Constructs an empty Component.
  Component();

  /**
   * Constructs a Component for the given `enum` value.  Implicit, so that an `enum` value can be passed wherever a
   * Component is expected.
   *
   * @tparam Payload
   *         `enum class Payload : enum_raw_t`.
   * @param payload
   *        The component.
   */
  template<typename Payload>
  Component(Payload payload);

  // Methods.

  /**
   * Returns `true` if and only if `*this` was default-constructed.
   * @return See above.
   */
  bool empty() const;

  /**
   * The component `enum` type; must not be called if empty().
   * @return See above.
   */
  std::type_index payload_type_index() const;

  /**
   * The component's integer value; must not be called if empty().
   * @return See above.
   */
  enum_raw_t payload_enum_raw_value() const;

private:
  // Data.

  /// `&typeid(Payload)`; null means empty().
  const std::type_info* m_payload_type_or_null;
  /// `Payload` value as an integer.
  enum_raw_t m_payload_enum_raw_value;
}; // class Component

/**
 * Everything about a message other than its text, as captured by TAILOR_LOG_WITH_CHECKING() at the call site and
 * handed to Logger::do_log().  Simple_ostream_logger prints all of it.
 */
struct Msg_metadata
{
  // Types.

  /// Wall-clock time point, so that it can be printed as a calendar date.
  using Time_stamp = std::chrono::system_clock::time_point;

  // Data.

  /// Component the message is tagged with.
  Component m_msg_component;
  /// Severity.
  Sev m_msg_sev;
  /// Source file name, directories removed.  Static storage.
  util::String_view m_msg_src_file;
  /// Source line.
  unsigned int m_msg_src_line;
  /// Function name.  Static storage.
  util::String_view m_msg_src_function;
  /// When the log call was made.
  Time_stamp m_called_when;
  /// Which thread made it.
  util::Thread_id m_call_thread_id;
}; // struct Msg_metadata

/**
 * Where messages go.  The `TAILOR_LOG_*()` macros ask should_log() first, and only if it says yes do they build
 * the message and call do_log().  Simple_ostream_logger is the implementation Tailor provides.
 *
 * ### Thread safety ###
 * Implementations must allow both methods to be called concurrently.
 */
class Logger :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /// Boring `virtual` destructor.
  virtual ~Logger();

  // Methods.

  /**
   * Returns whether a message of the given severity and component would be output.
   *
   * @param sev
   *        Severity; not Sev::S_NONE.
   * @param component
   *        Component; may be empty.
   * @return See above.
   */
  virtual bool should_log(Sev sev, const Component& component) const = 0;

  /**
   * Outputs the message.  Does not consult should_log() again.  Does not retain `metadata` or `msg` past return.
   *
   * @param metadata
   *        Message attributes.
   * @param msg
   *        Message text, without trailing newline.
   */
  virtual void do_log(Msg_metadata* metadata, util::String_view msg) = 0;
}; // class Logger

/**
 * Base for a class whose methods log: holds the `Logger*` and Component that the `TAILOR_LOG_*()` macros pick up
 * via get_logger() and get_log_component().
 *
 *   ~~~
 *   class Main : public tailor::log::Log_context
 *   {
 *   public:
 *     explicit Main(tailor::log::Logger* logger) :
 *       Log_context(logger, tailor::Tailor_log_component::S_TEST)
 *     {
 *       TAILOR_LOG_INFO("Starting.");
 *     }
 *   };
 *   ~~~
 */
class Log_context
{
public:
  // Constructors/destructor.

  /**
   * Holds `logger` and an empty Component.
   *
   * @param logger
   *        Logger; may be null.
   */
  explicit Log_context(Logger* logger = nullptr);

  /**
   * Holds `logger` and `Component(component_payload)`.
   *
   * @tparam Component_payload
   *         See Component.
   * @param logger
   *        Logger; may be null.
   * @param component_payload
   *        Component of every message logged through `*this`.
   */
  template<typename Component_payload>
  explicit Log_context(Logger* logger, Component_payload component_payload);

  // Methods.

  /**
   * The held Logger.
   * @return See above.
   */
  Logger* get_logger() const;

  /**
   * The held Component.
   * @return See above.
   */
  const Component& get_log_component() const;

private:
  // Data.

  /// See get_logger().
  Logger* m_logger;
  /// See get_log_component().
  Component m_component;
}; // class Log_context

// Template implementations.

template<typename Payload>
Component::Component(Payload payload) :
  m_payload_type_or_null(&(typeid(Payload))),
  m_payload_enum_raw_value(static_cast<enum_raw_t>(payload))
{
  static_assert(std::is_enum_v<Payload>, "A component must be an enum value.");
  static_assert(std::is_same_v<std::underlying_type_t<Payload>, enum_raw_t>,
                "A component enum's underlying type must be Component::enum_raw_t.");
}

template<typename Component_payload>
Log_context::Log_context(Logger* logger, Component_payload component_payload) :
  m_logger(logger),
  m_component(component_payload)
{
  // Nothing.
}

} // namespace tailor::log
