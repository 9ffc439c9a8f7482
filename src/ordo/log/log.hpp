/* Ordo
 * Copyright 2026 The Ordo Authors
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

#include "ordo/log/log_fwd.hpp"
#include "ordo/util/util.hpp"
#include "ordo/util/detail/util.hpp"
#include <boost/chrono/chrono.hpp>
#include <boost/thread/tss.hpp>
#include <boost/noncopyable.hpp>
#include <string>
#include <typeinfo>
#include <typeindex>

// Macros.  These (conceptually) belong to the ordo::log namespace (hence the prefix for each macro).

/**
 * Logs a WARNING message into ordo::log::Logger `*get_logger()` with ordo::log::Component `get_log_component()`, if
 * such logging is enabled by that `Logger`.  Supplies context information to be potentially logged with message,
 * like current time, source file/line/function, and thread ID/nickname info, in addition to the message, component,
 * and severity.  The severity checked against (and potentially logged in its own right) is ordo::log::Sev::S_WARNING.
 *
 * `get_logger()` must exist, and if not null, `get_log_component()` must also exist in the context of the macro
 * invocation.  Inside a Log_context-derived class these are its methods; elsewhere use ORDO_LOG_SET_CONTEXT().
 *
 * @param ARG_stream_fragment
 *        Same as in ORDO_LOG_WITH_CHECKING().
 */
#define ORDO_LOG_WARNING(ARG_stream_fragment) \
  ORDO_LOG_WITH_CHECKING(::ordo::log::Sev::S_WARNING, ARG_stream_fragment)

/**
 * Logs a FATAL message, if enabled.  See ORDO_LOG_WARNING().
 * @param ARG_stream_fragment
 *        Same as in ORDO_LOG_WARNING().
 */
#define ORDO_LOG_FATAL(ARG_stream_fragment) \
  ORDO_LOG_WITH_CHECKING(::ordo::log::Sev::S_FATAL, ARG_stream_fragment)

/**
 * Logs an ERROR message, if enabled.  See ORDO_LOG_WARNING().
 * @param ARG_stream_fragment
 *        Same as in ORDO_LOG_WARNING().
 */
#define ORDO_LOG_ERROR(ARG_stream_fragment) \
  ORDO_LOG_WITH_CHECKING(::ordo::log::Sev::S_ERROR, ARG_stream_fragment)

/**
 * Logs an INFO message, if enabled.  See ORDO_LOG_WARNING().
 * @param ARG_stream_fragment
 *        Same as in ORDO_LOG_WARNING().
 */
#define ORDO_LOG_INFO(ARG_stream_fragment) \
  ORDO_LOG_WITH_CHECKING(::ordo::log::Sev::S_INFO, ARG_stream_fragment)

/**
 * Logs a DEBUG message, if enabled.  See ORDO_LOG_WARNING().
 * @param ARG_stream_fragment
 *        Same as in ORDO_LOG_WARNING().
 */
#define ORDO_LOG_DEBUG(ARG_stream_fragment) \
  ORDO_LOG_WITH_CHECKING(::ordo::log::Sev::S_DEBUG, ARG_stream_fragment)

/**
 * Logs a TRACE message, if enabled.  See ORDO_LOG_WARNING().
 * @param ARG_stream_fragment
 *        Same as in ORDO_LOG_WARNING().
 */
#define ORDO_LOG_TRACE(ARG_stream_fragment) \
  ORDO_LOG_WITH_CHECKING(::ordo::log::Sev::S_TRACE, ARG_stream_fragment)

/**
 * Logs a DATA message, if enabled.  See ORDO_LOG_WARNING().
 * @param ARG_stream_fragment
 *        Same as in ORDO_LOG_WARNING().
 */
#define ORDO_LOG_DATA(ARG_stream_fragment) \
  ORDO_LOG_WITH_CHECKING(::ordo::log::Sev::S_DATA, ARG_stream_fragment)

/**
 * For the rest of the block within which this macro is instantiated, causes all `ORDO_LOG_...()`
 * invocations to log to `ARG_logger_ptr` with component `ordo::log::Component(ARG_component_payload)`, instead of the
 * normal `get_logger()` and `get_log_component()`, if there even such things are available in the block.
 * Useful in free functions and `static` methods.
 *
 * @param ARG_logger_ptr
 *        `ARG_logger_ptr` will be used as the `Logger*` in subsequent `ORDO_LOG_...()` invocations in this block.
 * @param ARG_component_payload
 *        `Component(ARG_component_payload)` will be used as the `Component` in the same.
 */
#define ORDO_LOG_SET_CONTEXT(ARG_logger_ptr, ARG_component_payload) \
  ORDO_LOG_SET_LOGGER(ARG_logger_ptr); \
  ORDO_LOG_SET_COMPONENT(ARG_component_payload);

/**
 * Equivalent to ORDO_LOG_SET_CONTEXT() but sets the `get_logger` only.
 * @param ARG_logger_ptr
 *        See ORDO_LOG_SET_CONTEXT().
 */
#define ORDO_LOG_SET_LOGGER(ARG_logger_ptr) \
  [[maybe_unused]] \
    const auto get_logger \
      = [logger_ptr_copy = static_cast<::ordo::log::Logger*>(ARG_logger_ptr)] \
          () -> ::ordo::log::Logger* { return logger_ptr_copy; }

/**
 * Equivalent to ORDO_LOG_SET_CONTEXT() but sets the `get_log_component` only.
 * @param ARG_component_payload
 *        See ORDO_LOG_SET_CONTEXT().
 */
#define ORDO_LOG_SET_COMPONENT(ARG_component_payload) \
  [[maybe_unused]] \
    const auto get_log_component = [component = ::ordo::log::Component(ARG_component_payload)] \
                                     () -> const ::ordo::log::Component & \
  { \
    return component; \
  }

/**
 * Logs a message of the specified severity into ordo::log::Logger `*get_logger()` with ordo::log::Component
 * `get_log_component()` if such logging is enabled by said `Logger`.  If not enabled (or the Logger is null),
 * the stream fragment is not evaluated at all.
 *
 * @param ARG_sev
 *        Severity (type log::Sev).
 * @param ARG_stream_fragment
 *        Fragment of code as if writing to a standard `ostream`.
 *        A terminating newline will be auto-appended to this eventually and therefore should generally not
 *        be included by the invoker.  (Such a terminating newline would manifest as a blank line, likely.)
 */
#define ORDO_LOG_WITH_CHECKING(ARG_sev, ARG_stream_fragment) \
  ORDO_UTIL_SEMICOLON_SAFE \
  ( \
    ::ordo::log::Logger const * const ORDO_LOG_W_CHK_logger = get_logger(); \
    if (ORDO_LOG_W_CHK_logger && ORDO_LOG_W_CHK_logger->should_log(ARG_sev, get_log_component())) \
    { \
      ORDO_LOG_WITHOUT_CHECKING(ARG_sev, ARG_stream_fragment); \
    } \
  )

/**
 * Identical to ORDO_LOG_WITH_CHECKING() but foregoes the filter (Logger::should_log()) check.  No-op if
 * `get_logger()` returns null.  Internally, all other log-call-site macros ultimately build on top of this one.
 *
 * The message is composed (via util::String_ostream) into a local string, and the metadata into a local
 * Msg_metadata; both are handed to Logger::do_log(), which must not retain references to either.
 *
 * @param ARG_sev
 *        See ORDO_LOG_WITH_CHECKING().
 * @param ARG_stream_fragment
 *        See ORDO_LOG_WITH_CHECKING().
 */
#define ORDO_LOG_WITHOUT_CHECKING(ARG_sev, ARG_stream_fragment) \
  ORDO_UTIL_SEMICOLON_SAFE \
  ( \
    ::ordo::log::Logger* const ORDO_LOG_WO_CHK_logger = get_logger(); \
    if (!ORDO_LOG_WO_CHK_logger) \
    { \
      break; \
    } \
    /* else */ \
    /* get_last_path_segment() is constexpr: the file name is trimmed at compile time. */ \
    constexpr ::ordo::util::String_view ORDO_LOG_WO_CHK_file_str \
      = ::ordo::util::get_last_path_segment(::ordo::util::String_view(__FILE__, sizeof(__FILE__) - 1)); \
    ::ordo::log::Msg_metadata ORDO_LOG_WO_CHK_metadata; \
    /* () used to avoid nested-macro-comma trouble. */ \
    (ORDO_LOG_WO_CHK_metadata \
       = { get_log_component(), ARG_sev, ORDO_LOG_WO_CHK_file_str, __LINE__, \
           ::ordo::util::String_view(__FUNCTION__, sizeof(__FUNCTION__) - 1), \
           ::boost::chrono::system_clock::now(), ::std::string(), ::ordo::util::Thread_id() }); \
    ::ordo::log::Logger::set_thread_info_in_msg_metadata(&ORDO_LOG_WO_CHK_metadata); \
    ::std::string ORDO_LOG_WO_CHK_msg; \
    { \
      ::ordo::util::String_ostream ORDO_LOG_WO_CHK_os(&ORDO_LOG_WO_CHK_msg); \
      ORDO_LOG_WO_CHK_os.os() << ARG_stream_fragment << ::std::flush; \
    } \
    ORDO_LOG_WO_CHK_logger->do_log(&ORDO_LOG_WO_CHK_metadata, ORDO_LOG_WO_CHK_msg); \
  ) /* ORDO_UTIL_SEMICOLON_SAFE() */

namespace ordo::log
{

// Types.

/**
 * A light-weight class, each object storing a *component* payload encoding an `enum` value from `enum` type of
 * user's choice, and a light-weight ID of that `enum` type itself.  A Component is supplied at every log call site,
 * along with the message, so that a Logger (typically through Config) can filter by component and print its name.
 *
 * Ordo's own call sites use ordo::Ordo_log_component.  User code should use its own `enum class`es, whose
 * underlying type must be #enum_raw_t.
 */
class Component
{
public:
  // Types.

  /// The type `Payload` must be `enum class Payload : enum_raw_t`: an `enum` type encoded via this integer type.
  using enum_raw_t = unsigned int;

  // Constructors/destructor.

  /// Constructs a Component that stores no payload: `empty() == true`.
  Component();

  /**
   * Constructs a Component with the given payload of arbitrary type, so long as that type is an
   * `enum class : Component::enum_raw_t`.
   *
   * @tparam Payload
   *         See above.
   * @param payload
   *        The payload value.
   */
  template<typename Payload>
  Component(Payload payload);

  /**
   * Copies the source Component.
   * @param src
   *        Object to copy.
   */
  Component(const Component& src);

  /**
   * Equivalent to the copy constructor.
   * @param src_moved
   *        Object to move.
   */
  Component(Component&& src_moved);

  // Methods.

  /**
   * Overwrites `*this` with a copy of `src`.
   * @param src
   *        Object to copy.
   * @return `*this`.
   */
  Component& operator=(const Component& src);

  /**
   * Equivalent to copy assignment.
   * @param src_moved
   *        Object to move.
   * @return `*this`.
   */
  Component& operator=(Component&& src_moved);

  /**
   * Returns `true` if `*this` is as if default-constructed (a null Component).
   * @return See above.
   */
  bool empty() const;

  /**
   * Returns the payload; undefined behavior if `empty() == true`.
   *
   * @tparam Payload
   *         See one-arg ctor doc header.
   * @return See above.
   */
  template<typename Payload>
  Payload payload() const;

  /**
   * Returns `typeid(Payload)`, where `Payload` was the template param used in the originating one-arg constructor;
   * undefined behavior if `empty() == true`.
   *
   * @return See above.
   */
  const std::type_info& payload_type() const;

  /**
   * Convenience accessor that returns `std::type_index(payload_type())`, suitable as an associative container key.
   * @return See above.
   */
  std::type_index payload_type_index() const;

  /**
   * Returns the numeric value of the `enum` payload; undefined behavior if `empty() == true`.
   * @return See above.
   */
  enum_raw_t payload_enum_raw_value() const;

private:
  // Data.

  /// The `typeid()` of the `Payload` passed to the 1-arg constructor; null if empty().
  std::type_info const * m_payload_type_or_null;

  /// The integer representation of the `enum` value passed to the 1-arg constructor; meaningless if empty().
  enum_raw_t m_payload_enum_raw_value;
}; // class Component

/**
 * Simple data store containing all of the information generated at every logging call site by ordo::log, except
 * the message itself, which is passed to Logger::do_log() alongside it.
 */
struct Msg_metadata
{
  // Types.

  /// Time stamp type: from the time-of-day clock, convertible to a calendar time.
  using Time_stamp = boost::chrono::system_clock::time_point;

  // Data.

  /// Component of message, as of this writing coming from either Log_context constructor or ORDO_LOG_SET_CONTEXT().
  Component m_msg_component;

  /// Severity of message, typically determined by choice of macro (e.g., ORDO_LOG_WARNING() vs. ORDO_LOG_INFO()).
  Sev m_msg_sev;

  /// Source file name (last path segment of `__FILE__`), pointing into static storage.
  util::String_view m_msg_src_file;

  /// Copy of integer that would come from `__LINE__`.
  unsigned int m_msg_src_line;

  /// Function name (`__FUNCTION__`), pointing into static storage.
  util::String_view m_msg_src_function;

  /// Time stamp from as close as possible to entry into the log call site.
  Time_stamp m_called_when;

  /// Thread nickname, as for Logger::this_thread_set_logged_nickname(); empty if none set.
  std::string m_call_thread_nickname;

  /// Thread ID; meaningful only if #m_call_thread_nickname is empty.
  util::Thread_id m_call_thread_id;
}; // struct Msg_metadata

/**
 * Interface that the user should implement, passing the implementing Logger into logging classes
 * (Ordo's own maps and views, user's classes) to configure their logging behavior.
 *
 * The two methods to implement are should_log() (the filter) and do_log() (the output).  Both may be called
 * concurrently from many threads; an implementation must be thread-safe in that sense.
 */
class Logger :
  public util::Null_interface,
  private boost::noncopyable
{
public:
  // Methods.

  /**
   * Given attributes of a hypothetical message that would be logged, return `true` if that message
   * should be logged and `false` otherwise.  Must be fast, as it is called at every log call site.
   *
   * @param sev
   *        Severity of the message.
   * @param component
   *        Component of the message.  Reminder: `component.empty() == true` is allowed.
   * @return `true` if it should be logged; `false` if it should not.
   */
  virtual bool should_log(Sev sev, const Component& component) const = 0;

  /**
   * Given a message and its severity, logs that message and possibly severity WITHOUT checking whether it should be
   * logged.  The objects passed in are valid only until this returns.
   *
   * @param metadata
   *        All information about the message except the message itself.  Not null.
   * @param msg
   *        The message.  No terminating newline.
   */
  virtual void do_log(Msg_metadata* metadata, util::String_view msg) = 0;

  /**
   * Sets or unsets the current thread's logging-worthy string name: instead of the thread ID, subsequent messages
   * logged from this thread will show the nickname.
   *
   * @param thread_nickname
   *        New nickname of thread; or "" to unset.
   * @param logger_ptr
   *        If not null, an INFO message is logged to it about the change.
   */
  static void this_thread_set_logged_nickname(util::String_view thread_nickname = util::String_view(),
                                              Logger* logger_ptr = nullptr);

  /**
   * Loads `msg_metadata->m_call_thread_nickname` (if set) or else `msg_metadata->m_call_thread_id`, based
   * on the current thread.
   *
   * @param msg_metadata
   *        Non-null pointer to structure to modify.
   */
  static void set_thread_info_in_msg_metadata(Msg_metadata* msg_metadata);

private:
  // Data.

  /// Thread-local storage for each thread's logged name (null pointer, which is default, means no nickname).
  static boost::thread_specific_ptr<std::string> s_this_thread_nickname_ptr;
}; // class Logger

/**
 * Convenience class that simply stores a Logger and/or Component passed into a constructor; and returns this
 * Logger and Component via get_logger() and get_log_component() public accessors.  Deriving from it is the usual
 * way for a class to enable `ORDO_LOG_*()` calls in its methods.
 */
class Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs Log_context by storing the given pointer to a Logger and a null Component.
   *
   * @param logger
   *        Pointer to store.  Rationale for providing the null default: To facilitate subclass `= default` no-arg
   *        ctors.
   */
  explicit Log_context(Logger* logger = nullptr);

  /**
   * Constructs Log_context by storing the given pointer to a Logger and a new Component storing the
   * specified generically typed payload (an `enum` value).
   *
   * @tparam Component_payload
   *         See Component.
   * @param logger
   *        Pointer to store.
   * @param component_payload
   *        See Component.
   */
  template<typename Component_payload>
  explicit Log_context(Logger* logger, Component_payload component_payload);

  /**
   * Copy constructor that stores equal `Logger*` and Component values as the source.
   * @param src
   *        Source object.
   */
  Log_context(const Log_context& src);

  /**
   * Move constructor that makes this equal to `src`, while the latter becomes as-if default-constructed.
   * @param src
   *        Source object.
   */
  Log_context(Log_context&& src);

  // Methods.

  /**
   * Assignment operator that behaves similarly to the copy constructor.
   * @param src
   *        Source object.
   * @return `*this`.
   */
  Log_context& operator=(const Log_context& src);

  /**
   * Move assignment operator that behaves similarly to the move constructor.
   * @param src
   *        Source object.
   * @return `*this`.
   */
  Log_context& operator=(Log_context&& src);

  /**
   * Swaps Logger pointers and Component objects held by `*this` and `other`.
   * @param other
   *        Other object.
   */
  void swap(Log_context& other);

  /**
   * Returns the stored Logger pointer, particularly as many `ORDO_LOG_*()` macros expect.
   * @return See above.
   */
  Logger* get_logger() const;

  /**
   * Returns reference to the stored Component object, particularly as many `ORDO_LOG_*()` macros expect.
   * @return See above.
   */
  const Component& get_log_component() const;

private:
  // Data.

  /// The held Logger pointer.  Making the pointer itself non-`const` to allow `operator=()` to work.
  Logger* m_logger;

  /// The held Component object.  Making the object non-`const` to allow `operator=()` to work.
  Component m_component;
}; // class Log_context

// Template implementations.

template<typename Payload>
Component::Component(Payload payload)
{
  static_assert(std::is_enum_v<Payload>, "Payload type must be an enum.");
  static_assert(std::is_same_v<typename std::underlying_type_t<Payload>, enum_raw_t>,
                "Payload enum underlying type must equal enum_raw_t.");

  m_payload_type_or_null = &(typeid(Payload));
  m_payload_enum_raw_value = static_cast<enum_raw_t>(payload);
}

template<typename Payload>
Payload Component::payload() const
{
  return static_cast<Payload>(m_payload_enum_raw_value);
}

template<typename Component_payload>
Log_context::Log_context(Logger* logger, Component_payload component_payload) :
  m_logger(logger),
  m_component(component_payload)
{
  // Nothing.
}

} // namespace ordo::log
