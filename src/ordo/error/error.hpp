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

#include "ordo/error/error_fwd.hpp"
#include "ordo/log/log.hpp"
#include "ordo/util/detail/util.hpp"
#include <boost/system/system_error.hpp>
#include <stdexcept>

namespace ordo::error
{
// Types.

/**
 * An `std::runtime_error` (which is an `std::exception`) that stores an #Error_code.  Ordo APIs throw this when
 * an operation fails, and the caller passed a null `Error_code*`.
 *
 * It is a `boost::system::system_error`, so code() yields the #Error_code; what() yields a message including
 * the code's message() and the context string passed to the constructor (typically the source location).
 */
class Runtime_error :
  public boost::system::system_error
{
public:
  // Constructors/destructor.

  /**
   * Constructs Runtime_error.
   *
   * @param err_code_or_success
   *        The #Error_code describing the error.  If falsy (success), what() returns just `context`.
   * @param context
   *        String describing the context; typically ORDO_UTIL_WHERE_AM_I_LITERAL() of the failed API.
   */
  explicit Runtime_error(const Error_code& err_code_or_success, util::String_view context = "");

  /**
   * Constructs Runtime_error with a success code and the given message.
   *
   * @param context
   *        Returned by what().
   */
  explicit Runtime_error(util::String_view context);

  // Methods.

  /**
   * Returns a message describing the exception.
   * @return See above.
   */
  const char* what() const noexcept override;

private:
  // Data.

  /// If code() is falsy, the `context` from constructor; else empty (system_error::what() includes it then).
  const std::string m_context_if_no_code;
}; // class Runtime_error

// Free functions: in *_fwd.hpp.

// Template implementations.

template<typename Func, typename Ret>
bool exec_and_throw_on_error(const Func& func, Ret* ret,
                             Error_code* err_code, util::String_view context)
{
  if (err_code)
  {
    // The caller can assume non-null err_code; it performs the operation and sets *err_code on error.
    return false;
  }
  // else: Make our own Error_code and throw if the wrapped operation yields a truthy one.

  Error_code our_err_code;
  *ret = func(&our_err_code);

  if (our_err_code)
  {
    throw Runtime_error(our_err_code, context);
  }

  return true;
} // exec_and_throw_on_error()

template<typename Func>
bool exec_void_and_throw_on_error(const Func& func, Error_code* err_code, util::String_view context)
{
  // See exec_and_throw_on_error().  This is just a simplified version where func() returns void.

  if (err_code)
  {
    return false;
  }

  Error_code our_err_code;
  func(&our_err_code);

  if (our_err_code)
  {
    throw Runtime_error(our_err_code, context);
  }

  return true;
} // exec_void_and_throw_on_error()

} // namespace ordo::error

// Macros.

/**
 * Sets `*err_code` to `ARG_val` and logs a warning about the error using ORDO_LOG_WARNING().
 * An `err_code` variable of type that is pointer to #Error_code must be declared at the point where the macro is
 * invoked; it must not be null.  Logging is done in the context of `get_logger()` and `get_log_component()`.
 *
 * @param ARG_val
 *        Value convertible to #Error_code.  Typically a module `error::Code` enum value.
 */
#define ORDO_ERROR_EMIT_ERROR(ARG_val) \
  ORDO_UTIL_SEMICOLON_SAFE \
  ( \
    ::ordo::Error_code ORDO_ERROR_EMIT_ERR_val(ARG_val); \
    ORDO_LOG_WARNING("Error code emitted: [" << ORDO_ERROR_EMIT_ERR_val << "] " \
                     "[" << ORDO_ERROR_EMIT_ERR_val.message() << "]."); \
    *err_code = ORDO_ERROR_EMIT_ERR_val; \
  )

/**
 * Logs a warning about the given error code using ORDO_LOG_WARNING(), without emitting it.
 *
 * @param ARG_val
 *        Value convertible to #Error_code.
 */
#define ORDO_ERROR_LOG_ERROR(ARG_val) \
  ORDO_UTIL_SEMICOLON_SAFE \
  ( \
    ::ordo::Error_code ORDO_ERROR_LOG_ERR_val(ARG_val); \
    ORDO_LOG_WARNING("Error occurred: [" << ORDO_ERROR_LOG_ERR_val << "] " \
                     "[" << ORDO_ERROR_LOG_ERR_val.message() << "]."); \
  )

/**
 * Narrow-use macro implementing the error convention documented in ordo::error, for an API returning a value.
 * Place it at the top of the API's body; `err_code` (the API's `Error_code*` argument) must be in scope.
 *
 * If `err_code` is null, the macro invokes `ARG_function_name(...)` with `_1` (a local non-null `Error_code*`)
 * in place of the `Error_code*` argument, returns the result if no error, or throws Runtime_error otherwise.
 * If `err_code` is not null, the macro does nothing, and the code below it runs with a non-null `err_code`.
 *
 * @param ARG_ret_type
 *        The API's return type.  Must be default-constructible and assignable.
 * @param ARG_function_name
 *        The API's name (itself, recursively; or a helper taking an `Error_code*`).
 * @param ...
 *        The arguments to `ARG_function_name`, with `_1` in place of the `Error_code*`.
 */
#define ORDO_ERROR_EXEC_AND_THROW_ON_ERROR(ARG_ret_type, ARG_function_name, ...) \
  ORDO_UTIL_SEMICOLON_SAFE \
  ( \
    /* Holds f()'s result if it ran; we can't use a sentinel value, as the result may need ARG_ret_type's range. */ \
    ARG_ret_type result; \
    if (::ordo::error::exec_and_throw_on_error \
          ([&](::ordo::Error_code* _1) -> ARG_ret_type \
             { return ARG_function_name(__VA_ARGS__); }, \
           &result, err_code, ORDO_UTIL_WHERE_AM_I_LITERAL(ARG_function_name))) \
    { \
      return result; \
    } \
    /* else: err_code is non-null; the invoker now proceeds knowing that. */ \
  )

/**
 * Same as ORDO_ERROR_EXEC_AND_THROW_ON_ERROR() but for APIs returning `void`.
 *
 * @param ARG_function_name
 *        See ORDO_ERROR_EXEC_AND_THROW_ON_ERROR().
 * @param ...
 *        See ORDO_ERROR_EXEC_AND_THROW_ON_ERROR().
 */
#define ORDO_ERROR_EXEC_VOID_AND_THROW_ON_ERROR(ARG_function_name, ...) \
  ORDO_UTIL_SEMICOLON_SAFE \
  ( \
    if (::ordo::error::exec_void_and_throw_on_error \
          ([&](::ordo::Error_code* _1) { ARG_function_name(__VA_ARGS__); }, \
           err_code, ORDO_UTIL_WHERE_AM_I_LITERAL(ARG_function_name))) \
    { \
      return; \
    } \
  )
