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

#include "ordo/util/util_fwd.hpp"
#include "ordo/common.hpp"

/**
 * Ordo module that facilitates working with error codes and exceptions; essentially comprised of niceties on top
 * of boost.system's error facility.
 *
 * The convention, used by every fallible Ordo API, is as follows.  The API's last argument is
 * `Error_code* err_code = nullptr`.
 *   - If `err_code` is null and the operation fails, error::Runtime_error is thrown, carrying the code.
 *   - If `err_code` is not null, `*err_code` is set to the outcome (falsy on success), and nothing is thrown.
 * The implementation of such an API typically begins with ORDO_ERROR_EXEC_AND_THROW_ON_ERROR(), which turns the
 * first case into the second by recursively invoking the API with a local `Error_code`.
 *
 * Each module with its own errors provides an `error::Code` enumeration plus a boost.system category; see
 * ordo::map::error for an example.
 */
namespace ordo::error
{
// Types.

// Find doc headers near the bodies of these compound types.

class Runtime_error;

// Free functions.

/**
 * Helper for ORDO_ERROR_EXEC_AND_THROW_ON_ERROR() macro that does everything in the latter not needing a
 * preprocessor.  Don't invoke this directly; use the macro.
 *
 * If `err_code` is not null, returns `false` without doing anything else: the caller shall perform the operation
 * itself, setting `*err_code`.  Otherwise executes `*ret = func(&e)` with a local `Error_code e`; throws
 * Runtime_error with that code (and `context`) if `e` is truthy; else returns `true`: the caller shall return `*ret`.
 *
 * @tparam Func
 *         Functor type equivalent to `Ret (Error_code*)`.
 * @tparam Ret
 *         Return type of the invoking API.
 * @param func
 *        The operation, invoking the API itself with a non-null `Error_code*`.
 * @param ret
 *        Result of `func()` is placed here, if executed and no throw.
 * @param err_code
 *        The invoking API's `Error_code*` argument.
 * @param context
 *        String to add to the exception's `what()`.
 * @return See above.
 */
template<typename Func, typename Ret>
bool exec_and_throw_on_error(const Func& func, Ret* ret,
                             Error_code* err_code, util::String_view context);

/**
 * Equivalent of exec_and_throw_on_error() for operations with `void` return type.
 *
 * @tparam Func
 *         Functor type equivalent to `void (Error_code*)`.
 * @param func
 *        See exec_and_throw_on_error().
 * @param err_code
 *        See exec_and_throw_on_error().
 * @param context
 *        See exec_and_throw_on_error().
 * @return See exec_and_throw_on_error().
 */
template<typename Func>
bool exec_void_and_throw_on_error(const Func& func, Error_code* err_code, util::String_view context);

} // namespace ordo::error
