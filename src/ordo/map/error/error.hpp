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

#include "ordo/common.hpp"

/**
 * Namespace containing the ordo::map module's extension of boost.system error conventions, so that map and view
 * APIs can return codes/messages from within its own new set of error codes/messages.  See ordo::error for the
 * `Error_code*`-or-throw convention these codes flow through.
 */
namespace ordo::map::error
{

// Types.

/**
 * All possible errors returned (via ordo::Error_code arguments) by ordo::map functions/methods.  These values are
 * convertible to ordo::Error_code (a/k/a `boost::system::error_code`) and thus extend the set of errors that
 * ordo::Error_code can represent.  Each also maps onto a generic `boost::system::errc` condition (see
 * `default_error_condition()` of the category), so callers may test either the specific code or the general kind:
 * S_UNMODIFIABLE_VIEW, S_IMMUTABLE_MAP and S_KEY_OUT_OF_RANGE are `errc::operation_not_supported`;
 * the rest are `errc::invalid_argument`.
 *
 * When you modify this, be sure to keep the messages in Category::message() in sync.
 */
enum class Code
{
  /// Attempted to modify a map, or remove via an iterator, through an unmodifiable view.
  S_UNMODIFIABLE_VIEW = 1,
  /// Attempted to modify a frozen (immutable) map.
  S_IMMUTABLE_MAP,
  /// Attempted to modify a sub-map with a key outside its range.
  S_KEY_OUT_OF_RANGE,
  /// A null key was given; keys are never null.
  S_NULL_KEY,
  /// Sub-map range lower bound compares greater than its upper bound.
  S_INVALID_RANGE,
  /// Entry handle given does not (or no longer does) belong to the map.
  S_ENTRY_NOT_IN_MAP
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight ordo::Error_code (`boost::system::error_code`)
 * representing that error.  This is needed to make the `boost::system::error_code::error_code<Code>()`
 * template implementation work.  Or, slightly more in English, it glues the (completely general)
 * `Error_code` to the (ordo::map-specific) error code set ordo::map::error::Code, so that one can
 * implicitly convert from the latter to the former.
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding ordo::Error_code.
 */
Error_code make_error_code(Code err_code);

} // namespace ordo::map::error

namespace boost::system
{

// Types.

template<>
struct is_error_code_enum<::ordo::map::error::Code>
{
  /// Means `Code` `enum` values can be used for ordo::Error_code.
  static const bool value = true;
};

} // namespace boost::system
