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

namespace ordo::util
{

// Template/constexpr implementations.

constexpr String_view get_last_path_segment(String_view full_path)
{
  String_view path(full_path); // This only copies the pointer and length (not the string).
  constexpr char SEP = '/';

  // Done manually instead of rfind(), so that it's usable in constant expressions with older `gcc`s.
  const auto path_sz = path.size();
  if (path_sz != 0)
  {
    const auto path_ptr = path.data();
    for (auto path_search_ptr = path_ptr + path_sz - 1;
         path_search_ptr >= path_ptr; --path_search_ptr)
    {
      if ((*path_search_ptr) == SEP)
      {
        path.remove_prefix((path_search_ptr - path_ptr) + 1);
        break;
      }
    }
  }
  // else { Nothing to do. }

  return path;
} // get_last_path_segment()

} // namespace ordo::util

// Macros.

/**
 * Expands to an `ostream` fragment `X` (suitable for, for example: `std::cout << X << ": Hi!"`) containing
 * the given file name, function name, and line number.
 *
 * @param ARG_file
 *        Expression yielding something `ostream<<`able: the file name (typically already trimmed via
 *        util::get_last_path_segment()).
 * @param ARG_function
 *        Expression yielding something `ostream<<`able: the function name.
 * @param ARG_line
 *        Expression yielding something `ostream<<`able: the line number.
 */
#define ORDO_UTIL_WHERE_AM_I_FROM_ARGS(ARG_file, ARG_function, ARG_line) \
  ARG_file << ':' << ARG_function << '(' << ARG_line << ')'

/**
 * Same as ORDO_UTIL_WHERE_AM_I_FROM_ARGS() except it expands to a comma-separated list of items, suitable
 * for util::ostream_op_to_string() and friends.
 *
 * @param ARG_file
 *        See ORDO_UTIL_WHERE_AM_I_FROM_ARGS().  The last path segment is taken here.
 * @param ARG_function
 *        See ORDO_UTIL_WHERE_AM_I_FROM_ARGS().
 * @param ARG_line
 *        See ORDO_UTIL_WHERE_AM_I_FROM_ARGS().
 */
#define ORDO_UTIL_WHERE_AM_I_FROM_ARGS_TO_ARGS(ARG_file, ARG_function, ARG_line) \
  ::ordo::util::get_last_path_segment(ARG_file), ':', ARG_function, '(', ARG_line, ')'
