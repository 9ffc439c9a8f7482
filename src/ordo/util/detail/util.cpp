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
#include "ordo/util/detail/util.hpp"
#include "ordo/util/util.hpp"

namespace ordo::util
{

// Implementations.

std::string get_where_am_i_str(String_view file, String_view function, unsigned int line)
{
  using std::string;

  string out; // Write directly into this string.
  ostream_op_to_string(&out, ORDO_UTIL_WHERE_AM_I_FROM_ARGS_TO_ARGS(file, function, line));

  return out;
}

} // namespace ordo::util
