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
#include "ordo/order/order.hpp"

namespace ordo::order
{

// Implementations.

uint32_t fold_hash(size_t hash)
{
  if constexpr(sizeof(size_t) > sizeof(uint32_t))
  {
    return uint32_t(hash ^ (hash >> 32));
  }
  else
  {
    return uint32_t(hash);
  }
}

int compare_indices(uint32_t left, uint32_t right)
{
  return (left == right) ? 0 : ((left < right) ? -1 : 1);
}

} // namespace ordo::order
