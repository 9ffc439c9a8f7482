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

#include "ordo/map/abstract_map.hpp"
#include <type_traits>
#include <vector>

namespace ordo::map::test
{

// Free functions.

/**
 * Exhausts the given iterator, returning the keys it yielded in order.
 *
 * @param it
 *        Iterator, typically fresh.
 * @return See above.
 */
template<typename Iterator_ptr>
auto keys_of(const Iterator_ptr& it)
{
  std::vector<std::decay_t<decltype(it->next()->key())>> keys;
  while (it->has_next())
  {
    keys.push_back(it->next()->key());
  }
  return keys;
}

/**
 * Same as keys_of() but for the values.
 *
 * @param it
 *        Iterator, typically fresh.
 * @return See above.
 */
template<typename Iterator_ptr>
auto values_of(const Iterator_ptr& it)
{
  std::vector<std::decay_t<decltype(it->next()->value())>> values;
  while (it->has_next())
  {
    values.push_back(it->next()->value());
  }
  return values;
}

} // namespace ordo::map::test
