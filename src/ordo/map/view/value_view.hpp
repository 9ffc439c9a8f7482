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
#include <vector>

namespace ordo::map
{

// Types.

/**
 * The values of a map, as a collection backed by it: changes to the map show here, and removals here remove entries
 * from the map.  Obtain via Abstract_map::values().  Values iterate in the map's iteration order, one per entry.
 * Value comparisons (contains(), remove()) use the map's Abstract_map::values_equality().
 *
 * @tparam Key
 *         Key type.
 * @tparam Mapped
 *         Value type.
 */
template<typename Key, typename Mapped>
class Value_view
{
public:
  // Types.

  /// Short-hand for the backing map pointer.
  using Map_ptr = typename Abstract_map<Key, Mapped>::Ptr;

  // Constructors/destructor.

  /**
   * Constructs view.
   * @param map
   *        The backing map.
   */
  explicit Value_view(Map_ptr map);

  // Methods.

  /**
   * Number of values: the map's size().
   * @return See above.
   */
  size_t size() const;

  /**
   * Whether there are no values.
   * @return See above.
   */
  bool empty() const;

  /**
   * Whether some entry's value equals `value`.  Linear.
   *
   * @param value
   *        Value.
   * @return See above.
   */
  bool contains(const Mapped& value) const;

  /**
   * Removes the first entry, in iteration order, whose value equals `value`, if any.  Linear.
   *
   * @param value
   *        Value.
   * @param err_code
   *        See ordo::error.
   * @return `true` if an entry was removed.
   */
  bool remove(const Mapped& value, Error_code* err_code = nullptr);

  /**
   * Clears the map.
   * @param err_code
   *        See ordo::error.
   */
  void clear(Error_code* err_code = nullptr);

  /**
   * Calls `func(value)` for each value, in iteration order.
   *
   * @tparam Func
   *         Callable taking `const Mapped&`.
   * @param func
   *        See above.
   */
  template<typename Func>
  void for_each(const Func& func) const;

  /**
   * The values in iteration order.
   * @return See above.
   */
  std::vector<Mapped> to_vector() const;

private:
  // Data.

  /// The backing map.
  const Map_ptr m_map;
}; // class Value_view

// Template implementations.

template<typename Key, typename Mapped>
Value_view<Key, Mapped>::Value_view(Map_ptr map) :
  m_map(std::move(map))
{
  // Nothing else.
}

template<typename Key, typename Mapped>
size_t Value_view<Key, Mapped>::size() const
{
  return m_map->size();
}

template<typename Key, typename Mapped>
bool Value_view<Key, Mapped>::empty() const
{
  return m_map->empty();
}

template<typename Key, typename Mapped>
bool Value_view<Key, Mapped>::contains(const Mapped& value) const
{
  const auto equality = m_map->values_equality();
  for (auto it = m_map->iterator(); it->has_next(); )
  {
    if (equality->are_equal(it->next()->value(), value))
    {
      return true;
    }
  }
  return false;
}

template<typename Key, typename Mapped>
bool Value_view<Key, Mapped>::remove(const Mapped& value, Error_code* err_code)
{
  ORDO_ERROR_EXEC_AND_THROW_ON_ERROR(bool, remove, value, _1);
  // else

  err_code->clear();
  const auto equality = m_map->values_equality();
  for (auto it = m_map->iterator(); it->has_next(); )
  {
    if (equality->are_equal(it->next()->value(), value))
    {
      it->remove(err_code);
      return !*err_code;
    }
  }
  return false;
}

template<typename Key, typename Mapped>
void Value_view<Key, Mapped>::clear(Error_code* err_code)
{
  m_map->clear(err_code);
}

template<typename Key, typename Mapped>
template<typename Func>
void Value_view<Key, Mapped>::for_each(const Func& func) const
{
  for (auto it = m_map->iterator(); it->has_next(); )
  {
    func(it->next()->value());
  }
}

template<typename Key, typename Mapped>
std::vector<Mapped> Value_view<Key, Mapped>::to_vector() const
{
  std::vector<Mapped> values;
  values.reserve(m_map->size());
  for_each([&](const Mapped& value) { values.push_back(value); });
  return values;
}

} // namespace ordo::map
