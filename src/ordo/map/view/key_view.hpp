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
 * The keys of a map, as a set-like collection backed by it: changes to the map show here, and removals here
 * remove entries from the map.  Obtain via Abstract_map::keys().  Keys iterate in the map's iteration order; over
 * a multimap a key appears once per entry.
 *
 * Mutations follow the ordo::error convention and the semantics of the map (e.g., remove() via an Unmodifiable_map
 * fails with its error).
 *
 * @tparam Key
 *         Key type.
 * @tparam Mapped
 *         Value type.  Must be default-constructible to use add().
 */
template<typename Key, typename Mapped>
class Key_view
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
  explicit Key_view(Map_ptr map);

  // Methods.

  /**
   * Number of keys, counting duplicates: the map's size().
   * @return See above.
   */
  size_t size() const;

  /**
   * Whether there are no keys.
   * @return See above.
   */
  bool empty() const;

  /**
   * Whether the map has an entry with a key equal to `key`.
   *
   * @param key
   *        Key.
   * @return See above.
   */
  bool contains(const Key& key) const;

  /**
   * Adds `key` mapped to a default-constructed value, unless the map already has an entry with an equal key.
   *
   * @param key
   *        Key.
   * @param err_code
   *        See ordo::error.
   * @return `true` if added.
   */
  bool add(const Key& key, Error_code* err_code = nullptr);

  /**
   * Removes an entry with a key equal to `key`, if any.
   *
   * @param key
   *        Key.
   * @param err_code
   *        See ordo::error.
   * @return `true` if an entry was removed.
   */
  bool remove(const Key& key, Error_code* err_code = nullptr);

  /**
   * Clears the map.
   * @param err_code
   *        See ordo::error.
   */
  void clear(Error_code* err_code = nullptr);

  /**
   * Calls `func(key)` for each key, in iteration order.
   *
   * @tparam Func
   *         Callable taking `const Key&`.
   * @param func
   *        See above.
   */
  template<typename Func>
  void for_each(const Func& func) const;

  /**
   * The keys in iteration order.
   * @return See above.
   */
  std::vector<Key> to_vector() const;

  /**
   * The backing map.
   * @return See above.
   */
  const Map_ptr& map() const;

private:
  // Data.

  /// See map().
  const Map_ptr m_map;
}; // class Key_view

// Template implementations.

template<typename Key, typename Mapped>
Key_view<Key, Mapped>::Key_view(Map_ptr map) :
  m_map(std::move(map))
{
  // Nothing else.
}

template<typename Key, typename Mapped>
size_t Key_view<Key, Mapped>::size() const
{
  return m_map->size();
}

template<typename Key, typename Mapped>
bool Key_view<Key, Mapped>::empty() const
{
  return m_map->empty();
}

template<typename Key, typename Mapped>
bool Key_view<Key, Mapped>::contains(const Key& key) const
{
  return m_map->contains_key(key);
}

template<typename Key, typename Mapped>
bool Key_view<Key, Mapped>::add(const Key& key, Error_code* err_code)
{
  ORDO_ERROR_EXEC_AND_THROW_ON_ERROR(bool, add, key, _1);
  // else

  err_code->clear();
  if (util::is_null_key(key))
  {
    // Let the map report it.
    m_map->put_entry(key, Mapped(), nullptr, err_code);
    return false;
  }
  // else
  if (m_map->contains_key(key))
  {
    return false;
  }
  // else
  return bool(m_map->put_entry(key, Mapped(), nullptr, err_code));
}

template<typename Key, typename Mapped>
bool Key_view<Key, Mapped>::remove(const Key& key, Error_code* err_code)
{
  ORDO_ERROR_EXEC_AND_THROW_ON_ERROR(bool, remove, key, _1);
  // else
  return bool(m_map->remove_entry(key, err_code));
}

template<typename Key, typename Mapped>
void Key_view<Key, Mapped>::clear(Error_code* err_code)
{
  m_map->clear(err_code);
}

template<typename Key, typename Mapped>
template<typename Func>
void Key_view<Key, Mapped>::for_each(const Func& func) const
{
  for (auto it = m_map->iterator(); it->has_next(); )
  {
    func(it->next()->key());
  }
}

template<typename Key, typename Mapped>
std::vector<Key> Key_view<Key, Mapped>::to_vector() const
{
  std::vector<Key> keys;
  keys.reserve(m_map->size());
  for_each([&](const Key& key) { keys.push_back(key); });
  return keys;
}

template<typename Key, typename Mapped>
const typename Key_view<Key, Mapped>::Map_ptr& Key_view<Key, Mapped>::map() const
{
  return m_map;
}

} // namespace ordo::map
