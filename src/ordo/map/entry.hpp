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

#include "ordo/map/map_fwd.hpp"
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/weak_ptr.hpp>
#include <utility>

namespace ordo::map
{

// Types.

/**
 * One key/value mapping stored in a map, with identity: the key is fixed at creation, while the value may be
 * replaced in place any number of times, but only by the owning Entry_table (through the map's `put()` or
 * `update_value()`).  An Entry is always held via Entry::Ptr; the owning table holds one such reference.
 *
 * ### Lifecycle ###
 * An entry is created by its table on insertion and is *detached* once removed from it (by `remove()`, `erase()`,
 * `clear()`).  A detached entry stays readable by whoever still holds it but no longer belongs to any map.
 *
 * When a map's storage, having been shared with a frozen snapshot (Fast_map::freeze()), is copied on the next
 * mutation, each old entry gets a *successor*: its copy in the new storage.  successor() lets holders of old
 * entries (e.g. Linked_map) find the live counterpart.
 *
 * @tparam Key
 *         Key type.
 * @tparam Mapped
 *         Value type.
 */
template<typename Key, typename Mapped>
class Entry :
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for ref-counted pointer to `*this`.
  using Ptr = boost::shared_ptr<Entry>;

  /// Short-hand for non-owning counterpart of #Ptr.
  using Weak_ptr = boost::weak_ptr<Entry>;

  // Constructors/destructor.

  /**
   * Constructs a standalone (not yet stored) entry.
   *
   * @param key
   *        Key.
   * @param value
   *        Value.
   */
  explicit Entry(const Key& key, const Mapped& value);

  // Methods.

  /**
   * The key.
   * @return See above.
   */
  const Key& key() const;

  /**
   * The current value.
   * @return See above.
   */
  const Mapped& value() const;

  /**
   * Whether this entry was removed from the table that stored it.
   * @return See above.
   */
  bool detached() const;

  /**
   * The copy that replaced `*this` when its storage was copied on write; null if none (or if that copy is gone).
   * @return See above.
   */
  Ptr successor() const;

  /**
   * Follows successor() links from `entry` to the last one.
   *
   * @param entry
   *        Entry; may be null.
   * @return The newest version of `entry`; `entry` itself if it has no successor.
   */
  static Ptr newest(Ptr entry);

private:
  // Friends.

  /// The owning container alone changes values and lifecycle state.
  friend class Entry_table<Key, Mapped>;

  // Data.

  /// See key().
  const Key m_key;

  /// See value().
  Mapped m_value;

  /// See detached().
  bool m_detached;

  /// See successor().
  Weak_ptr m_successor;
}; // class Entry

// Template implementations.

template<typename Key, typename Mapped>
Entry<Key, Mapped>::Entry(const Key& key, const Mapped& value) :
  m_key(key),
  m_value(value),
  m_detached(false)
{
  // Nothing else.
}

template<typename Key, typename Mapped>
const Key& Entry<Key, Mapped>::key() const
{
  return m_key;
}

template<typename Key, typename Mapped>
const Mapped& Entry<Key, Mapped>::value() const
{
  return m_value;
}

template<typename Key, typename Mapped>
bool Entry<Key, Mapped>::detached() const
{
  return m_detached;
}

template<typename Key, typename Mapped>
typename Entry<Key, Mapped>::Ptr Entry<Key, Mapped>::successor() const
{
  return m_successor.lock();
}

template<typename Key, typename Mapped>
typename Entry<Key, Mapped>::Ptr Entry<Key, Mapped>::newest(Ptr entry) // Static.
{
  while (entry)
  {
    auto next = entry->successor();
    if (!next)
    {
      break;
    }
    entry = std::move(next);
  }
  return entry;
}

} // namespace ordo::map
