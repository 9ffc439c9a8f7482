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

#include "ordo/map/entry.hpp"
#include "ordo/order/order.hpp"
#include "ordo/log/log.hpp"
#include <boost/make_shared.hpp>
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <optional>
#include <iterator>
#include <set>

namespace ordo::map
{

// Types.

/**
 * The entry container underlying Fast_map and Immutable_map: an ordered collection of Entry objects, ordered by
 * the entries' keys under the key order, in which any number of entries may have equal keys.  Uniqueness of keys,
 * where wanted, is the map's business (it looks up before inserting); the container itself only refuses exact
 * duplicates (equal key and equal value) when asked to.
 *
 * ### Ordering ###
 * Entries are ordered by Order::compare() over their keys.  When that returns 0, the key's Order::sub_order(),
 * if any, breaks the tie, and so on down the sub-orders; entries still tied (colliding unequal keys under a
 * hash-based order, or simply equal keys) stay in insertion order.  Lookup by key scans the tied range for an
 * entry whose key is Order::are_equal() to the lookup key.  All operations are logarithmic plus the size of that range.
 *
 * ### Freezing and copy-on-write ###
 * freeze() returns a read-only table sharing `*this` storage, in constant time.  The next mutation of `*this` first
 * copies the storage, giving each old entry (the ones now owned by the frozen table) a successor link to its
 * copy; see Entry::successor().  Entry handles taken before the copy stay usable with `*this`: every operation
 * taking an entry first follows its successor links.
 *
 * ### Thread safety ###
 * Same as for `std::multiset`.  A frozen table is never modified and hence safe for concurrent reads.
 *
 * @tparam Key
 *         Key type.
 * @tparam Mapped
 *         Value type.
 */
template<typename Key, typename Mapped>
class Entry_table :
  public log::Log_context,
  private boost::noncopyable
{
private:
  // Types.

  class Entry_less;

public:
  // Types.

  /// Short-hand for the stored entry type.
  using Entry_type = Entry<Key, Mapped>;

  /// Short-hand for ref-counted pointer to stored entry.
  using Entry_ptr = typename Entry_type::Ptr;

  /// Short-hand for ref-counted pointer to mutable `*this`.
  using Ptr = boost::shared_ptr<Entry_table>;

  /// Short-hand for ref-counted pointer to immutable `*this`.
  using Const_ptr = boost::shared_ptr<const Entry_table>;

  /// Short-hand for the key order pointer.
  using Key_order_ptr = typename order::Order<Key>::Const_ptr;

  /// Short-hand for the values equality pointer.
  using Values_equality_ptr = typename order::Equality<Mapped>::Const_ptr;

  class Cursor;

  // Constructors/destructor.

  /**
   * Constructs empty table.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param key_order
   *        Key order; must not be null.
   * @param values_equality
   *        Values equality; must not be null.
   */
  explicit Entry_table(log::Logger* logger_ptr, Key_order_ptr key_order, Values_equality_ptr values_equality);

  // Methods.

  /**
   * Inserts the given standalone entry after all entries whose keys compare equal to its key.
   *
   * @param entry
   *        Entry not stored anywhere; must not be null.
   * @param allow_duplicate
   *        If `false`, and an entry with equal key and equal value exists, nothing is inserted.
   * @return `true` if inserted.
   */
  bool add(const Entry_ptr& entry, bool allow_duplicate);

  /**
   * Returns an entry (the first in order, if several) whose key is equal to `key`; null if none.
   *
   * @param key
   *        Lookup key.
   * @return See above.
   */
  Entry_ptr get_any(const Key& key) const;

  /**
   * Like get_any() but also removes the entry, which becomes detached.
   *
   * @param key
   *        Lookup key.
   * @return The removed entry; null if none.
   */
  Entry_ptr remove_any(const Key& key);

  /**
   * Removes the given entry (or its newest successor), which becomes detached.
   *
   * @param entry
   *        Entry; may be null.
   * @return `true` if it was stored here and has been removed.
   */
  bool erase(const Entry_ptr& entry);

  /**
   * Returns the entry (`entry` or its newest successor) if it is stored here; else null.
   *
   * @param entry
   *        Entry; may be null.
   * @return See above.
   */
  Entry_ptr resolve(const Entry_ptr& entry) const;

  /**
   * Replaces the value of the given entry (or its newest successor), if it is stored here.
   *
   * @param entry
   *        Entry; may be null.
   * @param value
   *        New value.
   * @return The previous value; empty if the entry is not stored here.
   */
  std::optional<Mapped> update_value(const Entry_ptr& entry, const Mapped& value);

  /**
   * Number of entries.
   * @return See above.
   */
  size_t size() const;

  /**
   * Returns `size() == 0`.
   * @return See above.
   */
  bool empty() const;

  /// Removes all entries, which become detached.
  void clear();

  /**
   * Returns a new table with the same policies and a copy of each entry, in the same order.
   * @return See above.
   */
  Ptr clone() const;

  /**
   * Returns a frozen table sharing this table's current storage; see class doc header.
   * @return See above.
   */
  Const_ptr freeze();

  /**
   * Whether `*this` was produced by freeze().
   * @return See above.
   */
  bool frozen() const;

  /**
   * Returns cursor over all entries, in key order or reverse key order.
   *
   * @param descending
   *        If `true`, reverse key order.
   * @return See above.
   */
  Cursor cursor(bool descending) const;

  /**
   * Returns cursor starting at the first entry not less than (or, if `descending`, not greater than) `from_key`.
   *
   * @param descending
   *        If `true`, reverse key order.
   * @param from_key
   *        Starting key.
   * @return See above.
   */
  Cursor cursor(bool descending, const Key& from_key) const;

  /**
   * The key order.
   * @return See above.
   */
  const Key_order_ptr& key_order() const;

  /**
   * The values equality.
   * @return See above.
   */
  const Values_equality_ptr& values_equality() const;

private:
  // Types.

  /// Short-hand for the storage.
  using Entry_set = std::multiset<Entry_ptr, Entry_less>;

  /// Short-hand for ref-counted pointer to the storage (shared with frozen tables).
  using Entry_set_ptr = boost::shared_ptr<Entry_set>;

  // Constructors.

  /**
   * Constructs a frozen table over the given storage.
   *
   * @param logger_ptr
   *        See other ctor.
   * @param key_order
   *        See other ctor.
   * @param values_equality
   *        See other ctor.
   * @param entries
   *        Storage to share.
   */
  explicit Entry_table(log::Logger* logger_ptr, Key_order_ptr key_order, Values_equality_ptr values_equality,
                       Entry_set_ptr entries);

  // Methods.

  /// If storage is shared with a frozen table, replaces it with a copy; see class doc header.
  void copy_on_write();

  /**
   * Finds the exact entry (by identity) in #m_entries.
   * @param entry
   *        Entry; must not be null.
   * @return Iterator to it; `m_entries->end()` if not stored.
   */
  typename Entry_set::iterator find_stored(const Entry_ptr& entry) const;

  /**
   * Finds the first entry whose key is equal to `key`.
   * @param key
   *        Key.
   * @return Iterator to it; `m_entries->end()` if none.
   */
  typename Entry_set::iterator find_any(const Key& key) const;

  // Data.

  /// See key_order().
  const Key_order_ptr m_key_order;

  /// See values_equality().
  const Values_equality_ptr m_values_equality;

  /// The entries; possibly shared with frozen tables (then #m_storage_shared is `true`).
  Entry_set_ptr m_entries;

  /// Whether #m_entries is shared with a frozen table (which is then never the case for `*this`).
  bool m_storage_shared;

  /// See frozen().
  const bool m_frozen;
}; // class Entry_table

/**
 * Forward-only iteration over an Entry_table in one direction.  The cursor shares ownership of the storage it
 * iterates, so it remains valid when that storage is replaced by copy-on-write.  Removing the entry last returned
 * by next() from the table is allowed; any other concurrent structural change is not.
 */
template<typename Key, typename Mapped>
class Entry_table<Key, Mapped>::Cursor
{
public:
  // Methods.

  /**
   * Whether next() would return an entry.
   * @return See above.
   */
  bool has_next() const;

  /**
   * Returns the next entry and advances.  Behavior undefined unless has_next().
   * @return See above.
   */
  Entry_ptr next();

private:
  // Friends.

  /// Only the table creates cursors.
  friend class Entry_table;

  // Constructors.

  /**
   * Constructs cursor.
   *
   * @param entries
   *        The storage.
   * @param start
   *        First entry to return; `entries->end()` if none.
   * @param descending
   *        Direction.
   */
  explicit Cursor(boost::shared_ptr<const Entry_set> entries, typename Entry_set::const_iterator start,
                  bool descending);

  // Data.

  /// The storage iterated.
  boost::shared_ptr<const Entry_set> m_entries;

  /// Next entry to return; `m_entries->end()` when done.
  typename Entry_set::const_iterator m_next;

  /// Direction.
  bool m_descending;
}; // class Entry_table::Cursor

/**
 * Strict weak ordering of entries (and transparently of entries against bare keys) per Entry_table class doc
 * header.
 */
template<typename Key, typename Mapped>
class Entry_table<Key, Mapped>::Entry_less
{
public:
  // Types.

  /// Enables lookup by bare `Key`.
  using is_transparent = void;

  // Constructors/destructor.

  /**
   * Constructs comparator.
   * @param key_order
   *        Key order.
   */
  explicit Entry_less(Key_order_ptr key_order);

  // Methods.

  /**
   * Entry versus entry.
   * @param left
   *        Entry.
   * @param right
   *        Entry.
   * @return `true` if `left` goes before `right`.
   */
  bool operator()(const Entry_ptr& left, const Entry_ptr& right) const;

  /**
   * Entry versus key.
   * @param left
   *        Entry.
   * @param right
   *        Key.
   * @return `true` if `left` goes before `right`.
   */
  bool operator()(const Entry_ptr& left, const Key& right) const;

  /**
   * Key versus entry.
   * @param left
   *        Key.
   * @param right
   *        Entry.
   * @return `true` if `left` goes before `right`.
   */
  bool operator()(const Key& left, const Entry_ptr& right) const;

private:
  // Methods.

  /**
   * The underlying key comparison, descending into sub-orders on ties.
   * @param left
   *        Key.
   * @param right
   *        Key.
   * @return `true` if `left` goes before `right`.
   */
  bool less(const Key& left, const Key& right) const;

  // Data.

  /// See ctor.
  Key_order_ptr m_key_order;
}; // class Entry_table::Entry_less

// Template implementations.

template<typename Key, typename Mapped>
Entry_table<Key, Mapped>::Entry_table(log::Logger* logger_ptr,
                                      Key_order_ptr key_order, Values_equality_ptr values_equality) :
  log::Log_context(logger_ptr, Ordo_log_component::S_CONTAINER),
  m_key_order(std::move(key_order)),
  m_values_equality(std::move(values_equality)),
  m_entries(boost::make_shared<Entry_set>(Entry_less(m_key_order))),
  m_storage_shared(false),
  m_frozen(false)
{
  assert(m_key_order && m_values_equality);
}

template<typename Key, typename Mapped>
Entry_table<Key, Mapped>::Entry_table(log::Logger* logger_ptr,
                                      Key_order_ptr key_order, Values_equality_ptr values_equality,
                                      Entry_set_ptr entries) :
  log::Log_context(logger_ptr, Ordo_log_component::S_CONTAINER),
  m_key_order(std::move(key_order)),
  m_values_equality(std::move(values_equality)),
  m_entries(std::move(entries)),
  m_storage_shared(true),
  m_frozen(true)
{
  // Nothing else.
}

template<typename Key, typename Mapped>
bool Entry_table<Key, Mapped>::add(const Entry_ptr& entry, bool allow_duplicate)
{
  assert(entry && (!m_frozen));

  if (!allow_duplicate)
  {
    const auto range = m_entries->equal_range(entry->key());
    for (auto it = range.first; it != range.second; ++it)
    {
      const auto& stored = *it;
      if (m_key_order->are_equal(stored->key(), entry->key())
          && m_values_equality->are_equal(stored->value(), entry->value()))
      {
        return false;
      }
    }
  }

  copy_on_write();
  m_entries->insert(entry);
  return true;
}

template<typename Key, typename Mapped>
typename Entry_table<Key, Mapped>::Entry_ptr Entry_table<Key, Mapped>::get_any(const Key& key) const
{
  const auto it = find_any(key);
  return (it == m_entries->end()) ? Entry_ptr() : *it;
}

template<typename Key, typename Mapped>
typename Entry_table<Key, Mapped>::Entry_ptr Entry_table<Key, Mapped>::remove_any(const Key& key)
{
  assert(!m_frozen);

  if (find_any(key) == m_entries->end())
  {
    return Entry_ptr();
  }
  // else: Found; storage may be copied now, so look again in the (possibly) new storage.

  copy_on_write();
  const auto it = find_any(key);
  assert(it != m_entries->end());

  auto entry = *it;
  m_entries->erase(it);
  entry->m_detached = true;
  return entry;
}

template<typename Key, typename Mapped>
bool Entry_table<Key, Mapped>::erase(const Entry_ptr& entry)
{
  assert(!m_frozen);

  if (!resolve(entry))
  {
    return false;
  }
  // else

  copy_on_write();
  const auto stored = Entry_type::newest(entry);
  const auto it = find_stored(stored);
  assert(it != m_entries->end());

  m_entries->erase(it);
  stored->m_detached = true;
  return true;
}

template<typename Key, typename Mapped>
typename Entry_table<Key, Mapped>::Entry_ptr Entry_table<Key, Mapped>::resolve(const Entry_ptr& entry) const
{
  const auto stored = Entry_type::newest(entry);
  if ((!stored) || stored->detached() || (find_stored(stored) == m_entries->end()))
  {
    return Entry_ptr();
  }
  return stored;
}

template<typename Key, typename Mapped>
std::optional<Mapped> Entry_table<Key, Mapped>::update_value(const Entry_ptr& entry, const Mapped& value)
{
  assert(!m_frozen);

  if (!resolve(entry))
  {
    return std::nullopt;
  }
  // else

  copy_on_write();
  const auto stored = Entry_type::newest(entry);

  std::optional<Mapped> prev(std::move(stored->m_value));
  stored->m_value = value;
  return prev;
}

template<typename Key, typename Mapped>
size_t Entry_table<Key, Mapped>::size() const
{
  return m_entries->size();
}

template<typename Key, typename Mapped>
bool Entry_table<Key, Mapped>::empty() const
{
  return m_entries->empty();
}

template<typename Key, typename Mapped>
void Entry_table<Key, Mapped>::clear()
{
  assert(!m_frozen);

  if (m_entries->empty())
  {
    return;
  }
  // else

  /* With shared storage, copy first anyway: the old entries must get successors (then detached), or holders of old
   * entries would take them to be still stored here. */
  copy_on_write();

  ORDO_LOG_TRACE("Entry_table [" << this << "]: Clearing [" << m_entries->size() << "] entries.");
  for (const auto& entry : *m_entries)
  {
    entry->m_detached = true;
  }
  m_entries->clear();
}

template<typename Key, typename Mapped>
typename Entry_table<Key, Mapped>::Ptr Entry_table<Key, Mapped>::clone() const
{
  Ptr copy(new Entry_table(get_logger(), m_key_order, m_values_equality));
  auto& copy_entries = *copy->m_entries;
  for (const auto& entry : *m_entries)
  {
    // Hint at end() keeps the relative order of tied entries.
    copy_entries.emplace_hint(copy_entries.end(), boost::make_shared<Entry_type>(entry->key(), entry->value()));
  }

  ORDO_LOG_DEBUG("Entry_table [" << this << "]: Cloned [" << copy_entries.size() << "] entries "
                 "into table [" << copy.get() << "].");
  return copy;
}

template<typename Key, typename Mapped>
typename Entry_table<Key, Mapped>::Const_ptr Entry_table<Key, Mapped>::freeze()
{
  assert(!m_frozen);

  m_storage_shared = true;
  Const_ptr frozen(new Entry_table(get_logger(), m_key_order, m_values_equality, m_entries));

  ORDO_LOG_DEBUG("Entry_table [" << this << "]: Frozen into table [" << frozen.get() << "] sharing "
                 "[" << m_entries->size() << "] entries; storage will be copied on next mutation.");
  return frozen;
}

template<typename Key, typename Mapped>
bool Entry_table<Key, Mapped>::frozen() const
{
  return m_frozen;
}

template<typename Key, typename Mapped>
void Entry_table<Key, Mapped>::copy_on_write()
{
  if (!m_storage_shared)
  {
    return;
  }
  // else

  auto copy = boost::make_shared<Entry_set>(Entry_less(m_key_order));
  for (const auto& entry : *m_entries)
  {
    const auto entry_copy = boost::make_shared<Entry_type>(entry->key(), entry->value());
    entry->m_successor = entry_copy;
    copy->emplace_hint(copy->end(), entry_copy);
  }

  ORDO_LOG_TRACE("Entry_table [" << this << "]: Storage shared with a frozen table; copied "
                 "[" << copy->size() << "] entries before mutating.");

  m_entries = copy;
  m_storage_shared = false;
} // Entry_table::copy_on_write()

template<typename Key, typename Mapped>
typename Entry_table<Key, Mapped>::Entry_set::iterator
  Entry_table<Key, Mapped>::find_stored(const Entry_ptr& entry) const
{
  const auto range = m_entries->equal_range(entry);
  for (auto it = range.first; it != range.second; ++it)
  {
    if (*it == entry)
    {
      return it;
    }
  }
  return m_entries->end();
}

template<typename Key, typename Mapped>
typename Entry_table<Key, Mapped>::Entry_set::iterator Entry_table<Key, Mapped>::find_any(const Key& key) const
{
  const auto range = m_entries->equal_range(key);
  for (auto it = range.first; it != range.second; ++it)
  {
    if (m_key_order->are_equal((*it)->key(), key))
    {
      return it;
    }
  }
  return m_entries->end();
}

template<typename Key, typename Mapped>
typename Entry_table<Key, Mapped>::Cursor Entry_table<Key, Mapped>::cursor(bool descending) const
{
  const boost::shared_ptr<const Entry_set> entries = m_entries;
  if (entries->empty())
  {
    return Cursor(entries, entries->end(), descending);
  }
  return Cursor(entries, descending ? std::prev(entries->end()) : entries->begin(), descending);
}

template<typename Key, typename Mapped>
typename Entry_table<Key, Mapped>::Cursor Entry_table<Key, Mapped>::cursor(bool descending,
                                                                           const Key& from_key) const
{
  const boost::shared_ptr<const Entry_set> entries = m_entries;
  if (!descending)
  {
    return Cursor(entries, entries->lower_bound(from_key), false);
  }
  // else: Last entry not greater than from_key.

  const auto after = entries->upper_bound(from_key);
  return Cursor(entries, (after == entries->begin()) ? entries->end() : std::prev(after), true);
}

template<typename Key, typename Mapped>
const typename Entry_table<Key, Mapped>::Key_order_ptr& Entry_table<Key, Mapped>::key_order() const
{
  return m_key_order;
}

template<typename Key, typename Mapped>
const typename Entry_table<Key, Mapped>::Values_equality_ptr& Entry_table<Key, Mapped>::values_equality() const
{
  return m_values_equality;
}

template<typename Key, typename Mapped>
Entry_table<Key, Mapped>::Cursor::Cursor(boost::shared_ptr<const Entry_set> entries,
                                         typename Entry_set::const_iterator start, bool descending) :
  m_entries(std::move(entries)),
  m_next(start),
  m_descending(descending)
{
  // Nothing else.
}

template<typename Key, typename Mapped>
bool Entry_table<Key, Mapped>::Cursor::has_next() const
{
  return m_next != m_entries->end();
}

template<typename Key, typename Mapped>
typename Entry_table<Key, Mapped>::Entry_ptr Entry_table<Key, Mapped>::Cursor::next()
{
  assert(has_next());

  const auto entry = *m_next;
  if (!m_descending)
  {
    ++m_next;
  }
  else if (m_next == m_entries->begin())
  {
    m_next = m_entries->end();
  }
  else
  {
    --m_next;
  }
  return entry;
}

template<typename Key, typename Mapped>
Entry_table<Key, Mapped>::Entry_less::Entry_less(Key_order_ptr key_order) :
  m_key_order(std::move(key_order))
{
  // Nothing else.
}

template<typename Key, typename Mapped>
bool Entry_table<Key, Mapped>::Entry_less::operator()(const Entry_ptr& left, const Entry_ptr& right) const
{
  return less(left->key(), right->key());
}

template<typename Key, typename Mapped>
bool Entry_table<Key, Mapped>::Entry_less::operator()(const Entry_ptr& left, const Key& right) const
{
  return less(left->key(), right);
}

template<typename Key, typename Mapped>
bool Entry_table<Key, Mapped>::Entry_less::operator()(const Key& left, const Entry_ptr& right) const
{
  return less(left, right->key());
}

template<typename Key, typename Mapped>
bool Entry_table<Key, Mapped>::Entry_less::less(const Key& left, const Key& right) const
{
  auto order = m_key_order.get();
  Key_order_ptr sub_order;
  auto result = order->compare(left, right);
  while (result == 0)
  {
    sub_order = order->sub_order(left);
    if (!sub_order)
    {
      break;
    }
    // else
    order = sub_order.get();
    result = order->compare(left, right);
  }
  return result < 0;
}

} // namespace ordo::map
