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
#include "ordo/map/entry_table.hpp"
#include "ordo/map/immutable_map.hpp"
#include "ordo/order/standard_order.hpp"
#include "ordo/order/indexer_order.hpp"
#include <boost/make_shared.hpp>

namespace ordo::map
{

// Types.

/**
 * The core map: entries stored in an Entry_table ordered by the key order, with the value comparisons of the
 * values equality.  Create via make_fast_map() or make_indexed_map(); use the Abstract_map interface, and derive
 * views from it via its factories.
 *
 * ### Standard semantics ###
 * put() looks for an entry whose key the key order deems equal (Order::are_equal()) to the given one; if found its
 * value is replaced in place (the entry object stays the same, as seen by anyone holding it), else a new entry is
 * added.  So a map keyed by order::Multi_order, whose are_equal() is constantly false, adds on every put() and finds
 * nothing on get(): it is useful only for iteration in hash order.
 *
 * ### Iteration ###
 * Ascending iteration follows the key order; entries with keys comparing equal (possible with hash-based and
 * indexer orders) follow Order::sub_order() where given, else insertion order.  Descending iteration is the
 * reverse.  Mutating `*this` during iteration is allowed (and the iterator's `remove()` is the way to remove the
 * current entry) but entries added meanwhile may or may not be visited.
 *
 * ### Freezing ###
 * freeze() returns an Immutable_map sharing `*this` storage at that time.  `*this` remains fully usable: its next
 * mutation first copies the storage, so the frozen map never changes.  Entries obtained from `*this` before
 * the copy remain valid handles for erase() and update_value() on `*this`.
 *
 * ### Thread safety ###
 * None; wrap in a Shared_map or Atomic_map (shared(), atomic()) for that.
 *
 * @tparam Key
 *         Key type.
 * @tparam Mapped
 *         Value type.
 */
template<typename Key, typename Mapped>
class Fast_map :
  public Abstract_map<Key, Mapped>
{
public:
  // Types.

  /// Short-hand for our base.
  using Base = Abstract_map<Key, Mapped>;

  /// Short-hand for ref-counted map pointer.
  using Ptr = typename Base::Ptr;

  /// Short-hand for entry type.
  using Entry_type = typename Base::Entry_type;

  /// Short-hand for ref-counted entry pointer.
  using Entry_ptr = typename Base::Entry_ptr;

  /// Short-hand for ref-counted iterator pointer.
  using Iterator_ptr = typename Base::Iterator_ptr;

  /// Short-hand for key order pointer.
  using Key_order_ptr = typename Base::Key_order_ptr;

  /// Short-hand for values equality pointer.
  using Values_equality_ptr = typename Base::Values_equality_ptr;

  /// Short-hand for optional value.
  using Mapped_opt = typename Base::Mapped_opt;

  /// Short-hand for the storage type.
  using Entry_table_type = Entry_table<Key, Mapped>;

  /// Short-hand for the frozen counterpart's pointer.
  using Immutable_ptr = boost::shared_ptr<Immutable_map<Key, Mapped>>;

  // Constructors/destructor.

  /**
   * Constructs empty map.  Prefer make_fast_map().
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param key_order
   *        Key order; not null.
   * @param values_equality
   *        Values equality; not null.
   */
  explicit Fast_map(log::Logger* logger_ptr, Key_order_ptr key_order, Values_equality_ptr values_equality);

  // Methods.

  /**
   * Number of entries.
   * @return See above.
   */
  size_t size() const override;

  /**
   * The key order.
   * @return See above.
   */
  Key_order_ptr key_order() const override;

  /**
   * The values equality.
   * @return See above.
   */
  Values_equality_ptr values_equality() const override;

  /**
   * Returns a new Fast_map with copies of all entries (same keys and values, new Entry objects) in the same order,
   * sharing the key order and values equality.
   *
   * @return See above.
   */
  Ptr clone() const override;

  /**
   * Returns an Immutable_map of the current contents; see class doc header.
   * @return See above.
   */
  Immutable_ptr freeze();

  /**
   * The storage, read-only.
   * @return See above.
   */
  const Entry_table_type& entries() const;

  using Base::get_logger;
  using Base::get_log_component;

protected:
  // Methods.

  /**
   * Looks up in the storage.
   * @param key
   *        See Abstract_map.
   * @return See Abstract_map.
   */
  Entry_ptr get_entry_impl(const Key& key) const override;

  /**
   * Replaces the value of an entry with equal key, if any; else adds one.
   *
   * @param key
   *        See Abstract_map.
   * @param value
   *        See Abstract_map.
   * @param prev
   *        See Abstract_map.
   * @param err_code
   *        See Abstract_map.
   * @return See Abstract_map.
   */
  Entry_ptr put_entry_impl(const Key& key, const Mapped& value, Mapped_opt* prev, Error_code* err_code) override;

  /**
   * Adds an entry unconditionally.
   *
   * @param key
   *        See Abstract_map.
   * @param value
   *        See Abstract_map.
   * @param err_code
   *        See Abstract_map.
   * @return See Abstract_map.
   */
  Entry_ptr add_entry_impl(const Key& key, const Mapped& value, Error_code* err_code) override;

  /**
   * Removes an entry with equal key, if any.
   *
   * @param key
   *        See Abstract_map.
   * @param err_code
   *        See Abstract_map.
   * @return See Abstract_map.
   */
  Entry_ptr remove_entry_impl(const Key& key, Error_code* err_code) override;

  /**
   * Removes the given entry, if stored.
   *
   * @param entry
   *        See Abstract_map.
   * @param err_code
   *        See Abstract_map.
   * @return See Abstract_map.
   */
  bool erase_impl(const Entry_ptr& entry, Error_code* err_code) override;

  /**
   * Removes all entries.
   * @param err_code
   *        See Abstract_map.
   */
  void clear_impl(Error_code* err_code) override;

  /**
   * Replaces the value of the given entry; error::Code::S_ENTRY_NOT_IN_MAP if it is not stored.
   *
   * @param entry
   *        See Abstract_map.
   * @param value
   *        See Abstract_map.
   * @param err_code
   *        See Abstract_map.
   * @return See Abstract_map.
   */
  Mapped_opt update_value_impl(const Entry_ptr& entry, const Mapped& value, Error_code* err_code) override;

  /**
   * Iterates the storage.
   * @param descending
   *        See Abstract_map.
   * @param from_key
   *        See Abstract_map.
   * @return See Abstract_map.
   */
  Iterator_ptr iterator_impl(bool descending, const Key* from_key) override;

private:
  // Constructors.

  /**
   * Constructs map over the given storage.  Used by clone().
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param entries
   *        Storage.
   */
  explicit Fast_map(log::Logger* logger_ptr, typename Entry_table_type::Ptr entries);

  // Data.

  /// The storage.
  const typename Entry_table_type::Ptr m_entries;
}; // class Fast_map

// Template implementations.

template<typename Key, typename Mapped>
Fast_map<Key, Mapped>::Fast_map(log::Logger* logger_ptr,
                                Key_order_ptr key_order, Values_equality_ptr values_equality) :
  Base(logger_ptr, Ordo_log_component::S_MAP),
  m_entries(boost::make_shared<Entry_table_type>(logger_ptr, std::move(key_order), std::move(values_equality)))
{
  // Nothing else.
}

template<typename Key, typename Mapped>
Fast_map<Key, Mapped>::Fast_map(log::Logger* logger_ptr, typename Entry_table_type::Ptr entries) :
  Base(logger_ptr, Ordo_log_component::S_MAP),
  m_entries(std::move(entries))
{
  // Nothing else.
}

template<typename Key, typename Mapped>
size_t Fast_map<Key, Mapped>::size() const
{
  return m_entries->size();
}

template<typename Key, typename Mapped>
typename Fast_map<Key, Mapped>::Key_order_ptr Fast_map<Key, Mapped>::key_order() const
{
  return m_entries->key_order();
}

template<typename Key, typename Mapped>
typename Fast_map<Key, Mapped>::Values_equality_ptr Fast_map<Key, Mapped>::values_equality() const
{
  return m_entries->values_equality();
}

template<typename Key, typename Mapped>
typename Fast_map<Key, Mapped>::Ptr Fast_map<Key, Mapped>::clone() const
{
  return Ptr(new Fast_map(get_logger(), m_entries->clone()));
}

template<typename Key, typename Mapped>
typename Fast_map<Key, Mapped>::Immutable_ptr Fast_map<Key, Mapped>::freeze()
{
  Immutable_ptr frozen(new Immutable_map<Key, Mapped>(get_logger(), m_entries->freeze()));
  ORDO_LOG_INFO("Fast_map [" << this << "]: Frozen into immutable map [" << frozen.get() << "] of "
                "[" << frozen->size() << "] entries.");
  return frozen;
}

template<typename Key, typename Mapped>
const typename Fast_map<Key, Mapped>::Entry_table_type& Fast_map<Key, Mapped>::entries() const
{
  return *m_entries;
}

template<typename Key, typename Mapped>
typename Fast_map<Key, Mapped>::Entry_ptr Fast_map<Key, Mapped>::get_entry_impl(const Key& key) const
{
  return m_entries->get_any(key);
}

template<typename Key, typename Mapped>
typename Fast_map<Key, Mapped>::Entry_ptr
  Fast_map<Key, Mapped>::put_entry_impl(const Key& key, const Mapped& value, Mapped_opt* prev, Error_code*)
{
  const auto existing = m_entries->get_any(key);
  if (existing)
  {
    *prev = m_entries->update_value(existing, value);
    // The storage may have been copied (after freeze()); return the entry now stored.
    return m_entries->resolve(existing);
  }
  // else

  auto entry = boost::make_shared<Entry_type>(key, value);
  m_entries->add(entry, true);
  ORDO_LOG_TRACE("Fast_map [" << this << "]: Added entry [" << entry.get() << "]; "
                 "size now [" << m_entries->size() << "].");
  return entry;
}

template<typename Key, typename Mapped>
typename Fast_map<Key, Mapped>::Entry_ptr
  Fast_map<Key, Mapped>::add_entry_impl(const Key& key, const Mapped& value, Error_code*)
{
  auto entry = boost::make_shared<Entry_type>(key, value);
  m_entries->add(entry, true);
  ORDO_LOG_TRACE("Fast_map [" << this << "]: Added entry [" << entry.get() << "] unconditionally; "
                 "size now [" << m_entries->size() << "].");
  return entry;
}

template<typename Key, typename Mapped>
typename Fast_map<Key, Mapped>::Entry_ptr Fast_map<Key, Mapped>::remove_entry_impl(const Key& key, Error_code*)
{
  auto entry = m_entries->remove_any(key);
  if (entry)
  {
    ORDO_LOG_TRACE("Fast_map [" << this << "]: Removed entry [" << entry.get() << "]; "
                   "size now [" << m_entries->size() << "].");
  }
  return entry;
}

template<typename Key, typename Mapped>
bool Fast_map<Key, Mapped>::erase_impl(const Entry_ptr& entry, Error_code*)
{
  return m_entries->erase(entry);
}

template<typename Key, typename Mapped>
void Fast_map<Key, Mapped>::clear_impl(Error_code*)
{
  m_entries->clear();
}

template<typename Key, typename Mapped>
typename Fast_map<Key, Mapped>::Mapped_opt
  Fast_map<Key, Mapped>::update_value_impl(const Entry_ptr& entry, const Mapped& value, Error_code* err_code)
{
  auto prev = m_entries->update_value(entry, value);
  if (!prev)
  {
    ORDO_ERROR_EMIT_ERROR(error::Code::S_ENTRY_NOT_IN_MAP);
  }
  return prev;
}

template<typename Key, typename Mapped>
typename Fast_map<Key, Mapped>::Iterator_ptr Fast_map<Key, Mapped>::iterator_impl(bool descending,
                                                                                  const Key* from_key)
{
  auto cursor = from_key ? m_entries->cursor(descending, *from_key) : m_entries->cursor(descending);
  return this->make_iterator([cursor]() mutable -> Entry_ptr
                               { return cursor.has_next() ? cursor.next() : Entry_ptr(); });
}

// Free function template implementations.

template<typename Key, typename Mapped>
boost::shared_ptr<Fast_map<Key, Mapped>> make_fast_map(log::Logger* logger_ptr)
{
  return make_fast_map<Key, Mapped>(logger_ptr, order::Standard_order<Key>::instance(),
                                    order::Standard_equality<Mapped>::instance());
}

template<typename Key, typename Mapped>
boost::shared_ptr<Fast_map<Key, Mapped>>
  make_fast_map(log::Logger* logger_ptr, const boost::shared_ptr<const order::Order<Key>>& key_order)
{
  return make_fast_map<Key, Mapped>(logger_ptr, key_order, order::Standard_equality<Mapped>::instance());
}

template<typename Key, typename Mapped>
boost::shared_ptr<Fast_map<Key, Mapped>>
  make_fast_map(log::Logger* logger_ptr, const boost::shared_ptr<const order::Order<Key>>& key_order,
                const boost::shared_ptr<const order::Equality<Mapped>>& values_equality)
{
  return boost::make_shared<Fast_map<Key, Mapped>>(logger_ptr, key_order, values_equality);
}

template<typename Key, typename Mapped, typename Indexer>
boost::shared_ptr<Fast_map<Key, Mapped>> make_indexed_map(log::Logger* logger_ptr, Indexer indexer)
{
  return make_fast_map<Key, Mapped>(logger_ptr, order::make_indexer_order<Key>(std::move(indexer)));
}

} // namespace ordo::map
