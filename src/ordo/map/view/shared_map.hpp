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
#include "ordo/util/util_fwd.hpp"
#include <vector>

namespace ordo::map
{

// Types.

/**
 * Thread-safe view of a map: every read takes a shared (reader) lock and every mutation an exclusive (writer) lock
 * on a mutex owned by `*this`, so any number of threads may use the map through this view concurrently, provided
 * nobody bypasses it by using the delegate directly.  put_all() holds the writer lock for its whole duration, so
 * readers see all of the other map's entries or none.
 *
 * Iteration copies the entries into a snapshot under the reader lock; the returned iterator then walks that
 * snapshot without locking, while its `remove()` goes through erase() and so takes the writer lock.  An entry
 * obtained through this view may be read after the lock was released; its `value()` can then race with an
 * update_value() made through the view.  Use Atomic_map where that matters.
 *
 * shared() and atomic() on `*this` return `*this`.
 *
 * @tparam Key
 *         Key type.
 * @tparam Mapped
 *         Value type.
 */
template<typename Key, typename Mapped>
class Shared_map :
  public Forwarding_map<Key, Mapped>
{
public:
  // Types.

  /// Short-hand for our base.
  using Base = Forwarding_map<Key, Mapped>;

  /// Short-hand for ref-counted map pointer.
  using Ptr = typename Base::Ptr;

  /// Short-hand for ref-counted entry pointer.
  using Entry_ptr = typename Base::Entry_ptr;

  /// Short-hand for ref-counted iterator pointer.
  using Iterator_ptr = typename Base::Iterator_ptr;

  /// Short-hand for optional value.
  using Mapped_opt = typename Base::Mapped_opt;

  // Constructors/destructor.

  /**
   * Constructs view.
   * @param delegate
   *        The wrapped map.
   */
  explicit Shared_map(Ptr delegate);

  // Methods.

  /**
   * Size, under reader lock.
   * @return See above.
   */
  size_t size() const override;

  /**
   * Emptiness, under reader lock.
   * @return See above.
   */
  bool empty() const override;

  /**
   * Returns a Shared_map over a clone of the delegate, the clone made under reader lock.
   * @return See above.
   */
  Ptr clone() const override;

  /**
   * Returns `*this`.
   * @return See above.
   */
  Ptr shared() override;

  /**
   * Returns `*this`.
   * @return See above.
   */
  Ptr atomic() override;

  using Base::get_logger;
  using Base::get_log_component;

protected:
  // Methods.

  /**
   * Forwards under reader lock.
   * @param key
   *        See Abstract_map.
   * @return See Abstract_map.
   */
  Entry_ptr get_entry_impl(const Key& key) const override;

  /**
   * Forwards under writer lock.
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
   * Forwards under writer lock.
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
   * Forwards under writer lock.
   *
   * @param key
   *        See Abstract_map.
   * @param err_code
   *        See Abstract_map.
   * @return See Abstract_map.
   */
  Entry_ptr remove_entry_impl(const Key& key, Error_code* err_code) override;

  /**
   * Forwards under writer lock.
   *
   * @param entry
   *        See Abstract_map.
   * @param err_code
   *        See Abstract_map.
   * @return See Abstract_map.
   */
  bool erase_impl(const Entry_ptr& entry, Error_code* err_code) override;

  /**
   * Forwards under writer lock.
   * @param err_code
   *        See Abstract_map.
   */
  void clear_impl(Error_code* err_code) override;

  /**
   * Forwards under writer lock.
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
   * Puts all of `other`'s entries into the delegate under one writer lock.
   *
   * @param other
   *        See Abstract_map.
   * @param err_code
   *        See Abstract_map.
   */
  void put_all_impl(Abstract_map<Key, Mapped>& other, Error_code* err_code) override;

  /**
   * Snapshot iteration; see class doc header.
   * @param descending
   *        See Abstract_map.
   * @param from_key
   *        See Abstract_map.
   * @return See Abstract_map.
   */
  Iterator_ptr iterator_impl(bool descending, const Key* from_key) override;

private:
  // Types.

  /// Short-hand for the mutex type.
  using Mutex = util::Mutex_shared_non_recursive;

  /// Short-hand for writer lock.
  using Lock = util::Lock_guard<Mutex>;

  /// Short-hand for reader lock.
  using Shared_lock = util::Shared_lock_guard<Mutex>;

  // Data.

  /// Protects the delegate.
  mutable Mutex m_mutex;
}; // class Shared_map

// Template implementations.

template<typename Key, typename Mapped>
Shared_map<Key, Mapped>::Shared_map(Ptr delegate) :
  Base(std::move(delegate))
{
  // Nothing else.
}

template<typename Key, typename Mapped>
size_t Shared_map<Key, Mapped>::size() const
{
  Shared_lock lock(m_mutex);
  return Base::size();
}

template<typename Key, typename Mapped>
bool Shared_map<Key, Mapped>::empty() const
{
  Shared_lock lock(m_mutex);
  return Base::empty();
}

template<typename Key, typename Mapped>
typename Shared_map<Key, Mapped>::Ptr Shared_map<Key, Mapped>::clone() const
{
  Ptr copy;
  {
    Shared_lock lock(m_mutex);
    copy = this->delegate()->clone();
  }
  return Ptr(new Shared_map(copy));
}

template<typename Key, typename Mapped>
typename Shared_map<Key, Mapped>::Ptr Shared_map<Key, Mapped>::shared()
{
  return this->shared_from_this();
}

template<typename Key, typename Mapped>
typename Shared_map<Key, Mapped>::Ptr Shared_map<Key, Mapped>::atomic()
{
  return this->shared_from_this();
}

template<typename Key, typename Mapped>
typename Shared_map<Key, Mapped>::Entry_ptr Shared_map<Key, Mapped>::get_entry_impl(const Key& key) const
{
  Shared_lock lock(m_mutex);
  return Base::get_entry_impl(key);
}

template<typename Key, typename Mapped>
typename Shared_map<Key, Mapped>::Entry_ptr
  Shared_map<Key, Mapped>::put_entry_impl(const Key& key, const Mapped& value, Mapped_opt* prev,
                                          Error_code* err_code)
{
  Lock lock(m_mutex);
  return Base::put_entry_impl(key, value, prev, err_code);
}

template<typename Key, typename Mapped>
typename Shared_map<Key, Mapped>::Entry_ptr
  Shared_map<Key, Mapped>::add_entry_impl(const Key& key, const Mapped& value, Error_code* err_code)
{
  Lock lock(m_mutex);
  return Base::add_entry_impl(key, value, err_code);
}

template<typename Key, typename Mapped>
typename Shared_map<Key, Mapped>::Entry_ptr Shared_map<Key, Mapped>::remove_entry_impl(const Key& key,
                                                                                       Error_code* err_code)
{
  Lock lock(m_mutex);
  return Base::remove_entry_impl(key, err_code);
}

template<typename Key, typename Mapped>
bool Shared_map<Key, Mapped>::erase_impl(const Entry_ptr& entry, Error_code* err_code)
{
  Lock lock(m_mutex);
  return Base::erase_impl(entry, err_code);
}

template<typename Key, typename Mapped>
void Shared_map<Key, Mapped>::clear_impl(Error_code* err_code)
{
  Lock lock(m_mutex);
  Base::clear_impl(err_code);
}

template<typename Key, typename Mapped>
typename Shared_map<Key, Mapped>::Mapped_opt
  Shared_map<Key, Mapped>::update_value_impl(const Entry_ptr& entry, const Mapped& value, Error_code* err_code)
{
  Lock lock(m_mutex);
  return Base::update_value_impl(entry, value, err_code);
}

template<typename Key, typename Mapped>
void Shared_map<Key, Mapped>::put_all_impl(Abstract_map<Key, Mapped>& other, Error_code* err_code)
{
  Lock lock(m_mutex);
  // Straight into the delegate: our own put_entry() would lock again.
  this->delegate()->put_all(other, err_code);
}

template<typename Key, typename Mapped>
typename Shared_map<Key, Mapped>::Iterator_ptr Shared_map<Key, Mapped>::iterator_impl(bool descending,
                                                                                      const Key* from_key)
{
  std::vector<Entry_ptr> snapshot;
  {
    Shared_lock lock(m_mutex);
    const auto it = Base::iterator_impl(descending, from_key);
    while (it->has_next())
    {
      snapshot.push_back(it->next());
    }
  }

  ORDO_LOG_TRACE("Shared_map [" << this << "]: Iterating over snapshot of [" << snapshot.size() << "] entries.");

  size_t idx = 0;
  return this->make_iterator([snapshot = std::move(snapshot), idx]() mutable -> Entry_ptr
                               { return (idx == snapshot.size()) ? Entry_ptr() : snapshot[idx++]; });
}

} // namespace ordo::map
