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
#include <boost/make_shared.hpp>
#include <boost/unordered_map.hpp>

namespace ordo::map
{

// Types.

/**
 * Thread-safe view of a map optimized for reading: readers never block, working on an immutable snapshot of the
 * delegate published by the latest write.  Writers are serialized by a mutex owned by `*this`; each applies its
 * mutation to the delegate, then publishes a fresh snapshot (a clone of the delegate), so a write costs a full
 * copy.  Use it for maps read often and written rarely; otherwise use Shared_map.
 *
 * A reader therefore sees the state as of the latest completed write, and iteration walks the snapshot current at
 * its start, unaffected by later writes.  Entries returned by reads belong to the snapshot; their values never
 * change.  They may still be passed back to erase() and update_value(), which act on the corresponding delegate
 * entry, until the next write publishes another snapshot; after that they are no longer found in the map.  An
 * iterator's `remove()` maps through the iterator's own snapshot, so it keeps working.  Entries returned by writes
 * (put_entry(), add_entry()) are the delegate's.
 *
 * As with Shared_map, the delegate must not be mutated other than through `*this`.
 *
 * atomic() and shared() on `*this` return `*this`.
 *
 * @tparam Key
 *         Key type.
 * @tparam Mapped
 *         Value type.
 */
template<typename Key, typename Mapped>
class Atomic_map :
  public Forwarding_map<Key, Mapped>
{
public:
  // Types.

  /// Short-hand for our base.
  using Base = Forwarding_map<Key, Mapped>;

  /// Short-hand for ref-counted map pointer.
  using Ptr = typename Base::Ptr;

  /// Short-hand for entry type.
  using Entry_type = typename Abstract_map<Key, Mapped>::Entry_type;

  /// Short-hand for ref-counted entry pointer.
  using Entry_ptr = typename Base::Entry_ptr;

  /// Short-hand for ref-counted iterator pointer.
  using Iterator_ptr = typename Base::Iterator_ptr;

  /// Short-hand for optional value.
  using Mapped_opt = typename Base::Mapped_opt;

  // Constructors/destructor.

  /**
   * Constructs view, publishing the initial snapshot.
   * @param delegate
   *        The wrapped map.
   */
  explicit Atomic_map(Ptr delegate);

  // Methods.

  /**
   * Size of the current snapshot.
   * @return See above.
   */
  size_t size() const override;

  /**
   * Emptiness of the current snapshot.
   * @return See above.
   */
  bool empty() const override;

  /**
   * Returns an Atomic_map over a clone of the current snapshot.
   * @return See above.
   */
  Ptr clone() const override;

  /**
   * Returns `*this`.
   * @return See above.
   */
  Ptr atomic() override;

  /**
   * Returns `*this`.
   * @return See above.
   */
  Ptr shared() override;

  using Base::get_logger;
  using Base::get_log_component;

protected:
  // Methods.

  /**
   * Looks up in the current snapshot.
   * @param key
   *        See Abstract_map.
   * @return See Abstract_map.
   */
  Entry_ptr get_entry_impl(const Key& key) const override;

  /**
   * Forwards under writer lock, then publishes.
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
   * Forwards under writer lock, then publishes.
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
   * Forwards under writer lock, then publishes if something was removed.
   *
   * @param key
   *        See Abstract_map.
   * @param err_code
   *        See Abstract_map.
   * @return See Abstract_map.
   */
  Entry_ptr remove_entry_impl(const Key& key, Error_code* err_code) override;

  /**
   * Forwards the corresponding delegate entry under writer lock, then publishes if it was erased.
   *
   * @param entry
   *        See Abstract_map.
   * @param err_code
   *        See Abstract_map.
   * @return See Abstract_map.
   */
  bool erase_impl(const Entry_ptr& entry, Error_code* err_code) override;

  /**
   * Forwards under writer lock, then publishes.
   * @param err_code
   *        See Abstract_map.
   */
  void clear_impl(Error_code* err_code) override;

  /**
   * Forwards the corresponding delegate entry under writer lock, then publishes.
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
   * Under writer lock, tries the batch on a copy of the delegate; if that succeeds, puts it into the delegate and
   * publishes once.  On failure neither the delegate nor the snapshot changes.
   *
   * @param other
   *        See Abstract_map.
   * @param err_code
   *        See Abstract_map.
   */
  void put_all_impl(Abstract_map<Key, Mapped>& other, Error_code* err_code) override;

  /**
   * Iterates over the current snapshot.
   * @param descending
   *        See Abstract_map.
   * @param from_key
   *        See Abstract_map.
   * @return See Abstract_map.
   */
  Iterator_ptr iterator_impl(bool descending, const Key* from_key) override;

private:
  // Types.

  /// A published, never-mutated copy of the delegate, with the way back to the delegate's entries.
  struct Snapshot
  {
    /// The copy.
    Ptr m_map;
    /// Maps each entry of #m_map to the delegate entry it was copied from.
    boost::unordered_map<Entry_type const *, Entry_ptr> m_origin;
  };

  /// Short-hand for ref-counted pointer to published snapshot.
  using Snapshot_ptr = boost::shared_ptr<const Snapshot>;

  /// Short-hand for writer lock.
  using Lock = util::Lock_guard<util::Mutex_non_recursive>;

  // Methods.

  /**
   * Returns the current snapshot.
   * @return See above.
   */
  Snapshot_ptr snapshot() const;

  /// Replaces the current snapshot with a copy of the delegate.  Writer lock must be held.
  void publish();

  /**
   * The delegate entry the given snapshot entry was copied from; or `entry` itself if it is not from `snap`.
   *
   * @param snap
   *        Snapshot.
   * @param entry
   *        Entry.
   * @return See above.
   */
  static Entry_ptr origin_of(const Snapshot& snap, const Entry_ptr& entry);

  // Data.

  /// Serializes writers.
  util::Mutex_non_recursive m_mutex;

  /// Current snapshot; accessed only via `boost::atomic_load()` and `boost::atomic_store()`.
  Snapshot_ptr m_snapshot;
}; // class Atomic_map

// Template implementations.

template<typename Key, typename Mapped>
Atomic_map<Key, Mapped>::Atomic_map(Ptr delegate) :
  Base(std::move(delegate))
{
  Lock lock(m_mutex);
  publish();
}

template<typename Key, typename Mapped>
typename Atomic_map<Key, Mapped>::Snapshot_ptr Atomic_map<Key, Mapped>::snapshot() const
{
  return boost::atomic_load(&m_snapshot);
}

template<typename Key, typename Mapped>
void Atomic_map<Key, Mapped>::publish()
{
  const auto& delegate = this->delegate();
  auto snap = boost::make_shared<Snapshot>();
  snap->m_map = delegate->clone();

  // A clone iterates in the same order as its original; pair them up.
  const auto orig_it = delegate->iterator();
  const auto copy_it = snap->m_map->iterator();
  while (orig_it->has_next() && copy_it->has_next())
  {
    const auto copy = copy_it->next();
    snap->m_origin.emplace(copy.get(), orig_it->next());
  }
  assert((!orig_it->has_next()) && (!copy_it->has_next()));

  ORDO_LOG_DEBUG("Atomic_map [" << this << "]: Publishing snapshot [" << snap->m_map.get() << "] of "
                 "[" << snap->m_origin.size() << "] entries.");
  boost::atomic_store(&m_snapshot, Snapshot_ptr(std::move(snap)));
}

template<typename Key, typename Mapped>
typename Atomic_map<Key, Mapped>::Entry_ptr
  Atomic_map<Key, Mapped>::origin_of(const Snapshot& snap, const Entry_ptr& entry) // Static.
{
  const auto it = snap.m_origin.find(entry.get());
  return (it == snap.m_origin.end()) ? entry : it->second;
}

template<typename Key, typename Mapped>
size_t Atomic_map<Key, Mapped>::size() const
{
  return snapshot()->m_map->size();
}

template<typename Key, typename Mapped>
bool Atomic_map<Key, Mapped>::empty() const
{
  return snapshot()->m_map->empty();
}

template<typename Key, typename Mapped>
typename Atomic_map<Key, Mapped>::Ptr Atomic_map<Key, Mapped>::clone() const
{
  return Ptr(new Atomic_map(snapshot()->m_map->clone()));
}

template<typename Key, typename Mapped>
typename Atomic_map<Key, Mapped>::Ptr Atomic_map<Key, Mapped>::atomic()
{
  return this->shared_from_this();
}

template<typename Key, typename Mapped>
typename Atomic_map<Key, Mapped>::Ptr Atomic_map<Key, Mapped>::shared()
{
  return this->shared_from_this();
}

template<typename Key, typename Mapped>
typename Atomic_map<Key, Mapped>::Entry_ptr Atomic_map<Key, Mapped>::get_entry_impl(const Key& key) const
{
  return snapshot()->m_map->get_entry(key);
}

template<typename Key, typename Mapped>
typename Atomic_map<Key, Mapped>::Entry_ptr
  Atomic_map<Key, Mapped>::put_entry_impl(const Key& key, const Mapped& value, Mapped_opt* prev,
                                          Error_code* err_code)
{
  Lock lock(m_mutex);
  auto entry = this->delegate()->put_entry(key, value, prev, err_code);
  publish();
  return entry;
}

template<typename Key, typename Mapped>
typename Atomic_map<Key, Mapped>::Entry_ptr
  Atomic_map<Key, Mapped>::add_entry_impl(const Key& key, const Mapped& value, Error_code* err_code)
{
  Lock lock(m_mutex);
  auto entry = this->delegate()->add_entry(key, value, err_code);
  publish();
  return entry;
}

template<typename Key, typename Mapped>
typename Atomic_map<Key, Mapped>::Entry_ptr Atomic_map<Key, Mapped>::remove_entry_impl(const Key& key,
                                                                                       Error_code* err_code)
{
  Lock lock(m_mutex);
  auto entry = this->delegate()->remove_entry(key, err_code);
  if (entry)
  {
    publish();
  }
  return entry;
}

template<typename Key, typename Mapped>
bool Atomic_map<Key, Mapped>::erase_impl(const Entry_ptr& entry, Error_code* err_code)
{
  Lock lock(m_mutex);
  const bool erased = this->delegate()->erase(origin_of(*snapshot(), entry), err_code);
  if (erased)
  {
    publish();
  }
  return erased;
}

template<typename Key, typename Mapped>
void Atomic_map<Key, Mapped>::clear_impl(Error_code* err_code)
{
  Lock lock(m_mutex);
  this->delegate()->clear(err_code);
  publish();
}

template<typename Key, typename Mapped>
typename Atomic_map<Key, Mapped>::Mapped_opt
  Atomic_map<Key, Mapped>::update_value_impl(const Entry_ptr& entry, const Mapped& value, Error_code* err_code)
{
  Lock lock(m_mutex);
  auto prev = this->delegate()->update_value(origin_of(*snapshot(), entry), value, err_code);
  publish();
  return prev;
}

template<typename Key, typename Mapped>
void Atomic_map<Key, Mapped>::put_all_impl(Abstract_map<Key, Mapped>& other, Error_code* err_code)
{
  Lock lock(m_mutex);

  // The delegate's put_all() stops at the first failure, keeping what it already put.  Try the batch on a copy first.
  const auto trial = this->delegate()->clone();
  trial->put_all(other, err_code);
  if (*err_code)
  {
    ORDO_LOG_TRACE("Atomic_map [" << this << "]: put_all() of [" << other.size() << "] entries failed on scratch "
                   "copy; nothing applied.");
    return;
  }
  // else

  this->delegate()->put_all(other, err_code);
  publish();
}

template<typename Key, typename Mapped>
typename Atomic_map<Key, Mapped>::Iterator_ptr Atomic_map<Key, Mapped>::iterator_impl(bool descending,
                                                                                      const Key* from_key)
{
  const auto snap = snapshot();
  const auto it = Base::iterator_of(*snap->m_map, descending, from_key);
  const Ptr self = this->shared_from_this();

  // Removal maps entries through the iterator's own snapshot, which may no longer be current.
  return Iterator_ptr
           (new Sequence_iterator<Key, Mapped>
                  (get_logger(),
                   [it]() -> Entry_ptr { return it->has_next() ? it->next() : Entry_ptr(); },
                   [self, snap](const Entry_ptr& entry, Error_code* err_code) -> bool
                     { return self->erase(origin_of(*snap, entry), err_code); }));
}

} // namespace ordo::map
