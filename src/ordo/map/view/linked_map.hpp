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
#include "ordo/util/insertion_chain.hpp"
#include <boost/unordered_map.hpp>
#include <vector>

namespace ordo::map
{

// Types.

/**
 * View of a map iterating in insertion order instead of the delegate's order: iterator() yields the oldest entry
 * first, descending_iterator() the newest.  The order is kept in an util::Insertion_chain of non-owning
 * references to the delegate's entries; the delegate's own ordering is untouched.
 *
 * Entries inserted through `*this` are chained as they are inserted; replacing the value of an existing key keeps
 * its position.  Entries present in the delegate when `*this` is created, or inserted into the delegate by other
 * paths, are chained (in the delegate's order) when next iterated.  Entries removed by any path are unchained;
 * entries whose storage was copied on write (see Entry::successor()) are replaced by their copies in place.
 *
 * iterator(from_key) starts at the first chained entry whose key is equal to `from_key` (nothing if none);
 * descending_iterator(from_key) likewise, going newest to oldest.  clone() preserves the chain order.
 *
 * ### Iteration ###
 * Iterators walk a snapshot of the chain taken when created, skipping entries removed since.
 *
 * ### Thread safety ###
 * Creating an iterator may update the chain (see above).  That update is serialized by a mutex owned by `*this`, so
 * concurrent read-only use is as safe as the delegate's.  Concurrent mutation needs an outer view such as shared().
 *
 * @tparam Key
 *         Key type.
 * @tparam Mapped
 *         Value type.
 */
template<typename Key, typename Mapped>
class Linked_map :
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
   * Constructs view, chaining the delegate's current entries in its order.
   * @param delegate
   *        The wrapped map.
   */
  explicit Linked_map(Ptr delegate);

  // Methods.

  /**
   * Returns a linked view over a clone of the delegate, with the same chain order.
   * @return See above.
   */
  Ptr clone() const override;

  /**
   * Returns `*this`.
   * @return See above.
   */
  Ptr linked() override;

  /**
   * Returns `false`.
   * @return See above.
   */
  bool iterates_in_key_order() const override;

  using Base::get_logger;
  using Base::get_log_component;

protected:
  // Methods.

  /**
   * Forwards, then chains the resulting entry if new.
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
   * Forwards, then chains the resulting entry.
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
   * Forwards, then unchains the removed entry.
   *
   * @param key
   *        See Abstract_map.
   * @param err_code
   *        See Abstract_map.
   * @return See Abstract_map.
   */
  Entry_ptr remove_entry_impl(const Key& key, Error_code* err_code) override;

  /**
   * Forwards, then unchains the entry.
   *
   * @param entry
   *        See Abstract_map.
   * @param err_code
   *        See Abstract_map.
   * @return See Abstract_map.
   */
  bool erase_impl(const Entry_ptr& entry, Error_code* err_code) override;

  /**
   * Forwards, then empties the chain.
   * @param err_code
   *        See Abstract_map.
   */
  void clear_impl(Error_code* err_code) override;

  /**
   * Iterates the chain; see class doc header.
   * @param descending
   *        See Abstract_map.
   * @param from_key
   *        See Abstract_map.
   * @return See Abstract_map.
   */
  Iterator_ptr iterator_impl(bool descending, const Key* from_key) override;

private:
  // Types.

  /// Short-hand for entry type.
  using Entry_type = typename Base::Entry_type;

  /// Short-hand for the chain type.
  using Chain = util::Insertion_chain<Entry_type>;

  /// Short-hand for #m_chain_mutex lock.
  using Lock = util::Lock_guard<util::Mutex_non_recursive>;

  // Constructors.

  /**
   * Constructs view with the given chain, then chains any remaining entries.
   *
   * @param delegate
   *        The wrapped map.
   * @param chain
   *        Initial chain.
   */
  explicit Linked_map(Ptr delegate, const Chain& chain);

  // Methods.

  /// Drops removed entries from #m_chain, follows successors, and appends unchained delegate entries.  #m_chain_mutex
  /// must be locked.
  void sync();

  /**
   * Returns the newest version of `entry` unless that has been removed from its map; else null.
   * @param entry
   *        Entry; may be null.
   * @return See above.
   */
  static Entry_ptr live(const Entry_ptr& entry);

  // Data.

  /// Protects #m_chain.
  mutable util::Mutex_non_recursive m_chain_mutex;

  /// The insertion order.
  Chain m_chain;
}; // class Linked_map

// Template implementations.

template<typename Key, typename Mapped>
Linked_map<Key, Mapped>::Linked_map(Ptr delegate) :
  Linked_map(std::move(delegate), Chain())
{
  // Nothing else.
}

template<typename Key, typename Mapped>
Linked_map<Key, Mapped>::Linked_map(Ptr delegate, const Chain& chain) :
  Base(std::move(delegate)),
  m_chain(chain)
{
  Lock lock(m_chain_mutex);
  sync();
}

template<typename Key, typename Mapped>
typename Linked_map<Key, Mapped>::Entry_ptr Linked_map<Key, Mapped>::live(const Entry_ptr& entry) // Static.
{
  const auto newest = Entry_type::newest(entry);
  return (newest && (!newest->detached())) ? newest : Entry_ptr();
}

template<typename Key, typename Mapped>
void Linked_map<Key, Mapped>::sync()
{
  m_chain.prune([](const Entry_ptr& entry) -> Entry_ptr { return live(entry); });

  size_t n_chained = 0;
  for (auto it = this->delegate()->iterator(); it->has_next(); )
  {
    if (m_chain.push_back(it->next()))
    {
      ++n_chained;
    }
  }

  if (n_chained != 0)
  {
    ORDO_LOG_TRACE("Linked_map [" << this << "]: Chained [" << n_chained << "] entries not inserted through "
                   "this view; chain length now [" << m_chain.size() << "].");
  }
}

template<typename Key, typename Mapped>
typename Linked_map<Key, Mapped>::Ptr Linked_map<Key, Mapped>::clone() const
{
  const auto copy_delegate = this->delegate()->clone();

  /* The clone has the same entries in the same iteration order; pair them up by walking both, then rebuild our
   * chain in terms of the copies. */
  boost::unordered_map<Entry_type const *, Entry_ptr> copy_of;
  auto it = this->delegate()->iterator();
  auto copy_it = copy_delegate->iterator();
  while (it->has_next() && copy_it->has_next())
  {
    copy_of[it->next().get()] = copy_it->next();
  }

  std::vector<typename Chain::Weak_ptr> chained;
  {
    Lock lock(m_chain_mutex);
    chained = m_chain.snapshot(false);
  }

  Chain copy_chain;
  for (const auto& weak_entry : chained)
  {
    const auto entry = live(weak_entry.lock());
    if (!entry)
    {
      continue;
    }
    // else
    const auto found = copy_of.find(entry.get());
    if (found != copy_of.end())
    {
      copy_chain.push_back(found->second);
    }
  }

  ORDO_LOG_DEBUG("Linked_map [" << this << "]: Cloned with chain of [" << copy_chain.size() << "] entries.");
  return Ptr(new Linked_map(copy_delegate, copy_chain));
}

template<typename Key, typename Mapped>
typename Linked_map<Key, Mapped>::Ptr Linked_map<Key, Mapped>::linked()
{
  return this->shared_from_this();
}

template<typename Key, typename Mapped>
bool Linked_map<Key, Mapped>::iterates_in_key_order() const
{
  return false;
}

template<typename Key, typename Mapped>
typename Linked_map<Key, Mapped>::Entry_ptr
  Linked_map<Key, Mapped>::put_entry_impl(const Key& key, const Mapped& value, Mapped_opt* prev,
                                          Error_code* err_code)
{
  const auto entry = this->delegate()->put_entry(key, value, prev, err_code);
  if (entry)
  {
    Lock lock(m_chain_mutex);
    m_chain.push_back(entry);
  }
  return entry;
}

template<typename Key, typename Mapped>
typename Linked_map<Key, Mapped>::Entry_ptr
  Linked_map<Key, Mapped>::add_entry_impl(const Key& key, const Mapped& value, Error_code* err_code)
{
  const auto entry = this->delegate()->add_entry(key, value, err_code);
  if (entry)
  {
    Lock lock(m_chain_mutex);
    m_chain.push_back(entry);
  }
  return entry;
}

template<typename Key, typename Mapped>
typename Linked_map<Key, Mapped>::Entry_ptr
  Linked_map<Key, Mapped>::remove_entry_impl(const Key& key, Error_code* err_code)
{
  const auto entry = this->delegate()->remove_entry(key, err_code);
  Lock lock(m_chain_mutex);
  m_chain.erase(entry);
  return entry;
}

template<typename Key, typename Mapped>
bool Linked_map<Key, Mapped>::erase_impl(const Entry_ptr& entry, Error_code* err_code)
{
  const auto stored = Entry_type::newest(entry);
  const bool erased = this->delegate()->erase(entry, err_code);
  if (erased)
  {
    Lock lock(m_chain_mutex);
    m_chain.erase(stored);
  }
  return erased;
}

template<typename Key, typename Mapped>
void Linked_map<Key, Mapped>::clear_impl(Error_code* err_code)
{
  this->delegate()->clear(err_code);
  if (!*err_code)
  {
    Lock lock(m_chain_mutex);
    m_chain.clear();
  }
}

template<typename Key, typename Mapped>
typename Linked_map<Key, Mapped>::Iterator_ptr
  Linked_map<Key, Mapped>::iterator_impl(bool descending, const Key* from_key)
{
  using std::vector;

  vector<typename Chain::Weak_ptr> snapshot;
  {
    Lock lock(m_chain_mutex);
    sync();
    snapshot = m_chain.snapshot(descending);
  }

  auto start = snapshot.begin();
  if (from_key)
  {
    const auto key_order = this->key_order();
    for (; start != snapshot.end(); ++start)
    {
      const auto entry = start->lock();
      if (entry && key_order->are_equal(entry->key(), *from_key))
      {
        break;
      }
    }
  }

  vector<typename Chain::Weak_ptr> entries(start, snapshot.end());
  size_t pos = 0;
  return this->make_iterator([entries = std::move(entries), pos]() mutable -> Entry_ptr
  {
    while (pos != entries.size())
    {
      const auto entry = live(entries[pos++].lock());
      if (entry)
      {
        return entry;
      }
    }
    return Entry_ptr();
  });
} // Linked_map::iterator_impl()

} // namespace ordo::map
