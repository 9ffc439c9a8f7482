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
#include "ordo/map/entry.hpp"
#include "ordo/map/entry_iterator.hpp"
#include "ordo/map/error/error.hpp"
#include "ordo/order/order.hpp"
#include "ordo/error/error.hpp"
#include "ordo/log/log.hpp"
#include "ordo/util/util.hpp"
#include <boost/enable_shared_from_this.hpp>
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <optional>

namespace ordo::map
{

// Types.

/**
 * The interface of every Ordo map and view: a collection of key/value entries whose key order and key equality are
 * given by key_order(), and whose value comparisons use values_equality().  Fast_map is the core implementation;
 * Immutable_map its frozen counterpart; everything else is a view, wrapping another Abstract_map (its *delegate*)
 * and changing a well-defined part of its behavior, forwarding the rest.  Views are created by the factories
 * below (unmodifiable(), multi(), linked(), and so on) and may be stacked arbitrarily; all views over a given map
 * observe each other's mutations, except where documented otherwise (Atomic_map readers see published snapshots;
 * Immutable_map is frozen).
 *
 * An Abstract_map is always owned through #Ptr; views and iterators hold such references to the maps they use.
 *
 * ### Standard versus multimap semantics ###
 * In a standard map, put() replaces the value of the entry whose key is equal (Order::are_equal()) to the given key,
 * if there is one; so there is at most one entry per distinct key.  A Multi_map view instead inserts a new entry
 * on every put(); add_entry() does so at any level.  Lookups resolve to an arbitrary one of several entries
 * with equal keys.
 *
 * ### Null keys ###
 * Keys are never null.  For key types with a null state (see util::Null_key_traits), mutators given a null key emit
 * error::Code::S_NULL_KEY, while lookups (which take no `Error_code*`) throw error::Runtime_error with that code.
 *
 * ### Error reporting ###
 * Per ordo::error: each mutator takes `Error_code* err_code = nullptr` as last argument; on failure it throws if
 * that is null, else sets `*err_code` and returns a neutral value (null, empty, `false`).  Implementations
 * (the `*_impl()` methods) always get non-null `err_code`, already cleared, and only ever set it on error.
 *
 * ### Thread safety ###
 * None, unless `*this` is (or is reached only through) a Shared_map or Atomic_map.
 *
 * @tparam Key
 *         Key type.  Copyable.
 * @tparam Mapped
 *         Value type.  Copyable.  To store "null" values, choose a nullable type (e.g., `std::optional<X>`).
 */
template<typename Key, typename Mapped>
class Abstract_map :
  public log::Log_context,
  public boost::enable_shared_from_this<Abstract_map<Key, Mapped>>,
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for ref-counted pointer to `*this`; the one way maps are owned.
  using Ptr = boost::shared_ptr<Abstract_map>;

  /// Short-hand for the entry type.
  using Entry_type = Entry<Key, Mapped>;

  /// Short-hand for ref-counted pointer to entry; null means absent.
  using Entry_ptr = typename Entry_type::Ptr;

  /// Short-hand for ref-counted pointer to iterator.
  using Iterator_ptr = typename Entry_iterator<Key, Mapped>::Ptr;

  /// Short-hand for the key order pointer.
  using Key_order_ptr = typename order::Order<Key>::Const_ptr;

  /// Short-hand for the values equality pointer.
  using Values_equality_ptr = typename order::Equality<Mapped>::Const_ptr;

  /// Short-hand for a value or its absence.
  using Mapped_opt = std::optional<Mapped>;

  // Constructors/destructor.

  /// Boring `virtual` destructor.
  virtual ~Abstract_map() = default;

  // Methods.

  /**
   * Returns the value of an entry whose key is equal to `key`; empty if there is none.
   *
   * @param key
   *        Key.  Must not be null; see class doc header.
   * @return See above.
   */
  Mapped_opt get(const Key& key) const;

  /**
   * Returns an entry whose key is equal to `key`; null if there is none.  Unlike get(), this distinguishes
   * an absent mapping from a present one with a "null" value.
   *
   * @param key
   *        Key.  Must not be null; see class doc header.
   * @return See above.
   */
  Entry_ptr get_entry(const Key& key) const;

  /**
   * Returns `get_entry(key) != nullptr`.
   *
   * @param key
   *        Key.  Must not be null; see class doc header.
   * @return See above.
   */
  bool contains_key(const Key& key) const;

  /**
   * Number of entries.
   * @return See above.
   */
  virtual size_t size() const = 0;

  /**
   * Returns `size() == 0`, though perhaps more cheaply.
   * @return See above.
   */
  virtual bool empty() const;

  /**
   * The key order.
   * @return See above.
   */
  virtual Key_order_ptr key_order() const = 0;

  /**
   * The values equality.
   * @return See above.
   */
  virtual Values_equality_ptr values_equality() const = 0;

  /**
   * Whether iterator() yields entries in ascending key order (and descending_iterator() in descending key order).
   * `false` for views that impose another order, such as Linked_map and Reversed_map.
   *
   * @return See above.
   */
  virtual bool iterates_in_key_order() const;

  /**
   * Returns a structurally independent copy: same kind of map (and same stack of views), same policies (shared),
   * copies of the entries.  Mutating either afterwards does not affect the other.
   *
   * @return See above.
   */
  virtual Ptr clone() const = 0;

  /**
   * Returns iterator over all entries in this map's order.
   * @return See above.
   */
  Iterator_ptr iterator();

  /**
   * Returns iterator starting at the first entry not less than `from_key` (for views with their own order, see
   * the view).
   *
   * @param from_key
   *        Key.  Must not be null.
   * @return See above.
   */
  Iterator_ptr iterator(const Key& from_key);

  /**
   * Returns iterator over all entries in reverse order.
   * @return See above.
   */
  Iterator_ptr descending_iterator();

  /**
   * Returns reverse-order iterator starting at the first entry not greater than `from_key`.
   *
   * @param from_key
   *        Key.  Must not be null.
   * @return See above.
   */
  Iterator_ptr descending_iterator(const Key& from_key);

  /**
   * Maps `key` to `value`: replaces the value of an existing entry with key equal to `key`, or (if none, or under
   * multimap semantics) inserts a new entry.
   *
   * @param key
   *        Key.
   * @param value
   *        Value.
   * @param err_code
   *        See class doc header.
   * @return Previous value of the replaced entry; empty if an entry was inserted.
   */
  Mapped_opt put(const Key& key, const Mapped& value, Error_code* err_code = nullptr);

  /**
   * Same as put() but returns the entry now holding the mapping.
   *
   * @param key
   *        Key.
   * @param value
   *        Value.
   * @param prev
   *        If not null, `*prev` is set to what put() would return.
   * @param err_code
   *        See class doc header.
   * @return See above; null on error.
   */
  Entry_ptr put_entry(const Key& key, const Mapped& value, Mapped_opt* prev = nullptr,
                      Error_code* err_code = nullptr);

  /**
   * Inserts a new entry regardless of existing entries with equal keys (the multimap primitive).
   *
   * @param key
   *        Key.
   * @param value
   *        Value.
   * @param err_code
   *        See class doc header.
   * @return The new entry; null on error.
   */
  Entry_ptr add_entry(const Key& key, const Mapped& value, Error_code* err_code = nullptr);

  /**
   * Removes one entry whose key is equal to `key`, if any.
   *
   * @param key
   *        Key.
   * @param err_code
   *        See class doc header.
   * @return Value of the removed entry; empty if none.
   */
  Mapped_opt remove(const Key& key, Error_code* err_code = nullptr);

  /**
   * Same as remove() but returns the removed (now detached) entry.
   *
   * @param key
   *        Key.
   * @param err_code
   *        See class doc header.
   * @return See above; null if none, or on error.
   */
  Entry_ptr remove_entry(const Key& key, Error_code* err_code = nullptr);

  /**
   * Removes the given entry, as identified by a previous lookup or iteration.
   *
   * @param entry
   *        Entry; may be null (then nothing happens).
   * @param err_code
   *        See class doc header.
   * @return `true` if it was in the map and has been removed.
   */
  bool erase(const Entry_ptr& entry, Error_code* err_code = nullptr);

  /**
   * Removes all entries.
   * @param err_code
   *        See class doc header.
   */
  void clear(Error_code* err_code = nullptr);

  /**
   * Replaces the value of the given entry in place.
   *
   * @param entry
   *        Entry, as identified by a previous lookup or iteration.
   * @param value
   *        New value.
   * @param err_code
   *        See class doc header.  error::Code::S_ENTRY_NOT_IN_MAP if `entry` is not (or no longer) in the map.
   * @return Previous value; empty on error.
   */
  Mapped_opt update_value(const Entry_ptr& entry, const Mapped& value, Error_code* err_code = nullptr);

  /**
   * Performs put() for each entry of `other`, in its order; stops at the first error.
   *
   * @param other
   *        Another map; must not be `*this` (or a view over it).
   * @param err_code
   *        See class doc header.
   */
  void put_all(Abstract_map& other, Error_code* err_code = nullptr);

  /**
   * Chaining put(): `map->with(k1, v1).with(k2, v2)`.  Throws on error.
   *
   * @param key
   *        Key.
   * @param value
   *        Value.
   * @return `*this`.
   */
  Abstract_map& with(const Key& key, const Mapped& value);

  /**
   * Returns a read-only view of `*this`: every mutation through it (including via its iterators) fails with
   * error::Code::S_UNMODIFIABLE_VIEW.  See Unmodifiable_map.
   *
   * @return See above.
   */
  virtual Ptr unmodifiable();

  /**
   * Returns a view of `*this` with multimap semantics: put() always inserts.  See Multi_map.
   * @return See above.
   */
  virtual Ptr multi();

  /**
   * Returns a view of `*this` iterating in insertion order.  See Linked_map.
   * @return See above.
   */
  virtual Ptr linked();

  /**
   * Returns a view of `*this` iterating in reverse order.  See Reversed_map.
   * @return See above.
   */
  virtual Ptr reversed();

  /**
   * Returns a thread-safe view of `*this` guarded by a readers-writer lock.  See Shared_map.
   * @return See above.
   */
  virtual Ptr shared();

  /**
   * Returns a thread-safe view of `*this` whose readers see atomically published snapshots.  See Atomic_map.
   * @return See above.
   */
  virtual Ptr atomic();

  /**
   * Returns a view of the entries with keys in the given range under key_order().  See Sub_map.
   *
   * @param from_key
   *        Lower bound.
   * @param from_inclusive
   *        Whether keys comparing equal to `from_key` are in range.
   * @param to_key
   *        Upper bound.
   * @param to_inclusive
   *        Whether keys comparing equal to `to_key` are in range.
   * @param err_code
   *        See class doc header.  error::Code::S_INVALID_RANGE if `from_key` compares greater than `to_key`.
   * @return See above; null on error.
   */
  Ptr sub_map(const Key& from_key, bool from_inclusive, const Key& to_key, bool to_inclusive,
              Error_code* err_code = nullptr);

  /**
   * Returns a view of the entries whose key is equal to `key`: in a multimap, all values for one key.
   *
   * @param key
   *        Key.
   * @param err_code
   *        See class doc header.
   * @return See above; null on error.
   */
  Ptr sub_map(const Key& key, Error_code* err_code = nullptr);

  /**
   * Returns a view of the entries with keys less than (or equal to) `to_key`.
   *
   * @param to_key
   *        Upper bound.
   * @param inclusive
   *        Whether keys comparing equal to `to_key` are in range.
   * @param err_code
   *        See class doc header.
   * @return See above; null on error.
   */
  Ptr head_map(const Key& to_key, bool inclusive = false, Error_code* err_code = nullptr);

  /**
   * Returns a view of the entries with keys greater than (or equal to) `from_key`.
   *
   * @param from_key
   *        Lower bound.
   * @param inclusive
   *        Whether keys comparing equal to `from_key` are in range.
   * @param err_code
   *        See class doc header.
   * @return See above; null on error.
   */
  Ptr tail_map(const Key& from_key, bool inclusive = true, Error_code* err_code = nullptr);

  /**
   * Returns a view of `*this` using the given values equality.  See Values_equality_map.
   *
   * @param values_equality
   *        Values equality; must not be null.
   * @return See above.
   */
  Ptr with_values_equality(Values_equality_ptr values_equality);

  /**
   * Returns the keys of `*this` as a collection view.
   * @return See above.
   */
  Key_view<Key, Mapped> keys();

  /**
   * Returns the values of `*this` as a collection view.
   * @return See above.
   */
  Value_view<Key, Mapped> values();

protected:
  // Constructors/destructor.

  /**
   * Constructs the interface part.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param component
   *        Log component of the implementing class.
   */
  explicit Abstract_map(log::Logger* logger_ptr, Ordo_log_component component);

  // Methods.

  /**
   * Implements get_entry() given non-null key.
   * @param key
   *        See get_entry().
   * @return See get_entry().
   */
  virtual Entry_ptr get_entry_impl(const Key& key) const = 0;

  /**
   * Implements put_entry() given non-null key, non-null `prev` (already reset) and `err_code`.
   *
   * @param key
   *        See put_entry().
   * @param value
   *        See put_entry().
   * @param prev
   *        See put_entry().
   * @param err_code
   *        See class doc header.
   * @return See put_entry().
   */
  virtual Entry_ptr put_entry_impl(const Key& key, const Mapped& value, Mapped_opt* prev,
                                   Error_code* err_code) = 0;

  /**
   * Implements add_entry() given non-null key.
   *
   * @param key
   *        See add_entry().
   * @param value
   *        See add_entry().
   * @param err_code
   *        See class doc header.
   * @return See add_entry().
   */
  virtual Entry_ptr add_entry_impl(const Key& key, const Mapped& value, Error_code* err_code) = 0;

  /**
   * Implements remove_entry() given non-null key.
   *
   * @param key
   *        See remove_entry().
   * @param err_code
   *        See class doc header.
   * @return See remove_entry().
   */
  virtual Entry_ptr remove_entry_impl(const Key& key, Error_code* err_code) = 0;

  /**
   * Implements erase() given non-null entry.
   *
   * @param entry
   *        See erase().
   * @param err_code
   *        See class doc header.
   * @return See erase().
   */
  virtual bool erase_impl(const Entry_ptr& entry, Error_code* err_code) = 0;

  /**
   * Implements clear().
   * @param err_code
   *        See class doc header.
   */
  virtual void clear_impl(Error_code* err_code) = 0;

  /**
   * Implements update_value().
   *
   * @param entry
   *        See update_value().
   * @param value
   *        See update_value().
   * @param err_code
   *        See class doc header.
   * @return See update_value().
   */
  virtual Mapped_opt update_value_impl(const Entry_ptr& entry, const Mapped& value, Error_code* err_code) = 0;

  /**
   * Implements put_all().  The default does put_entry() (so, through `*this` semantics) for each entry of `other`.
   *
   * @param other
   *        See put_all().
   * @param err_code
   *        See class doc header.
   */
  virtual void put_all_impl(Abstract_map& other, Error_code* err_code);

  /**
   * Emits the error, if any, with which every mutator of `*this` fails whatever its arguments.  put_entry(),
   * add_entry() and remove_entry() check this before the key, so such a map reports it even for a null key.
   * The default emits nothing.
   *
   * @param err_code
   *        Non-null.
   * @return `true` if an error was emitted.
   */
  virtual bool refuse_mutation(Error_code* err_code) const;

  /**
   * Implements the 4 iteration methods.
   *
   * @param descending
   *        `true` for descending_iterator().
   * @param from_key
   *        Starting key, non-null; or null to start at the beginning.
   * @return See iterator().
   */
  virtual Iterator_ptr iterator_impl(bool descending, const Key* from_key) = 0;

  /**
   * Lets a view obtain an iterator from its delegate through iterator_impl(), forwarding a possibly null
   * `from_key`.
   *
   * @param map
   *        The delegate.
   * @param descending
   *        See iterator_impl().
   * @param from_key
   *        See iterator_impl().
   * @return See iterator_impl().
   */
  static Iterator_ptr iterator_of(Abstract_map& map, bool descending, const Key* from_key);

  /**
   * Returns an iterator over the entries yielded by `source`, whose remove() goes through erase() on `*this`.
   *
   * @param source
   *        See Sequence_iterator.
   * @return See above.
   */
  Iterator_ptr make_iterator(typename Sequence_iterator<Key, Mapped>::Source source);

  /**
   * Returns an iterator that iterates `delegate_it` but removes through erase() on `*this`.
   *
   * @param delegate_it
   *        Another iterator.
   * @return See above.
   */
  Iterator_ptr make_iterator(Iterator_ptr delegate_it);

private:
  // Methods.

  /**
   * Throws error::Runtime_error with error::Code::S_NULL_KEY if `key` is null.
   *
   * @param key
   *        Key.
   * @param context
   *        Name of the calling API.
   */
  void throw_if_null_key(const Key& key, util::String_view context) const;

  /**
   * Emits error::Code::S_NULL_KEY if `key` is null.
   *
   * @param key
   *        Key.
   * @param err_code
   *        Non-null.
   * @return `true` if the error was emitted.
   */
  bool null_key_error(const Key& key, Error_code* err_code) const;
}; // class Abstract_map

// Template implementations.

template<typename Key, typename Mapped>
Abstract_map<Key, Mapped>::Abstract_map(log::Logger* logger_ptr, Ordo_log_component component) :
  log::Log_context(logger_ptr, component)
{
  // Nothing else.
}

template<typename Key, typename Mapped>
void Abstract_map<Key, Mapped>::throw_if_null_key(const Key& key, util::String_view context) const
{
  if (util::is_null_key(key))
  {
    const Error_code err_code(error::Code::S_NULL_KEY);
    ORDO_ERROR_LOG_ERROR(err_code);
    throw ::ordo::error::Runtime_error(err_code, context);
  }
}

template<typename Key, typename Mapped>
bool Abstract_map<Key, Mapped>::null_key_error(const Key& key, Error_code* err_code) const
{
  if (util::is_null_key(key))
  {
    ORDO_ERROR_EMIT_ERROR(error::Code::S_NULL_KEY);
    return true;
  }
  return false;
}

template<typename Key, typename Mapped>
typename Abstract_map<Key, Mapped>::Mapped_opt Abstract_map<Key, Mapped>::get(const Key& key) const
{
  throw_if_null_key(key, "get()");
  const auto entry = get_entry_impl(key);
  return entry ? Mapped_opt(entry->value()) : Mapped_opt();
}

template<typename Key, typename Mapped>
typename Abstract_map<Key, Mapped>::Entry_ptr Abstract_map<Key, Mapped>::get_entry(const Key& key) const
{
  throw_if_null_key(key, "get_entry()");
  return get_entry_impl(key);
}

template<typename Key, typename Mapped>
bool Abstract_map<Key, Mapped>::contains_key(const Key& key) const
{
  return bool(get_entry(key));
}

template<typename Key, typename Mapped>
bool Abstract_map<Key, Mapped>::empty() const
{
  return size() == 0;
}

template<typename Key, typename Mapped>
bool Abstract_map<Key, Mapped>::iterates_in_key_order() const
{
  return true;
}

template<typename Key, typename Mapped>
typename Abstract_map<Key, Mapped>::Iterator_ptr Abstract_map<Key, Mapped>::iterator()
{
  return iterator_impl(false, nullptr);
}

template<typename Key, typename Mapped>
typename Abstract_map<Key, Mapped>::Iterator_ptr Abstract_map<Key, Mapped>::iterator(const Key& from_key)
{
  throw_if_null_key(from_key, "iterator()");
  return iterator_impl(false, &from_key);
}

template<typename Key, typename Mapped>
typename Abstract_map<Key, Mapped>::Iterator_ptr Abstract_map<Key, Mapped>::descending_iterator()
{
  return iterator_impl(true, nullptr);
}

template<typename Key, typename Mapped>
typename Abstract_map<Key, Mapped>::Iterator_ptr
  Abstract_map<Key, Mapped>::descending_iterator(const Key& from_key)
{
  throw_if_null_key(from_key, "descending_iterator()");
  return iterator_impl(true, &from_key);
}

template<typename Key, typename Mapped>
typename Abstract_map<Key, Mapped>::Mapped_opt
  Abstract_map<Key, Mapped>::put(const Key& key, const Mapped& value, Error_code* err_code)
{
  ORDO_ERROR_EXEC_AND_THROW_ON_ERROR(Mapped_opt, put, key, value, _1);
  // else

  Mapped_opt prev;
  put_entry(key, value, &prev, err_code);
  return prev;
}

template<typename Key, typename Mapped>
typename Abstract_map<Key, Mapped>::Entry_ptr
  Abstract_map<Key, Mapped>::put_entry(const Key& key, const Mapped& value, Mapped_opt* prev,
                                       Error_code* err_code)
{
  ORDO_ERROR_EXEC_AND_THROW_ON_ERROR(Entry_ptr, put_entry, key, value, prev, _1);
  // else

  Mapped_opt prev_if_ignored;
  if (!prev)
  {
    prev = &prev_if_ignored;
  }
  prev->reset();
  err_code->clear();

  if (refuse_mutation(err_code) || null_key_error(key, err_code))
  {
    return Entry_ptr();
  }
  // else
  return put_entry_impl(key, value, prev, err_code);
}

template<typename Key, typename Mapped>
typename Abstract_map<Key, Mapped>::Entry_ptr
  Abstract_map<Key, Mapped>::add_entry(const Key& key, const Mapped& value, Error_code* err_code)
{
  ORDO_ERROR_EXEC_AND_THROW_ON_ERROR(Entry_ptr, add_entry, key, value, _1);
  // else

  err_code->clear();
  if (refuse_mutation(err_code) || null_key_error(key, err_code))
  {
    return Entry_ptr();
  }
  // else
  return add_entry_impl(key, value, err_code);
}

template<typename Key, typename Mapped>
typename Abstract_map<Key, Mapped>::Mapped_opt Abstract_map<Key, Mapped>::remove(const Key& key,
                                                                                  Error_code* err_code)
{
  ORDO_ERROR_EXEC_AND_THROW_ON_ERROR(Mapped_opt, remove, key, _1);
  // else

  const auto entry = remove_entry(key, err_code);
  return entry ? Mapped_opt(entry->value()) : Mapped_opt();
}

template<typename Key, typename Mapped>
typename Abstract_map<Key, Mapped>::Entry_ptr Abstract_map<Key, Mapped>::remove_entry(const Key& key,
                                                                                       Error_code* err_code)
{
  ORDO_ERROR_EXEC_AND_THROW_ON_ERROR(Entry_ptr, remove_entry, key, _1);
  // else

  err_code->clear();
  if (refuse_mutation(err_code) || null_key_error(key, err_code))
  {
    return Entry_ptr();
  }
  // else
  return remove_entry_impl(key, err_code);
}

template<typename Key, typename Mapped>
bool Abstract_map<Key, Mapped>::erase(const Entry_ptr& entry, Error_code* err_code)
{
  ORDO_ERROR_EXEC_AND_THROW_ON_ERROR(bool, erase, entry, _1);
  // else

  err_code->clear();
  if (!entry)
  {
    return false;
  }
  // else
  return erase_impl(entry, err_code);
}

template<typename Key, typename Mapped>
void Abstract_map<Key, Mapped>::clear(Error_code* err_code)
{
  ORDO_ERROR_EXEC_VOID_AND_THROW_ON_ERROR(clear, _1);
  // else

  err_code->clear();
  clear_impl(err_code);
}

template<typename Key, typename Mapped>
typename Abstract_map<Key, Mapped>::Mapped_opt
  Abstract_map<Key, Mapped>::update_value(const Entry_ptr& entry, const Mapped& value, Error_code* err_code)
{
  ORDO_ERROR_EXEC_AND_THROW_ON_ERROR(Mapped_opt, update_value, entry, value, _1);
  // else

  err_code->clear();
  if (!entry)
  {
    ORDO_ERROR_EMIT_ERROR(error::Code::S_ENTRY_NOT_IN_MAP);
    return Mapped_opt();
  }
  // else
  return update_value_impl(entry, value, err_code);
}

template<typename Key, typename Mapped>
void Abstract_map<Key, Mapped>::put_all(Abstract_map& other, Error_code* err_code)
{
  ORDO_ERROR_EXEC_VOID_AND_THROW_ON_ERROR(put_all, other, _1);
  // else

  err_code->clear();
  put_all_impl(other, err_code);
}

template<typename Key, typename Mapped>
void Abstract_map<Key, Mapped>::put_all_impl(Abstract_map& other, Error_code* err_code)
{
  assert(&other != this);

  size_t n_put = 0;
  for (auto it = other.iterator(); it->has_next(); )
  {
    const auto entry = it->next();
    put_entry(entry->key(), entry->value(), nullptr, err_code);
    if (*err_code)
    {
      return;
    }
    ++n_put;
  }

  ORDO_LOG_TRACE("Map [" << this << "]: Put [" << n_put << "] entries from map [" << &other << "].");
}

template<typename Key, typename Mapped>
bool Abstract_map<Key, Mapped>::refuse_mutation(Error_code*) const
{
  return false;
}

template<typename Key, typename Mapped>
Abstract_map<Key, Mapped>& Abstract_map<Key, Mapped>::with(const Key& key, const Mapped& value)
{
  put(key, value);
  return *this;
}

template<typename Key, typename Mapped>
typename Abstract_map<Key, Mapped>::Iterator_ptr
  Abstract_map<Key, Mapped>::iterator_of(Abstract_map& map, bool descending, const Key* from_key) // Static.
{
  return map.iterator_impl(descending, from_key);
}

template<typename Key, typename Mapped>
typename Abstract_map<Key, Mapped>::Iterator_ptr
  Abstract_map<Key, Mapped>::make_iterator(typename Sequence_iterator<Key, Mapped>::Source source)
{
  const Ptr self = this->shared_from_this();
  return Iterator_ptr
           (new Sequence_iterator<Key, Mapped>
                  (get_logger(), std::move(source),
                   [self](const Entry_ptr& entry, Error_code* err_code) -> bool
                     { return self->erase(entry, err_code); }));
}

template<typename Key, typename Mapped>
typename Abstract_map<Key, Mapped>::Iterator_ptr Abstract_map<Key, Mapped>::make_iterator(Iterator_ptr delegate_it)
{
  return make_iterator([delegate_it]() -> Entry_ptr
                         { return delegate_it->has_next() ? delegate_it->next() : Entry_ptr(); });
}

} // namespace ordo::map

/* The views derive from Abstract_map, while Abstract_map's view factories create them; so they come after the class
 * definition, and the factory definitions after them.  Forwarding_map, the views' base, comes first. */
#include "ordo/map/view/forwarding_map.hpp"
#include "ordo/map/view/unmodifiable_map.hpp"
#include "ordo/map/view/multi_map.hpp"
#include "ordo/map/view/linked_map.hpp"
#include "ordo/map/view/reversed_map.hpp"
#include "ordo/map/view/sub_map.hpp"
#include "ordo/map/view/shared_map.hpp"
#include "ordo/map/view/atomic_map.hpp"
#include "ordo/map/view/values_equality_map.hpp"
#include "ordo/map/view/key_view.hpp"
#include "ordo/map/view/value_view.hpp"

namespace ordo::map
{

// Template implementations (view factories).

template<typename Key, typename Mapped>
typename Abstract_map<Key, Mapped>::Ptr Abstract_map<Key, Mapped>::unmodifiable()
{
  return Ptr(new Unmodifiable_map<Key, Mapped>(this->shared_from_this()));
}

template<typename Key, typename Mapped>
typename Abstract_map<Key, Mapped>::Ptr Abstract_map<Key, Mapped>::multi()
{
  return Ptr(new Multi_map<Key, Mapped>(this->shared_from_this()));
}

template<typename Key, typename Mapped>
typename Abstract_map<Key, Mapped>::Ptr Abstract_map<Key, Mapped>::linked()
{
  return Ptr(new Linked_map<Key, Mapped>(this->shared_from_this()));
}

template<typename Key, typename Mapped>
typename Abstract_map<Key, Mapped>::Ptr Abstract_map<Key, Mapped>::reversed()
{
  return Ptr(new Reversed_map<Key, Mapped>(this->shared_from_this()));
}

template<typename Key, typename Mapped>
typename Abstract_map<Key, Mapped>::Ptr Abstract_map<Key, Mapped>::shared()
{
  return Ptr(new Shared_map<Key, Mapped>(this->shared_from_this()));
}

template<typename Key, typename Mapped>
typename Abstract_map<Key, Mapped>::Ptr Abstract_map<Key, Mapped>::atomic()
{
  return Ptr(new Atomic_map<Key, Mapped>(this->shared_from_this()));
}

template<typename Key, typename Mapped>
typename Abstract_map<Key, Mapped>::Ptr
  Abstract_map<Key, Mapped>::sub_map(const Key& from_key, bool from_inclusive,
                                     const Key& to_key, bool to_inclusive, Error_code* err_code)
{
  ORDO_ERROR_EXEC_AND_THROW_ON_ERROR(Ptr, sub_map, from_key, from_inclusive, to_key, to_inclusive, _1);
  // else

  err_code->clear();
  if (null_key_error(from_key, err_code) || null_key_error(to_key, err_code))
  {
    return Ptr();
  }
  // else

  if (key_order()->compare(from_key, to_key) > 0)
  {
    ORDO_ERROR_EMIT_ERROR(error::Code::S_INVALID_RANGE);
    return Ptr();
  }
  // else

  using Bound = typename Sub_map<Key, Mapped>::Bound;
  return Ptr(new Sub_map<Key, Mapped>(this->shared_from_this(),
                                      Bound{ from_key, from_inclusive }, Bound{ to_key, to_inclusive }));
}

template<typename Key, typename Mapped>
typename Abstract_map<Key, Mapped>::Ptr Abstract_map<Key, Mapped>::sub_map(const Key& key, Error_code* err_code)
{
  ORDO_ERROR_EXEC_AND_THROW_ON_ERROR(Ptr, sub_map, key, _1);
  // else

  err_code->clear();
  if (null_key_error(key, err_code))
  {
    return Ptr();
  }
  // else
  return Ptr(new Sub_map<Key, Mapped>(this->shared_from_this(), key));
}

template<typename Key, typename Mapped>
typename Abstract_map<Key, Mapped>::Ptr Abstract_map<Key, Mapped>::head_map(const Key& to_key, bool inclusive,
                                                                             Error_code* err_code)
{
  ORDO_ERROR_EXEC_AND_THROW_ON_ERROR(Ptr, head_map, to_key, inclusive, _1);
  // else

  err_code->clear();
  if (null_key_error(to_key, err_code))
  {
    return Ptr();
  }
  // else

  using Bound = typename Sub_map<Key, Mapped>::Bound;
  return Ptr(new Sub_map<Key, Mapped>(this->shared_from_this(),
                                      std::optional<Bound>(), Bound{ to_key, inclusive }));
}

template<typename Key, typename Mapped>
typename Abstract_map<Key, Mapped>::Ptr Abstract_map<Key, Mapped>::tail_map(const Key& from_key, bool inclusive,
                                                                             Error_code* err_code)
{
  ORDO_ERROR_EXEC_AND_THROW_ON_ERROR(Ptr, tail_map, from_key, inclusive, _1);
  // else

  err_code->clear();
  if (null_key_error(from_key, err_code))
  {
    return Ptr();
  }
  // else

  using Bound = typename Sub_map<Key, Mapped>::Bound;
  return Ptr(new Sub_map<Key, Mapped>(this->shared_from_this(),
                                      Bound{ from_key, inclusive }, std::optional<Bound>()));
}

template<typename Key, typename Mapped>
typename Abstract_map<Key, Mapped>::Ptr
  Abstract_map<Key, Mapped>::with_values_equality(Values_equality_ptr values_equality)
{
  return Ptr(new Values_equality_map<Key, Mapped>(this->shared_from_this(), std::move(values_equality)));
}

template<typename Key, typename Mapped>
Key_view<Key, Mapped> Abstract_map<Key, Mapped>::keys()
{
  return Key_view<Key, Mapped>(this->shared_from_this());
}

template<typename Key, typename Mapped>
Value_view<Key, Mapped> Abstract_map<Key, Mapped>::values()
{
  return Value_view<Key, Mapped>(this->shared_from_this());
}

} // namespace ordo::map
