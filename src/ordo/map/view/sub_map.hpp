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
#include <optional>
#include <vector>

namespace ordo::map
{

// Types.

/**
 * View of the part of a map whose keys fall within a range under the key order's Order::compare(): above an optional
 * lower bound and below an optional upper bound, each inclusive or exclusive.  A special form (created by
 * `sub_map(key)`) restricts to keys Order::are_equal() to one key; over a multimap this is the set of all values for
 * that key.  Entries outside the range are invisible: lookups of such keys find nothing, size() counts only entries
 * in range, and iteration skips the rest.  Mutations naming a key outside the range (including removal and
 * `erase()` or `update_value()` of an outside entry) fail with error::Code::S_KEY_OUT_OF_RANGE.  clear() removes
 * just the entries in range.
 *
 * Create one via Abstract_map::sub_map(), Abstract_map::head_map(), Abstract_map::tail_map().
 *
 * ### Performance ###
 * Over a delegate iterating in key order, iteration starts at the lower bound (upper, if descending) and stops past
 * the other; otherwise the delegate's full iteration is filtered.  size() iterates.
 *
 * @tparam Key
 *         Key type.
 * @tparam Mapped
 *         Value type.
 */
template<typename Key, typename Mapped>
class Sub_map :
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

  /// One end of the range.
  struct Bound
  {
    /// The bounding key.
    Key m_key;
    /// Whether keys comparing equal to #m_key are in range.
    bool m_inclusive;
  };

  // Constructors/destructor.

  /**
   * Constructs range view.  The caller ensures the lower bound does not compare greater than the upper one.
   *
   * @param delegate
   *        The wrapped map.
   * @param lower
   *        Lower bound; none means unbounded below.
   * @param upper
   *        Upper bound; none means unbounded above.
   */
  explicit Sub_map(Ptr delegate, std::optional<Bound> lower, std::optional<Bound> upper);

  /**
   * Constructs single-key view.
   *
   * @param delegate
   *        The wrapped map.
   * @param key
   *        The key.
   */
  explicit Sub_map(Ptr delegate, const Key& key);

  // Methods.

  /**
   * Number of entries in range.
   * @return See above.
   */
  size_t size() const override;

  /**
   * Whether there are no entries in range.
   * @return See above.
   */
  bool empty() const override;

  /**
   * Returns the same range over a clone of the delegate.
   * @return See above.
   */
  Ptr clone() const override;

  /**
   * Whether `key` is within the range.
   *
   * @param key
   *        Key.
   * @return See above.
   */
  bool in_range(const Key& key) const;

  using Base::get_logger;
  using Base::get_log_component;

protected:
  // Methods.

  /**
   * Looks up in the delegate if `key` is in range.
   * @param key
   *        See Abstract_map.
   * @return See Abstract_map.
   */
  Entry_ptr get_entry_impl(const Key& key) const override;

  /**
   * Forwards if `key` is in range; else fails.
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
   * Forwards if `key` is in range; else fails.
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
   * Forwards if `key` is in range; else fails.
   *
   * @param key
   *        See Abstract_map.
   * @param err_code
   *        See Abstract_map.
   * @return See Abstract_map.
   */
  Entry_ptr remove_entry_impl(const Key& key, Error_code* err_code) override;

  /**
   * Forwards if the entry's key is in range; else fails.
   *
   * @param entry
   *        See Abstract_map.
   * @param err_code
   *        See Abstract_map.
   * @return See Abstract_map.
   */
  bool erase_impl(const Entry_ptr& entry, Error_code* err_code) override;

  /**
   * Erases each entry in range from the delegate.
   * @param err_code
   *        See Abstract_map.
   */
  void clear_impl(Error_code* err_code) override;

  /**
   * Forwards if the entry's key is in range; else fails.
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
   * Iterates the entries in range; see class doc header.
   * @param descending
   *        See Abstract_map.
   * @param from_key
   *        See Abstract_map.
   * @return See Abstract_map.
   */
  Iterator_ptr iterator_impl(bool descending, const Key* from_key) override;

private:
  // Types.

  /// Short-hand for the entry source type.
  using Source = typename Sequence_iterator<Key, Mapped>::Source;

  // Methods.

  /**
   * Whether `key` is below the lower bound.
   * @param key
   *        Key.
   * @return See above.
   */
  bool below(const Key& key) const;

  /**
   * Whether `key` is above the upper bound.
   * @param key
   *        Key.
   * @return See above.
   */
  bool above(const Key& key) const;

  /**
   * Emits error::Code::S_KEY_OUT_OF_RANGE unless `key` is in range.
   *
   * @param key
   *        Key.
   * @param err_code
   *        Non-null.
   * @return `true` if the error was emitted.
   */
  bool out_of_range_error(const Key& key, Error_code* err_code) const;

  /**
   * Returns function yielding the entries in range, in the given direction, from the given key.
   *
   * @param descending
   *        See iterator_impl().
   * @param from_key
   *        See iterator_impl().
   * @return See above.
   */
  Source make_source(bool descending, const Key* from_key) const;

  // Data.

  /// Lower bound; none if unbounded.
  const std::optional<Bound> m_lower;

  /// Upper bound; none if unbounded.
  const std::optional<Bound> m_upper;

  /// If `true`, both bounds are the same inclusive key, and keys must also be equal to it.
  const bool m_single_key;
}; // class Sub_map

// Template implementations.

template<typename Key, typename Mapped>
Sub_map<Key, Mapped>::Sub_map(Ptr delegate, std::optional<Bound> lower, std::optional<Bound> upper) :
  Base(std::move(delegate)),
  m_lower(std::move(lower)),
  m_upper(std::move(upper)),
  m_single_key(false)
{
  // Nothing else.
}

template<typename Key, typename Mapped>
Sub_map<Key, Mapped>::Sub_map(Ptr delegate, const Key& key) :
  Base(std::move(delegate)),
  m_lower(Bound{ key, true }),
  m_upper(Bound{ key, true }),
  m_single_key(true)
{
  // Nothing else.
}

template<typename Key, typename Mapped>
bool Sub_map<Key, Mapped>::below(const Key& key) const
{
  if (!m_lower)
  {
    return false;
  }
  // else
  const auto result = this->key_order()->compare(key, m_lower->m_key);
  return (result < 0) || ((result == 0) && (!m_lower->m_inclusive));
}

template<typename Key, typename Mapped>
bool Sub_map<Key, Mapped>::above(const Key& key) const
{
  if (!m_upper)
  {
    return false;
  }
  // else
  const auto result = this->key_order()->compare(key, m_upper->m_key);
  return (result > 0) || ((result == 0) && (!m_upper->m_inclusive));
}

template<typename Key, typename Mapped>
bool Sub_map<Key, Mapped>::in_range(const Key& key) const
{
  return (!below(key)) && (!above(key))
         && ((!m_single_key) || this->key_order()->are_equal(key, m_lower->m_key));
}

template<typename Key, typename Mapped>
bool Sub_map<Key, Mapped>::out_of_range_error(const Key& key, Error_code* err_code) const
{
  if (in_range(key))
  {
    return false;
  }
  // else
  ORDO_ERROR_EMIT_ERROR(error::Code::S_KEY_OUT_OF_RANGE);
  return true;
}

template<typename Key, typename Mapped>
typename Sub_map<Key, Mapped>::Source Sub_map<Key, Mapped>::make_source(bool descending, const Key* from_key) const
{
  const auto& delegate = this->delegate();
  const bool ordered = delegate->iterates_in_key_order();

  // Over a key-ordered delegate start at the nearer of from_key and our bound on that side.
  const Key* start_key = from_key;
  if (ordered)
  {
    const auto& bound = descending ? m_upper : m_lower;
    if (bound
        && ((!start_key)
            || (this->key_order()->compare(*start_key, bound->m_key) == (descending ? 1 : -1))))
    {
      start_key = &bound->m_key;
    }
  }

  const auto it = Abstract_map<Key, Mapped>::iterator_of(*delegate, descending, start_key);
  return [this, it, ordered, descending]() -> Entry_ptr
  {
    while (it->has_next())
    {
      auto entry = it->next();
      const auto& key = entry->key();
      if (in_range(key))
      {
        return entry;
      }
      // else
      if (ordered && (descending ? below(key) : above(key)))
      {
        break;
      }
    }
    return Entry_ptr();
  };
} // Sub_map::make_source()

template<typename Key, typename Mapped>
size_t Sub_map<Key, Mapped>::size() const
{
  const auto source = make_source(false, nullptr);
  size_t count = 0;
  while (source())
  {
    ++count;
  }
  return count;
}

template<typename Key, typename Mapped>
bool Sub_map<Key, Mapped>::empty() const
{
  return !make_source(false, nullptr)();
}

template<typename Key, typename Mapped>
typename Sub_map<Key, Mapped>::Ptr Sub_map<Key, Mapped>::clone() const
{
  if (m_single_key)
  {
    return Ptr(new Sub_map(this->delegate()->clone(), m_lower->m_key));
  }
  return Ptr(new Sub_map(this->delegate()->clone(), m_lower, m_upper));
}

template<typename Key, typename Mapped>
typename Sub_map<Key, Mapped>::Entry_ptr Sub_map<Key, Mapped>::get_entry_impl(const Key& key) const
{
  return in_range(key) ? this->delegate()->get_entry(key) : Entry_ptr();
}

template<typename Key, typename Mapped>
typename Sub_map<Key, Mapped>::Entry_ptr
  Sub_map<Key, Mapped>::put_entry_impl(const Key& key, const Mapped& value, Mapped_opt* prev, Error_code* err_code)
{
  if (out_of_range_error(key, err_code))
  {
    return Entry_ptr();
  }
  return this->delegate()->put_entry(key, value, prev, err_code);
}

template<typename Key, typename Mapped>
typename Sub_map<Key, Mapped>::Entry_ptr
  Sub_map<Key, Mapped>::add_entry_impl(const Key& key, const Mapped& value, Error_code* err_code)
{
  if (out_of_range_error(key, err_code))
  {
    return Entry_ptr();
  }
  return this->delegate()->add_entry(key, value, err_code);
}

template<typename Key, typename Mapped>
typename Sub_map<Key, Mapped>::Entry_ptr Sub_map<Key, Mapped>::remove_entry_impl(const Key& key,
                                                                                 Error_code* err_code)
{
  if (out_of_range_error(key, err_code))
  {
    return Entry_ptr();
  }
  return this->delegate()->remove_entry(key, err_code);
}

template<typename Key, typename Mapped>
bool Sub_map<Key, Mapped>::erase_impl(const Entry_ptr& entry, Error_code* err_code)
{
  if (out_of_range_error(entry->key(), err_code))
  {
    return false;
  }
  return this->delegate()->erase(entry, err_code);
}

template<typename Key, typename Mapped>
void Sub_map<Key, Mapped>::clear_impl(Error_code* err_code)
{
  std::vector<Entry_ptr> doomed;
  const auto source = make_source(false, nullptr);
  for (auto entry = source(); entry; entry = source())
  {
    doomed.push_back(entry);
  }

  ORDO_LOG_TRACE("Sub_map [" << this << "]: Clearing [" << doomed.size() << "] entries in range.");
  for (const auto& entry : doomed)
  {
    this->delegate()->erase(entry, err_code);
    if (*err_code)
    {
      return;
    }
  }
}

template<typename Key, typename Mapped>
typename Sub_map<Key, Mapped>::Mapped_opt
  Sub_map<Key, Mapped>::update_value_impl(const Entry_ptr& entry, const Mapped& value, Error_code* err_code)
{
  if (out_of_range_error(entry->key(), err_code))
  {
    return Mapped_opt();
  }
  return this->delegate()->update_value(entry, value, err_code);
}

template<typename Key, typename Mapped>
typename Sub_map<Key, Mapped>::Iterator_ptr Sub_map<Key, Mapped>::iterator_impl(bool descending,
                                                                                const Key* from_key)
{
  return this->make_iterator(make_source(descending, from_key));
}

} // namespace ordo::map
