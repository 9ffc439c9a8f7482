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

namespace ordo::map
{

// Types.

/**
 * Multimap view of a map: put() and put_entry() do not look for an existing entry with an equal key but always
 * insert a new entry (via the delegate's `add_entry()`), so a key may map to any number of values.  Lookups
 * (`get()`, `get_entry()`, `remove()`) resolve to an arbitrary one of the entries with equal keys; use
 * `sub_map(key)` to see all of them.  Everything else forwards.
 *
 * multi() on `*this` returns `*this`.
 *
 * @tparam Key
 *         Key type.
 * @tparam Mapped
 *         Value type.
 */
template<typename Key, typename Mapped>
class Multi_map :
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

  /// Short-hand for optional value.
  using Mapped_opt = typename Base::Mapped_opt;

  // Constructors/destructor.

  /**
   * Constructs view.
   * @param delegate
   *        The wrapped map.
   */
  explicit Multi_map(Ptr delegate);

  // Methods.

  /**
   * Returns a multimap view over a clone of the delegate.
   * @return See above.
   */
  Ptr clone() const override;

  /**
   * Returns `*this`.
   * @return See above.
   */
  Ptr multi() override;

protected:
  // Methods.

  /**
   * Inserts unconditionally via the delegate's `add_entry()`.
   *
   * @param key
   *        See Abstract_map.
   * @param value
   *        See Abstract_map.
   * @param prev
   *        Left empty.
   * @param err_code
   *        See Abstract_map.
   * @return See Abstract_map.
   */
  Entry_ptr put_entry_impl(const Key& key, const Mapped& value, Mapped_opt* prev, Error_code* err_code) override;
}; // class Multi_map

// Template implementations.

template<typename Key, typename Mapped>
Multi_map<Key, Mapped>::Multi_map(Ptr delegate) :
  Base(std::move(delegate))
{
  // Nothing else.
}

template<typename Key, typename Mapped>
typename Multi_map<Key, Mapped>::Ptr Multi_map<Key, Mapped>::clone() const
{
  return Ptr(new Multi_map(this->delegate()->clone()));
}

template<typename Key, typename Mapped>
typename Multi_map<Key, Mapped>::Ptr Multi_map<Key, Mapped>::multi()
{
  return this->shared_from_this();
}

template<typename Key, typename Mapped>
typename Multi_map<Key, Mapped>::Entry_ptr
  Multi_map<Key, Mapped>::put_entry_impl(const Key& key, const Mapped& value, Mapped_opt*, Error_code* err_code)
{
  return this->delegate()->add_entry(key, value, err_code);
}

} // namespace ordo::map
