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
 * View of a map iterating in the opposite direction: iterator() is the delegate's descending_iterator() and vice
 * versa, including the forms with a starting key.  Everything else forwards.
 *
 * reversed() on `*this` returns the delegate.
 *
 * @tparam Key
 *         Key type.
 * @tparam Mapped
 *         Value type.
 */
template<typename Key, typename Mapped>
class Reversed_map :
  public Forwarding_map<Key, Mapped>
{
public:
  // Types.

  /// Short-hand for our base.
  using Base = Forwarding_map<Key, Mapped>;

  /// Short-hand for ref-counted map pointer.
  using Ptr = typename Base::Ptr;

  /// Short-hand for ref-counted iterator pointer.
  using Iterator_ptr = typename Base::Iterator_ptr;

  // Constructors/destructor.

  /**
   * Constructs view.
   * @param delegate
   *        The wrapped map.
   */
  explicit Reversed_map(Ptr delegate);

  // Methods.

  /**
   * Returns a reversed view over a clone of the delegate.
   * @return See above.
   */
  Ptr clone() const override;

  /**
   * Returns the delegate.
   * @return See above.
   */
  Ptr reversed() override;

  /**
   * Returns `false`.
   * @return See above.
   */
  bool iterates_in_key_order() const override;

protected:
  // Methods.

  /**
   * Returns the delegate's iterator in the other direction.
   * @param descending
   *        See Abstract_map.
   * @param from_key
   *        See Abstract_map.
   * @return See Abstract_map.
   */
  Iterator_ptr iterator_impl(bool descending, const Key* from_key) override;
}; // class Reversed_map

// Template implementations.

template<typename Key, typename Mapped>
Reversed_map<Key, Mapped>::Reversed_map(Ptr delegate) :
  Base(std::move(delegate))
{
  // Nothing else.
}

template<typename Key, typename Mapped>
typename Reversed_map<Key, Mapped>::Ptr Reversed_map<Key, Mapped>::clone() const
{
  return Ptr(new Reversed_map(this->delegate()->clone()));
}

template<typename Key, typename Mapped>
typename Reversed_map<Key, Mapped>::Ptr Reversed_map<Key, Mapped>::reversed()
{
  return this->delegate();
}

template<typename Key, typename Mapped>
bool Reversed_map<Key, Mapped>::iterates_in_key_order() const
{
  return false;
}

template<typename Key, typename Mapped>
typename Reversed_map<Key, Mapped>::Iterator_ptr
  Reversed_map<Key, Mapped>::iterator_impl(bool descending, const Key* from_key)
{
  return Abstract_map<Key, Mapped>::iterator_of(*(this->delegate()), !descending, from_key);
}

} // namespace ordo::map
