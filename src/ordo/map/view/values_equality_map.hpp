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
#include <utility>

namespace ordo::map
{

// Types.

/**
 * View of a map with a different values equality: values_equality() returns the one given at construction, which
 * in turn governs value comparisons made through the view, notably Value_view::contains() and
 * Value_view::remove().  Everything else forwards.
 *
 * @tparam Key
 *         Key type.
 * @tparam Mapped
 *         Value type.
 */
template<typename Key, typename Mapped>
class Values_equality_map :
  public Forwarding_map<Key, Mapped>
{
public:
  // Types.

  /// Short-hand for our base.
  using Base = Forwarding_map<Key, Mapped>;

  /// Short-hand for ref-counted map pointer.
  using Ptr = typename Base::Ptr;

  /// Short-hand for values equality pointer.
  using Values_equality_ptr = typename Base::Values_equality_ptr;

  // Constructors/destructor.

  /**
   * Constructs view.
   *
   * @param delegate
   *        The wrapped map.
   * @param values_equality
   *        Values equality; must not be null.
   */
  explicit Values_equality_map(Ptr delegate, Values_equality_ptr values_equality);

  // Methods.

  /**
   * Returns a view with the same values equality over a clone of the delegate.
   * @return See above.
   */
  Ptr clone() const override;

  /**
   * Returns the values equality given to ctor.
   * @return See above.
   */
  Values_equality_ptr values_equality() const override;

private:
  // Data.

  /// See ctor.
  const Values_equality_ptr m_values_equality;
}; // class Values_equality_map

// Template implementations.

template<typename Key, typename Mapped>
Values_equality_map<Key, Mapped>::Values_equality_map(Ptr delegate, Values_equality_ptr values_equality) :
  Base(std::move(delegate)),
  m_values_equality(std::move(values_equality))
{
  assert(m_values_equality);
}

template<typename Key, typename Mapped>
typename Values_equality_map<Key, Mapped>::Ptr Values_equality_map<Key, Mapped>::clone() const
{
  return Ptr(new Values_equality_map(this->delegate()->clone(), m_values_equality));
}

template<typename Key, typename Mapped>
typename Values_equality_map<Key, Mapped>::Values_equality_ptr
  Values_equality_map<Key, Mapped>::values_equality() const
{
  return m_values_equality;
}

} // namespace ordo::map
