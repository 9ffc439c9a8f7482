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

#include "ordo/order/order.hpp"

namespace ordo::order
{

// Types.

/**
 * The "every object distinct" key order: are_equal() is constantly `false`, so a map keyed by it keeps every
 * inserted key as a separate entry even if the keys compare equal by any other measure.  compare() and index_of()
 * come from the value's hash (`Hash`, folded to 32 bits via fold_hash()); compare() returns 0 only when the folded
 * hashes coincide, leaving such collisions to the container.
 *
 * Stateless; exactly one instance per `T`/`Hash` combination exists, obtained via instance().
 *
 * @tparam T
 *         Value type.
 * @tparam Hash
 *         Hash functor type.
 */
template<typename T, typename Hash>
class Multi_order :
  public Order<T>
{
public:
  // Types.

  /// Short-hand for the base pointer type.
  using Const_ptr = typename Order<T>::Const_ptr;

  // Methods.

  /**
   * Returns the process-wide instance.
   * @return See above.
   */
  static const Const_ptr& instance();

  /**
   * Returns `false`.
   * @return See above.
   */
  bool are_equal(const T&, const T&) const override;

  /**
   * Compares the folded hashes, as unsigned.
   *
   * @param left
   *        Value.
   * @param right
   *        Value.
   * @return See Order::compare().
   */
  int compare(const T& left, const T& right) const override;

  /**
   * Returns the folded hash of `value`.
   * @param value
   *        Value.
   * @return See above.
   */
  uint32_t index_of(const T& value) const override;

private:
  // Constructors/destructor.

  /// Use instance().
  Multi_order() = default;
}; // class Multi_order

// Template implementations.

template<typename T, typename Hash>
const typename Multi_order<T, Hash>::Const_ptr& Multi_order<T, Hash>::instance() // Static.
{
  static const Const_ptr s_instance(new Multi_order);
  return s_instance;
}

template<typename T, typename Hash>
bool Multi_order<T, Hash>::are_equal(const T&, const T&) const
{
  return false;
}

template<typename T, typename Hash>
int Multi_order<T, Hash>::compare(const T& left, const T& right) const
{
  return compare_indices(index_of(left), index_of(right));
}

template<typename T, typename Hash>
uint32_t Multi_order<T, Hash>::index_of(const T& value) const
{
  return fold_hash(Hash()(value));
}

} // namespace ordo::order
