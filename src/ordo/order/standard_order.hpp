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
 * The default key order: arbitrary but stable iteration order given by the keys' hashes, with key equality via
 * `Pred` (by default `operator==`).  compare() and index_of() behave as in Multi_order; so two equal keys (which
 * hash alike) always compare 0, and two unequal keys whose folded hashes collide compare 0 as well, the container
 * telling them apart via are_equal().
 *
 * Stateless; one instance per template instantiation, via instance().
 *
 * @tparam T
 *         Value type.
 * @tparam Hash
 *         Hash functor type consistent with `Pred`.
 * @tparam Pred
 *         Equality predicate type.
 */
template<typename T, typename Hash, typename Pred>
class Standard_order :
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
   * Returns `Pred()(left, right)`.
   *
   * @param left
   *        Value.
   * @param right
   *        Value.
   * @return See above.
   */
  bool are_equal(const T& left, const T& right) const override;

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
  Standard_order() = default;
}; // class Standard_order

// Template implementations.

template<typename T, typename Hash, typename Pred>
const typename Standard_order<T, Hash, Pred>::Const_ptr& Standard_order<T, Hash, Pred>::instance() // Static.
{
  static const Const_ptr s_instance(new Standard_order);
  return s_instance;
}

template<typename T, typename Hash, typename Pred>
bool Standard_order<T, Hash, Pred>::are_equal(const T& left, const T& right) const
{
  return Pred()(left, right);
}

template<typename T, typename Hash, typename Pred>
int Standard_order<T, Hash, Pred>::compare(const T& left, const T& right) const
{
  return compare_indices(index_of(left), index_of(right));
}

template<typename T, typename Hash, typename Pred>
uint32_t Standard_order<T, Hash, Pred>::index_of(const T& value) const
{
  return fold_hash(Hash()(value));
}

} // namespace ordo::order
