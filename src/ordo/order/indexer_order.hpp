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
#include <utility>

namespace ordo::order
{

// Types.

/**
 * Key order built around a caller-supplied indexing function mapping each key to a `uint32_t`.  Keys are ordered by
 * unsigned comparison of their indices; keys with equal indices compare 0 and are told apart by are_equal(), which
 * is `operator==`.  The caller guarantees that `operator==`-equal keys get equal indices.
 *
 * The indexer is stored once at construction and never replaced; the object is immutable afterwards.
 *
 * @tparam T
 *         Value type.
 * @tparam Indexer
 *         Callable type, signature `uint32_t (const T&)`.
 */
template<typename T, typename Indexer>
class Indexer_order :
  public Order<T>
{
public:
  // Types.

  /// Short-hand for the base pointer type.
  using Const_ptr = typename Order<T>::Const_ptr;

  // Constructors/destructor.

  /**
   * Constructs the order.
   *
   * @param indexer
   *        The indexing function.  Must be safe to call concurrently.
   */
  explicit Indexer_order(Indexer indexer);

  // Methods.

  /**
   * Returns `left == right`.
   *
   * @param left
   *        Value.
   * @param right
   *        Value.
   * @return See above.
   */
  bool are_equal(const T& left, const T& right) const override;

  /**
   * Compares the two indices, as unsigned.
   *
   * @param left
   *        Value.
   * @param right
   *        Value.
   * @return See Order::compare().
   */
  int compare(const T& left, const T& right) const override;

  /**
   * Returns the indexer's result for `value`.
   * @param value
   *        Value.
   * @return See above.
   */
  uint32_t index_of(const T& value) const override;

private:
  // Data.

  /// See ctor.
  const Indexer m_indexer;
}; // class Indexer_order

// Free functions.

/**
 * Creates an Indexer_order over the given function, type-erased to the base pointer.
 *
 * @tparam T
 *         Value type.
 * @tparam Indexer
 *         See Indexer_order.
 * @param indexer
 *        See Indexer_order ctor.
 * @return See above.
 */
template<typename T, typename Indexer>
typename Order<T>::Const_ptr make_indexer_order(Indexer indexer);

// Template implementations.

template<typename T, typename Indexer>
Indexer_order<T, Indexer>::Indexer_order(Indexer indexer) :
  m_indexer(std::move(indexer))
{
  // Nothing else.
}

template<typename T, typename Indexer>
bool Indexer_order<T, Indexer>::are_equal(const T& left, const T& right) const
{
  return left == right;
}

template<typename T, typename Indexer>
int Indexer_order<T, Indexer>::compare(const T& left, const T& right) const
{
  return compare_indices(index_of(left), index_of(right));
}

template<typename T, typename Indexer>
uint32_t Indexer_order<T, Indexer>::index_of(const T& value) const
{
  return uint32_t(m_indexer(value));
}

template<typename T, typename Indexer>
typename Order<T>::Const_ptr make_indexer_order(Indexer indexer)
{
  return typename Order<T>::Const_ptr(new Indexer_order<T, Indexer>(std::move(indexer)));
}

} // namespace ordo::order
