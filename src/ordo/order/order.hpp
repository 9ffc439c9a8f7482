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

#include "ordo/order/order_fwd.hpp"
#include "ordo/util/util.hpp"
#include <boost/shared_ptr.hpp>

namespace ordo::order
{

// Types.

/**
 * Strategy deciding whether two values of type `T` are equal.  Maps use one over their values
 * (map::Abstract_map::values_equality()); Order refines it for keys.
 *
 * Implementations must be an equivalence relation and must be safe to call concurrently.
 *
 * @tparam T
 *         Value type.
 */
template<typename T>
class Equality :
  public util::Null_interface
{
public:
  // Types.

  /// Short-hand for ref-counted pointer to mutable `*this`.
  using Ptr = boost::shared_ptr<Equality>;

  /// Short-hand for ref-counted pointer to immutable `*this`; the usual way to hold one.
  using Const_ptr = boost::shared_ptr<const Equality>;

  // Methods.

  /**
   * Returns `true` if and only if the two values are equal under this strategy.
   *
   * @param left
   *        Value.
   * @param right
   *        Value.
   * @return See above.
   */
  virtual bool are_equal(const T& left, const T& right) const = 0;
}; // class Equality

/**
 * Equality via `operator==`.  Stateless; use instance().
 *
 * @tparam T
 *         Value type; must have `operator==`.
 */
template<typename T>
class Standard_equality :
  public Equality<T>
{
public:
  // Methods.

  /**
   * Returns the process-wide instance.
   * @return See above.
   */
  static const typename Equality<T>::Const_ptr& instance();

  /**
   * Returns `left == right`.
   * @param left
   *        Value.
   * @param right
   *        Value.
   * @return See above.
   */
  bool are_equal(const T& left, const T& right) const override;

private:
  // Constructors/destructor.

  /// Use instance().
  Standard_equality() = default;
}; // class Standard_equality

/**
 * The central strategy of Ordo: over values of type `T`, an equivalence (are_equal()), a total order consistent
 * with it (compare()), and a placement index (index_of()), plus an optional refinement for values colliding at
 * the same index (sub_order()).
 *
 * ### Contract ###
 *   - are_equal() is an equivalence relation; it need not agree with `T::operator==`.
 *   - compare() returns -1, 0 or 1.  If `are_equal(a, b)` then `compare(a, b) == 0`.  Conversely compare() may
 *     return 0 for unequal values only when their indices coincide ("let the container disambiguate"): hash-based
 *     orders (Standard_order, Multi_order) and Indexer_order do so.
 *   - index_of() is monotone with compare(): `compare(a, b) < 0` implies `index_of(a) <= index_of(b)`.
 *     It need not be injective.
 *   - sub_order() returns an order refining this one at the next structural level, or null at the leaf level.
 *   - All methods are pure functions over non-null values, safe to call concurrently.
 *
 * Multi_order is the one exception to the first two: its are_equal() is constantly `false` ("every object
 * distinct"), so a map keyed by it never merges two keys.
 *
 * @tparam T
 *         Value type.
 */
template<typename T>
class Order :
  public Equality<T>
{
public:
  // Types.

  /// Short-hand for ref-counted pointer to mutable `*this`.
  using Ptr = boost::shared_ptr<Order>;

  /// Short-hand for ref-counted pointer to immutable `*this`; the usual way to hold one.
  using Const_ptr = boost::shared_ptr<const Order>;

  // Methods.

  /**
   * Three-way comparison per the class contract.
   *
   * @param left
   *        Value.
   * @param right
   *        Value.
   * @return -1, 0 or 1.
   */
  virtual int compare(const T& left, const T& right) const = 0;

  /**
   * Placement index per the class contract.
   *
   * @param value
   *        Value.
   * @return See above.
   */
  virtual uint32_t index_of(const T& value) const = 0;

  /**
   * Finer-grained order for values colliding with `value` at this level; null (the default) at the leaf level.
   *
   * @param value
   *        Value.
   * @return See above.
   */
  virtual Const_ptr sub_order(const T& value) const;
}; // class Order

// Template implementations.

template<typename T>
const typename Equality<T>::Const_ptr& Standard_equality<T>::instance() // Static.
{
  static const typename Equality<T>::Const_ptr s_instance(new Standard_equality);
  return s_instance;
}

template<typename T>
bool Standard_equality<T>::are_equal(const T& left, const T& right) const
{
  return left == right;
}

template<typename T>
typename Order<T>::Const_ptr Order<T>::sub_order(const T&) const
{
  return Const_ptr();
}

} // namespace ordo::order
