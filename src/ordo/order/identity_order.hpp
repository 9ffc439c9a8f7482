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
#include <boost/get_pointer.hpp>
#include <functional>

namespace ordo::order
{

// Types.

/**
 * Key order by object identity, for pointer-like `T` (raw pointer, `boost::shared_ptr`, `std::shared_ptr`): two keys
 * are equal iff they point to the same address.  index_of() is the folded hash of the address; compare() orders by
 * index, then by address, so it returns 0 only for the same address.
 *
 * Stateless; one instance per `T` via instance().
 *
 * @tparam T
 *         Pointer-like value type supported by `boost::get_pointer()`.
 */
template<typename T>
class Identity_order :
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
   * Returns `true` iff both point to the same address.
   *
   * @param left
   *        Value.
   * @param right
   *        Value.
   * @return See above.
   */
  bool are_equal(const T& left, const T& right) const override;

  /**
   * Compares by index, then by address.
   *
   * @param left
   *        Value.
   * @param right
   *        Value.
   * @return See Order::compare().
   */
  int compare(const T& left, const T& right) const override;

  /**
   * Returns the folded hash of the address.
   * @param value
   *        Value.
   * @return See above.
   */
  uint32_t index_of(const T& value) const override;

private:
  // Constructors/destructor.

  /// Use instance().
  Identity_order() = default;

  // Methods.

  /**
   * Returns the address `value` points to.
   * @param value
   *        Value.
   * @return See above.
   */
  static void const * address_of(const T& value);
}; // class Identity_order

// Template implementations.

template<typename T>
const typename Identity_order<T>::Const_ptr& Identity_order<T>::instance() // Static.
{
  static const Const_ptr s_instance(new Identity_order);
  return s_instance;
}

template<typename T>
bool Identity_order<T>::are_equal(const T& left, const T& right) const
{
  return address_of(left) == address_of(right);
}

template<typename T>
int Identity_order<T>::compare(const T& left, const T& right) const
{
  const auto result = compare_indices(index_of(left), index_of(right));
  if (result != 0)
  {
    return result;
  }
  // else

  const auto left_addr = address_of(left);
  const auto right_addr = address_of(right);
  if (left_addr == right_addr)
  {
    return 0;
  }
  // else
  return std::less<void const *>()(left_addr, right_addr) ? -1 : 1;
}

template<typename T>
uint32_t Identity_order<T>::index_of(const T& value) const
{
  return fold_hash(boost::hash<void const *>()(address_of(value)));
}

template<typename T>
void const * Identity_order<T>::address_of(const T& value) // Static.
{
  return static_cast<void const *>(boost::get_pointer(value));
}

} // namespace ordo::order
