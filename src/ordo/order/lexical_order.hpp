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
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>

namespace ordo::order
{

// Types.

/**
 * Total key order by `Less` (by default `operator<`); are_equal() holds when neither value is less than the other.
 * Unlike the hash-based orders, compare() returns 0 exactly when are_equal() holds.
 *
 * index_of() gives a placement index agreeing with the lexical order (as long as `Less` is the default):
 *   - `std::string` / `std::string_view`: the 4 bytes starting at this order's character offset (0 for instance()),
 *     as an unsigned big-endian number; bytes past the end count as 0.  sub_order() then yields the order at
 *     offset + 4, created on first use and cached; it is null when the value has no bytes beyond this level.
 *   - integral types: the value biased so that unsigned comparison agrees with signed comparison; for types wider
 *     than 32 bits, the high 32 bits thereof.
 *   - anything else: 0.
 *
 * @tparam T
 *         Value type.
 * @tparam Less
 *         Strict weak ordering functor type.
 */
template<typename T, typename Less>
class Lexical_order :
  public Order<T>
{
public:
  // Types.

  /// Short-hand for the base pointer type.
  using Const_ptr = typename Order<T>::Const_ptr;

  // Constructors/destructor.

  /**
   * Constructs the order at the given character offset; see class doc header.  Typically use instance() instead.
   *
   * @param char_offset
   *        Offset of the first byte examined by index_of() for string-like `T`; ignored otherwise.
   */
  explicit Lexical_order(size_t char_offset = 0);

  // Methods.

  /**
   * Returns the process-wide instance at offset 0.
   * @return See above.
   */
  static const Const_ptr& instance();

  /**
   * Returns `true` iff neither value is less than the other.
   *
   * @param left
   *        Value.
   * @param right
   *        Value.
   * @return See above.
   */
  bool are_equal(const T& left, const T& right) const override;

  /**
   * Compares via `Less`.
   *
   * @param left
   *        Value.
   * @param right
   *        Value.
   * @return See Order::compare().
   */
  int compare(const T& left, const T& right) const override;

  /**
   * See class doc header.
   * @param value
   *        Value.
   * @return See above.
   */
  uint32_t index_of(const T& value) const override;

  /**
   * See class doc header.
   * @param value
   *        Value.
   * @return See above.
   */
  Const_ptr sub_order(const T& value) const override;

  /**
   * Returns the character offset given to ctor.
   * @return See above.
   */
  size_t char_offset() const;

private:
  // Constants.

  /// `true` if `T` is string-like, which enables the byte-packing index and sub-orders.
  static constexpr bool S_STRING_LIKE = std::is_same_v<T, std::string> || std::is_same_v<T, std::string_view>;

  // Data.

  /// See ctor.
  const size_t m_char_offset;

  /// Guards the one-time creation of #m_sub_order.
  mutable std::once_flag m_sub_order_once;

  /// The order at `m_char_offset + 4`; null until first needed.
  mutable Const_ptr m_sub_order;
}; // class Lexical_order

// Template implementations.

template<typename T, typename Less>
Lexical_order<T, Less>::Lexical_order(size_t char_offset) :
  m_char_offset(char_offset)
{
  // Nothing else.
}

template<typename T, typename Less>
const typename Lexical_order<T, Less>::Const_ptr& Lexical_order<T, Less>::instance() // Static.
{
  static const Const_ptr s_instance(new Lexical_order);
  return s_instance;
}

template<typename T, typename Less>
bool Lexical_order<T, Less>::are_equal(const T& left, const T& right) const
{
  return (!Less()(left, right)) && (!Less()(right, left));
}

template<typename T, typename Less>
int Lexical_order<T, Less>::compare(const T& left, const T& right) const
{
  if (Less()(left, right))
  {
    return -1;
  }
  // else
  return Less()(right, left) ? 1 : 0;
}

template<typename T, typename Less>
uint32_t Lexical_order<T, Less>::index_of(const T& value) const
{
  if constexpr(S_STRING_LIKE)
  {
    uint32_t idx = 0;
    for (size_t pos = m_char_offset; pos != m_char_offset + 4; ++pos)
    {
      idx <<= 8;
      if (pos < value.size())
      {
        idx |= uint32_t(static_cast<unsigned char>(value[pos]));
      }
    }
    return idx;
  }
  else if constexpr(std::is_same_v<T, bool>)
  {
    return value ? 1 : 0;
  }
  else if constexpr(std::is_integral_v<T>)
  {
    using Unsigned = std::make_unsigned_t<T>;
    constexpr size_t N_BITS = sizeof(T) * 8;

    Unsigned biased = Unsigned(value);
    if constexpr(std::is_signed_v<T>)
    {
      biased ^= Unsigned(Unsigned(1) << (N_BITS - 1));
    }
    if constexpr(N_BITS > 32)
    {
      return uint32_t(biased >> (N_BITS - 32));
    }
    else
    {
      return uint32_t(biased);
    }
  }
  else
  {
    return 0;
  }
} // Lexical_order::index_of()

template<typename T, typename Less>
typename Lexical_order<T, Less>::Const_ptr Lexical_order<T, Less>::sub_order(const T& value) const
{
  if constexpr(S_STRING_LIKE)
  {
    if (value.size() <= m_char_offset + 4)
    {
      return Const_ptr();
    }
    // else
    std::call_once(m_sub_order_once, [&]()
    {
      m_sub_order.reset(new Lexical_order(m_char_offset + 4));
    });
    return m_sub_order;
  }
  else
  {
    return Const_ptr();
  }
}

template<typename T, typename Less>
size_t Lexical_order<T, Less>::char_offset() const
{
  return m_char_offset;
}

} // namespace ordo::order
