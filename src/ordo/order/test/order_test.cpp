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

#include "ordo/order/multi_order.hpp"
#include "ordo/order/standard_order.hpp"
#include "ordo/order/indexer_order.hpp"
#include "ordo/order/lexical_order.hpp"
#include "ordo/order/identity_order.hpp"
#include "ordo/util/util.hpp"
#include <boost/shared_ptr.hpp>
#include <gtest/gtest.h>
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace ordo::order::test
{

namespace
{
using std::string;
using std::vector;

/* Checks the parts of the Order contract that hold for every order but Multi_order, over all pairs of the given
 * values. */
template<typename T>
void check_contract(const Order<T>& order, const vector<T>& values, const string& ctx)
{
  for (const auto& left : values)
  {
    EXPECT_TRUE(order.are_equal(left, left)) << ctx;
    EXPECT_EQ(order.compare(left, left), 0) << ctx;
    for (const auto& right : values)
    {
      const auto result = order.compare(left, right);
      EXPECT_TRUE((result == -1) || (result == 0) || (result == 1)) << ctx;
      EXPECT_EQ(result, -order.compare(right, left)) << ctx;
      EXPECT_EQ(order.are_equal(left, right), order.are_equal(right, left)) << ctx;
      if (order.are_equal(left, right))
      {
        EXPECT_EQ(result, 0) << ctx;
      }
      if (result < 0)
      {
        EXPECT_LE(order.index_of(left), order.index_of(right)) << ctx;
      }
    }
  }
}

} // Anonymous namespace

// Yes... this is very cheesy... but this is a test, so I don't really care.
#define CTX util::ostream_op_string("Caller context [", ORDO_UTIL_WHERE_AM_I_STR(), "].")

TEST(Order, Fold_hash)
{
  EXPECT_EQ(compare_indices(1, 2), -1);
  EXPECT_EQ(compare_indices(2, 1), 1);
  EXPECT_EQ(compare_indices(7, 7), 0);
  // Unsigned: the "negative" half sorts last.
  EXPECT_EQ(compare_indices(0x80000000, 1), 1);

  EXPECT_EQ(fold_hash(5), 5u);
  if constexpr(sizeof(size_t) > sizeof(uint32_t))
  {
    EXPECT_EQ(fold_hash((size_t(1) << 32) | 2), 3u);
    EXPECT_EQ(fold_hash(size_t(0xFFFFFFFF) << 32), 0xFFFFFFFFu);
  }
}

TEST(Order, Standard_order)
{
  const auto& order = *Standard_order<string>::instance();
  EXPECT_EQ(Standard_order<string>::instance().get(), &order); // One instance.

  const vector<string> values{ "", "a", "b", "abc", "hello", "world", "Hello", "hello!" };
  check_contract(order, values, CTX);

  EXPECT_TRUE(order.are_equal(string("x") + "yz", "xyz"));
  EXPECT_FALSE(order.are_equal("xyz", "xy"));
  EXPECT_EQ(order.index_of("xyz"), fold_hash(boost::hash<string>()("xyz")));
  EXPECT_FALSE(order.sub_order("xyz"));

  const auto& eq = *Standard_equality<int>::instance();
  EXPECT_TRUE(eq.are_equal(3, 3));
  EXPECT_FALSE(eq.are_equal(3, 4));
}

TEST(Order, Multi_order)
{
  const auto& order = *Multi_order<string>::instance();
  EXPECT_EQ(Multi_order<string>::instance().get(), &order);

  const vector<string> values{ "", "a", "b", "abc", "hello" };
  for (const auto& left : values)
  {
    // Every object is distinct, even from itself.
    EXPECT_FALSE(order.are_equal(left, left)) << CTX;
    for (const auto& right : values)
    {
      EXPECT_FALSE(order.are_equal(left, right)) << CTX;
      const auto result = order.compare(left, right);
      EXPECT_EQ(result == 0, order.index_of(left) == order.index_of(right)) << CTX;
      EXPECT_EQ(result, compare_indices(order.index_of(left), order.index_of(right))) << CTX;
    }
    EXPECT_EQ(order.index_of(left), fold_hash(boost::hash<string>()(left))) << CTX;
  }
  EXPECT_FALSE(order.sub_order("abc"));
}

TEST(Order, Indexer_order)
{
  // Index by tens: 5 and 7 collide, yet are unequal; the container must disambiguate.
  const auto order_ptr = make_indexer_order<int>([](int value) { return uint32_t(value / 10); });
  const auto& order = *order_ptr;

  EXPECT_EQ(order.index_of(57), 5u);
  EXPECT_EQ(order.compare(5, 7), 0);
  EXPECT_FALSE(order.are_equal(5, 7));
  EXPECT_TRUE(order.are_equal(7, 7));
  EXPECT_EQ(order.compare(5, 15), -1);
  EXPECT_EQ(order.compare(25, 15), 1);
  check_contract(order, vector<int>{ 0, 1, 9, 10, 11, 99, 100 }, CTX);

  // Also directly with a function object type.
  struct By_length
  {
    uint32_t operator()(const string& value) const { return uint32_t(value.size()); }
  };
  const Indexer_order<string, By_length> by_length{ By_length() };
  EXPECT_EQ(by_length.compare("aaa", "b"), 1);
  EXPECT_EQ(by_length.compare("ab", "cd"), 0);
  EXPECT_FALSE(by_length.are_equal("ab", "cd"));
}

TEST(Order, Lexical_order_strings)
{
  const auto& order = *Lexical_order<string>::instance();
  EXPECT_EQ(order.char_offset(), 0u);

  const vector<string> values{ "", "a", "ab", "abc", "abcd", "abcde", "abcdefghij", "abd", "b", "zzzz" };
  check_contract(order, values, CTX);

  EXPECT_EQ(order.compare("apple", "banana"), -1);
  EXPECT_EQ(order.compare("banana", "apple"), 1);
  EXPECT_TRUE(order.are_equal("pear", "pear"));

  // Big-endian, zero-padded: the index agrees with lexical order.
  EXPECT_EQ(order.index_of("abcd"), 0x61626364u);
  EXPECT_EQ(order.index_of("ab"), 0x61620000u);
  EXPECT_EQ(order.index_of(""), 0u);
  EXPECT_EQ(order.index_of("\xff"), 0xff000000u);

  // Next level refines the next 4 characters; the same object each time.
  EXPECT_FALSE(order.sub_order("abcd"));
  const auto sub = order.sub_order("abcdefgh");
  ASSERT_TRUE(sub);
  EXPECT_EQ(sub.get(), order.sub_order("wxyz!").get());
  EXPECT_EQ(sub->index_of("abcdefgh"), 0x65666768u);
  EXPECT_EQ(sub->index_of("abcdef"), 0x65660000u);
  EXPECT_FALSE(sub->sub_order("abcdefgh"));
  EXPECT_TRUE(sub->sub_order("abcdefghi"));

  const Lexical_order<util::String_view> view_order;
  EXPECT_EQ(view_order.index_of("abcd"), 0x61626364u);
  EXPECT_EQ(view_order.compare("a", "b"), -1);
}

TEST(Order, Lexical_order_integers)
{
  const auto& order = *Lexical_order<int>::instance();
  check_contract(order, vector<int>{ std::numeric_limits<int>::min(), -100, -1, 0, 1, 100,
                                     std::numeric_limits<int>::max() }, CTX);
  EXPECT_EQ(order.index_of(std::numeric_limits<int>::min()), 0u);
  EXPECT_EQ(order.index_of(0), 0x80000000u);
  EXPECT_LT(order.index_of(-1), order.index_of(0));
  EXPECT_FALSE(order.sub_order(5));

  const auto& order64 = *Lexical_order<int64_t>::instance();
  EXPECT_EQ(order64.index_of(0), 0x80000000u);
  EXPECT_EQ(order64.index_of(int64_t(1) << 32), 0x80000001u);
  EXPECT_EQ(order64.index_of(1), order64.index_of(2)); // Same high half.
  EXPECT_EQ(order64.compare(1, 2), -1);

  const auto& order_u8 = *Lexical_order<uint8_t>::instance();
  EXPECT_EQ(order_u8.index_of(200), 200u);

  const auto& order_bool = *Lexical_order<bool>::instance();
  EXPECT_EQ(order_bool.index_of(false), 0u);
  EXPECT_EQ(order_bool.index_of(true), 1u);
  EXPECT_EQ(order_bool.compare(false, true), -1);

  // Not string-like, not integral: index 0 for all, order purely via compare().
  const auto& order_dbl = *Lexical_order<double>::instance();
  EXPECT_EQ(order_dbl.index_of(3.5), 0u);
  EXPECT_EQ(order_dbl.compare(3.5, -1.0), 1);
}

TEST(Order, Identity_order)
{
  using Ptr = boost::shared_ptr<string>;
  const auto& order = *Identity_order<Ptr>::instance();

  const Ptr a(new string("same"));
  const Ptr b(new string("same"));
  const Ptr a_copy = a;
  EXPECT_TRUE(order.are_equal(a, a_copy));
  EXPECT_EQ(order.compare(a, a_copy), 0);
  EXPECT_FALSE(order.are_equal(a, b));
  EXPECT_NE(order.compare(a, b), 0);
  EXPECT_EQ(order.compare(a, b), -order.compare(b, a));
  EXPECT_EQ(order.index_of(a), fold_hash(boost::hash<void const *>()(a.get())));
  check_contract(order, vector<Ptr>{ a, b, Ptr(new string("c")) }, CTX);

  int x = 0;
  int y = 0;
  const auto& raw_order = *Identity_order<int*>::instance();
  EXPECT_TRUE(raw_order.are_equal(&x, &x));
  EXPECT_FALSE(raw_order.are_equal(&x, &y));

  const auto std_ptr = std::make_shared<int>(3);
  const auto& std_order = *Identity_order<std::shared_ptr<int>>::instance();
  EXPECT_TRUE(std_order.are_equal(std_ptr, std_ptr));
  EXPECT_FALSE(std_order.are_equal(std_ptr, std::make_shared<int>(3)));
}

} // namespace ordo::order::test
