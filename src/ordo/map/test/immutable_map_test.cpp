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
#include "ordo/map/fast_map.hpp"
#include "ordo/map/error/error.hpp"
#include "ordo/map/test/map_test_util.hpp"
#include "ordo/order/lexical_order.hpp"
#include "ordo/test/test_logger.hpp"
#include "ordo/error/error.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace ordo::map::test
{

namespace
{
using std::string;
using std::vector;
using Test_logger = ordo::test::Test_logger;
using Keys = vector<int>;

boost::shared_ptr<Fast_map<int, string>> make_odd_map(log::Logger* logger_ptr)
{
  const auto map = make_fast_map<int, string>(logger_ptr, order::Lexical_order<int>::instance());
  map->with(5, "5").with(1, "1").with(3, "3").with(9, "9").with(7, "7");
  return map;
}

} // Anonymous namespace

TEST(Immutable_map, Freeze_then_mutate)
{
  Test_logger logger;
  const auto map = make_odd_map(&logger);
  const auto frozen = map->freeze();
  const Abstract_map<int, string>::Ptr frozen_ptr = frozen;

  EXPECT_TRUE(frozen->entries().frozen());
  EXPECT_EQ(frozen->size(), 5u);
  EXPECT_EQ(frozen->key_order(), map->key_order());
  EXPECT_EQ(frozen->values_equality(), map->values_equality());
  EXPECT_EQ(frozen->unmodifiable(), frozen_ptr);
  EXPECT_EQ(frozen->freeze(), frozen);

  // Every mutation of the frozen map fails.
  const auto other = make_odd_map(&logger);
  const Error_code expected(error::Code::S_IMMUTABLE_MAP);
  Error_code err_code;
  EXPECT_FALSE(frozen->put(4, "4", &err_code).has_value());
  EXPECT_EQ(err_code, expected);
  EXPECT_FALSE(frozen->add_entry(4, "4", &err_code));
  EXPECT_EQ(err_code, expected);
  EXPECT_FALSE(frozen->remove(5, &err_code).has_value());
  EXPECT_EQ(err_code, expected);
  EXPECT_FALSE(frozen->erase(frozen->get_entry(5), &err_code));
  EXPECT_EQ(err_code, expected);
  EXPECT_FALSE(frozen->update_value(frozen->get_entry(5), "x", &err_code).has_value());
  EXPECT_EQ(err_code, expected);
  frozen->clear(&err_code);
  EXPECT_EQ(err_code, expected);
  frozen->put_all(*other, &err_code);
  EXPECT_EQ(err_code, expected);
  EXPECT_THROW(frozen->put(4, "4"), ordo::error::Runtime_error);
  EXPECT_THROW(frozen->clear(), ordo::error::Runtime_error);
  {
    const auto it = frozen->iterator();
    it->next();
    it->remove(&err_code);
    EXPECT_EQ(err_code, expected);
  }
  EXPECT_TRUE(err_code == boost::system::errc::make_error_condition(boost::system::errc::operation_not_supported));

  // Neither do the views over it help.
  frozen->multi()->put(5, "x", &err_code);
  EXPECT_EQ(err_code, expected);
  frozen->sub_map(3, true, 7, true)->remove(5, &err_code);
  EXPECT_EQ(err_code, expected);
  frozen->keys().add(4, &err_code);
  EXPECT_EQ(err_code, expected);

  // The source stays mutable and goes its own way.
  map->put(4, "4");
  map->put(5, "five");
  map->remove(1);
  EXPECT_EQ(keys_of(map->iterator()), Keys({ 3, 4, 5, 7, 9 }));
  EXPECT_EQ(keys_of(frozen->iterator()), Keys({ 1, 3, 5, 7, 9 }));
  EXPECT_EQ(keys_of(frozen->descending_iterator(6)), Keys({ 5, 3, 1 }));
  EXPECT_EQ(frozen->get(5), "5");
  EXPECT_EQ(map->get(5), "five");
  map->clear();
  EXPECT_EQ(frozen->size(), 5u);
} // TEST(Immutable_map, Freeze_then_mutate)

TEST(Immutable_map, Entry_handles)
{
  Test_logger logger;
  const auto map = make_odd_map(&logger);
  const auto entry = map->get_entry(3);

  const auto frozen = map->freeze();
  // Before the source's next mutation, the storage (and the entries) are shared.
  EXPECT_EQ(frozen->get_entry(3), entry);

  // The first mutation copies the source's storage; old handles still work on the source.
  map->put(4, "4");
  EXPECT_NE(map->get_entry(3), entry);
  EXPECT_EQ((Entry<int, string>::newest(entry)), map->get_entry(3));
  EXPECT_FALSE(entry->detached());
  EXPECT_EQ(map->update_value(entry, "three"), "3");
  EXPECT_EQ(map->get(3), "three");
  EXPECT_EQ(frozen->get(3), "3");
  EXPECT_EQ(entry->value(), "3");

  EXPECT_TRUE(map->erase(entry));
  EXPECT_FALSE(map->contains_key(3));
  EXPECT_TRUE(frozen->contains_key(3));
  EXPECT_FALSE(map->erase(entry));
} // TEST(Immutable_map, Entry_handles)

TEST(Immutable_map, Iteration_and_clone)
{
  Test_logger logger;
  const auto map = make_odd_map(&logger);

  // An iterator over the source created before freezing is unaffected by the copy.
  const auto it = map->iterator();
  const auto frozen1 = map->freeze();
  // Freezing again without intervening mutation shares the same storage.
  const auto frozen2 = map->freeze();
  map->clear();
  EXPECT_EQ(keys_of(it), Keys({ 1, 3, 5, 7, 9 }));
  EXPECT_EQ(keys_of(frozen1->iterator()), keys_of(frozen2->iterator()));
  EXPECT_TRUE(map->empty());

  const auto copy = frozen1->clone();
  EXPECT_EQ(keys_of(copy->iterator()), Keys({ 1, 3, 5, 7, 9 }));
  Error_code err_code;
  copy->put(2, "2", &err_code);
  EXPECT_EQ(err_code, Error_code(error::Code::S_IMMUTABLE_MAP));

  // Views over a frozen map read as usual.
  EXPECT_EQ(keys_of(frozen1->reversed()->iterator()), Keys({ 9, 7, 5, 3, 1 }));
  EXPECT_EQ(keys_of(frozen1->linked()->iterator()), Keys({ 1, 3, 5, 7, 9 }));
  EXPECT_EQ(frozen1->tail_map(6)->size(), 2u);

  // An empty map freezes fine.
  const auto empty = make_fast_map<int, string>(&logger, order::Lexical_order<int>::instance())->freeze();
  EXPECT_TRUE(empty->empty());
  EXPECT_FALSE(empty->iterator()->has_next());
} // TEST(Immutable_map, Iteration_and_clone)

} // namespace ordo::map::test
