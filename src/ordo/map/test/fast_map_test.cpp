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
#include "ordo/order/multi_order.hpp"
#include "ordo/order/identity_order.hpp"
#include "ordo/test/test_logger.hpp"
#include "ordo/error/error.hpp"
#include "ordo/util/util.hpp"
#include <boost/shared_ptr.hpp>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

namespace ordo::map::test
{

namespace
{
using std::string;
using std::vector;
using Test_logger = ordo::test::Test_logger;

/* Keys 5, 1, 3, 9, 7 inserted in that order, each mapped to its decimal representation, in a map ordered by
 * integer value. */
boost::shared_ptr<Fast_map<int, string>> make_odd_map(log::Logger* logger_ptr)
{
  const auto map = make_fast_map<int, string>(logger_ptr, order::Lexical_order<int>::instance());
  map->with(5, "5").with(1, "1").with(3, "3").with(9, "9").with(7, "7");
  return map;
}

} // Anonymous namespace

// Yes... this is very cheesy... but this is a test, so I don't really care.
#define CTX util::ostream_op_string("Caller context [", ORDO_UTIL_WHERE_AM_I_STR(), "].")

TEST(Fast_map, Standard_semantics)
{
  Test_logger logger;
  const auto map = make_fast_map<string, int>(&logger);

  EXPECT_TRUE(map->empty());
  EXPECT_FALSE(map->put("a", 1).has_value());
  EXPECT_EQ(map->put("a", 2), 1);
  EXPECT_EQ(map->size(), 1u);
  EXPECT_EQ(map->get("a"), 2);
  EXPECT_FALSE(map->get("b").has_value());
  EXPECT_TRUE(map->contains_key("a"));
  EXPECT_FALSE(map->contains_key("b"));

  // Replacing a value keeps the entry.
  const auto entry = map->put_entry("a", 3);
  std::optional<int> prev;
  EXPECT_EQ(map->put_entry("a", 4, &prev), entry);
  EXPECT_EQ(prev, 3);
  EXPECT_EQ(entry->value(), 4);
  EXPECT_EQ(map->get_entry("a"), entry);
  EXPECT_FALSE(entry->detached());

  // A new key: prev is reset to absent.
  map->put_entry("b", 5, &prev);
  EXPECT_FALSE(prev.has_value());
  EXPECT_EQ(map->size(), 2u);

  EXPECT_EQ(map->remove("a"), 4);
  EXPECT_TRUE(entry->detached());
  EXPECT_FALSE(map->remove("a").has_value());
  EXPECT_FALSE(map->erase(entry));
  EXPECT_FALSE(map->erase(nullptr));
  EXPECT_EQ(map->size(), 1u);

  // Same key, fresh entry.
  EXPECT_NE(map->put_entry("a", 6), entry);

  map->clear();
  EXPECT_TRUE(map->empty());
  EXPECT_FALSE(map->get("b").has_value());
} // TEST(Fast_map, Standard_semantics)

TEST(Fast_map, Key_order_iteration)
{
  using Keys = vector<int>;

  Test_logger logger;
  const auto map = make_odd_map(&logger);

  EXPECT_TRUE(map->iterates_in_key_order());
  EXPECT_EQ(keys_of(map->iterator()), Keys({ 1, 3, 5, 7, 9 }));
  EXPECT_EQ(keys_of(map->descending_iterator()), Keys({ 9, 7, 5, 3, 1 }));
  EXPECT_EQ(values_of(map->iterator()), vector<string>({ "1", "3", "5", "7", "9" }));

  // From an absent key: the next one in the direction of iteration.
  EXPECT_EQ(keys_of(map->iterator(4)), Keys({ 5, 7, 9 }));
  EXPECT_EQ(keys_of(map->descending_iterator(6)), Keys({ 5, 3, 1 }));
  // From a present key: that key first.
  EXPECT_EQ(keys_of(map->iterator(5)), Keys({ 5, 7, 9 }));
  EXPECT_EQ(keys_of(map->descending_iterator(5)), Keys({ 5, 3, 1 }));
  // Past either end.
  EXPECT_TRUE(keys_of(map->iterator(10)).empty());
  EXPECT_TRUE(keys_of(map->descending_iterator(0)).empty());
  EXPECT_EQ(keys_of(map->iterator(-5)), Keys({ 1, 3, 5, 7, 9 }));

  // Iterators over an empty map.
  const auto empty_map = make_fast_map<int, string>(&logger, order::Lexical_order<int>::instance());
  EXPECT_FALSE(empty_map->iterator()->has_next());
  EXPECT_FALSE(empty_map->descending_iterator()->has_next());
  EXPECT_FALSE(empty_map->iterator(3)->has_next());
} // TEST(Fast_map, Key_order_iteration)

TEST(Fast_map, Iterator_remove)
{
  Test_logger logger;
  const auto map = make_odd_map(&logger);

  {
    // Nothing yielded yet: nothing to remove.
    const auto it = map->iterator();
    Error_code err_code;
    it->remove(&err_code);
    EXPECT_EQ(err_code, Error_code(error::Code::S_ENTRY_NOT_IN_MAP));
    EXPECT_EQ(map->size(), 5u);
  }

  const auto it = map->iterator();
  while (it->has_next())
  {
    const auto entry = it->next();
    if ((entry->key() == 3) || (entry->key() == 7))
    {
      it->remove();
      EXPECT_TRUE(entry->detached()) << CTX;
      // Twice in a row: the entry is already gone.
      EXPECT_THROW(it->remove(), ordo::error::Runtime_error) << CTX;
    }
  }
  EXPECT_EQ(keys_of(map->iterator()), vector<int>({ 1, 5, 9 }));

  // Removal through the map after an iterator yielded the entry.
  const auto it2 = map->iterator();
  const auto first = it2->next();
  EXPECT_TRUE(map->erase(first));
  Error_code err_code;
  it2->remove(&err_code);
  EXPECT_EQ(err_code, Error_code(error::Code::S_ENTRY_NOT_IN_MAP));
  EXPECT_EQ(keys_of(it2), vector<int>({ 5, 9 }));
} // TEST(Fast_map, Iterator_remove)

TEST(Fast_map, Clone_and_put_all)
{
  Test_logger logger;
  const auto map = make_odd_map(&logger);

  const auto copy = map->clone();
  EXPECT_EQ(copy->key_order(), map->key_order());
  EXPECT_EQ(copy->values_equality(), map->values_equality());
  EXPECT_EQ(keys_of(copy->iterator()), keys_of(map->iterator()));
  EXPECT_NE(copy->get_entry(5), map->get_entry(5));

  copy->put(5, "five");
  map->remove(3);
  EXPECT_EQ(map->get(5), "5");
  EXPECT_EQ(copy->get(3), "3");
  EXPECT_EQ(copy->size(), 5u);
  EXPECT_EQ(map->size(), 4u);

  // put_all() replaces values of equal keys and adds the rest.
  const auto other = make_fast_map<int, string>(&logger, order::Lexical_order<int>::instance());
  other->with(1, "one").with(2, "two");
  map->put_all(*other);
  EXPECT_EQ(keys_of(map->iterator()), vector<int>({ 1, 2, 5, 7, 9 }));
  EXPECT_EQ(map->get(1), "one");
  EXPECT_EQ(other->size(), 2u);
} // TEST(Fast_map, Clone_and_put_all)

TEST(Fast_map, Multi_order_keys)
{
  Test_logger logger;
  const auto map = make_fast_map<string, int>(&logger, order::Multi_order<string>::instance());

  // No two keys are ever equal: each put() adds an entry, and lookups find nothing.
  EXPECT_FALSE(map->put("a", 1).has_value());
  EXPECT_FALSE(map->put("a", 2).has_value());
  EXPECT_EQ(map->size(), 2u);
  EXPECT_FALSE(map->get("a").has_value());
  EXPECT_FALSE(map->remove("a").has_value());
  EXPECT_EQ(map->size(), 2u);

  // Equal keys stay in insertion order.
  EXPECT_EQ(values_of(map->iterator()), vector<int>({ 1, 2 }));
  EXPECT_EQ(values_of(map->descending_iterator()), vector<int>({ 2, 1 }));

  // Entries remain removable by handle.
  const auto it = map->iterator();
  it->next();
  it->remove();
  EXPECT_EQ(values_of(map->iterator()), vector<int>({ 2 }));
} // TEST(Fast_map, Multi_order_keys)

TEST(Fast_map, Indexed_collisions)
{
  Test_logger logger;
  const auto map = make_indexed_map<string, int>(&logger, [](const string& key) -> uint32_t
                                                            { return uint32_t(key.size()); });

  map->with("bb", 1).with("a", 2).with("cc", 3).with("aa", 4).with("ddd", 5);
  EXPECT_EQ(map->size(), 5u);

  // By index (length); colliding keys in insertion order.
  EXPECT_EQ(keys_of(map->iterator()), vector<string>({ "a", "bb", "cc", "aa", "ddd" }));
  EXPECT_EQ(keys_of(map->descending_iterator()), vector<string>({ "ddd", "aa", "cc", "bb", "a" }));

  // Colliding keys are still told apart.
  EXPECT_EQ(map->get("cc"), 3);
  EXPECT_EQ(map->put("cc", 30), 3);
  EXPECT_EQ(map->size(), 5u);
  EXPECT_FALSE(map->get("zz").has_value());
  EXPECT_EQ(map->remove("bb"), 1);
  EXPECT_EQ(keys_of(map->iterator()), vector<string>({ "a", "cc", "aa", "ddd" }));

  // A re-added key goes last among its collisions.
  map->put("bb", 6);
  EXPECT_EQ(keys_of(map->iterator()), vector<string>({ "a", "cc", "aa", "bb", "ddd" }));
} // TEST(Fast_map, Indexed_collisions)

TEST(Fast_map, Update_value)
{
  Test_logger logger;
  const auto map = make_odd_map(&logger);

  const auto entry = map->get_entry(3);
  ASSERT_TRUE(entry);
  EXPECT_EQ(map->update_value(entry, "three"), "3");
  EXPECT_EQ(map->get(3), "three");
  EXPECT_EQ(entry->value(), "three");

  map->remove(3);
  Error_code err_code;
  EXPECT_FALSE(map->update_value(entry, "x", &err_code).has_value());
  EXPECT_EQ(err_code, Error_code(error::Code::S_ENTRY_NOT_IN_MAP));
  EXPECT_THROW(map->update_value(entry, "x"), ordo::error::Runtime_error);
  EXPECT_THROW(map->update_value(nullptr, "x"), ordo::error::Runtime_error);

  // An entry of another map does not belong to this one.
  const auto copy = map->clone();
  EXPECT_FALSE(map->update_value(copy->get_entry(5), "x", &err_code).has_value());
  EXPECT_EQ(err_code, Error_code(error::Code::S_ENTRY_NOT_IN_MAP));
  EXPECT_FALSE(map->erase(copy->get_entry(5)));
  EXPECT_EQ(map->get(5), "5");
} // TEST(Fast_map, Update_value)

TEST(Fast_map, Null_keys)
{
  using Key = boost::shared_ptr<int>;

  Test_logger logger;
  const auto map = make_fast_map<Key, int>(&logger, order::Identity_order<Key>::instance());

  // Identity: equal pointees, distinct keys.
  const Key key1(new int(1));
  const Key key2(new int(1));
  map->put(key1, 1);
  map->put(key2, 2);
  EXPECT_EQ(map->size(), 2u);
  EXPECT_EQ(map->get(key1), 1);
  EXPECT_EQ(map->get(key2), 2);

  Error_code err_code;
  EXPECT_FALSE(map->put(Key(), 3, &err_code).has_value());
  EXPECT_EQ(err_code, Error_code(error::Code::S_NULL_KEY));
  EXPECT_FALSE(map->add_entry(Key(), 3, &err_code));
  EXPECT_EQ(err_code, Error_code(error::Code::S_NULL_KEY));
  EXPECT_FALSE(map->remove(Key(), &err_code).has_value());
  EXPECT_EQ(err_code, Error_code(error::Code::S_NULL_KEY));
  EXPECT_EQ(map->size(), 2u);

  EXPECT_THROW(map->put(Key(), 3), ordo::error::Runtime_error);
  EXPECT_THROW(map->get(Key()), ordo::error::Runtime_error);
  EXPECT_THROW(map->contains_key(Key()), ordo::error::Runtime_error);
  EXPECT_THROW(map->iterator(Key()), ordo::error::Runtime_error);
  try
  {
    map->get(Key());
  }
  catch (const ordo::error::Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), Error_code(error::Code::S_NULL_KEY));
  }
} // TEST(Fast_map, Null_keys)

TEST(Fast_map, Errors_logged)
{
  std::ostringstream os;
  std::ostringstream os_for_err;
  Test_logger logger(log::Sev::S_WARNING, os, os_for_err);
  const auto map = make_odd_map(&logger);

  const auto entry = map->remove_entry(1);
  EXPECT_TRUE(os_for_err.str().empty());

  Error_code err_code;
  map->update_value(entry, "x", &err_code);
  EXPECT_TRUE(err_code);
  EXPECT_NE(os_for_err.str().find("Error code emitted"), string::npos);
  EXPECT_NE(os_for_err.str().find("WARNING"), string::npos);
  EXPECT_NE(os_for_err.str().find("ORDO-MAP"), string::npos);
  EXPECT_TRUE(os.str().empty());
} // TEST(Fast_map, Errors_logged)

TEST(Map_error, Codes)
{
  using boost::system::errc::make_error_condition;
  namespace errc = boost::system::errc;

  const Error_code immutable(error::Code::S_IMMUTABLE_MAP);
  EXPECT_STREQ(immutable.category().name(), "ordo_map");
  EXPECT_FALSE(immutable.message().empty());
  EXPECT_TRUE(immutable == make_error_condition(errc::operation_not_supported));
  EXPECT_TRUE(Error_code(error::Code::S_UNMODIFIABLE_VIEW) == make_error_condition(errc::operation_not_supported));
  EXPECT_TRUE(Error_code(error::Code::S_KEY_OUT_OF_RANGE) == make_error_condition(errc::operation_not_supported));
  EXPECT_TRUE(Error_code(error::Code::S_NULL_KEY) == make_error_condition(errc::invalid_argument));
  EXPECT_TRUE(Error_code(error::Code::S_INVALID_RANGE) == make_error_condition(errc::invalid_argument));
  EXPECT_TRUE(Error_code(error::Code::S_ENTRY_NOT_IN_MAP) == make_error_condition(errc::invalid_argument));
  EXPECT_FALSE(Error_code(error::Code::S_NULL_KEY) == make_error_condition(errc::operation_not_supported));

  // Distinct codes, distinct messages.
  EXPECT_NE(Error_code(error::Code::S_NULL_KEY).message(), immutable.message());
} // TEST(Map_error, Codes)

} // namespace ordo::map::test
