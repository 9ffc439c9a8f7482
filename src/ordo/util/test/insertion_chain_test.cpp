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

#include "ordo/util/insertion_chain.hpp"
#include "ordo/util/util.hpp"
#include <boost/make_shared.hpp>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace ordo::util::test
{

namespace
{
using std::string;
using std::vector;
using Chain = Insertion_chain<string>;
using Ptr = Chain::Ptr;

vector<string> contents(const Chain& chain, bool newest_first = false)
{
  vector<string> result;
  for (const auto& weak : chain.snapshot(newest_first))
  {
    const auto obj = weak.lock();
    if (obj)
    {
      result.push_back(*obj);
    }
  }
  return result;
}

} // Anonymous namespace

// Yes... this is very cheesy... but this is a test, so I don't really care.
#define CTX ostream_op_string("Caller context [", ORDO_UTIL_WHERE_AM_I_STR(), "].")

TEST(Insertion_chain, Interface)
{
  Chain chain;
  EXPECT_EQ(chain.size(), 0u);

  const Ptr a = boost::make_shared<string>("a");
  const Ptr b = boost::make_shared<string>("b");
  const Ptr c = boost::make_shared<string>("c");
  const Ptr a_twin = boost::make_shared<string>("a"); // Equal value, different object.

  EXPECT_TRUE(chain.push_back(b));
  EXPECT_TRUE(chain.push_back(a));
  EXPECT_TRUE(chain.push_back(c));
  EXPECT_FALSE(chain.push_back(a)) << "Already chained: no-op.";
  EXPECT_EQ(chain.size(), 3u);
  EXPECT_EQ(contents(chain), (vector<string>{ "b", "a", "c" })) << CTX;
  EXPECT_EQ(contents(chain, true), (vector<string>{ "c", "a", "b" })) << CTX;

  EXPECT_TRUE(chain.contains(a));
  EXPECT_FALSE(chain.contains(a_twin)) << "Identity, not value, matters.";
  EXPECT_FALSE(chain.contains(Ptr()));

  EXPECT_TRUE(chain.erase(a));
  EXPECT_FALSE(chain.erase(a));
  EXPECT_FALSE(chain.erase(Ptr()));
  EXPECT_FALSE(chain.contains(a));
  EXPECT_EQ(contents(chain), (vector<string>{ "b", "c" })) << CTX;

  // Re-adding goes to the end.
  EXPECT_TRUE(chain.push_back(a));
  EXPECT_EQ(contents(chain), (vector<string>{ "b", "c", "a" })) << CTX;

  // Copies are independent.
  Chain copy(chain);
  EXPECT_TRUE(copy.erase(b));
  EXPECT_EQ(contents(copy), (vector<string>{ "c", "a" })) << CTX;
  EXPECT_EQ(contents(chain), (vector<string>{ "b", "c", "a" })) << CTX;
  copy = chain;
  EXPECT_TRUE(copy.contains(b));
  EXPECT_TRUE(copy.erase(c));
  EXPECT_TRUE(chain.contains(c));

  chain.clear();
  EXPECT_EQ(chain.size(), 0u);
  EXPECT_FALSE(chain.contains(b));
  EXPECT_TRUE(contents(chain).empty());
} // TEST(Insertion_chain, Interface)

TEST(Insertion_chain, Expiry_and_prune)
{
  Chain chain;
  const Ptr a = boost::make_shared<string>("a");
  const Ptr c = boost::make_shared<string>("c");
  {
    const Ptr b = boost::make_shared<string>("b");
    chain.push_back(a);
    chain.push_back(b);
    chain.push_back(c);
  }
  // The chain never owns: b is gone, and is skipped, but its node remains until pruned.
  EXPECT_EQ(contents(chain), (vector<string>{ "a", "c" })) << CTX;
  EXPECT_EQ(chain.size(), 3u);

  // Replace a by a successor in place; keep c.
  const Ptr a2 = boost::make_shared<string>("a2");
  chain.prune([&](const Ptr& obj) -> Ptr { return (obj == a) ? a2 : obj; });
  EXPECT_EQ(chain.size(), 2u);
  EXPECT_EQ(contents(chain), (vector<string>{ "a2", "c" })) << CTX;
  EXPECT_TRUE(chain.contains(a2));
  EXPECT_FALSE(chain.contains(a));

  // A replacement already chained elsewhere drops the node instead.
  chain.prune([&](const Ptr& obj) -> Ptr { return (obj == c) ? a2 : obj; });
  EXPECT_EQ(contents(chain), (vector<string>{ "a2" })) << CTX;

  // Null means drop.
  chain.prune([](const Ptr&) { return Ptr(); });
  EXPECT_EQ(chain.size(), 0u);
} // TEST(Insertion_chain, Expiry_and_prune)

} // namespace ordo::util::test
