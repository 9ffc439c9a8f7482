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
#include "ordo/order/identity_order.hpp"
#include "ordo/order/lexical_order.hpp"
#include "ordo/test/test_logger.hpp"
#include "ordo/error/error.hpp"
#include "ordo/util/util.hpp"
#include <boost/thread.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <string>
#include <vector>

namespace ordo::map::test
{

namespace
{
using std::vector;
using Test_logger = ordo::test::Test_logger;
using Map_ptr = Abstract_map<int, int>::Ptr;
using Key_ptr = boost::shared_ptr<int>;
using Key_map_ptr = Abstract_map<Key_ptr, int>::Ptr;

constexpr int S_BATCH_SIZE = 50;
constexpr int S_N_ROUNDS = 200;
constexpr int S_N_READERS = 3;

boost::shared_ptr<Fast_map<int, int>> make_int_map(log::Logger* logger_ptr)
{
  return make_fast_map<int, int>(logger_ptr, order::Lexical_order<int>::instance());
}

/* Runs `reader` in S_N_READERS threads while this thread runs `writer`; the readers loop until the writer is
 * done.  Returns how many times the readers ran in total. */
template<typename Writer, typename Reader>
size_t run_concurrently(const Writer& writer, const Reader& reader)
{
  std::atomic<bool> done(false);
  std::atomic<size_t> n_reads(0);

  vector<util::Thread> readers;
  for (int idx = 0; idx != S_N_READERS; ++idx)
  {
    readers.emplace_back([&]()
    {
      while (!done)
      {
        reader();
        ++n_reads;
      }
    });
  }

  writer();
  done = true;
  for (auto& thread : readers)
  {
    thread.join();
  }
  return n_reads;
} // run_concurrently()

/* Builds `make_safe(base->multi()->linked())` over an identity-keyed base, fills it, and freezes the base; then
 * readers check the insertion order while this thread keeps adding through the view. */
template<typename Make_safe>
void check_linked_multimap(const Make_safe& make_safe)
{
  constexpr int S_N_INITIAL = 200;

  Test_logger logger;
  const auto base = make_fast_map<Key_ptr, int>(&logger, order::Identity_order<Key_ptr>::instance());
  const Key_map_ptr view = make_safe(base->multi()->linked());

  // Many keys share a pointee; identity tells them apart.
  vector<Key_ptr> keys;
  for (int idx = 0; idx != S_N_INITIAL + S_N_ROUNDS; ++idx)
  {
    keys.emplace_back(new int(idx % 10));
  }
  for (int idx = 0; idx != S_N_INITIAL; ++idx)
  {
    view->put(keys[idx], idx);
  }

  // The next write through the view copies the base's storage; the chain must follow its entries.
  const auto frozen = base->freeze();

  std::atomic<bool> torn(false);
  run_concurrently([&]()
  {
    for (int idx = S_N_INITIAL; idx != int(keys.size()); ++idx)
    {
      view->put(keys[idx], idx);
    }
  },
                   [&]()
  {
    int idx = 0;
    for (auto it = view->iterator(); it->has_next(); ++idx)
    {
      const auto entry = it->next();
      if ((idx >= int(keys.size())) || (entry->key() != keys[idx]) || (entry->value() != idx))
      {
        torn = true;
      }
    }
    if (idx < S_N_INITIAL)
    {
      torn = true;
    }
  });

  EXPECT_FALSE(torn.load());
  EXPECT_EQ(view->size(), keys.size());
  EXPECT_EQ(keys_of(view->iterator()), keys);

  // The frozen base saw none of it.
  EXPECT_EQ(frozen->size(), size_t(S_N_INITIAL));
  EXPECT_EQ(frozen->get(keys.front()), 0);
  EXPECT_FALSE(frozen->contains_key(keys.back()));

  // A multimap: the same key again is another entry, chained last.
  view->put(keys.front(), -1);
  EXPECT_EQ(view->size(), keys.size() + 1);
  const auto newest_first = view->descending_iterator();
  EXPECT_EQ(newest_first->next()->value(), -1);
  EXPECT_EQ(newest_first->next()->key(), keys.back());
} // check_linked_multimap()

} // Anonymous namespace

TEST(Shared_map, Put_all_is_exclusive)
{
  Test_logger logger;
  const auto map = make_int_map(&logger)->shared();
  EXPECT_EQ(map->shared(), map);
  EXPECT_EQ(map->atomic(), map);

  /* Each round adds a batch of fresh keys at once; so readers must always see a whole number of batches, and keys
   * in order. */
  std::atomic<bool> torn(false);
  const auto n_reads = run_concurrently([&]()
  {
    for (int round = 0; round != S_N_ROUNDS; ++round)
    {
      const auto batch = make_int_map(&logger);
      for (int idx = 0; idx != S_BATCH_SIZE; ++idx)
      {
        batch->put((round * S_BATCH_SIZE) + idx, round);
      }
      map->put_all(*batch);
    }
  },
                                        [&]()
  {
    const auto keys = keys_of(map->iterator());
    if ((keys.size() % S_BATCH_SIZE) != 0)
    {
      torn = true;
    }
    for (size_t idx = 0; idx != keys.size(); ++idx)
    {
      if (keys[idx] != int(idx))
      {
        torn = true;
      }
    }
    if ((map->size() % S_BATCH_SIZE) != 0)
    {
      torn = true;
    }
  });

  EXPECT_FALSE(torn.load());
  EXPECT_GT(n_reads, 0u);
  EXPECT_EQ(map->size(), size_t(S_BATCH_SIZE * S_N_ROUNDS));
} // TEST(Shared_map, Put_all_is_exclusive)

TEST(Shared_map, Mutations_from_many_threads)
{
  Test_logger logger;
  const auto map = make_int_map(&logger)->shared();

  vector<util::Thread> writers;
  for (int thread_idx = 0; thread_idx != 4; ++thread_idx)
  {
    writers.emplace_back([&, thread_idx]()
    {
      for (int idx = 0; idx != 500; ++idx)
      {
        const int key = (idx * 4) + thread_idx;
        map->put(key, key);
        if ((key % 3) == 0)
        {
          map->remove(key);
        }
      }
    });
  }
  for (auto& thread : writers)
  {
    thread.join();
  }

  EXPECT_EQ(map->size(), size_t(2000 - 667));
  for (auto it = map->iterator(); it->has_next(); )
  {
    const auto entry = it->next();
    EXPECT_NE(entry->key() % 3, 0);
    EXPECT_EQ(entry->value(), entry->key());
  }

  // Iterator removal through the view.
  const auto it = map->iterator();
  it->next();
  it->remove();
  EXPECT_FALSE(map->contains_key(1));

  // A clone is an independent Shared_map.
  const auto copy = map->clone();
  copy->clear();
  EXPECT_TRUE(copy->empty());
  EXPECT_FALSE(map->empty());
} // TEST(Shared_map, Mutations_from_many_threads)

TEST(Shared_map, Linked_multimap)
{
  check_linked_multimap([](const Key_map_ptr& map) { return map->shared(); });
}

TEST(Atomic_map, Put_all_is_atomic)
{
  Test_logger logger;
  const auto map = make_int_map(&logger)->atomic();
  EXPECT_EQ(map->atomic(), map);
  EXPECT_EQ(map->shared(), map);

  /* Each round overwrites the same keys with the round number; readers must never see a mix of rounds, nor a
   * partial first round. */
  std::atomic<bool> torn(false);
  const auto n_reads = run_concurrently([&]()
  {
    for (int round = 0; round != S_N_ROUNDS; ++round)
    {
      const auto batch = make_int_map(&logger);
      for (int idx = 0; idx != S_BATCH_SIZE; ++idx)
      {
        batch->put(idx, round);
      }
      map->put_all(*batch);
    }
  },
                                        [&]()
  {
    const auto values = values_of(map->iterator());
    if ((!values.empty()) && (values.size() != size_t(S_BATCH_SIZE)))
    {
      torn = true;
    }
    for (const auto value : values)
    {
      if (value != values.front())
      {
        torn = true;
      }
    }
  });

  EXPECT_FALSE(torn.load());
  EXPECT_GT(n_reads, 0u);
  EXPECT_EQ(map->size(), size_t(S_BATCH_SIZE));
  EXPECT_EQ(map->get(0), S_N_ROUNDS - 1);
} // TEST(Atomic_map, Put_all_is_atomic)

TEST(Atomic_map, Failed_put_all_changes_nothing)
{
  Test_logger logger;
  const auto base = make_int_map(&logger);
  base->put(3, 3);
  const auto map = base->head_map(10)->atomic();

  const auto batch = make_int_map(&logger);
  batch->with(1, 1).with(2, 2).with(50, 50);

  Error_code err_code;
  map->put_all(*batch, &err_code);
  EXPECT_EQ(err_code, Error_code(error::Code::S_KEY_OUT_OF_RANGE));
  EXPECT_EQ(map->size(), 1u);
  EXPECT_EQ(keys_of(map->iterator()), vector<int>({ 3 }));
  EXPECT_EQ(base->size(), 1u);
  EXPECT_THROW(map->put_all(*batch), ordo::error::Runtime_error);
  EXPECT_FALSE(map->contains_key(1));

  // Without the offending entry the batch goes in whole.
  batch->remove(50);
  map->put_all(*batch, &err_code);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(keys_of(map->iterator()), vector<int>({ 1, 2, 3 }));
  EXPECT_EQ(base->size(), 3u);
} // TEST(Atomic_map, Failed_put_all_changes_nothing)

TEST(Atomic_map, Linked_multimap)
{
  check_linked_multimap([](const Key_map_ptr& map) { return map->atomic(); });
}

TEST(Atomic_map, Snapshots)
{
  Test_logger logger;
  const auto delegate = make_int_map(&logger);
  delegate->with(1, 10).with(2, 20).with(3, 30);
  const auto map = delegate->atomic();

  // An iterator walks the snapshot current at its creation.
  const auto it = map->iterator();
  map->put(4, 40);
  map->remove(1);
  EXPECT_EQ(keys_of(it), vector<int>({ 1, 2, 3 }));
  EXPECT_EQ(keys_of(map->iterator()), vector<int>({ 2, 3, 4 }));
  EXPECT_EQ(keys_of(map->descending_iterator(3)), vector<int>({ 3, 2 }));

  // Entries read from a snapshot act on the delegate's entries.
  const auto entry = map->get_entry(2);
  EXPECT_EQ(map->update_value(entry, 21), 20);
  EXPECT_EQ(map->get(2), 21);
  EXPECT_EQ(entry->value(), 20);
  // That write published a new snapshot: the entry is now stale.
  EXPECT_FALSE(map->erase(entry));
  EXPECT_TRUE(map->contains_key(2));
  EXPECT_TRUE(map->erase(map->get_entry(2)));
  EXPECT_FALSE(map->contains_key(2));
  EXPECT_FALSE(delegate->contains_key(2));

  // Even through a stale iterator.
  const auto stale = map->iterator();
  map->put(5, 50);
  EXPECT_EQ(stale->next()->key(), 3);
  stale->remove();
  EXPECT_EQ(keys_of(map->iterator()), vector<int>({ 4, 5 }));

  // A clone is an independent Atomic_map.
  const auto copy = map->clone();
  copy->put(6, 60);
  EXPECT_FALSE(map->contains_key(6));
  EXPECT_EQ(copy->size(), 3u);

  map->clear();
  EXPECT_TRUE(map->empty());
  EXPECT_TRUE(delegate->empty());
} // TEST(Atomic_map, Snapshots)

} // namespace ordo::map::test
