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

#include "ordo/common.hpp"
#include "ordo/util/util_fwd.hpp"
#include "ordo/log/log_fwd.hpp"
#include "ordo/order/order_fwd.hpp"
#include <boost/shared_ptr.hpp>
#include <cstddef>

/**
 * Ordo module containing the maps: the key/value Entry record, the Entry_table container storing entries in key
 * order, the Abstract_map interface, its core implementation Fast_map, its frozen counterpart Immutable_map, and the
 * views layered over any Abstract_map by composition: Unmodifiable_map, Multi_map, Linked_map, Reversed_map,
 * Sub_map, Shared_map, Atomic_map, Values_equality_map, and the Key_view and Value_view projections.
 *
 * Everything about ordering and key uniqueness is given by the map's key order (ordo::order::Order) and values
 * equality (ordo::order::Equality).  Maps are always owned through `Abstract_map::Ptr`; create one with
 * make_fast_map() or make_indexed_map(), then derive views from it via the Abstract_map view factories
 * (`unmodifiable()`, `multi()`, and so on).
 *
 * ### Error reporting ###
 * Mutating operations take a trailing `Error_code* err_code = nullptr` and follow the ordo::error convention;
 * the codes are in ordo::map::error::Code.
 *
 * ### Thread safety ###
 * None, except through a Shared_map or Atomic_map view; see those.
 */
namespace ordo::map
{

// Types.

// Find doc headers near the bodies of these compound types.

template<typename Key, typename Mapped>
class Entry;
template<typename Key, typename Mapped>
class Entry_iterator;
template<typename Key, typename Mapped>
class Entry_table;
template<typename Key, typename Mapped>
class Abstract_map;
template<typename Key, typename Mapped>
class Fast_map;
template<typename Key, typename Mapped>
class Immutable_map;
template<typename Key, typename Mapped>
class Unmodifiable_map;
template<typename Key, typename Mapped>
class Multi_map;
template<typename Key, typename Mapped>
class Linked_map;
template<typename Key, typename Mapped>
class Reversed_map;
template<typename Key, typename Mapped>
class Sub_map;
template<typename Key, typename Mapped>
class Shared_map;
template<typename Key, typename Mapped>
class Atomic_map;
template<typename Key, typename Mapped>
class Values_equality_map;
template<typename Key, typename Mapped>
class Key_view;
template<typename Key, typename Mapped>
class Value_view;

// Free functions.

/**
 * Creates an empty Fast_map with the default policies: Standard_order over keys (hash-based order, `operator==`
 * equality) and Standard_equality over values.
 *
 * @tparam Key
 *         Key type.
 * @tparam Mapped
 *         Value type.
 * @param logger_ptr
 *        Logger to use for subsequently logging; null disables logging.
 * @return See above.
 */
template<typename Key, typename Mapped>
boost::shared_ptr<Fast_map<Key, Mapped>> make_fast_map(log::Logger* logger_ptr);

/**
 * Creates an empty Fast_map with the given key order and Standard_equality over values.
 *
 * @tparam Key
 *         Key type.
 * @tparam Mapped
 *         Value type.
 * @param logger_ptr
 *        Logger to use for subsequently logging; null disables logging.
 * @param key_order
 *        Key order; must not be null.
 * @return See above.
 */
template<typename Key, typename Mapped>
boost::shared_ptr<Fast_map<Key, Mapped>>
  make_fast_map(log::Logger* logger_ptr, const boost::shared_ptr<const order::Order<Key>>& key_order);

/**
 * Creates an empty Fast_map with the given policies.
 *
 * @tparam Key
 *         Key type.
 * @tparam Mapped
 *         Value type.
 * @param logger_ptr
 *        Logger to use for subsequently logging; null disables logging.
 * @param key_order
 *        Key order; must not be null.
 * @param values_equality
 *        Values equality; must not be null.
 * @return See above.
 */
template<typename Key, typename Mapped>
boost::shared_ptr<Fast_map<Key, Mapped>>
  make_fast_map(log::Logger* logger_ptr, const boost::shared_ptr<const order::Order<Key>>& key_order,
                const boost::shared_ptr<const order::Equality<Mapped>>& values_equality);

/**
 * Creates an empty Fast_map whose key order is an order::Indexer_order over the given indexing function.
 *
 * @tparam Key
 *         Key type.
 * @tparam Mapped
 *         Value type.
 * @tparam Indexer
 *         Callable type, signature `uint32_t (const Key&)`.
 * @param logger_ptr
 *        Logger to use for subsequently logging; null disables logging.
 * @param indexer
 *        See order::Indexer_order.
 * @return See above.
 */
template<typename Key, typename Mapped, typename Indexer>
boost::shared_ptr<Fast_map<Key, Mapped>> make_indexed_map(log::Logger* logger_ptr, Indexer indexer);

} // namespace ordo::map
