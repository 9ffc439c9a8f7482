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

#include "ordo/util/util_fwd.hpp"
#include <boost/functional/hash.hpp>
#include <cstdint>
#include <functional>

/**
 * Ordo module containing the Order strategy: one object answering three questions about values of a type
 * (are two values equivalent; how do they compare; at what integer index should a value be placed), plus its
 * value-only parent Equality, and built-in implementations.  Maps (ordo::map) are parameterized by an Order over
 * keys and an Equality over values; everything about iteration order and key uniqueness follows from them.
 *
 * Order objects are immutable and stateless from the caller's point of view; they are always held through
 * `Const_ptr` (`boost::shared_ptr<const ...>`) and may be shared freely among maps, views and threads.
 */
namespace ordo::order
{
// Types.

// Find doc headers near the bodies of these compound types.

template<typename T>
class Equality;
template<typename T>
class Standard_equality;

template<typename T>
class Order;
template<typename T, typename Hash = boost::hash<T>>
class Multi_order;
template<typename T, typename Hash = boost::hash<T>, typename Pred = std::equal_to<T>>
class Standard_order;
template<typename T, typename Indexer = util::Function<uint32_t (const T&)>>
class Indexer_order;
template<typename T, typename Less = std::less<T>>
class Lexical_order;
template<typename T>
class Identity_order;

// Free functions.

/**
 * Folds a `size_t` hash value to the unsigned 32-bit range used by Order::index_of(): on 64-bit `size_t` the
 * high and low halves are XORed.
 *
 * @param hash
 *        Hash value.
 * @return See above.
 */
uint32_t fold_hash(size_t hash);

/**
 * Three-way comparison of two unsigned 32-bit indices.
 *
 * @param left
 *        Index.
 * @param right
 *        Index.
 * @return -1, 0 or 1 as `left` is less than, equal to, or greater than `right`.
 */
int compare_indices(uint32_t left, uint32_t right);

} // namespace ordo::order
