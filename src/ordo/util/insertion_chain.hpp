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

#include "ordo/util/util.hpp"
#include <boost/shared_ptr.hpp>
#include <boost/weak_ptr.hpp>
#include <boost/unordered_map.hpp>
#include <algorithm>
#include <iterator>
#include <list>
#include <vector>

namespace ordo::util
{

/**
 * An insertion-ordered sequence of non-owning (weak) references to objects owned elsewhere, with hash-indexed
 * lookup of a given object by identity.  The structure is that of a linked hash map: a doubly linked list
 * holding the sequence, plus a hash map from each object's address to its list node.
 *
 * Objects are never kept alive by `*this`.  An object whose last owner goes away simply becomes an expired node,
 * which is skipped by snapshot() and physically removed by prune().  An address recycled by the allocator is
 * detected (the node's reference is expired or points elsewhere) and treated as absent.
 *
 * ### Thread safety ###
 * Same as for `std::list`: none beyond concurrent `const` access.
 *
 * @tparam Value
 *         Type of referred-to object.  Referred to via `boost::shared_ptr<Value>`.
 */
template<typename Value>
class Insertion_chain
{
public:
  // Types.

  /// Short-hand for owning reference to a chained object.
  using Ptr = boost::shared_ptr<Value>;

  /// Short-hand for the non-owning reference actually stored.
  using Weak_ptr = boost::weak_ptr<Value>;

  /**
   * Function that, given a live chained object, returns what should replace it in the chain: itself (keep), another
   * object (replace in place, keeping the position), or null (drop).
   */
  using Resolver = Function<Ptr (const Ptr&)>;

  // Constructors/destructor.

  /// Constructs empty chain.
  Insertion_chain() = default;

  /**
   * Constructs a copy referring to the same objects in the same order.
   * @param src
   *        Source.
   */
  Insertion_chain(const Insertion_chain& src);

  // Methods.

  /**
   * Copy-assigns.
   * @param src
   *        Source.
   * @return `*this`.
   */
  Insertion_chain& operator=(const Insertion_chain& src);

  /**
   * Appends `obj` to the end of the chain, unless it is already chained, in which case its position is unchanged.
   *
   * @param obj
   *        Object; must not be null.
   * @return `true` if appended; `false` if already present.
   */
  bool push_back(const Ptr& obj);

  /**
   * Returns `true` if and only if `obj` is chained (and live).
   *
   * @param obj
   *        Object.
   * @return See above.
   */
  bool contains(const Ptr& obj) const;

  /**
   * Unchains `obj`, if it is chained.
   *
   * @param obj
   *        Object.
   * @return `true` if it was removed; `false` if it was not chained.
   */
  bool erase(const Ptr& obj);

  /**
   * Walks the chain in order, removing expired nodes, and passing each live object to `resolver`, acting on the
   * result as documented for #Resolver.  A replacement already chained elsewhere causes the current node to be dropped.
   *
   * @param resolver
   *        See #Resolver.
   */
  void prune(const Resolver& resolver);

  /**
   * Returns the live objects in chain order (or reverse chain order), as weak references.
   *
   * @param newest_first
   *        If `true`, the most recently appended object comes first.
   * @return See above.
   */
  std::vector<Weak_ptr> snapshot(bool newest_first) const;

  /**
   * Number of nodes, including any expired ones not yet prune()d.
   * @return See above.
   */
  size_t size() const;

  /// Makes it so that `size() == 0`.
  void clear();

private:
  // Types.

  /// One chain link: the reference plus the address it was made from (which outlives the referred-to object).
  struct Node
  {
    /// The reference.
    Weak_ptr m_obj;
    /// `m_obj.lock().get()` at the time the node was made.
    Value const * m_addr;
  };

  /// Short-hand for the node sequence.
  using Node_list = std::list<Node>;

  /// Short-hand for node-list iterator.
  using Node_iter = typename Node_list::iterator;

  /// Short-hand for the identity index.
  using Node_index = boost::unordered_map<Value const *, Node_iter>;

  // Methods.

  /**
   * Returns iterator into #m_index for `obj` if and only if that node is live and refers to `obj`.
   * @param obj
   *        Object.
   * @return See above; `m_index.end()` if not found.
   */
  typename Node_index::const_iterator find_live(const Ptr& obj) const;

  /// Rebuilds #m_index from #m_nodes.
  void reindex();

  // Data.

  /// The sequence, oldest first.
  Node_list m_nodes;

  /// Object address to node.
  Node_index m_index;
}; // class Insertion_chain

// Template implementations.

template<typename Value>
Insertion_chain<Value>::Insertion_chain(const Insertion_chain& src) :
  m_nodes(src.m_nodes)
{
  // m_index holds iterators into src.m_nodes; must be rebuilt against our own nodes.
  reindex();
}

template<typename Value>
Insertion_chain<Value>& Insertion_chain<Value>::operator=(const Insertion_chain& src)
{
  if (&src != this)
  {
    m_nodes = src.m_nodes;
    reindex();
  }
  return *this;
}

template<typename Value>
void Insertion_chain<Value>::reindex()
{
  m_index.clear();
  for (auto node_it = m_nodes.begin(); node_it != m_nodes.end(); ++node_it)
  {
    m_index[node_it->m_addr] = node_it;
  }
}

template<typename Value>
typename Insertion_chain<Value>::Node_index::const_iterator
  Insertion_chain<Value>::find_live(const Ptr& obj) const
{
  const auto idx_it = m_index.find(obj.get());
  if ((idx_it == m_index.end()) || (idx_it->second->m_obj.lock() != obj))
  {
    return m_index.end();
  }
  return idx_it;
}

template<typename Value>
bool Insertion_chain<Value>::push_back(const Ptr& obj)
{
  assert(obj);

  const auto idx_it = m_index.find(obj.get());
  if (idx_it != m_index.end())
  {
    if (idx_it->second->m_obj.lock() == obj)
    {
      return false;
    }
    // else: Stale node whose address got recycled.  Drop it.
    m_nodes.erase(idx_it->second);
    m_index.erase(idx_it);
  }

  m_nodes.push_back(Node{ obj, obj.get() });
  m_index[obj.get()] = std::prev(m_nodes.end());
  return true;
}

template<typename Value>
bool Insertion_chain<Value>::contains(const Ptr& obj) const
{
  return obj && (find_live(obj) != m_index.end());
}

template<typename Value>
bool Insertion_chain<Value>::erase(const Ptr& obj)
{
  if (!obj)
  {
    return false;
  }

  const auto idx_it = find_live(obj);
  if (idx_it == m_index.end())
  {
    return false;
  }
  m_nodes.erase(idx_it->second);
  m_index.erase(idx_it);
  return true;
}

template<typename Value>
void Insertion_chain<Value>::prune(const Resolver& resolver)
{
  for (auto node_it = m_nodes.begin(); node_it != m_nodes.end(); )
  {
    const auto obj = node_it->m_obj.lock();
    const auto replacement = obj ? resolver(obj) : Ptr();

    if (obj && (replacement == obj))
    {
      ++node_it;
      continue;
    }
    // else: Node is dropped or replaced; either way unindex it.

    const auto idx_it = m_index.find(node_it->m_addr);
    if ((idx_it != m_index.end()) && (idx_it->second == node_it))
    {
      m_index.erase(idx_it);
    }

    if (replacement && (find_live(replacement) == m_index.end()))
    {
      *node_it = Node{ replacement, replacement.get() };
      m_index[replacement.get()] = node_it;
      ++node_it;
    }
    else
    {
      node_it = m_nodes.erase(node_it);
    }
  } // for (node_it)
} // Insertion_chain::prune()

template<typename Value>
std::vector<typename Insertion_chain<Value>::Weak_ptr> Insertion_chain<Value>::snapshot(bool newest_first) const
{
  std::vector<Weak_ptr> result;
  result.reserve(m_nodes.size());
  for (const auto& node : m_nodes)
  {
    if (!node.m_obj.expired())
    {
      result.push_back(node.m_obj);
    }
  }
  if (newest_first)
  {
    std::reverse(result.begin(), result.end());
  }
  return result;
}

template<typename Value>
size_t Insertion_chain<Value>::size() const
{
  return m_nodes.size();
}

template<typename Value>
void Insertion_chain<Value>::clear()
{
  m_index.clear();
  m_nodes.clear();
}

} // namespace ordo::util
