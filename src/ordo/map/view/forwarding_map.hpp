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

#include "ordo/map/abstract_map.hpp"
#include <utility>

namespace ordo::map
{

// Types.

/**
 * Base of the views: an Abstract_map that forwards every operation, unchanged, to the Abstract_map it wraps (the
 * delegate), to which it holds a shared reference.  A view overrides just the operations whose behavior it changes.
 * clone() is left to each view, since the copy must be of the same kind of view.
 *
 * This header is included by abstract_map.hpp; include that one instead.
 *
 * @tparam Key
 *         Key type.
 * @tparam Mapped
 *         Value type.
 */
template<typename Key, typename Mapped>
class Forwarding_map :
  public Abstract_map<Key, Mapped>
{
public:
  // Types.

  /// Short-hand for our base.
  using Base = Abstract_map<Key, Mapped>;

  /// Short-hand for ref-counted map pointer.
  using Ptr = typename Base::Ptr;

  /// Short-hand for ref-counted entry pointer.
  using Entry_ptr = typename Base::Entry_ptr;

  /// Short-hand for ref-counted iterator pointer.
  using Iterator_ptr = typename Base::Iterator_ptr;

  /// Short-hand for key order pointer.
  using Key_order_ptr = typename Base::Key_order_ptr;

  /// Short-hand for values equality pointer.
  using Values_equality_ptr = typename Base::Values_equality_ptr;

  /// Short-hand for optional value.
  using Mapped_opt = typename Base::Mapped_opt;

  // Methods.

  /**
   * Forwards to delegate.
   * @return See above.
   */
  size_t size() const override;

  /**
   * Forwards to delegate.
   * @return See above.
   */
  bool empty() const override;

  /**
   * Forwards to delegate.
   * @return See above.
   */
  Key_order_ptr key_order() const override;

  /**
   * Forwards to delegate.
   * @return See above.
   */
  Values_equality_ptr values_equality() const override;

  /**
   * Forwards to delegate.
   * @return See above.
   */
  bool iterates_in_key_order() const override;

protected:
  // Constructors/destructor.

  /**
   * Constructs view over `delegate`, logging to the same Logger.
   * @param delegate
   *        The wrapped map; must not be null.
   */
  explicit Forwarding_map(Ptr delegate);

  // Methods.

  /**
   * The wrapped map.
   * @return See above.
   */
  const Ptr& delegate() const;

  /**
   * Forwards to delegate.
   * @param key
   *        See Abstract_map.
   * @return See Abstract_map.
   */
  Entry_ptr get_entry_impl(const Key& key) const override;

  /**
   * Forwards to delegate.
   * @param key
   *        See Abstract_map.
   * @param value
   *        See Abstract_map.
   * @param prev
   *        See Abstract_map.
   * @param err_code
   *        See Abstract_map.
   * @return See Abstract_map.
   */
  Entry_ptr put_entry_impl(const Key& key, const Mapped& value, Mapped_opt* prev, Error_code* err_code) override;

  /**
   * Forwards to delegate.
   * @param key
   *        See Abstract_map.
   * @param value
   *        See Abstract_map.
   * @param err_code
   *        See Abstract_map.
   * @return See Abstract_map.
   */
  Entry_ptr add_entry_impl(const Key& key, const Mapped& value, Error_code* err_code) override;

  /**
   * Forwards to delegate.
   * @param key
   *        See Abstract_map.
   * @param err_code
   *        See Abstract_map.
   * @return See Abstract_map.
   */
  Entry_ptr remove_entry_impl(const Key& key, Error_code* err_code) override;

  /**
   * Forwards to delegate.
   * @param entry
   *        See Abstract_map.
   * @param err_code
   *        See Abstract_map.
   * @return See Abstract_map.
   */
  bool erase_impl(const Entry_ptr& entry, Error_code* err_code) override;

  /**
   * Forwards to delegate.
   * @param err_code
   *        See Abstract_map.
   */
  void clear_impl(Error_code* err_code) override;

  /**
   * Forwards to delegate.
   * @param entry
   *        See Abstract_map.
   * @param value
   *        See Abstract_map.
   * @param err_code
   *        See Abstract_map.
   * @return See Abstract_map.
   */
  Mapped_opt update_value_impl(const Entry_ptr& entry, const Mapped& value, Error_code* err_code) override;

  /**
   * Forwards to delegate; the iterator removes through the delegate.
   * @param descending
   *        See Abstract_map.
   * @param from_key
   *        See Abstract_map.
   * @return See Abstract_map.
   */
  Iterator_ptr iterator_impl(bool descending, const Key* from_key) override;

private:
  // Data.

  /// See delegate().
  const Ptr m_delegate;
}; // class Forwarding_map

// Template implementations.

template<typename Key, typename Mapped>
Forwarding_map<Key, Mapped>::Forwarding_map(Ptr delegate) :
  Base(delegate->get_logger(), Ordo_log_component::S_VIEW),
  m_delegate(std::move(delegate))
{
  // Nothing else.
}

template<typename Key, typename Mapped>
const typename Forwarding_map<Key, Mapped>::Ptr& Forwarding_map<Key, Mapped>::delegate() const
{
  return m_delegate;
}

template<typename Key, typename Mapped>
size_t Forwarding_map<Key, Mapped>::size() const
{
  return m_delegate->size();
}

template<typename Key, typename Mapped>
bool Forwarding_map<Key, Mapped>::empty() const
{
  return m_delegate->empty();
}

template<typename Key, typename Mapped>
typename Forwarding_map<Key, Mapped>::Key_order_ptr Forwarding_map<Key, Mapped>::key_order() const
{
  return m_delegate->key_order();
}

template<typename Key, typename Mapped>
typename Forwarding_map<Key, Mapped>::Values_equality_ptr Forwarding_map<Key, Mapped>::values_equality() const
{
  return m_delegate->values_equality();
}

template<typename Key, typename Mapped>
bool Forwarding_map<Key, Mapped>::iterates_in_key_order() const
{
  return m_delegate->iterates_in_key_order();
}

template<typename Key, typename Mapped>
typename Forwarding_map<Key, Mapped>::Entry_ptr Forwarding_map<Key, Mapped>::get_entry_impl(const Key& key) const
{
  return m_delegate->get_entry(key);
}

template<typename Key, typename Mapped>
typename Forwarding_map<Key, Mapped>::Entry_ptr
  Forwarding_map<Key, Mapped>::put_entry_impl(const Key& key, const Mapped& value, Mapped_opt* prev,
                                              Error_code* err_code)
{
  return m_delegate->put_entry(key, value, prev, err_code);
}

template<typename Key, typename Mapped>
typename Forwarding_map<Key, Mapped>::Entry_ptr
  Forwarding_map<Key, Mapped>::add_entry_impl(const Key& key, const Mapped& value, Error_code* err_code)
{
  return m_delegate->add_entry(key, value, err_code);
}

template<typename Key, typename Mapped>
typename Forwarding_map<Key, Mapped>::Entry_ptr
  Forwarding_map<Key, Mapped>::remove_entry_impl(const Key& key, Error_code* err_code)
{
  return m_delegate->remove_entry(key, err_code);
}

template<typename Key, typename Mapped>
bool Forwarding_map<Key, Mapped>::erase_impl(const Entry_ptr& entry, Error_code* err_code)
{
  return m_delegate->erase(entry, err_code);
}

template<typename Key, typename Mapped>
void Forwarding_map<Key, Mapped>::clear_impl(Error_code* err_code)
{
  m_delegate->clear(err_code);
}

template<typename Key, typename Mapped>
typename Forwarding_map<Key, Mapped>::Mapped_opt
  Forwarding_map<Key, Mapped>::update_value_impl(const Entry_ptr& entry, const Mapped& value, Error_code* err_code)
{
  return m_delegate->update_value(entry, value, err_code);
}

template<typename Key, typename Mapped>
typename Forwarding_map<Key, Mapped>::Iterator_ptr
  Forwarding_map<Key, Mapped>::iterator_impl(bool descending, const Key* from_key)
{
  return Base::iterator_of(*m_delegate, descending, from_key);
}

} // namespace ordo::map
