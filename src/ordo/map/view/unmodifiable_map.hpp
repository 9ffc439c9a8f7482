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

namespace ordo::map
{

// Types.

/**
 * Read-only view of a map.  Every mutating operation (`put()`, `put_entry()`, `add_entry()`, `remove()`,
 * `remove_entry()`, `erase()`, `clear()`, `update_value()`, `put_all()`), as well as `remove()` on any iterator
 * obtained through it, fails with error::Code::S_UNMODIFIABLE_VIEW, whatever the arguments (a null key included),
 * without touching the delegate.  Reads and
 * iteration (both directions, with or without starting key) are those of the delegate, which may itself still be
 * modified directly: the view shows such changes.
 *
 * unmodifiable() on `*this` returns `*this`; clone() returns an Unmodifiable_map over a clone of the delegate.
 *
 * @tparam Key
 *         Key type.
 * @tparam Mapped
 *         Value type.
 */
template<typename Key, typename Mapped>
class Unmodifiable_map :
  public Forwarding_map<Key, Mapped>
{
public:
  // Types.

  /// Short-hand for our base.
  using Base = Forwarding_map<Key, Mapped>;

  /// Short-hand for ref-counted map pointer.
  using Ptr = typename Base::Ptr;

  /// Short-hand for ref-counted entry pointer.
  using Entry_ptr = typename Base::Entry_ptr;

  /// Short-hand for ref-counted iterator pointer.
  using Iterator_ptr = typename Base::Iterator_ptr;

  /// Short-hand for optional value.
  using Mapped_opt = typename Base::Mapped_opt;

  // Constructors/destructor.

  /**
   * Constructs view.
   * @param delegate
   *        The wrapped map.
   */
  explicit Unmodifiable_map(Ptr delegate);

  // Methods.

  /**
   * Returns a read-only view over a clone of the delegate.
   * @return See above.
   */
  Ptr clone() const override;

  /**
   * Returns `*this`.
   * @return See above.
   */
  Ptr unmodifiable() override;

  using Base::get_logger;
  using Base::get_log_component;

protected:
  // Methods.

  /**
   * Fails; see class doc header.
   * @param key
   *        Ignored.
   * @param value
   *        Ignored.
   * @param prev
   *        Ignored.
   * @param err_code
   *        Set to error::Code::S_UNMODIFIABLE_VIEW.
   * @return Null.
   */
  Entry_ptr put_entry_impl(const Key& key, const Mapped& value, Mapped_opt* prev, Error_code* err_code) override;

  /**
   * Fails; see class doc header.
   * @param key
   *        Ignored.
   * @param value
   *        Ignored.
   * @param err_code
   *        Set to error::Code::S_UNMODIFIABLE_VIEW.
   * @return Null.
   */
  Entry_ptr add_entry_impl(const Key& key, const Mapped& value, Error_code* err_code) override;

  /**
   * Fails; see class doc header.
   * @param key
   *        Ignored.
   * @param err_code
   *        Set to error::Code::S_UNMODIFIABLE_VIEW.
   * @return Null.
   */
  Entry_ptr remove_entry_impl(const Key& key, Error_code* err_code) override;

  /**
   * Fails; see class doc header.
   * @param entry
   *        Ignored.
   * @param err_code
   *        Set to error::Code::S_UNMODIFIABLE_VIEW.
   * @return `false`.
   */
  bool erase_impl(const Entry_ptr& entry, Error_code* err_code) override;

  /**
   * Fails; see class doc header.
   * @param err_code
   *        Set to error::Code::S_UNMODIFIABLE_VIEW.
   */
  void clear_impl(Error_code* err_code) override;

  /**
   * Fails; see class doc header.
   * @param entry
   *        Ignored.
   * @param value
   *        Ignored.
   * @param err_code
   *        Set to error::Code::S_UNMODIFIABLE_VIEW.
   * @return Empty.
   */
  Mapped_opt update_value_impl(const Entry_ptr& entry, const Mapped& value, Error_code* err_code) override;

  /**
   * Fails; see class doc header.
   * @param other
   *        Ignored.
   * @param err_code
   *        Set to error::Code::S_UNMODIFIABLE_VIEW.
   */
  void put_all_impl(Abstract_map<Key, Mapped>& other, Error_code* err_code) override;

  /**
   * Iterates the delegate; remove() fails.
   * @param descending
   *        See Abstract_map.
   * @param from_key
   *        See Abstract_map.
   * @return See Abstract_map.
   */
  Iterator_ptr iterator_impl(bool descending, const Key* from_key) override;

  /**
   * Emits error::Code::S_UNMODIFIABLE_VIEW.
   * @param err_code
   *        Non-null.
   * @return `true`.
   */
  bool refuse_mutation(Error_code* err_code) const override;
}; // class Unmodifiable_map

// Template implementations.

template<typename Key, typename Mapped>
Unmodifiable_map<Key, Mapped>::Unmodifiable_map(Ptr delegate) :
  Base(std::move(delegate))
{
  // Nothing else.
}

template<typename Key, typename Mapped>
typename Unmodifiable_map<Key, Mapped>::Ptr Unmodifiable_map<Key, Mapped>::clone() const
{
  return Ptr(new Unmodifiable_map(this->delegate()->clone()));
}

template<typename Key, typename Mapped>
typename Unmodifiable_map<Key, Mapped>::Ptr Unmodifiable_map<Key, Mapped>::unmodifiable()
{
  return this->shared_from_this();
}

template<typename Key, typename Mapped>
bool Unmodifiable_map<Key, Mapped>::refuse_mutation(Error_code* err_code) const
{
  ORDO_ERROR_EMIT_ERROR(error::Code::S_UNMODIFIABLE_VIEW);
  return true;
}

template<typename Key, typename Mapped>
typename Unmodifiable_map<Key, Mapped>::Entry_ptr
  Unmodifiable_map<Key, Mapped>::put_entry_impl(const Key&, const Mapped&, Mapped_opt*, Error_code* err_code)
{
  refuse_mutation(err_code);
  return Entry_ptr();
}

template<typename Key, typename Mapped>
typename Unmodifiable_map<Key, Mapped>::Entry_ptr
  Unmodifiable_map<Key, Mapped>::add_entry_impl(const Key&, const Mapped&, Error_code* err_code)
{
  refuse_mutation(err_code);
  return Entry_ptr();
}

template<typename Key, typename Mapped>
typename Unmodifiable_map<Key, Mapped>::Entry_ptr
  Unmodifiable_map<Key, Mapped>::remove_entry_impl(const Key&, Error_code* err_code)
{
  refuse_mutation(err_code);
  return Entry_ptr();
}

template<typename Key, typename Mapped>
bool Unmodifiable_map<Key, Mapped>::erase_impl(const Entry_ptr&, Error_code* err_code)
{
  refuse_mutation(err_code);
  return false;
}

template<typename Key, typename Mapped>
void Unmodifiable_map<Key, Mapped>::clear_impl(Error_code* err_code)
{
  refuse_mutation(err_code);
}

template<typename Key, typename Mapped>
typename Unmodifiable_map<Key, Mapped>::Mapped_opt
  Unmodifiable_map<Key, Mapped>::update_value_impl(const Entry_ptr&, const Mapped&, Error_code* err_code)
{
  refuse_mutation(err_code);
  return Mapped_opt();
}

template<typename Key, typename Mapped>
void Unmodifiable_map<Key, Mapped>::put_all_impl(Abstract_map<Key, Mapped>&, Error_code* err_code)
{
  refuse_mutation(err_code);
}

template<typename Key, typename Mapped>
typename Unmodifiable_map<Key, Mapped>::Iterator_ptr
  Unmodifiable_map<Key, Mapped>::iterator_impl(bool descending, const Key* from_key)
{
  // Iterator's remove() goes through erase() on *this, hence fails.
  return this->make_iterator(Abstract_map<Key, Mapped>::iterator_of(*(this->delegate()), descending, from_key));
}

} // namespace ordo::map
