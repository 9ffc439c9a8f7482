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
#include "ordo/map/entry_table.hpp"
#include <boost/pointer_cast.hpp>

namespace ordo::map
{

// Types.

/**
 * A frozen map: the result of Fast_map::freeze().  It shares the entry storage the source map had at freeze time,
 * and that storage never changes again (the source copies it before its next mutation).  Every read works as in
 * Fast_map; every mutation, including removal through an iterator, fails with error::Code::S_IMMUTABLE_MAP.
 *
 * Thread safety: reads are safe to perform concurrently, since nothing mutates the storage.
 *
 * @tparam Key
 *         Key type.
 * @tparam Mapped
 *         Value type.
 */
template<typename Key, typename Mapped>
class Immutable_map :
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

  /// Short-hand for the storage type.
  using Entry_table_type = Entry_table<Key, Mapped>;

  // Constructors/destructor.

  /**
   * Constructs map over frozen storage.  Use Fast_map::freeze().
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param entries
   *        Frozen storage.
   */
  explicit Immutable_map(log::Logger* logger_ptr, typename Entry_table_type::Const_ptr entries);

  // Methods.

  /**
   * Number of entries.
   * @return See above.
   */
  size_t size() const override;

  /**
   * The key order.
   * @return See above.
   */
  Key_order_ptr key_order() const override;

  /**
   * The values equality.
   * @return See above.
   */
  Values_equality_ptr values_equality() const override;

  /**
   * Returns another Immutable_map sharing the same storage.
   * @return See above.
   */
  Ptr clone() const override;

  /**
   * Returns `*this`: it is as unmodifiable as it gets.
   * @return See above.
   */
  Ptr unmodifiable() override;

  /**
   * Returns `*this`.
   * @return See above.
   */
  boost::shared_ptr<Immutable_map> freeze();

  /**
   * The storage, read-only.
   * @return See above.
   */
  const Entry_table_type& entries() const;

  using Base::get_logger;
  using Base::get_log_component;

protected:
  // Methods.

  /**
   * Looks up in the storage.
   * @param key
   *        See Abstract_map.
   * @return See Abstract_map.
   */
  Entry_ptr get_entry_impl(const Key& key) const override;

  /**
   * Fails.
   *
   * @param key
   *        See Abstract_map.
   * @param value
   *        See Abstract_map.
   * @param prev
   *        See Abstract_map.
   * @param err_code
   *        See Abstract_map.
   * @return Null.
   */
  Entry_ptr put_entry_impl(const Key& key, const Mapped& value, Mapped_opt* prev, Error_code* err_code) override;

  /**
   * Fails.
   *
   * @param key
   *        See Abstract_map.
   * @param value
   *        See Abstract_map.
   * @param err_code
   *        See Abstract_map.
   * @return Null.
   */
  Entry_ptr add_entry_impl(const Key& key, const Mapped& value, Error_code* err_code) override;

  /**
   * Fails.
   *
   * @param key
   *        See Abstract_map.
   * @param err_code
   *        See Abstract_map.
   * @return Null.
   */
  Entry_ptr remove_entry_impl(const Key& key, Error_code* err_code) override;

  /**
   * Fails.
   *
   * @param entry
   *        See Abstract_map.
   * @param err_code
   *        See Abstract_map.
   * @return `false`.
   */
  bool erase_impl(const Entry_ptr& entry, Error_code* err_code) override;

  /**
   * Fails.
   * @param err_code
   *        See Abstract_map.
   */
  void clear_impl(Error_code* err_code) override;

  /**
   * Fails.
   *
   * @param entry
   *        See Abstract_map.
   * @param value
   *        See Abstract_map.
   * @param err_code
   *        See Abstract_map.
   * @return Empty.
   */
  Mapped_opt update_value_impl(const Entry_ptr& entry, const Mapped& value, Error_code* err_code) override;

  /**
   * Fails.
   *
   * @param other
   *        See Abstract_map.
   * @param err_code
   *        See Abstract_map.
   */
  void put_all_impl(Base& other, Error_code* err_code) override;

  /**
   * Iterates the storage; `remove()` fails.
   * @param descending
   *        See Abstract_map.
   * @param from_key
   *        See Abstract_map.
   * @return See Abstract_map.
   */
  Iterator_ptr iterator_impl(bool descending, const Key* from_key) override;

  /**
   * Emits error::Code::S_IMMUTABLE_MAP.
   * @param err_code
   *        Non-null.
   * @return `true`.
   */
  bool refuse_mutation(Error_code* err_code) const override;

private:
  // Data.

  /// See entries().
  const typename Entry_table_type::Const_ptr m_entries;
}; // class Immutable_map

// Template implementations.

template<typename Key, typename Mapped>
Immutable_map<Key, Mapped>::Immutable_map(log::Logger* logger_ptr, typename Entry_table_type::Const_ptr entries) :
  Base(logger_ptr, Ordo_log_component::S_MAP),
  m_entries(std::move(entries))
{
  assert(m_entries->frozen());
}

template<typename Key, typename Mapped>
size_t Immutable_map<Key, Mapped>::size() const
{
  return m_entries->size();
}

template<typename Key, typename Mapped>
typename Immutable_map<Key, Mapped>::Key_order_ptr Immutable_map<Key, Mapped>::key_order() const
{
  return m_entries->key_order();
}

template<typename Key, typename Mapped>
typename Immutable_map<Key, Mapped>::Values_equality_ptr Immutable_map<Key, Mapped>::values_equality() const
{
  return m_entries->values_equality();
}

template<typename Key, typename Mapped>
typename Immutable_map<Key, Mapped>::Ptr Immutable_map<Key, Mapped>::clone() const
{
  return Ptr(new Immutable_map(get_logger(), m_entries));
}

template<typename Key, typename Mapped>
typename Immutable_map<Key, Mapped>::Ptr Immutable_map<Key, Mapped>::unmodifiable()
{
  return this->shared_from_this();
}

template<typename Key, typename Mapped>
boost::shared_ptr<Immutable_map<Key, Mapped>> Immutable_map<Key, Mapped>::freeze()
{
  return boost::static_pointer_cast<Immutable_map>(this->shared_from_this());
}

template<typename Key, typename Mapped>
const typename Immutable_map<Key, Mapped>::Entry_table_type& Immutable_map<Key, Mapped>::entries() const
{
  return *m_entries;
}

template<typename Key, typename Mapped>
bool Immutable_map<Key, Mapped>::refuse_mutation(Error_code* err_code) const
{
  ORDO_ERROR_EMIT_ERROR(error::Code::S_IMMUTABLE_MAP);
  return true;
}

template<typename Key, typename Mapped>
typename Immutable_map<Key, Mapped>::Entry_ptr Immutable_map<Key, Mapped>::get_entry_impl(const Key& key) const
{
  return m_entries->get_any(key);
}

template<typename Key, typename Mapped>
typename Immutable_map<Key, Mapped>::Entry_ptr
  Immutable_map<Key, Mapped>::put_entry_impl(const Key&, const Mapped&, Mapped_opt*, Error_code* err_code)
{
  refuse_mutation(err_code);
  return Entry_ptr();
}

template<typename Key, typename Mapped>
typename Immutable_map<Key, Mapped>::Entry_ptr
  Immutable_map<Key, Mapped>::add_entry_impl(const Key&, const Mapped&, Error_code* err_code)
{
  refuse_mutation(err_code);
  return Entry_ptr();
}

template<typename Key, typename Mapped>
typename Immutable_map<Key, Mapped>::Entry_ptr Immutable_map<Key, Mapped>::remove_entry_impl(const Key&,
                                                                                             Error_code* err_code)
{
  refuse_mutation(err_code);
  return Entry_ptr();
}

template<typename Key, typename Mapped>
bool Immutable_map<Key, Mapped>::erase_impl(const Entry_ptr&, Error_code* err_code)
{
  refuse_mutation(err_code);
  return false;
}

template<typename Key, typename Mapped>
void Immutable_map<Key, Mapped>::clear_impl(Error_code* err_code)
{
  refuse_mutation(err_code);
}

template<typename Key, typename Mapped>
typename Immutable_map<Key, Mapped>::Mapped_opt
  Immutable_map<Key, Mapped>::update_value_impl(const Entry_ptr&, const Mapped&, Error_code* err_code)
{
  refuse_mutation(err_code);
  return Mapped_opt();
}

template<typename Key, typename Mapped>
void Immutable_map<Key, Mapped>::put_all_impl(Base&, Error_code* err_code)
{
  refuse_mutation(err_code);
}

template<typename Key, typename Mapped>
typename Immutable_map<Key, Mapped>::Iterator_ptr Immutable_map<Key, Mapped>::iterator_impl(bool descending,
                                                                                            const Key* from_key)
{
  auto cursor = from_key ? m_entries->cursor(descending, *from_key) : m_entries->cursor(descending);
  return this->make_iterator([cursor]() mutable -> Entry_ptr
                               { return cursor.has_next() ? cursor.next() : Entry_ptr(); });
}

} // namespace ordo::map
