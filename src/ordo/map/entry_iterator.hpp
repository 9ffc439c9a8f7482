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

#include "ordo/map/entry.hpp"
#include "ordo/map/error/error.hpp"
#include "ordo/error/error.hpp"
#include "ordo/log/log.hpp"
#include "ordo/util/util.hpp"
#include <boost/shared_ptr.hpp>
#include <utility>

namespace ordo::map
{

// Types.

/**
 * Iteration over the entries of a map (or view), in the order that map defines, with removal of the entry last
 * returned.  Obtain one from Abstract_map::iterator() or Abstract_map::descending_iterator().
 *
 * An iterator stays valid across removal via its own remove(); other structural changes to the map during
 * iteration have undefined effect on the iteration (though never on memory safety), unless the map is a
 * snapshotting view (Linked_map, Shared_map, Atomic_map).
 *
 * @tparam Key
 *         Key type.
 * @tparam Mapped
 *         Value type.
 */
template<typename Key, typename Mapped>
class Entry_iterator :
  public util::Null_interface
{
public:
  // Types.

  /// Short-hand for ref-counted pointer to `*this`.
  using Ptr = boost::shared_ptr<Entry_iterator>;

  /// Short-hand for ref-counted pointer to entry.
  using Entry_ptr = typename Entry<Key, Mapped>::Ptr;

  // Methods.

  /**
   * Whether next() would return an entry.
   * @return See above.
   */
  virtual bool has_next() const = 0;

  /**
   * Returns the next entry and advances.  Behavior undefined unless has_next().
   * @return See above.
   */
  virtual Entry_ptr next() = 0;

  /**
   * Removes the entry last returned by next() from the map this iterator came from.  Fails if there is no such
   * entry (next() not yet called, or entry already removed) or if that map refuses removal (e.g., an
   * Unmodifiable_map view).
   *
   * @param err_code
   *        See ordo::error.  map::error::Code::S_ENTRY_NOT_IN_MAP, or whatever the map's `erase()` emits.
   */
  void remove(Error_code* err_code = nullptr);

protected:
  // Methods.

  /**
   * Implements remove() given non-null, cleared `*err_code`.
   * @param err_code
   *        See remove().
   */
  virtual void remove_impl(Error_code* err_code) = 0;
}; // class Entry_iterator

/**
 * The one concrete Entry_iterator, built from two functions: a source yielding the entries in order (null when
 * exhausted), and an eraser removing a given entry through the map the iterator was obtained from.  The source is
 * read one entry ahead, so that has_next() is cheap and the source may skip and filter.
 *
 * @tparam Key
 *         Key type.
 * @tparam Mapped
 *         Value type.
 */
template<typename Key, typename Mapped>
class Sequence_iterator :
  public Entry_iterator<Key, Mapped>,
  public log::Log_context
{
public:
  // Types.

  /// Short-hand for ref-counted pointer to entry.
  using Entry_ptr = typename Entry_iterator<Key, Mapped>::Entry_ptr;

  /// Yields the next entry or null when exhausted; not called again after yielding null.
  using Source = util::Function<Entry_ptr ()>;

  /// Removes the given entry, given non-null `Error_code*`; returns whether it was removed.
  using Eraser = util::Function<bool (const Entry_ptr& entry, Error_code* err_code)>;

  // Constructors/destructor.

  /**
   * Constructs iterator, reading the first entry from `source` immediately.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param source
   *        See #Source.
   * @param eraser
   *        See #Eraser.
   */
  explicit Sequence_iterator(log::Logger* logger_ptr, Source source, Eraser eraser);

  // Methods.

  /**
   * Implements interface.
   * @return See above.
   */
  bool has_next() const override;

  /**
   * Implements interface.
   * @return See above.
   */
  Entry_ptr next() override;

protected:
  // Methods.

  /**
   * Implements interface.
   * @param err_code
   *        See Entry_iterator::remove().
   */
  void remove_impl(Error_code* err_code) override;

private:
  // Data.

  /// See ctor.
  Source m_source;

  /// See ctor.
  Eraser m_eraser;

  /// Entry to be returned by next(); null when exhausted.
  Entry_ptr m_next;

  /// Entry last returned by next() and not yet removed; else null.
  Entry_ptr m_last;
}; // class Sequence_iterator

// Template implementations.

template<typename Key, typename Mapped>
void Entry_iterator<Key, Mapped>::remove(Error_code* err_code)
{
  ORDO_ERROR_EXEC_VOID_AND_THROW_ON_ERROR(remove, _1);
  // else

  err_code->clear();
  remove_impl(err_code);
}

template<typename Key, typename Mapped>
Sequence_iterator<Key, Mapped>::Sequence_iterator(log::Logger* logger_ptr, Source source, Eraser eraser) :
  log::Log_context(logger_ptr, Ordo_log_component::S_MAP),
  m_source(std::move(source)),
  m_eraser(std::move(eraser)),
  m_next(m_source())
{
  // Nothing else.
}

template<typename Key, typename Mapped>
bool Sequence_iterator<Key, Mapped>::has_next() const
{
  return bool(m_next);
}

template<typename Key, typename Mapped>
typename Sequence_iterator<Key, Mapped>::Entry_ptr Sequence_iterator<Key, Mapped>::next()
{
  assert(m_next);

  m_last = std::move(m_next);
  m_next = m_source();
  return m_last;
}

template<typename Key, typename Mapped>
void Sequence_iterator<Key, Mapped>::remove_impl(Error_code* err_code)
{
  const bool removed = m_eraser(m_last, err_code);
  if (*err_code)
  {
    return;
  }
  // else

  if (!removed)
  {
    ORDO_ERROR_EMIT_ERROR(error::Code::S_ENTRY_NOT_IN_MAP);
    return;
  }
  // else
  m_last.reset();
}

} // namespace ordo::map
