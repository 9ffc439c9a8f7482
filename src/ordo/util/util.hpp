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
#include "ordo/util/detail/util.hpp"
#include "ordo/util/string_ostream.hpp"
#include <boost/shared_ptr.hpp>
#include <memory>
#include <type_traits>
#include <cassert>

namespace ordo::util
{

// Types.

/**
 * An empty interface, consisting of nothing but a default `virtual` destructor, intended as a boiler-plate-reducing
 * base for any other (presumably `virtual`-method-having) class that would otherwise require a default `virtual`
 * destructor.  It is particularly useful for interface classes such as order::Equality and map::Entry_iterator.
 */
class Null_interface
{
public:
  // Destructor.

  /**
   * Boring `virtual` destructor.  Pure, so that Null_interface itself cannot be instantiated; subclasses need not
   * define a body.
   */
  virtual ~Null_interface() = 0;
};

/**
 * Traits determining whether a key value is "null."  The primary template covers non-pointer-like types, which
 * are never null.  Specializations below cover raw pointers and the two usual shared-pointer templates.
 *
 * Specialize this for a custom handle type whose null state should be rejected as a map key.
 *
 * @tparam Key
 *         Key type.
 * @tparam Enable
 *         SFINAE hook.
 */
template<typename Key, typename Enable>
struct Null_key_traits
{
  /// `false` means is_null() is always `false`.
  static constexpr bool S_NULLABLE = false;

  /**
   * Returns `false`.
   * @return See above.
   */
  static constexpr bool is_null(const Key&)
  {
    return false;
  }
};

/// Raw pointer keys: null iff the pointer is null.
template<typename Key>
struct Null_key_traits<Key, std::enable_if_t<std::is_pointer_v<Key>>>
{
  /// Keys of this type can be null.
  static constexpr bool S_NULLABLE = true;

  /**
   * Returns `true` iff `key` is null.
   * @param key
   *        Key.
   * @return See above.
   */
  static bool is_null(const Key& key)
  {
    return !key;
  }
};

/// `boost::shared_ptr` keys: null iff empty.
template<typename T>
struct Null_key_traits<boost::shared_ptr<T>, void>
{
  /// Keys of this type can be null.
  static constexpr bool S_NULLABLE = true;

  /**
   * Returns `true` iff `key` is null.
   * @param key
   *        Key.
   * @return See above.
   */
  static bool is_null(const boost::shared_ptr<T>& key)
  {
    return !key;
  }
};

/// `std::shared_ptr` keys: null iff empty.
template<typename T>
struct Null_key_traits<std::shared_ptr<T>, void>
{
  /// Keys of this type can be null.
  static constexpr bool S_NULLABLE = true;

  /**
   * Returns `true` iff `key` is null.
   * @param key
   *        Key.
   * @return See above.
   */
  static bool is_null(const std::shared_ptr<T>& key)
  {
    return !key;
  }
};

// Template implementations.

template<typename Container>
bool key_exists(const Container& container, const typename Container::key_type& key)
{
  return container.find(key) != container.end();
}

template<typename Key>
bool is_null_key(const Key& key)
{
  if constexpr(Null_key_traits<Key>::S_NULLABLE)
  {
    return Null_key_traits<Key>::is_null(key);
  }
  else
  {
    return false;
  }
}

template<typename T1, typename ...T_rest>
void feed_args_to_ostream(std::ostream* os, T1 const & ostream_arg1, T_rest const &... remaining_ostream_args)
{
  // Induction step for variadic template.
  feed_args_to_ostream(os, ostream_arg1);
  feed_args_to_ostream(os, remaining_ostream_args...);
}

template<typename T>
void feed_args_to_ostream(std::ostream* os, T const & only_ostream_arg)
{
  // Induction base.
  *os << only_ostream_arg;
}

template<typename ...T>
void ostream_op_to_string(std::string* target_str, T const &... ostream_args)
{
  using std::flush;

  // Pushes characters directly onto the `std::string`, avoiding an `ostringstream` and its copying str().
  String_ostream os(target_str);
  feed_args_to_ostream(&(os.os()), ostream_args...);
  os.os() << flush;
}

template<typename ...T>
std::string ostream_op_string(T const &... ostream_args)
{
  using std::string;

  string result;
  ostream_op_to_string(&result, ostream_args...);
  return result;
}

} // namespace ordo::util
