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
#include <boost/thread.hpp>
#include <boost/thread/shared_mutex.hpp>
#include <boost/functional/hash.hpp>
#include <boost/preprocessor/stringize.hpp>
#include <functional>
#include <string_view>
#include <ostream>

/**
 * Grab-bag of utilities used throughout Ordo: string/stream conveniences, thread and mutex aliases, null-key
 * detection, and the insertion-order chain backing map::Linked_map.
 */
namespace ordo::util
{
// Types.

// Find doc headers near the bodies of these compound types.

template<typename Value>
class Insertion_chain;

class Null_interface;

class String_ostream;

template<typename Key, typename Enable = void>
struct Null_key_traits;

/// Short-hand for a string-view type.  Ordo builds in C++17 mode, so this is the standard one.
using String_view = std::string_view;

/// Short-hand for standard thread class.  We use boost.thread, as elsewhere in the stack.
using Thread = boost::thread;

/// Short-hand for an OS-provided ID of a util::Thread.
using Thread_id = Thread::id;

/// Short-hand for polymorphic function (a-la `std::function<>`).
template<typename Signature>
using Function = std::function<Signature>;

/// Short-hand for non-reentrant, exclusive mutex.  ("Reentrant" = one can lock an already-locked-in-that-thread mutex.)
using Mutex_non_recursive = boost::mutex;

/**
 * Short-hand for non-reentrant, shared-or-exclusive mutex.  When locking one of these, choose one of:
 * #Lock_guard (exclusive: writers) or #Shared_lock_guard (shared: readers).
 */
using Mutex_shared_non_recursive = boost::shared_mutex;

/**
 * Short-hand for advanced-capability RAII lock guard for any mutex, ensuring exclusive ownership of that mutex.
 *
 * @tparam Mutex
 *         Mutex type.  Recommended: #Mutex_non_recursive or #Mutex_shared_non_recursive.
 */
template<typename Mutex>
using Lock_guard = boost::unique_lock<Mutex>;

/**
 * Short-hand for shared mode advanced-capability RAII lock guard, particularly for #Mutex_shared_non_recursive mutexes.
 *
 * @tparam Shared_mutex
 *         Typically #Mutex_shared_non_recursive.
 */
template<typename Shared_mutex>
using Shared_lock_guard = boost::shared_lock<Shared_mutex>;

// Free functions.

/**
 * Returns `true` if and only if the given key is in the given container.
 *
 * @tparam Container
 *         Associative container type (`boost::unordered_map`, `std::set`, etc.).
 * @param container
 *        Container to search.
 * @param key
 *        Key to find.
 * @return See above.
 */
template<typename Container>
bool key_exists(const Container& container, const typename Container::key_type& key);

/**
 * Returns `true` if and only if `key` is the null value of a pointer-like key type: a null raw pointer, or
 * an empty `boost::shared_ptr` or `std::shared_ptr`.  For every other type it returns `false` at compile time.
 *
 * Maps never store null keys; values, by contrast, may be "null" in whatever sense the `Mapped` type allows.
 *
 * @tparam Key
 *         Key type.
 * @param key
 *        Key to check.
 * @return See above.
 */
template<typename Key>
bool is_null_key(const Key& key);

/**
 * Writes to the specified string, as if the given arguments were each passed, via `<<` in sequence,
 * to an `ostringstream`, and then the result were appended to the aforementioned string variable.
 *
 * @tparam ...T
 *         Each type `T` is such that `os << t`, with types `T const & t` and `ostream& os`, builds and writes
 *         `t` to `os`, returning lvalue `os`.
 * @param target_str
 *        Pointer to the string to which to append.
 * @param ostream_args
 *        One or more arguments, such that each argument `arg` is suitable for `os << arg`.
 */
template<typename ...T>
void ostream_op_to_string(std::string* target_str, T const &... ostream_args);

/**
 * Equivalent to ostream_op_to_string() but returns a new `string` by value instead of writing to the caller's.
 *
 * @tparam ...T
 *         See ostream_op_to_string().
 * @param ostream_args
 *        See ostream_op_to_string().
 * @return Resulting `std::string`.
 */
template<typename ...T>
std::string ostream_op_string(T const &... ostream_args);

/**
 * "Induction step" version of variadic function template that simply outputs arguments 2+ via
 * `<<` to the given `ostream`, in the order given.
 *
 * @tparam T1
 *         See `...T` in ostream_op_to_string().
 * @tparam T_rest
 *         See `...T` in ostream_op_to_string().
 * @param os
 *        Stream to which to write.
 * @param ostream_arg1
 *        First argument.
 * @param remaining_ostream_args
 *        See `ostream_args` in ostream_op_to_string().
 */
template<typename T1, typename ...T_rest>
void feed_args_to_ostream(std::ostream* os, T1 const & ostream_arg1, T_rest const &... remaining_ostream_args);

/**
 * "Induction base" for a variadic function template, this simply outputs given item to given `ostream` via `<<`.
 *
 * @tparam T
 *         See `...T` in ostream_op_to_string().
 * @param os
 *        See other feed_args_to_ostream().
 * @param only_ostream_arg
 *        See `ostream_arg1` in other feed_args_to_ostream().
 */
template<typename T>
void feed_args_to_ostream(std::ostream* os, T const & only_ostream_arg);

/**
 * Helper that, given a path string, returns the part of it after the last path separator (or all of it if none).
 * `constexpr`, so that `__FILE__`-based invocations evaluate at compile time.
 *
 * @param path
 *        Path.
 * @return See above.
 */
constexpr String_view get_last_path_segment(String_view path);

/**
 * Returns a string equal to what ORDO_UTIL_WHERE_AM_I() would place into an `ostream`.
 *
 * @param file
 *        File name or path; only the last path segment is used.
 * @param function
 *        Function name.
 * @param line
 *        Line number.
 * @return See above.
 */
std::string get_where_am_i_str(String_view file, String_view function, unsigned int line);

// Macros.

/**
 * Expands to an `ostream` fragment `X` (suitable for, for example: `std::cout << X << ": Hi!"`) containing
 * the file name, function name, and line number at the macro invocation's context.
 */
#define ORDO_UTIL_WHERE_AM_I() \
  ORDO_UTIL_WHERE_AM_I_FROM_ARGS(::ordo::util::get_last_path_segment \
                                   (::ordo::util::String_view(__FILE__, sizeof(__FILE__) - 1)), \
                                 ::ordo::util::String_view(__FUNCTION__, sizeof(__FUNCTION__) - 1), \
                                 __LINE__)

/// Same as ORDO_UTIL_WHERE_AM_I() but evaluates to an `std::string`.
#define ORDO_UTIL_WHERE_AM_I_STR() \
  ::ordo::util::get_where_am_i_str(::ordo::util::String_view(__FILE__, sizeof(__FILE__) - 1), \
                                   ::ordo::util::String_view(__FUNCTION__, sizeof(__FUNCTION__) - 1), \
                                   __LINE__)

/**
 * Expands to a string literal containing the file, the given function name, and the line number at the
 * macro invocation's context.  Usable where a compile-time `const char*` is required.
 *
 * @param ARG_function
 *        Function name token(s), e.g., the name of a method about to be invoked.
 */
#define ORDO_UTIL_WHERE_AM_I_LITERAL(ARG_function) \
  __FILE__ ":" BOOST_PP_STRINGIZE(ARG_function) "(" BOOST_PP_STRINGIZE(__LINE__) ")"

/**
 * Place the argument inside a `do {} while (false)` block, so that a multi-statement macro body can be used
 * anywhere a single statement (followed by `;`) can.
 *
 * @param ARG_func_macro_definition
 *        The intended macro body.
 */
#define ORDO_UTIL_SEMICOLON_SAFE(ARG_func_macro_definition) \
  do \
  { \
    ARG_func_macro_definition \
  } \
  while (false)

} // namespace ordo::util
