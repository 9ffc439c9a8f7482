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
#include <boost/iostreams/stream.hpp>
#include <boost/iostreams/stream_buffer.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/noncopyable.hpp>

namespace ordo::util
{

/**
 * An `ostream` appending directly onto an `std::string` it wraps, with read-only access to that string by
 * reference.  Used to build log messages and `ostream<<`-composed strings without the copy that
 * `ostringstream::str()` would make.
 *
 * ### Thread safety ###
 * Same as `ostringstream`.
 */
class String_ostream :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Wraps the given `std::string` (appending to its current contents), or an internal initially empty string
   * if null is passed.
   *
   * @param target_str
   *        String to which to append; or null.  While `*this` exists, access `*target_str` only through `*this`.
   */
  explicit String_ostream(std::string* target_str = nullptr);

  // Methods.

  /**
   * Access to stream that will write to the wrapped string.
   *
   * @return Stream.
   */
  std::ostream& os();

  /**
   * Read-only access to the string being wrapped.  Flush os() first to see everything written.
   *
   * @return Read-only reference; its address is the same for the lifetime of `*this`.
   */
  const std::string& str() const;

  /// Performs `std::string::clear()` on the object returned by str().
  void str_clear();

private:
  // Types.

  /// Short-hand for an `ostream` writing to which will append to an std::string it is adapting.
  using String_appender_ostream = boost::iostreams::stream<boost::iostreams::back_insert_device<std::string>>;

  // Data.

  /// Underlying string, if user chose not to pass in their own in constructor.  Otherwise unused.
  std::string m_own_target_str;

  /// Pointer to the target string.
  std::string* m_target;

  /// Inserter into #m_target.
  boost::iostreams::back_insert_device<std::string> m_target_inserter;

  /// Appender `ostream` into #m_target by way of #m_target_inserter.
  String_appender_ostream m_target_appender_ostream;
}; // class String_ostream

} // namespace ordo::util
